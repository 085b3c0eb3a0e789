#pragma once

/**
 * @file FrameCodec.h
 * @brief Multimeter ASCII frame protocol
 *
 * Frames:
 *   request:       $SEL,<point id>*XX\r\n
 *   response:      $VAL,<point id>,<value>,<unit>*XX\r\n
 *   device error:  $ERR,<point id>,<code>*XX\r\n
 *
 * Responses echo the id of the request they answer, so a late reply to an
 * abandoned request can be told apart from the current one. An ERR frame
 * with id 0 means the meter could not parse the request at all.
 *
 * XX is the two-digit upper-case hex XOR of every byte between '$' and '*'.
 * A frame longer than MAX_FRAME_LENGTH bytes (terminator included) or without
 * the "\r\n" terminator is malformed.
 */

#include <MiProbe/Core/Export.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Mi::Probe::Serial {

// =============================================================================
// Constants
// =============================================================================

constexpr size_t MAX_FRAME_LENGTH = 80;

constexpr const char* FRAME_SELECT = "SEL";
constexpr const char* FRAME_VALUE = "VAL";
constexpr const char* FRAME_ERROR = "ERR";

// =============================================================================
// Types
// =============================================================================

enum class FrameStatus {
    Ok,
    ChecksumMismatch,   ///< Well-formed, but XX does not match the payload
    Malformed           ///< Framing, length, or hex digits invalid
};

MIPROBE_API const char* FrameStatusName(FrameStatus status);

/**
 * @brief Decoded frame: "$VAL,7,1.5,V" -> type "VAL", fields {"7", "1.5", "V"}
 */
struct MIPROBE_API Frame {
    std::string type;
    std::vector<std::string> fields;
};

// =============================================================================
// Encoding
// =============================================================================

/// Wrap payload as "$payload*XX\r\n"
MIPROBE_API std::string EncodeFrame(const std::string& payload);

MIPROBE_API std::string EncodeSelect(int32_t pointId);
MIPROBE_API std::string EncodeValue(int32_t pointId, double value, const std::string& unit);
MIPROBE_API std::string EncodeError(int32_t pointId, const std::string& code);

// =============================================================================
// Decoding
// =============================================================================

/**
 * @brief Decode one raw frame (terminator included)
 * @param raw As returned by FrameAssembler::NextFrame
 * @param frame Output, valid when Ok is returned
 */
MIPROBE_API FrameStatus DecodeFrame(const std::string& raw, Frame& frame);

/**
 * @brief Extract point id, value and unit from a VAL frame
 * @return false unless frame is VAL with a positive id, a finite number and
 *         a unit field
 */
MIPROBE_API bool ParseValueFrame(const Frame& frame, int32_t& pointId, double& value,
                                 std::string& unit);

/**
 * @brief Extract point id and error code from an ERR frame
 * @return false unless frame is ERR with a non-negative id and a code field
 */
MIPROBE_API bool ParseErrorFrame(const Frame& frame, int32_t& pointId, std::string& code);

/**
 * @brief Extract point id from a SEL frame
 */
MIPROBE_API bool ParseSelectFrame(const Frame& frame, int32_t& pointId);

// =============================================================================
// FrameAssembler
// =============================================================================

/**
 * @brief Splits a byte stream into raw frames
 *
 * Bytes before '$' are dropped. A frame that grows past MAX_FRAME_LENGTH
 * without a terminator is emitted as-is (DecodeFrame reports it Malformed) and
 * the rest of that line is skipped.
 */
class MIPROBE_API FrameAssembler {
public:
    void Append(const std::string& bytes);

    /// Next complete (or overlong) frame, if any
    std::optional<std::string> NextFrame();

    void Reset();

    size_t Buffered() const { return buffer_.size(); }

private:
    std::string buffer_;
    bool skipLine_ = false;
};

} // namespace Mi::Probe::Serial
