#pragma once

/**
 * @file SerialChannel.h
 * @brief Byte channel to the multimeter
 *
 * Reads are blocking with a timeout; there are no receive callbacks. A channel
 * has a single owner (AcquisitionProtocol) and is not thread-safe by itself.
 */

#include <MiProbe/Core/Export.h>

#include <cstdint>
#include <memory>
#include <string>

namespace Mi::Probe::Serial {

// =============================================================================
// Configuration
// =============================================================================

enum class Parity {
    None,
    Odd,
    Even
};

MIPROBE_API const char* ParityName(Parity parity);

/**
 * @brief Serial line settings
 */
struct MIPROBE_API SerialConfig {
    std::string devicePath = "/dev/ttyUSB0";
    int32_t baudRate = 9600;
    Parity parity = Parity::None;
    int32_t dataBits = 8;       ///< 5..8
    int32_t stopBits = 1;       ///< 1 or 2

    SerialConfig& SetDevicePath(const std::string& p) { devicePath = p; return *this; }
    SerialConfig& SetBaudRate(int32_t b) { baudRate = b; return *this; }
    SerialConfig& SetParity(Parity p) { parity = p; return *this; }
    SerialConfig& SetDataBits(int32_t d) { dataBits = d; return *this; }
    SerialConfig& SetStopBits(int32_t s) { stopBits = s; return *this; }

    /// @throws InvalidArgumentException on unsupported values
    void Validate() const;
};

// =============================================================================
// Channel
// =============================================================================

enum class ReadStatus {
    Data,       ///< At least one byte appended
    Timeout     ///< Nothing arrived within the timeout
};

class MIPROBE_API SerialChannel {
public:
    virtual ~SerialChannel() = default;

    /**
     * @brief Write all bytes
     * @throws IOException on failure
     */
    virtual void Write(const std::string& bytes) = 0;

    /**
     * @brief Wait up to timeoutMs for input and append what is available
     * @throws IOException on failure
     */
    virtual ReadStatus Read(std::string& buffer, int32_t timeoutMs) = 0;

    /// Drop any unread input
    virtual void Discard() = 0;

    virtual bool IsOpen() const = 0;

    /// Human-readable endpoint, e.g. "/dev/ttyUSB0 @ 9600 8N1"
    virtual std::string Description() const = 0;
};

/**
 * @brief Open a serial device
 * @throws InvalidArgumentException on invalid config
 * @throws IOException if the device cannot be opened or configured
 */
MIPROBE_API std::unique_ptr<SerialChannel> OpenSerialChannel(const SerialConfig& config);

} // namespace Mi::Probe::Serial
