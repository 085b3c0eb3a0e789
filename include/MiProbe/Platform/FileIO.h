#pragma once

#include <MiProbe/Core/Export.h>

/**
 * @file FileIO.h
 * @brief Cross-platform file I/O utilities
 *
 * Provides:
 * - Binary file read/write (with atomic replace)
 * - Text file line reading
 * - In-memory little-endian writer/reader for container serialization
 */

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace Mi::Probe::Platform {

// ============================================================================
// Binary File I/O
// ============================================================================

/**
 * @brief Read entire file into byte vector
 * @return true on success
 */
MIPROBE_API bool ReadBinaryFile(const std::string& path, std::vector<uint8_t>& data);

/**
 * @brief Write byte vector to file
 * @return true on success
 */
MIPROBE_API bool WriteBinaryFile(const std::string& path, const std::vector<uint8_t>& data);

/**
 * @brief Write byte vector to a sibling temp file, then rename over path
 *
 * The destination is either the old content or the complete new content,
 * never a partial write.
 *
 * @return true on success (temp file removed on failure)
 */
MIPROBE_API bool WriteBinaryFileAtomic(const std::string& path,
                                       const std::vector<uint8_t>& data);

// ============================================================================
// Text File I/O (UTF-8)
// ============================================================================

/**
 * @brief Write string to text file (UTF-8)
 * @return true on success
 */
MIPROBE_API bool WriteTextFile(const std::string& path, const std::string& content);

/**
 * @brief Read text file lines into vector
 * @param path File path
 * @param lines Output vector of lines
 * @param trimLines If true, trim whitespace from each line
 * @return true on success
 */
MIPROBE_API bool ReadTextLines(const std::string& path, std::vector<std::string>& lines,
                               bool trimLines = true);

/**
 * @brief Trim leading/trailing whitespace
 */
MIPROBE_API std::string TrimString(const std::string& str);

// ============================================================================
// Serialization Helpers
// ============================================================================

namespace detail {

template<size_t N> struct UIntOfSize;
template<> struct UIntOfSize<1> { using Type = uint8_t; };
template<> struct UIntOfSize<2> { using Type = uint16_t; };
template<> struct UIntOfSize<4> { using Type = uint32_t; };
template<> struct UIntOfSize<8> { using Type = uint64_t; };

} // namespace detail

/**
 * @brief Binary writer into a growable byte buffer
 *
 * Multi-byte values are written little-endian regardless of the host, doubles
 * as their IEEE-754 bit pattern. Strings are length-prefixed with uint64_t.
 */
class MIPROBE_API ByteWriter {
public:
    ByteWriter() = default;

    /**
     * @brief Write arithmetic value (little-endian)
     */
    template<typename T>
    void Write(T value);

    /**
     * @brief Write string (length-prefixed)
     */
    void WriteString(const std::string& str);

    /**
     * @brief Write raw bytes
     */
    void WriteBytes(const void* data, size_t size);

    std::vector<uint8_t> Release() { return std::move(buffer_); }

private:
    std::vector<uint8_t> buffer_;
};

/**
 * @brief Bounds-checked little-endian reader over a byte range
 *
 * Reading past the end sets the overrun flag and yields zero values; callers
 * check Overrun() once a record has been decoded.
 */
class MIPROBE_API ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size)
        : data_(data), size_(size) {}

    explicit ByteReader(const std::vector<uint8_t>& buffer)
        : data_(buffer.data()), size_(buffer.size()) {}

    /**
     * @brief Read arithmetic value (little-endian)
     */
    template<typename T>
    T Read();

    /**
     * @brief Read string (length-prefixed)
     */
    std::string ReadString();

    /**
     * @brief Read raw bytes
     */
    void ReadBytes(void* data, size_t size);

    /**
     * @brief Copy out the next size bytes
     */
    std::vector<uint8_t> ReadBlock(size_t size);

    size_t Remaining() const { return size_ - pos_; }
    bool AtEnd() const { return pos_ == size_; }
    bool Overrun() const { return overrun_; }

private:
    bool Take(size_t size);

    const uint8_t* data_ = nullptr;
    size_t size_ = 0;
    size_t pos_ = 0;
    bool overrun_ = false;
};

// ============================================================================
// Template Implementations
// ============================================================================

template<typename T>
void ByteWriter::Write(T value) {
    static_assert(std::is_arithmetic<T>::value, "Write requires an arithmetic type");
    using Bits = typename detail::UIntOfSize<sizeof(T)>::Type;

    Bits bits;
    std::memcpy(&bits, &value, sizeof(T));

    uint8_t bytes[sizeof(T)];
    for (size_t i = 0; i < sizeof(T); ++i) {
        bytes[i] = static_cast<uint8_t>((bits >> (8 * i)) & 0xFFu);
    }
    WriteBytes(bytes, sizeof(T));
}

template<typename T>
T ByteReader::Read() {
    static_assert(std::is_arithmetic<T>::value, "Read requires an arithmetic type");
    using Bits = typename detail::UIntOfSize<sizeof(T)>::Type;

    Bits bits = 0;
    if (Take(sizeof(T))) {
        const uint8_t* bytes = data_ + pos_ - sizeof(T);
        for (size_t i = 0; i < sizeof(T); ++i) {
            bits = static_cast<Bits>(bits | (static_cast<Bits>(bytes[i]) << (8 * i)));
        }
    }

    T value;
    std::memcpy(&value, &bits, sizeof(T));
    return value;
}

} // namespace Mi::Probe::Platform
