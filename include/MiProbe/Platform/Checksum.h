#pragma once

/**
 * @file Checksum.h
 * @brief Integrity checksums
 *
 * Provides:
 * - CRC-32 (IEEE 802.3, reflected, poly 0xEDB88320) for container entries
 * - 8-bit XOR checksum for serial frames
 */

#include <MiProbe/Core/Export.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Mi::Probe::Platform {

/**
 * @brief Compute CRC-32 of a byte range
 * @param crc Previous value when computing incrementally (0 to start)
 *
 * Crc32("123456789") == 0xCBF43926
 */
MIPROBE_API uint32_t Crc32(const void* data, size_t size, uint32_t crc = 0);

inline uint32_t Crc32(const std::vector<uint8_t>& data) {
    return Crc32(data.data(), data.size());
}

/**
 * @brief XOR of all bytes in the string
 */
inline uint8_t XorChecksum(const std::string& text) {
    uint8_t sum = 0;
    for (char c : text) {
        sum ^= static_cast<uint8_t>(c);
    }
    return sum;
}

} // namespace Mi::Probe::Platform
