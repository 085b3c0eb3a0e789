/**
 * @file test_checksum.cpp
 * @brief Unit tests for Platform/Checksum.h
 */

#include <MiProbe/Platform/Checksum.h>
#include <gtest/gtest.h>

#include <cstring>
#include <string>
#include <vector>

using namespace Mi::Probe::Platform;

// ============================================================================
// CRC-32 Tests
// ============================================================================

TEST(ChecksumTest, Crc32CheckValue) {
    const char* text = "123456789";
    EXPECT_EQ(Crc32(text, std::strlen(text)), 0xCBF43926u);
}

TEST(ChecksumTest, Crc32Empty) {
    EXPECT_EQ(Crc32(nullptr, 0), 0u);
    EXPECT_EQ(Crc32(std::vector<uint8_t>()), 0u);
}

TEST(ChecksumTest, Crc32Incremental) {
    const char* text = "123456789";
    uint32_t crc = Crc32(text, 4);
    crc = Crc32(text + 4, 5, crc);
    EXPECT_EQ(crc, 0xCBF43926u);
}

TEST(ChecksumTest, Crc32DetectsSingleBitFlip) {
    std::vector<uint8_t> data(256);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<uint8_t>(i);
    }
    uint32_t original = Crc32(data);
    data[100] ^= 0x01;
    EXPECT_NE(Crc32(data), original);
}

// ============================================================================
// XOR Checksum Tests
// ============================================================================

TEST(ChecksumTest, XorChecksumKnownFrames) {
    EXPECT_EQ(XorChecksum("SEL,7"), 0x41);
    EXPECT_EQ(XorChecksum("VAL,10.4,V"), 0x16);
    EXPECT_EQ(XorChecksum("ERR,E02"), 0x2E);
}

TEST(ChecksumTest, XorChecksumEmpty) {
    EXPECT_EQ(XorChecksum(""), 0);
}
