#pragma once

/**
 * @file BoardImage.h
 * @brief Owned 8-bit raster of the board photograph
 */

#include <MiProbe/Core/Export.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace Mi::Probe {

/**
 * @brief Board photograph held by a Project
 *
 * Key features:
 * - Tightly packed rows (stride == width * channels)
 * - 1 (gray), 3 (RGB) or 4 (RGBA) channels of UInt8
 * - Deep copy semantics, movable
 *
 * The workflow only uses the pixel dimensions (point bounds validation);
 * pixels are carried through to persistence untouched.
 */
class MIPROBE_API BoardImage {
public:
    /// Default constructor (empty image)
    BoardImage() = default;

    /// Create zero-filled image
    BoardImage(int32_t width, int32_t height, int32_t channels = 3);

    /// Create from packed pixel data (copies data)
    static BoardImage FromData(const void* data, int32_t width, int32_t height,
                               int32_t channels);

    int32_t Width() const { return width_; }
    int32_t Height() const { return height_; }
    int32_t Channels() const { return channels_; }
    size_t Stride() const { return static_cast<size_t>(width_) * channels_; }

    bool Empty() const { return width_ == 0 || height_ == 0; }

    /// Check pixel coordinate lies inside [0, width) x [0, height)
    bool Contains(int32_t x, int32_t y) const {
        return x >= 0 && y >= 0 && x < width_ && y < height_;
    }

    uint8_t* Data() { return pixels_.data(); }
    const uint8_t* Data() const { return pixels_.data(); }
    const std::vector<uint8_t>& Pixels() const { return pixels_; }

    uint8_t* RowPtr(int32_t row) { return pixels_.data() + row * Stride(); }
    const uint8_t* RowPtr(int32_t row) const { return pixels_.data() + row * Stride(); }

    bool operator==(const BoardImage& other) const {
        return width_ == other.width_ && height_ == other.height_ &&
               channels_ == other.channels_ && pixels_ == other.pixels_;
    }
    bool operator!=(const BoardImage& other) const { return !(*this == other); }

private:
    int32_t width_ = 0;
    int32_t height_ = 0;
    int32_t channels_ = 0;
    std::vector<uint8_t> pixels_;
};

} // namespace Mi::Probe
