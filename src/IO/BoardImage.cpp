#include <MiProbe/IO/BoardImage.h>
#include <MiProbe/Core/Exception.h>

#include <cstring>

namespace Mi::Probe {

BoardImage::BoardImage(int32_t width, int32_t height, int32_t channels) {
    if (width <= 0 || height <= 0) {
        throw InvalidArgumentException("Image dimensions must be positive");
    }
    if (channels != 1 && channels != 3 && channels != 4) {
        throw InvalidArgumentException("Unsupported channel count: " +
                                       std::to_string(channels));
    }

    width_ = width;
    height_ = height;
    channels_ = channels;
    pixels_.assign(Stride() * static_cast<size_t>(height), 0);
}

BoardImage BoardImage::FromData(const void* data, int32_t width, int32_t height,
                                int32_t channels) {
    BoardImage img(width, height, channels);
    std::memcpy(img.pixels_.data(), data, img.pixels_.size());
    return img;
}

} // namespace Mi::Probe
