#include <MiProbe/IO/ImageStore.h>
#include <MiProbe/Core/Exception.h>
#include <MiProbe/Platform/FileIO.h>

#include <climits>
#include <cstring>
#include <memory>

// stb_image for raster decode/encode
#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb/stb_image.h>
#include <stb/stb_image_write.h>

namespace Mi::Probe::IO {

namespace {

void AppendToVector(void* context, void* data, int size) {
    auto* out = static_cast<std::vector<uint8_t>*>(context);
    const uint8_t* bytes = static_cast<const uint8_t*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

struct StbiDeleter {
    void operator()(stbi_uc* pixels) const { stbi_image_free(pixels); }
};

/// Pixels returned by stbi_load_*; released on every exit path
using PixelBuffer = std::unique_ptr<stbi_uc, StbiDeleter>;

} // anonymous namespace

BoardImage DecodeImage(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        throw IOException("DecodeImage: no image data");
    }
    if (bytes.size() > static_cast<size_t>(INT_MAX)) {
        throw IOException("DecodeImage: image data too large");
    }

    int w = 0, h = 0, channels = 0;
    PixelBuffer data(stbi_load_from_memory(bytes.data(), static_cast<int>(bytes.size()),
                                           &w, &h, &channels, 0));
    if (!data) {
        throw IOException(std::string("DecodeImage: ") + stbi_failure_reason());
    }

    // Gray+alpha has no BoardImage layout; reload as RGBA
    if (channels == 2) {
        data.reset(stbi_load_from_memory(bytes.data(), static_cast<int>(bytes.size()),
                                         &w, &h, &channels, 4));
        if (!data) {
            throw IOException(std::string("DecodeImage: ") + stbi_failure_reason());
        }
        channels = 4;
    }

    try {
        return BoardImage::FromData(data.get(), w, h, channels);
    } catch (const Exception&) {
        throw IOException("DecodeImage: unsupported channel count: " +
                          std::to_string(channels));
    }
}

std::vector<uint8_t> EncodePng(const BoardImage& image) {
    if (image.Empty()) {
        throw InvalidArgumentException("EncodePng: image is empty");
    }

    std::vector<uint8_t> out;
    int ok = stbi_write_png_to_func(AppendToVector, &out,
                                    image.Width(), image.Height(), image.Channels(),
                                    image.Data(), static_cast<int>(image.Stride()));
    if (!ok || out.empty()) {
        throw IOException("EncodePng: PNG encoding failed");
    }
    return out;
}

BoardImage ReadImageFile(const std::string& path) {
    std::vector<uint8_t> bytes;
    if (!Platform::ReadBinaryFile(path, bytes)) {
        throw IOException("Failed to read image: " + path);
    }
    return DecodeImage(bytes);
}

void WriteImagePng(const BoardImage& image, const std::string& path) {
    std::vector<uint8_t> png = EncodePng(image);
    if (!Platform::WriteBinaryFile(path, png)) {
        throw IOException("Failed to write image: " + path);
    }
}

} // namespace Mi::Probe::IO
