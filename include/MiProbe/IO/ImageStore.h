#pragma once

/**
 * @file ImageStore.h
 * @brief Board photograph decode/encode
 *
 * Supported input formats: whatever stb_image decodes (PNG, JPEG, BMP, TGA,
 * PSD, GIF, HDR, PIC, PNM). Output is always PNG (lossless).
 * Supported channels: Gray, RGB, RGBA (gray+alpha is expanded to RGBA).
 */

#include <MiProbe/Core/Export.h>
#include <MiProbe/IO/BoardImage.h>

#include <cstdint>
#include <string>
#include <vector>

namespace Mi::Probe::IO {

/**
 * @brief Decode an encoded raster held in memory
 *
 * @param bytes Encoded image (PNG, JPEG, ...)
 * @return Decoded image
 * @throws IOException if bytes are not a decodable image
 */
MIPROBE_API BoardImage DecodeImage(const std::vector<uint8_t>& bytes);

/**
 * @brief Encode image as PNG
 *
 * @param image Non-empty image
 * @return PNG bytes
 * @throws InvalidArgumentException if image is empty
 * @throws IOException if encoding fails
 */
MIPROBE_API std::vector<uint8_t> EncodePng(const BoardImage& image);

/**
 * @brief Read and decode an image file
 * @throws IOException if the file cannot be read or decoded
 */
MIPROBE_API BoardImage ReadImageFile(const std::string& path);

/**
 * @brief Encode image as PNG and write it to path
 * @throws IOException on failure
 */
MIPROBE_API void WriteImagePng(const BoardImage& image, const std::string& path);

} // namespace Mi::Probe::IO
