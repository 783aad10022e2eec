/**
 * @file format_converter.cpp
 * @brief Normalization of captured frame bytes to packed RGBA
 */

#include "processing/format_converter.h"
#include "utils/logger.h"

#include <utility>

namespace overlay_ocr {

namespace {

inline uint32_t loadBigEndian(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) |
           static_cast<uint32_t>(p[3]);
}

inline void storeBigEndian(uint8_t* p, uint32_t v) {
    p[0] = static_cast<uint8_t>(v >> 24);
    p[1] = static_cast<uint8_t>(v >> 16);
    p[2] = static_cast<uint8_t>(v >> 8);
    p[3] = static_cast<uint8_t>(v);
}

inline uint32_t byteSwap32(uint32_t v) {
    return ((v & 0x000000FFu) << 24) |
           ((v & 0x0000FF00u) << 8) |
           ((v & 0x00FF0000u) >> 8) |
           ((v & 0xFF000000u) >> 24);
}

inline uint32_t rotateLeft32(uint32_t v, unsigned n) {
    return (v << n) | (v >> (32u - n));
}

} // namespace

void bgraToRgbaInPlace(uint8_t* data, size_t pixelCount) {
    for (size_t i = 0; i < pixelCount; i++) {
        uint8_t* p = data + i * 4;
        const uint32_t bgra = loadBigEndian(p);
        const uint32_t argb = byteSwap32(bgra);
        storeBigEndian(p, rotateLeft32(argb, 8));
    }
}

std::optional<RgbaImage> normalizeToRgba(std::vector<uint8_t>&& bytes, const FrameFormat& format) {
    if (format.format == PixelFormat::Other) {
        logErrorOnce("pixel-format:" + format.describe(),
                     "Unknown capture image format " + format.describe());
        return std::nullopt;
    }

    const size_t required = format.requiredBytes();
    if (required == 0 || bytes.size() < required) {
        return std::nullopt;
    }

    RgbaImage image;
    image.width = format.width;
    image.height = format.height;
    image.pixels = std::move(bytes);
    image.pixels.resize(required);

    switch (format.format) {
        case PixelFormat::BGRA:
        case PixelFormat::BGRx:
            bgraToRgbaInPlace(image.pixels.data(), required / 4);
            break;
        case PixelFormat::RGBA:
        case PixelFormat::RGBx:
        case PixelFormat::Other:
            break;
    }
    return image;
}

} // namespace overlay_ocr
