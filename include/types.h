#pragma once
/**
 * @file types.h
 * @brief Common type definitions for the overlay OCR pipeline
 */

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace overlay_ocr {

/**
 * @brief Pixel layout declared by the capture backend
 */
enum class PixelFormat {
    BGRA,
    RGBA,
    BGRx,
    RGBx,
    Other   ///< Anything else; the backend name is kept in FrameFormat::formatName
};

inline const char* pixelFormatName(PixelFormat format) {
    switch (format) {
        case PixelFormat::BGRA: return "BGRA";
        case PixelFormat::RGBA: return "RGBA";
        case PixelFormat::BGRx: return "BGRx";
        case PixelFormat::RGBx: return "RGBx";
        case PixelFormat::Other: return "Other";
    }
    return "Other";
}

/**
 * @brief Frame metadata negotiated with the capture backend
 */
struct FrameFormat {
    uint32_t width = 0;                         ///< Frame width in pixels
    uint32_t height = 0;                        ///< Frame height in pixels
    PixelFormat format = PixelFormat::BGRA;     ///< Declared pixel layout
    std::string formatName;                     ///< Backend format name (set for Other)

    /// Bytes required for a packed 4-byte-per-pixel frame of this size
    size_t requiredBytes() const {
        return static_cast<size_t>(width) * static_cast<size_t>(height) * 4;
    }

    std::string describe() const {
        return formatName.empty() ? std::string(pixelFormatName(format)) : formatName;
    }
};

/**
 * @brief Raw frame bytes plus the format they were published with
 */
struct RawFrame {
    std::vector<uint8_t> data;
    FrameFormat format;
};

/**
 * @brief 8-bit RGBA color
 */
struct Rgba8 {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;

    bool operator==(const Rgba8& o) const {
        return r == o.r && g == o.g && b == o.b && a == o.a;
    }
    bool operator!=(const Rgba8& o) const { return !(*this == o); }
};

/**
 * @brief Packed RGBA image (row-major, 4 bytes per pixel, no padding)
 */
struct RgbaImage {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> pixels;

    bool empty() const { return width == 0 || height == 0 || pixels.empty(); }

    Rgba8 pixel(uint32_t x, uint32_t y) const {
        const size_t i = (static_cast<size_t>(y) * width + x) * 4;
        return Rgba8{pixels[i], pixels[i + 1], pixels[i + 2], pixels[i + 3]};
    }
};

/**
 * @brief Unsigned 2D vector (pixel offsets, sizes, resolutions)
 */
struct UVec2 {
    uint32_t x = 0;
    uint32_t y = 0;

    bool operator==(const UVec2& o) const { return x == o.x && y == o.y; }
};

/**
 * @brief Integer pixel rectangle in frame coordinates
 */
struct PixelRect {
    uint32_t x = 0;   ///< Top-left X coordinate
    uint32_t y = 0;   ///< Top-left Y coordinate
    uint32_t w = 0;   ///< Width in pixels
    uint32_t h = 0;   ///< Height in pixels

    bool empty() const { return w == 0 || h == 0; }
};

/**
 * @brief Axis-aligned bounding box with float corners
 */
struct Aabb {
    float minX = 0.0f;
    float minY = 0.0f;
    float maxX = 0.0f;
    float maxY = 0.0f;

    float width() const { return maxX - minX; }
    float height() const { return maxY - minY; }
    float centerX() const { return (minX + maxX) * 0.5f; }
    float centerY() const { return (minY + maxY) * 0.5f; }

    Aabb merged(const Aabb& o) const {
        return Aabb{(std::min)(minX, o.minX), (std::min)(minY, o.minY),
                    (std::max)(maxX, o.maxX), (std::max)(maxY, o.maxY)};
    }

    Aabb translated(float dx, float dy) const {
        return Aabb{minX + dx, minY + dy, maxX + dx, maxY + dy};
    }

    static Aabb fromRect(const PixelRect& r) {
        return Aabb{static_cast<float>(r.x), static_cast<float>(r.y),
                    static_cast<float>(r.x + r.w), static_cast<float>(r.y + r.h)};
    }
};

/**
 * @brief One recognized word in image pixel space
 */
struct Word {
    std::string text;
    Aabb bounds;
};

/**
 * @brief One recognized line; words are [wordBegin, wordEnd) of OcrResults::words
 */
struct Line {
    Aabb bounds;
    size_t wordBegin = 0;
    size_t wordEnd = 0;

    size_t wordCount() const { return wordEnd - wordBegin; }
};

/**
 * @brief One clustered column of words (a semantic text entry)
 */
struct Item {
    std::string name;
    Aabb bounds;
};

enum class CoordinateSpace {
    Image,    ///< Captured frame pixels, origin top-left, y down
    Screen    ///< Consumer display/world space
};

/**
 * @brief Output of one completed OCR cycle
 */
struct OcrResults {
    Aabb detectBounds;                      ///< Region handed to the engine
    std::vector<Word> words;
    std::vector<Line> lines;
    std::vector<Item> items;
    CoordinateSpace space = CoordinateSpace::Image;
};

/**
 * @brief Failure and skip reasons of the capture-to-text pipeline
 */
enum class ErrorKind {
    NoFrame,
    NoLayoutMatch,
    DegenerateCrop,
    EngineFailure,
    UnsupportedPixelFormat
};

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NoFrame: return "NoFrame";
        case ErrorKind::NoLayoutMatch: return "NoLayoutMatch";
        case ErrorKind::DegenerateCrop: return "DegenerateCrop";
        case ErrorKind::EngineFailure: return "EngineFailure";
        case ErrorKind::UnsupportedPixelFormat: return "UnsupportedPixelFormat";
    }
    return "Unknown";
}

} // namespace overlay_ocr
