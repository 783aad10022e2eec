/**
 * @file layout_selector.cpp
 * @brief Matching captured frames to configured screen layouts
 */

#include "detection/layout_selector.h"

#include <algorithm>
#include <cmath>

namespace overlay_ocr {

float colorDistance(const Rgba8& a, const Rgba8& b) {
    const float dr = static_cast<float>(a.r) - static_cast<float>(b.r);
    const float dg = static_cast<float>(a.g) - static_cast<float>(b.g);
    const float db = static_cast<float>(a.b) - static_cast<float>(b.b);
    return std::sqrt(dr * dr + dg * dg + db * db);
}

bool PixelCheck::matchesPixel(const Rgba8& pixel) const {
    if (tolerance == 0.0f) {
        return color == pixel;
    }
    return colorDistance(color, pixel) <= tolerance;
}

PixelRect Layout::ocrBounds(uint32_t frameWidth, uint32_t frameHeight) const {
    const uint32_t fx = referenceResolution.x ? frameWidth / referenceResolution.x : 0;
    const uint32_t fy = referenceResolution.y ? frameHeight / referenceResolution.y : 0;

    // Scaled in 64 bits, then clipped so x + w and y + h stay within the frame.
    const uint64_t x = (std::min)(static_cast<uint64_t>(offset.x) * fx, static_cast<uint64_t>(frameWidth));
    const uint64_t y = (std::min)(static_cast<uint64_t>(offset.y) * fy, static_cast<uint64_t>(frameHeight));
    const uint64_t w = (std::min)(static_cast<uint64_t>(size.x) * fx, frameWidth - x);
    const uint64_t h = (std::min)(static_cast<uint64_t>(size.y) * fy, frameHeight - y);

    PixelRect r;
    r.x = static_cast<uint32_t>(x);
    r.y = static_cast<uint32_t>(y);
    r.w = static_cast<uint32_t>(w);
    r.h = static_cast<uint32_t>(h);
    return r;
}

bool LayoutOption::aspectRatioMatches(uint32_t width, uint32_t height) const {
    // Cross-multiplied in 64 bits.
    return static_cast<uint64_t>(aspectRatio[0]) * height ==
           static_cast<uint64_t>(aspectRatio[1]) * width;
}

bool LayoutOption::verifyPixelChecks(const RgbaImage& image) const {
    return std::all_of(pixelChecks.begin(), pixelChecks.end(), [&](const PixelCheck& check) {
        if (check.x >= image.width || check.y >= image.height) {
            return false;
        }
        return check.matchesPixel(image.pixel(check.x, check.y));
    });
}

bool LayoutOption::matches(const RgbaImage& image) const {
    return aspectRatioMatches(image.width, image.height) && verifyPixelChecks(image);
}

const Layout* selectLayout(const RgbaImage& image, const std::vector<LayoutOption>& options) {
    for (const auto& option : options) {
        if (option.matches(image)) {
            return &option.layout;
        }
    }
    return nullptr;
}

std::vector<const LayoutOption*> selectAllLayouts(const RgbaImage& image,
                                                  const std::vector<LayoutOption>& options) {
    std::vector<const LayoutOption*> out;
    for (const auto& option : options) {
        if (option.matches(image)) {
            out.push_back(&option);
        }
    }
    return out;
}

} // namespace overlay_ocr
