#pragma once
/**
 * @file layout_selector.h
 * @brief Matching captured frames to configured screen layouts
 */

#include "types.h"

#include <array>
#include <cstdint>
#include <vector>

namespace overlay_ocr {

/**
 * @brief Expected color at a pixel, used to tell layouts apart
 */
struct PixelCheck {
    uint32_t x = 0;
    uint32_t y = 0;
    Rgba8 color;
    float tolerance = 0.0f;     ///< Max Euclidean RGB distance in 0-255 channel units (not 0-1); 0 = exact

    /**
     * @brief Check if a pixel matches the expected color
     */
    bool matchesPixel(const Rgba8& pixel) const;
};

/**
 * @brief Euclidean distance between the RGB components of two colors
 */
float colorDistance(const Rgba8& a, const Rgba8& b);

/**
 * @brief Screen region that holds the text to recognize
 *
 * Offset and size are authored against referenceResolution and scaled to
 * the captured resolution by ocrBounds().
 */
struct Layout {
    UVec2 offset;
    UVec2 size;
    UVec2 referenceResolution;
    Rgba8 themeTextColor;
    uint32_t itemNameDistance = 0;  ///< Spacing between item names in reference pixels

    /**
     * @brief Region to OCR for a frame of the given size
     *
     * Each axis is scaled by the integer factor actual / reference and the
     * result is clipped to the frame. A frame smaller than the reference
     * resolution, or a region lying outside the frame, yields an empty
     * rectangle.
     */
    PixelRect ocrBounds(uint32_t frameWidth, uint32_t frameHeight) const;
};

/**
 * @brief A Layout plus the rules that select it
 */
struct LayoutOption {
    std::array<uint32_t, 2> aspectRatio{{16, 9}};
    std::vector<PixelCheck> pixelChecks;
    Layout layout;

    /// aspect[0] * height == aspect[1] * width
    bool aspectRatioMatches(uint32_t width, uint32_t height) const;

    /// Every check lies inside the frame and matches its pixel
    bool verifyPixelChecks(const RgbaImage& image) const;

    bool matches(const RgbaImage& image) const;
};

/**
 * @brief Layout of the first option matching the frame
 * @return Pointer into options, or nullptr when nothing matches
 */
const Layout* selectLayout(const RgbaImage& image, const std::vector<LayoutOption>& options);

/**
 * @brief Every option matching the frame, in configured order
 */
std::vector<const LayoutOption*> selectAllLayouts(const RgbaImage& image,
                                                  const std::vector<LayoutOption>& options);

} // namespace overlay_ocr
