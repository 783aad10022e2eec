#pragma once
/**
 * @file format_converter.h
 * @brief Normalization of captured frame bytes to packed RGBA
 */

#include "types.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace overlay_ocr {

/**
 * @brief Swap BGRA pixels to RGBA in place
 *
 * Each pixel is read as a big-endian 32-bit word, byte-swapped and rotated
 * left by 8 bits, then written back big-endian. Alpha is preserved.
 *
 * @param data Pixel bytes (at least pixelCount * 4)
 * @param pixelCount Number of pixels to convert
 */
void bgraToRgbaInPlace(uint8_t* data, size_t pixelCount);

/**
 * @brief Convert raw frame bytes to an RGBA image
 *
 * BGRA/BGRx are swizzled, RGBA/RGBx pass through untouched. Other formats
 * are logged once per format name and dropped.
 *
 * @param bytes Frame bytes, consumed
 * @param format Declared frame format
 * @return RGBA image, or nullopt if the format is unsupported or the buffer
 *         is shorter than width * height * 4
 */
std::optional<RgbaImage> normalizeToRgba(std::vector<uint8_t>&& bytes, const FrameFormat& format);

} // namespace overlay_ocr
