#pragma once
/**
 * @file preprocess.h
 * @brief Image preprocessing for small, low-contrast overlay text
 */

#include "types.h"

#include <opencv2/core.hpp>

namespace overlay_ocr {

/**
 * @brief Parameters of the fixed preprocessing sequence
 *
 * Sequence: unsharpen -> contrast -> blur -> unsharpen -> invert ->
 * brighten -> contrast.
 */
struct PreprocessParams {
    float firstUnsharpSigma = 20.0f;
    int firstUnsharpThreshold = 15;
    float firstContrast = 20.0f;
    double blurSigma = 1.0;
    float secondUnsharpSigma = 5.0f;
    int secondUnsharpThreshold = 15;
    int brightness = -30;
    float finalContrast = 20.0f;
};

/**
 * @brief Wrap an RGBA image in a CV_8UC4 header (no copy)
 *
 * The returned Mat aliases image.pixels and must not outlive it.
 */
cv::Mat wrapRgba(const RgbaImage& image);

/**
 * @brief Copy a rectangle out of an RGBA image, clamped to the image
 * @return CV_8UC4 crop; empty when the clamped rectangle has no area
 */
cv::Mat cropRgba(const RgbaImage& image, const PixelRect& bounds);

/**
 * @brief Threshold unsharp mask
 *
 * Every channel whose distance from the gaussian-blurred value exceeds
 * threshold is pushed away from it by that distance; others are unchanged.
 */
cv::Mat unsharpen(const cv::Mat& src, float sigma, int threshold);

/**
 * @brief Scale RGB around mid-grey by ((100 + contrast) / 100)^2; alpha kept
 */
void adjustContrast(cv::Mat& img, float contrast);

/**
 * @brief Add value to RGB with saturation; alpha kept
 */
void brighten(cv::Mat& img, int value);

/**
 * @brief Invert RGB; alpha kept
 */
void invertColors(cv::Mat& img);

/**
 * @brief Run the full preprocessing sequence on a CV_8UC4 image
 */
cv::Mat preprocessForOcr(const cv::Mat& rgba, const PreprocessParams& params = PreprocessParams{});

} // namespace overlay_ocr
