#pragma once
/**
 * @file image_io.h
 * @brief Reading test captures and writing diagnostic screenshots
 */

#include "types.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace overlay_ocr {

/**
 * @brief Decode an image file into packed BGRA bytes
 * @param path Any format OpenCV can read
 * @param bytes Output, width * height * 4 bytes
 * @param format Output, BGRA with the decoded size
 * @param errorMessage Populated on failure
 * @return true on success
 */
bool loadImageAsBgraFrame(const std::string& path, std::vector<uint8_t>& bytes,
                          FrameFormat& format, std::string& errorMessage);

/**
 * @brief Screenshot file name for a point in time: "2026-10-17_12_30_45Z.png" (UTC)
 */
std::string makeCaptureFilename(std::chrono::system_clock::time_point when);

/**
 * @brief Save an RGBA frame as PNG under directory, named by the current UTC time
 * @param writtenPath Output, path of the written file
 * @return true on success
 */
bool saveCaptureImage(const RgbaImage& image, const std::string& directory,
                      std::string& writtenPath, std::string& errorMessage);

} // namespace overlay_ocr
