#pragma once
/**
 * @file config_loader.h
 * @brief Configuration file loading utilities
 */

#include "types.h"
#include "detection/layout_selector.h"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace overlay_ocr {

/**
 * @brief Full overlay configuration (config/overlay_config.json)
 */
struct OverlayConfig {
    bool overlay = true;                    ///< Draw the item board at all
    std::string overlayKey = "I";           ///< Key that toggles the overlay
    float closeLayoutAfter = 14.5f;         ///< Seconds before the item board clears
    uint32_t maxDisplayedItems = 4;         ///< Items shown per OCR pass
    float gapThreshold = 15.0f;             ///< Column split gap in pixels
    bool saveToDisk = false;                ///< Save every triggered capture as PNG
    std::string saveDirectory = "images";
    std::string logLevel = "info";

    std::string detectionModel = "models/text_detection_db.onnx";
    std::string recognitionModel = "models/text_recognition_crnn.onnx";
    std::string vocabulary = "models/vocabulary.txt";

    uint32_t tickHz = 60;                   ///< Consumer loop rate
    std::vector<LayoutOption> layouts;      ///< Tried in order; first match wins

    /// Configuration with the built-in 16:9 layout
    static OverlayConfig defaults();
};

/**
 * @brief Built-in 1920x1080 layout option
 */
LayoutOption defaultLayoutOption();

/**
 * @brief Parse "W:H"
 */
bool parseAspectRatio(const std::string& text, std::array<uint32_t, 2>& ratio, std::string& errorMessage);
std::string formatAspectRatio(const std::array<uint32_t, 2>& ratio);

/**
 * @brief Parse "#rgb", "#rgba", "#rrggbb" or "#rrggbbaa" (leading '#' optional)
 */
bool parseHexColor(const std::string& text, Rgba8& color, std::string& errorMessage);

/**
 * @brief "#RRGGBB", or "#RRGGBBAA" when alpha is not 255
 */
std::string formatHexColor(const Rgba8& color);

/**
 * @brief Parse "x,y,#hexcolor,tolerance"
 *
 * tolerance is a Euclidean RGB distance in 0-255 channel units, so a
 * tolerance authored against normalized 0-1 colors must be scaled by 255.
 */
bool parsePixelCheck(const std::string& text, PixelCheck& check, std::string& errorMessage);
std::string formatPixelCheck(const PixelCheck& check);

/**
 * @brief Load the overlay configuration
 *
 * A missing file is created with defaults. A file that fails to parse is
 * renamed to "<stem>.bak.json" and recreated with defaults; if that backup
 * already exists the load fails and the file is left untouched.
 *
 * @param path Path to the JSON config
 * @param config Filled on success
 * @param errorMessage Populated on failure
 * @return true if config holds a usable configuration
 */
bool loadOverlayConfig(const std::string& path, OverlayConfig& config, std::string& errorMessage);

/**
 * @brief Write the configuration to disk
 *
 * Top-level keys already in the file that are not part of OverlayConfig
 * are preserved.
 */
bool saveOverlayConfig(const std::string& path, const OverlayConfig& config, std::string& errorMessage);

/**
 * @brief Path of the backup written for an invalid config file
 */
std::string backupConfigPath(const std::string& path);

} // namespace overlay_ocr
