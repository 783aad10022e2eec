/**
 * @file config_loader.cpp
 * @brief Configuration file loading
 */

#include "utils/config_loader.h"
#include "utils/logger.h"

#include <nlohmann/json.hpp>

#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace overlay_ocr {

using json = nlohmann::json;

namespace {

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) begin++;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    return s.substr(begin, end - begin);
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : s) {
        if (c == sep) {
            parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(current);
    return parts;
}

bool parseUint(const std::string& text, uint32_t& value) {
    if (text.empty() || text.size() > 10) {
        return false;
    }
    uint64_t v = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
        v = v * 10 + static_cast<uint64_t>(c - '0');
    }
    if (v > std::numeric_limits<uint32_t>::max()) {
        return false;
    }
    value = static_cast<uint32_t>(v);
    return true;
}

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Throwing readers used while decoding a config document. Absent keys keep
// the current value; present keys of the wrong type are an error.

void readBool(const json& obj, const char* key, bool& out) {
    if (!obj.contains(key)) return;
    const json& v = obj.at(key);
    if (!v.is_boolean()) {
        throw std::runtime_error(std::string("'") + key + "' must be a boolean");
    }
    out = v.get<bool>();
}

bool isUint32(const json& v) {
    return v.is_number_unsigned() && v.get<uint64_t>() <= std::numeric_limits<uint32_t>::max();
}

void readUint(const json& obj, const char* key, uint32_t& out) {
    if (!obj.contains(key)) return;
    const json& v = obj.at(key);
    if (!isUint32(v)) {
        throw std::runtime_error(std::string("'") + key + "' must be a non-negative integer");
    }
    out = v.get<uint32_t>();
}

void readFloat(const json& obj, const char* key, float& out) {
    if (!obj.contains(key)) return;
    const json& v = obj.at(key);
    if (!v.is_number()) {
        throw std::runtime_error(std::string("'") + key + "' must be a number");
    }
    out = v.get<float>();
}

void readString(const json& obj, const char* key, std::string& out) {
    if (!obj.contains(key)) return;
    const json& v = obj.at(key);
    if (!v.is_string()) {
        throw std::runtime_error(std::string("'") + key + "' must be a string");
    }
    out = v.get<std::string>();
}

UVec2 uvec2FromJson(const json& obj, const char* key) {
    if (!obj.contains(key)) {
        throw std::runtime_error(std::string("layout is missing '") + key + "'");
    }
    const json& v = obj.at(key);
    if (!v.is_array() || v.size() != 2 || !isUint32(v[0]) || !isUint32(v[1])) {
        throw std::runtime_error(std::string("'") + key + "' must be an [x, y] pair of non-negative integers");
    }
    return UVec2{v[0].get<uint32_t>(), v[1].get<uint32_t>()};
}

json uvec2ToJson(const UVec2& v) {
    return json::array({v.x, v.y});
}

LayoutOption layoutOptionFromJson(const json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("layout entries must be objects");
    }

    LayoutOption option;
    std::string error;

    std::string aspect;
    readString(j, "aspect_ratio", aspect);
    if (aspect.empty()) {
        throw std::runtime_error("layout is missing 'aspect_ratio'");
    }
    if (!parseAspectRatio(aspect, option.aspectRatio, error)) {
        throw std::runtime_error(error);
    }

    if (j.contains("pixel_checks")) {
        const json& checks = j.at("pixel_checks");
        if (!checks.is_array()) {
            throw std::runtime_error("'pixel_checks' must be an array of strings");
        }
        for (const auto& c : checks) {
            if (!c.is_string()) {
                throw std::runtime_error("'pixel_checks' must be an array of strings");
            }
            PixelCheck check;
            if (!parsePixelCheck(c.get<std::string>(), check, error)) {
                throw std::runtime_error(error);
            }
            option.pixelChecks.push_back(check);
        }
    }

    Layout& layout = option.layout;
    layout.offset = uvec2FromJson(j, "offset");
    layout.size = uvec2FromJson(j, "size");
    layout.referenceResolution = uvec2FromJson(j, "reference_resolution");

    std::string color;
    readString(j, "theme_text_color", color);
    if (!color.empty() && !parseHexColor(color, layout.themeTextColor, error)) {
        throw std::runtime_error(error);
    }
    readUint(j, "item_name_distance", layout.itemNameDistance);

    return option;
}

json layoutOptionToJson(const LayoutOption& option) {
    json j;
    j["aspect_ratio"] = formatAspectRatio(option.aspectRatio);
    json checks = json::array();
    for (const auto& check : option.pixelChecks) {
        checks.push_back(formatPixelCheck(check));
    }
    j["pixel_checks"] = checks;
    j["offset"] = uvec2ToJson(option.layout.offset);
    j["size"] = uvec2ToJson(option.layout.size);
    j["reference_resolution"] = uvec2ToJson(option.layout.referenceResolution);
    j["theme_text_color"] = formatHexColor(option.layout.themeTextColor);
    j["item_name_distance"] = option.layout.itemNameDistance;
    return j;
}

OverlayConfig configFromJson(const json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("top level must be an object");
    }

    OverlayConfig config = OverlayConfig::defaults();
    readBool(j, "overlay", config.overlay);
    readString(j, "overlay_key", config.overlayKey);
    readFloat(j, "close_layout_after", config.closeLayoutAfter);
    readUint(j, "max_displayed_items", config.maxDisplayedItems);
    readFloat(j, "gap_threshold", config.gapThreshold);
    readBool(j, "save_to_disk", config.saveToDisk);
    readString(j, "save_directory", config.saveDirectory);
    readString(j, "log_level", config.logLevel);
    readString(j, "detection_model", config.detectionModel);
    readString(j, "recognition_model", config.recognitionModel);
    readString(j, "vocabulary", config.vocabulary);
    readUint(j, "tick_hz", config.tickHz);

    if (config.closeLayoutAfter < 0.0f || !std::isfinite(config.closeLayoutAfter)) {
        throw std::runtime_error("'close_layout_after' must be a non-negative number of seconds");
    }
    if (config.gapThreshold < 0.0f || !std::isfinite(config.gapThreshold)) {
        throw std::runtime_error("'gap_threshold' must be non-negative");
    }
    if (config.tickHz == 0) {
        throw std::runtime_error("'tick_hz' must be positive");
    }
    LogLevel level;
    if (!parseLogLevel(config.logLevel, level)) {
        throw std::runtime_error("unknown 'log_level': " + config.logLevel);
    }

    if (j.contains("layouts")) {
        const json& layouts = j.at("layouts");
        if (!layouts.is_array()) {
            throw std::runtime_error("'layouts' must be an array");
        }
        config.layouts.clear();
        for (const auto& entry : layouts) {
            config.layouts.push_back(layoutOptionFromJson(entry));
        }
    }

    return config;
}

void configToJson(const OverlayConfig& config, json& j) {
    j["overlay"] = config.overlay;
    j["overlay_key"] = config.overlayKey;
    j["close_layout_after"] = config.closeLayoutAfter;
    j["max_displayed_items"] = config.maxDisplayedItems;
    j["gap_threshold"] = config.gapThreshold;
    j["save_to_disk"] = config.saveToDisk;
    j["save_directory"] = config.saveDirectory;
    j["log_level"] = config.logLevel;
    j["detection_model"] = config.detectionModel;
    j["recognition_model"] = config.recognitionModel;
    j["vocabulary"] = config.vocabulary;
    j["tick_hz"] = config.tickHz;

    json layouts = json::array();
    for (const auto& option : config.layouts) {
        layouts.push_back(layoutOptionToJson(option));
    }
    j["layouts"] = layouts;
}

bool writeJson(const std::string& path, const json& doc, std::string& errorMessage) {
    try {
        std::filesystem::path p(path);
        if (p.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(p.parent_path(), ec);
        }

        std::ofstream out(path, std::ios::trunc);
        if (!out.good()) {
            errorMessage = "Cannot open config for writing: " + path;
            return false;
        }
        out << doc.dump(2) << std::endl;
    } catch (const std::exception& e) {
        errorMessage = std::string("Error writing config: ") + e.what();
        return false;
    }
    return true;
}

} // anonymous namespace

LayoutOption defaultLayoutOption() {
    LayoutOption option;
    option.aspectRatio = {{16, 9}};
    option.layout.offset = UVec2{478, 411};
    option.layout.size = UVec2{965, 49};
    option.layout.referenceResolution = UVec2{1920, 1080};
    option.layout.themeTextColor = Rgba8{0xbe, 0xa9, 0x66, 0xff};
    option.layout.itemNameDistance = 90;
    return option;
}

OverlayConfig OverlayConfig::defaults() {
    OverlayConfig config;
    config.layouts.push_back(defaultLayoutOption());
    return config;
}

bool parseAspectRatio(const std::string& text, std::array<uint32_t, 2>& ratio, std::string& errorMessage) {
    const auto parts = split(text, ':');
    if (parts.size() != 2) {
        errorMessage = "Aspect ratio must be in format 'width:height', got: " + text;
        return false;
    }
    uint32_t w = 0;
    uint32_t h = 0;
    if (!parseUint(trim(parts[0]), w)) {
        errorMessage = "Invalid aspect ratio width: " + parts[0];
        return false;
    }
    if (!parseUint(trim(parts[1]), h)) {
        errorMessage = "Invalid aspect ratio height: " + parts[1];
        return false;
    }
    ratio = {{w, h}};
    return true;
}

std::string formatAspectRatio(const std::array<uint32_t, 2>& ratio) {
    return std::to_string(ratio[0]) + ":" + std::to_string(ratio[1]);
}

bool parseHexColor(const std::string& text, Rgba8& color, std::string& errorMessage) {
    std::string hex = trim(text);
    if (!hex.empty() && hex[0] == '#') {
        hex.erase(0, 1);
    }

    for (char c : hex) {
        if (hexDigit(c) < 0) {
            errorMessage = "Invalid hex color: " + text;
            return false;
        }
    }

    uint8_t channels[4] = {0, 0, 0, 255};
    if (hex.size() == 3 || hex.size() == 4) {
        for (size_t i = 0; i < hex.size(); i++) {
            const int d = hexDigit(hex[i]);
            channels[i] = static_cast<uint8_t>(d * 16 + d);
        }
    } else if (hex.size() == 6 || hex.size() == 8) {
        for (size_t i = 0; i < hex.size() / 2; i++) {
            channels[i] = static_cast<uint8_t>(hexDigit(hex[2 * i]) * 16 + hexDigit(hex[2 * i + 1]));
        }
    } else {
        errorMessage = "Invalid hex color length: " + text;
        return false;
    }

    color = Rgba8{channels[0], channels[1], channels[2], channels[3]};
    return true;
}

std::string formatHexColor(const Rgba8& color) {
    std::ostringstream oss;
    oss << '#' << std::uppercase << std::hex << std::setfill('0')
        << std::setw(2) << static_cast<int>(color.r)
        << std::setw(2) << static_cast<int>(color.g)
        << std::setw(2) << static_cast<int>(color.b);
    if (color.a != 255) {
        oss << std::setw(2) << static_cast<int>(color.a);
    }
    return oss.str();
}

bool parsePixelCheck(const std::string& text, PixelCheck& check, std::string& errorMessage) {
    const auto parts = split(text, ',');
    if (parts.size() != 4) {
        errorMessage = "PixelCheck format must be 'x,y,#hexcolor,tolerance', got: " + text;
        return false;
    }

    PixelCheck parsed;
    if (!parseUint(trim(parts[0]), parsed.x)) {
        errorMessage = "Invalid x coordinate: " + parts[0];
        return false;
    }
    if (!parseUint(trim(parts[1]), parsed.y)) {
        errorMessage = "Invalid y coordinate: " + parts[1];
        return false;
    }
    if (!parseHexColor(parts[2], parsed.color, errorMessage)) {
        return false;
    }

    const std::string tol = trim(parts[3]);
    try {
        size_t consumed = 0;
        parsed.tolerance = std::stof(tol, &consumed);
        if (consumed != tol.size()) {
            errorMessage = "Invalid tolerance: " + tol;
            return false;
        }
    } catch (const std::exception&) {
        errorMessage = "Invalid tolerance: " + tol;
        return false;
    }
    if (!std::isfinite(parsed.tolerance) || parsed.tolerance < 0.0f) {
        errorMessage = "Tolerance must be a non-negative number: " + tol;
        return false;
    }

    check = parsed;
    return true;
}

std::string formatPixelCheck(const PixelCheck& check) {
    std::ostringstream oss;
    oss << check.x << "," << check.y << "," << formatHexColor(check.color) << "," << check.tolerance;
    return oss.str();
}

std::string backupConfigPath(const std::string& path) {
    std::filesystem::path p(path);
    std::string ext = p.extension().string();
    if (ext.empty()) {
        ext = ".json";
    }
    return (p.parent_path() / (p.stem().string() + ".bak" + ext)).string();
}

bool loadOverlayConfig(const std::string& path, OverlayConfig& config, std::string& errorMessage) {
    errorMessage.clear();

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        logInfo("Config file " + path + " not found, writing defaults");
        config = OverlayConfig::defaults();
        std::string writeError;
        if (!saveOverlayConfig(path, config, writeError)) {
            logWarning(writeError);
        }
        return true;
    }

    std::string parseError;
    {
        std::ifstream in(path);
        if (!in.good()) {
            errorMessage = "Cannot open config file: " + path;
            return false;
        }
        try {
            config = configFromJson(json::parse(in));
            return true;
        } catch (const std::exception& e) {
            parseError = e.what();
        }
    }

    const std::string backup = backupConfigPath(path);
    if (std::filesystem::exists(backup, ec)) {
        errorMessage = "Invalid config (" + parseError + ") and backup " + backup + " already exists";
        return false;
    }
    std::filesystem::rename(path, backup, ec);
    if (ec) {
        errorMessage = "Invalid config (" + parseError + ") and renaming to " + backup +
                       " failed: " + ec.message();
        return false;
    }
    logError("Encountered '" + parseError + "' while loading config, renamed to " +
             backup + " and recreated");

    config = OverlayConfig::defaults();
    std::string writeError;
    if (!saveOverlayConfig(path, config, writeError)) {
        logWarning(writeError);
    }
    return true;
}

bool saveOverlayConfig(const std::string& path, const OverlayConfig& config, std::string& errorMessage) {
    errorMessage.clear();

    json doc = json::object();

    // Keep keys we do not know about.
    {
        std::ifstream in(path);
        if (in.good()) {
            try {
                doc = json::parse(in);
            } catch (const std::exception&) {
                doc = json::object();
            }
        }
    }
    if (!doc.is_object()) {
        doc = json::object();
    }

    configToJson(config, doc);
    return writeJson(path, doc, errorMessage);
}

} // namespace overlay_ocr
