/**
 * @file image_io.cpp
 * @brief Reading test captures and writing diagnostic screenshots
 */

#include "utils/image_io.h"
#include "processing/preprocess.h"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <cstring>
#include <ctime>
#include <filesystem>

namespace overlay_ocr {

bool loadImageAsBgraFrame(const std::string& path, std::vector<uint8_t>& bytes,
                          FrameFormat& format, std::string& errorMessage) {
    cv::Mat decoded;
    try {
        decoded = cv::imread(path, cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        errorMessage = "Failed to decode " + path + ": " + e.what();
        return false;
    }
    if (decoded.empty()) {
        errorMessage = "Failed to load image: " + path;
        return false;
    }
    if (decoded.depth() != CV_8U) {
        decoded.convertTo(decoded, CV_8U, decoded.depth() == CV_16U ? 1.0 / 257.0 : 1.0);
    }

    cv::Mat bgra;
    switch (decoded.channels()) {
        case 1: cv::cvtColor(decoded, bgra, cv::COLOR_GRAY2BGRA); break;
        case 3: cv::cvtColor(decoded, bgra, cv::COLOR_BGR2BGRA); break;
        case 4: bgra = decoded; break;
        default:
            errorMessage = "Unsupported channel count in " + path;
            return false;
    }
    if (!bgra.isContinuous()) {
        bgra = bgra.clone();
    }

    format = FrameFormat{};
    format.width = static_cast<uint32_t>(bgra.cols);
    format.height = static_cast<uint32_t>(bgra.rows);
    format.format = PixelFormat::BGRA;

    bytes.resize(format.requiredBytes());
    std::memcpy(bytes.data(), bgra.data, bytes.size());
    return true;
}

std::string makeCaptureFilename(std::chrono::system_clock::time_point when) {
    const std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm utc{};
    gmtime_r(&t, &utc);

    char buf[64];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d_%H_%M_%SZ.png", &utc);
    return buf;
}

bool saveCaptureImage(const RgbaImage& image, const std::string& directory,
                      std::string& writtenPath, std::string& errorMessage) {
    if (image.empty()) {
        errorMessage = "Capture is empty";
        return false;
    }

    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        errorMessage = "Cannot create " + directory + ": " + ec.message();
        return false;
    }

    const std::filesystem::path path =
        std::filesystem::path(directory) / makeCaptureFilename(std::chrono::system_clock::now());

    try {
        cv::Mat bgra;
        cv::cvtColor(wrapRgba(image), bgra, cv::COLOR_RGBA2BGRA);
        if (!cv::imwrite(path.string(), bgra)) {
            errorMessage = "Failed to write " + path.string();
            return false;
        }
    } catch (const cv::Exception& e) {
        errorMessage = "Failed to write " + path.string() + ": " + e.what();
        return false;
    }

    writtenPath = path.string();
    return true;
}

} // namespace overlay_ocr
