/**
 * @file image_file_source.cpp
 * @brief Capture producer that replays image files into a CaptureLink
 */

#include "capture/image_file_source.h"
#include "utils/image_io.h"
#include "utils/logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <sstream>

namespace overlay_ocr {

namespace {

bool hasImageExtension(const std::filesystem::path& p) {
    std::string ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".bmp";
}

} // anonymous namespace

ImageFileSource::~ImageFileSource() {
    stop();
}

bool ImageFileSource::open(const std::string& path) {
    m_images.clear();

    std::vector<std::string> files;
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        for (const auto& entry : std::filesystem::directory_iterator(path, ec)) {
            if (entry.is_regular_file() && hasImageExtension(entry.path())) {
                files.push_back(entry.path().string());
            }
        }
        std::sort(files.begin(), files.end());
    } else {
        files.push_back(path);
    }

    for (const auto& file : files) {
        SourceImage image;
        image.path = file;
        std::string error;
        if (!loadImageAsBgraFrame(file, image.bytes, image.format, error)) {
            logWarning(error);
            continue;
        }
        std::ostringstream oss;
        oss << "Loaded " << file << " (" << image.format.width << "x" << image.format.height << ")";
        logDebug(oss.str());
        m_images.push_back(std::move(image));
    }

    if (m_images.empty()) {
        logError("No usable images found at " + path);
        return false;
    }
    return true;
}

bool ImageFileSource::start(CaptureLink& link, double fps, uint32_t framesPerImage) {
    if (m_running) {
        logWarning("Image source already running");
        return false;
    }
    if (m_images.empty()) {
        logError("Image source has nothing to publish");
        return false;
    }
    if (fps <= 0.0) {
        logError("Image source fps must be positive");
        return false;
    }

    m_running = true;
    m_thread = std::thread(&ImageFileSource::run, this, &link, fps, (std::max)(framesPerImage, 1u));
    return true;
}

void ImageFileSource::stop() {
    m_running = false;
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

void ImageFileSource::run(CaptureLink* link, double fps, uint32_t framesPerImage) {
    using Clock = std::chrono::steady_clock;
    const auto interval = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(1.0 / fps));

    size_t index = 0;
    uint32_t framesOnImage = 0;
    bool formatSent = false;
    auto next = Clock::now();

    while (m_running) {
        const SourceImage& image = m_images[index];
        if (!formatSent) {
            link->publishFormat(image.format);
            formatSent = true;
        }

        link->publishFrame(image.bytes);
        m_framesPublished++;

        if (++framesOnImage >= framesPerImage && m_images.size() > 1) {
            framesOnImage = 0;
            const size_t nextIndex = (index + 1) % m_images.size();
            const FrameFormat& nextFormat = m_images[nextIndex].format;
            if (nextFormat.width != image.format.width || nextFormat.height != image.format.height) {
                formatSent = false;
            }
            index = nextIndex;
        }

        next += interval;
        std::this_thread::sleep_until(next);
    }
}

} // namespace overlay_ocr
