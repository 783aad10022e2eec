#pragma once
/**
 * @file image_file_source.h
 * @brief Capture producer that replays image files into a CaptureLink
 *
 * Stands in for a live screen capture: each image is decoded once with
 * OpenCV, then published as BGRA at a fixed rate from a worker thread.
 */

#include "types.h"
#include "capture/capture_link.h"

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

namespace overlay_ocr {

/**
 * @brief Decoded image ready to publish
 */
struct SourceImage {
    std::string path;
    FrameFormat format;
    std::vector<uint8_t> bytes;
};

class ImageFileSource {
public:
    ImageFileSource() = default;
    ~ImageFileSource();

    ImageFileSource(const ImageFileSource&) = delete;
    ImageFileSource& operator=(const ImageFileSource&) = delete;

    /**
     * @brief Load one image file, or every readable image in a directory (sorted by name)
     * @return true if at least one image was loaded
     */
    bool open(const std::string& path);

    /**
     * @brief Start publishing into link at fps frames per second
     *
     * When several images are loaded, each one is held for
     * framesPerImage frames before moving to the next.
     */
    bool start(CaptureLink& link, double fps, uint32_t framesPerImage = 60);

    /**
     * @brief Stop the worker thread and wait for it
     */
    void stop();

    bool isRunning() const { return m_running; }

    size_t getImageCount() const { return m_images.size(); }
    uint64_t getFramesPublished() const { return m_framesPublished; }

private:
    void run(CaptureLink* link, double fps, uint32_t framesPerImage);

    std::vector<SourceImage> m_images;
    std::thread m_thread;
    std::atomic<bool> m_running{false};
    std::atomic<uint64_t> m_framesPublished{0};
};

} // namespace overlay_ocr
