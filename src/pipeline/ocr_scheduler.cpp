/**
 * @file ocr_scheduler.cpp
 * @brief Single-in-flight, non-blocking OCR task scheduling
 */

#include "pipeline/ocr_scheduler.h"
#include "utils/image_io.h"
#include "utils/logger.h"

#include <chrono>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace overlay_ocr {

const char* triggerStatusName(TriggerStatus status) {
    switch (status) {
        case TriggerStatus::Started: return "Started";
        case TriggerStatus::AlreadyRunning: return "AlreadyRunning";
        case TriggerStatus::NoFrame: return "NoFrame";
        case TriggerStatus::UnsupportedPixelFormat: return "UnsupportedPixelFormat";
        case TriggerStatus::NoLayoutMatch: return "NoLayoutMatch";
        case TriggerStatus::DegenerateBounds: return "DegenerateBounds";
    }
    return "Unknown";
}

OcrScheduler::OcrScheduler(std::shared_ptr<GuardedOcrEngine> engine, SchedulerOptions options)
    : m_engine(std::move(engine)),
      m_extractor(options.extraction),
      m_options(std::move(options)) {
    if (!m_engine) {
        throw std::invalid_argument("OcrScheduler: engine is null");
    }
}

OcrScheduler::~OcrScheduler() {
    if (m_task.valid()) {
        m_task.wait();
    }
}

TriggerStatus OcrScheduler::trigger(LatestImage& image, const std::vector<LayoutOption>& layouts) {
    if (isRunning()) {
        return TriggerStatus::AlreadyRunning;
    }

    ErrorKind skip = ErrorKind::NoFrame;
    auto rgba = image.takeLatestRgba(&skip);
    if (!rgba) {
        return skip == ErrorKind::UnsupportedPixelFormat
            ? TriggerStatus::UnsupportedPixelFormat
            : TriggerStatus::NoFrame;
    }

    if (m_options.saveToDisk) {
        std::string path;
        std::string error;
        if (saveCaptureImage(*rgba, m_options.saveDirectory, path, error)) {
            logDebug("Saved capture to " + path);
        } else {
            logError("Could not save screenshot: " + error);
        }
    }

    const Layout* layout = selectLayout(*rgba, layouts);
    if (!layout) {
        std::ostringstream oss;
        oss << "Could not detect layout for " << rgba->width << "x" << rgba->height << " capture";
        logWarning(oss.str());
        return TriggerStatus::NoLayoutMatch;
    }

    return start(std::move(*rgba), *layout);
}

TriggerStatus OcrScheduler::start(RgbaImage image, const Layout& layout) {
    if (isRunning()) {
        return TriggerStatus::AlreadyRunning;
    }

    const PixelRect bounds = layout.ocrBounds(image.width, image.height);
    if (bounds.empty()) {
        std::ostringstream oss;
        oss << "Layout region scales to " << bounds.w << "x" << bounds.h << " for a "
            << image.width << "x" << image.height << " capture";
        logWarning(oss.str());
        return TriggerStatus::DegenerateBounds;
    }

    std::shared_ptr<GuardedOcrEngine> engine = m_engine;
    TextExtractor extractor = m_extractor;
    m_timer.start();
    m_task = std::async(std::launch::async,
        [engine, extractor, bounds, frame = std::move(image)]() {
            return extractor.extract(frame, bounds, *engine);
        });

    m_started++;
    return TriggerStatus::Started;
}

std::optional<OcrCompletion> OcrScheduler::poll() {
    if (!m_task.valid()) {
        return std::nullopt;
    }
    if (m_task.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        return std::nullopt;
    }

    OcrCompletion completion;
    completion.elapsedMs = m_timer.currentElapsedMs();
    m_completed++;

    try {
        completion.results = m_task.get();
        completion.ok = true;
        std::ostringstream oss;
        oss << "OCR took " << static_cast<long long>(completion.elapsedMs) << "ms: "
            << completion.results.words.size() << " words, "
            << completion.results.items.size() << " items";
        logDebug(oss.str());
    } catch (const ExtractionError& e) {
        completion.errorKind = e.kind();
        completion.errorMessage = e.what();
        logError(std::string("OCR failed (") + errorKindName(e.kind()) + "): " + e.what());
    } catch (const std::exception& e) {
        completion.errorKind = ErrorKind::EngineFailure;
        completion.errorMessage = e.what();
        logError(std::string("OCR failed: ") + e.what());
    }
    return completion;
}

} // namespace overlay_ocr
