#pragma once
/**
 * @file ocr_scheduler.h
 * @brief Single-in-flight, non-blocking OCR task scheduling
 */

#include "types.h"
#include "capture/capture_link.h"
#include "detection/layout_selector.h"
#include "ocr/ocr_engine.h"
#include "ocr/text_extractor.h"
#include "utils/timer.h"

#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace overlay_ocr {

/**
 * @brief Outcome of a trigger request
 */
enum class TriggerStatus {
    Started,                ///< Extraction spawned, scheduler is now Running
    AlreadyRunning,         ///< Ignored: one extraction is already in flight
    NoFrame,                ///< Nothing usable captured yet
    UnsupportedPixelFormat, ///< Frame dropped by format conversion
    NoLayoutMatch,          ///< Frame captured but no layout matched
    DegenerateBounds        ///< Layout region scales to zero area for this frame
};

const char* triggerStatusName(TriggerStatus status);

/**
 * @brief Scheduler settings
 */
struct SchedulerOptions {
    ExtractionOptions extraction;
    bool saveToDisk = false;                ///< Write each triggered frame as PNG before OCR
    std::string saveDirectory = "images";
};

/**
 * @brief Result of one finished extraction, handed out exactly once
 */
struct OcrCompletion {
    bool ok = false;
    OcrResults results;                     ///< Valid when ok
    ErrorKind errorKind = ErrorKind::EngineFailure;
    std::string errorMessage;
    double elapsedMs = 0.0;                 ///< Trigger to observed completion
};

/**
 * @brief Owns at most one in-flight OCR computation
 *
 * Idle -> Running on a successful trigger(); Running -> Idle when poll()
 * observes completion. Triggers while Running are ignored. poll() never
 * blocks. An in-flight pass always runs to completion; the destructor
 * waits for it.
 */
class OcrScheduler {
public:
    OcrScheduler(std::shared_ptr<GuardedOcrEngine> engine, SchedulerOptions options);
    ~OcrScheduler();

    OcrScheduler(const OcrScheduler&) = delete;
    OcrScheduler& operator=(const OcrScheduler&) = delete;

    /**
     * @brief Consume the latest frame, select a layout and start OCR
     */
    TriggerStatus trigger(LatestImage& image, const std::vector<LayoutOption>& layouts);

    /**
     * @brief Start OCR on an already selected layout
     */
    TriggerStatus start(RgbaImage image, const Layout& layout);

    /**
     * @brief Non-blocking completion check
     * @return The completion the first time a finished task is observed
     */
    std::optional<OcrCompletion> poll();

    bool isRunning() const { return m_task.valid(); }

    uint64_t getStartedCount() const { return m_started; }
    uint64_t getCompletedCount() const { return m_completed; }

private:
    std::shared_ptr<GuardedOcrEngine> m_engine;
    TextExtractor m_extractor;
    SchedulerOptions m_options;

    std::future<OcrResults> m_task;
    HighResTimer m_timer;
    uint64_t m_started = 0;
    uint64_t m_completed = 0;
};

} // namespace overlay_ocr
