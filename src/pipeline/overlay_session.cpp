/**
 * @file overlay_session.cpp
 * @brief Per-tick consumer glue: capture in, item board out
 */

#include "pipeline/overlay_session.h"
#include "utils/logger.h"

#include <sstream>
#include <utility>

namespace overlay_ocr {

namespace {

SchedulerOptions schedulerOptionsFrom(const OverlayConfig& config) {
    SchedulerOptions options;
    options.extraction.gapThreshold = config.gapThreshold;
    options.saveToDisk = config.saveToDisk;
    options.saveDirectory = config.saveDirectory;
    return options;
}

} // anonymous namespace

OverlaySession::OverlaySession(OverlayConfig config, std::shared_ptr<GuardedOcrEngine> engine,
                               ViewportProjection projection)
    : m_config(std::move(config)),
      m_scheduler(std::move(engine), schedulerOptionsFrom(m_config)),
      m_projection(projection),
      m_overlayEnabled(m_config.overlay) {
}

TriggerStatus OverlaySession::requestOcr() {
    // Pick up anything published since the last tick.
    m_latest.receive(m_link);

    const FrameFormat format = m_latest.getHeldFormat();
    const TriggerStatus status = m_scheduler.trigger(m_latest, m_config.layouts);
    if (status == TriggerStatus::Started) {
        m_triggeredFormat = format;
        logDebug("OCR started");
    } else if (status != TriggerStatus::AlreadyRunning) {
        logDebug(std::string("OCR not started: ") + triggerStatusName(status));
    }
    return status;
}

bool OverlaySession::tick(Clock::time_point now) {
    m_latest.receive(m_link);

    bool shown = false;
    if (auto completion = m_scheduler.poll()) {
        if (completion->ok) {
            if (mapResultsToScreenSpace(completion->results, effectiveProjection())) {
                showResults(completion->results, now);
                shown = true;
            }
        }
        m_lastCompletion = std::move(completion);
    }

    if (m_board.visible) {
        const double age = std::chrono::duration<double>(now - m_board.shownAt).count();
        if (age >= m_config.closeLayoutAfter) {
            m_board = ItemBoard{};
        }
    }

    return shown;
}

ViewportProjection OverlaySession::effectiveProjection() const {
    ViewportProjection projection = m_projection;
    if (projection.viewportWidth <= 0.0f || projection.viewportHeight <= 0.0f) {
        projection.viewportWidth = static_cast<float>(m_triggeredFormat.width);
        projection.viewportHeight = static_cast<float>(m_triggeredFormat.height);
    }
    return projection;
}

void OverlaySession::showResults(const OcrResults& results, Clock::time_point now) {
    m_board = ItemBoard{};
    m_board.visible = true;
    m_board.detectBounds = results.detectBounds;
    m_board.shownAt = now;

    for (const auto& item : results.items) {
        if (m_board.items.size() >= m_config.maxDisplayedItems) {
            break;
        }
        m_board.items.push_back(item);
    }

    std::ostringstream oss;
    oss << "Showing " << m_board.items.size() << " of " << results.items.size() << " items";
    for (const auto& item : m_board.items) {
        oss << " [" << item.name << "]";
    }
    logInfo(oss.str());
}

} // namespace overlay_ocr
