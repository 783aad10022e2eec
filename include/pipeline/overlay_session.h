#pragma once
/**
 * @file overlay_session.h
 * @brief Per-tick consumer glue: capture in, item board out
 */

#include "types.h"
#include "capture/capture_link.h"
#include "ocr/ocr_engine.h"
#include "pipeline/coordinate_mapper.h"
#include "pipeline/ocr_scheduler.h"
#include "utils/config_loader.h"

#include <chrono>
#include <memory>
#include <optional>
#include <vector>

namespace overlay_ocr {

/**
 * @brief What the overlay currently displays (screen space)
 */
struct ItemBoard {
    bool visible = false;
    Aabb detectBounds;                              ///< Region that was read
    std::vector<Item> items;                        ///< At most max_displayed_items
    std::chrono::steady_clock::time_point shownAt;
};

/**
 * @brief Owns the capture link, the scheduler and the displayed results
 *
 * Capture producers publish into getCaptureLink(). The owner calls tick()
 * once per frame of its loop and requestOcr() when the user asks for a read.
 */
class OverlaySession {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @param projection Consumer viewport; a zero viewport size follows the captured frame size
     */
    OverlaySession(OverlayConfig config, std::shared_ptr<GuardedOcrEngine> engine,
                   ViewportProjection projection = ViewportProjection{});

    OverlaySession(const OverlaySession&) = delete;
    OverlaySession& operator=(const OverlaySession&) = delete;

    CaptureLink& getCaptureLink() { return m_link; }

    /**
     * @brief Start an OCR pass on the most recent frame
     */
    TriggerStatus requestOcr();

    /**
     * @brief Drain capture updates, collect a finished pass and expire the board
     * @return true if a new result set was shown during this tick
     */
    bool tick(Clock::time_point now);

    void toggleOverlay() { m_overlayEnabled = !m_overlayEnabled; }
    bool isOverlayEnabled() const { return m_overlayEnabled; }

    bool isOcrRunning() const { return m_scheduler.isRunning(); }

    const ItemBoard& getItemBoard() const { return m_board; }

    /// Last completed pass, successful or not
    const std::optional<OcrCompletion>& getLastCompletion() const { return m_lastCompletion; }

    const OverlayConfig& getConfig() const { return m_config; }

    void setProjection(const ViewportProjection& projection) { m_projection = projection; }

private:
    ViewportProjection effectiveProjection() const;
    void showResults(const OcrResults& results, Clock::time_point now);

    OverlayConfig m_config;
    CaptureLink m_link;
    LatestImage m_latest;
    OcrScheduler m_scheduler;
    ViewportProjection m_projection;
    FrameFormat m_triggeredFormat;      ///< Format of the frame handed to the running pass

    bool m_overlayEnabled = true;
    ItemBoard m_board;
    std::optional<OcrCompletion> m_lastCompletion;
};

} // namespace overlay_ocr
