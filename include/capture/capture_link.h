#pragma once
/**
 * @file capture_link.h
 * @brief Transport between an external capture producer and the OCR consumer
 */

#include "types.h"
#include "capture/frame_channel.h"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace overlay_ocr {

/**
 * @brief Capture statistics
 */
struct CaptureStats {
    uint64_t framesPublished = 0;   ///< Frames handed to the link
    uint64_t framesDropped = 0;     ///< Frames overwritten before the consumer took them
    uint64_t formatChanges = 0;     ///< Format updates published
};

/**
 * @brief Frame and format channels fed by the capture producer
 *
 * Producer threads call publishFormat()/publishFrame(); the consumer polls
 * pollFormat()/pollFrame() once per tick. Every frame carries the format that
 * was current when it was published, so bytes and size never mismatch on the
 * consumer side even though the two channels are read independently.
 */
class CaptureLink {
public:
    CaptureLink() = default;

    CaptureLink(const CaptureLink&) = delete;
    CaptureLink& operator=(const CaptureLink&) = delete;

    /**
     * @brief Publish a negotiated format; later frames are stamped with it
     */
    void publishFormat(const FrameFormat& format);

    /**
     * @brief Publish frame bytes, replacing any unread frame
     * @return true if an unread frame was dropped
     */
    bool publishFrame(std::vector<uint8_t> bytes);

    /**
     * @brief Take the latest format update, if any
     */
    std::optional<FrameFormat> pollFormat();

    /**
     * @brief Take the latest frame, if any
     */
    std::optional<RawFrame> pollFrame();

    CaptureStats getStats() const;

private:
    LatestValueChannel<RawFrame> m_frames;
    LatestValueChannel<FrameFormat> m_formats;

    std::mutex m_formatMutex;
    FrameFormat m_currentFormat;

    std::atomic<uint64_t> m_framesPublished{0};
    std::atomic<uint64_t> m_framesDropped{0};
    std::atomic<uint64_t> m_formatChanges{0};
};

/**
 * @brief Consumer-side holder of the most recent frame
 *
 * Frame bytes are moved out when consumed, so each captured frame is OCR'd
 * at most once.
 */
class LatestImage {
public:
    /**
     * @brief Drain pending format and frame updates from the link
     */
    void receive(CaptureLink& link);

    /**
     * @brief Replace the held frame directly
     */
    void setLatestFrame(RawFrame frame);

    /**
     * @brief True if a frame with at least 4 bytes is held
     */
    bool hasFrame() const { return m_frame.data.size() >= 4; }

    /**
     * @brief Consume the held frame and convert it to RGBA
     * @param skipReason Set when nullopt is returned (NoFrame or UnsupportedPixelFormat)
     * @return RGBA image or nullopt if nothing usable is held
     */
    std::optional<RgbaImage> takeLatestRgba(ErrorKind* skipReason = nullptr);

    /**
     * @brief Last format announced on the format channel
     */
    const FrameFormat& getAnnouncedFormat() const { return m_announcedFormat; }

    /**
     * @brief Format stamped on the held frame
     */
    const FrameFormat& getHeldFormat() const { return m_frame.format; }

private:
    RawFrame m_frame;
    FrameFormat m_announcedFormat;
};

} // namespace overlay_ocr
