/**
 * @file capture_link.cpp
 * @brief Transport between an external capture producer and the OCR consumer
 */

#include "capture/capture_link.h"
#include "processing/format_converter.h"
#include "utils/logger.h"

#include <sstream>
#include <utility>

namespace overlay_ocr {

void CaptureLink::publishFormat(const FrameFormat& format) {
    {
        std::lock_guard<std::mutex> lock(m_formatMutex);
        m_currentFormat = format;
    }
    m_formatChanges++;
    m_formats.publish(format);
}

bool CaptureLink::publishFrame(std::vector<uint8_t> bytes) {
    RawFrame frame;
    frame.data = std::move(bytes);
    {
        std::lock_guard<std::mutex> lock(m_formatMutex);
        frame.format = m_currentFormat;
    }
    m_framesPublished++;
    const bool dropped = m_frames.publish(std::move(frame));
    if (dropped) {
        m_framesDropped++;
    }
    return dropped;
}

std::optional<FrameFormat> CaptureLink::pollFormat() {
    return m_formats.tryTake();
}

std::optional<RawFrame> CaptureLink::pollFrame() {
    return m_frames.tryTake();
}

CaptureStats CaptureLink::getStats() const {
    CaptureStats stats;
    stats.framesPublished = m_framesPublished.load();
    stats.framesDropped = m_framesDropped.load();
    stats.formatChanges = m_formatChanges.load();
    return stats;
}

void LatestImage::receive(CaptureLink& link) {
    if (auto format = link.pollFormat()) {
        std::ostringstream oss;
        oss << "Frame format changed: " << format->width << "x" << format->height
            << " (" << format->describe() << ")";
        logInfo(oss.str());
        m_announcedFormat = *format;
    }
    if (auto frame = link.pollFrame()) {
        m_frame = std::move(*frame);
    }
}

void LatestImage::setLatestFrame(RawFrame frame) {
    m_frame = std::move(frame);
}

std::optional<RgbaImage> LatestImage::takeLatestRgba(ErrorKind* skipReason) {
    if (!hasFrame()) {
        if (skipReason) *skipReason = ErrorKind::NoFrame;
        return std::nullopt;
    }

    const FrameFormat format = m_frame.format;
    if (format.format != PixelFormat::Other &&
        (format.requiredBytes() == 0 || m_frame.data.size() < format.requiredBytes())) {
        // Bytes and size disagree; wait for the next frame instead of faulting.
        std::ostringstream oss;
        oss << "Frame not yet usable: " << m_frame.data.size() << " bytes for "
            << format.width << "x" << format.height;
        logDebug(oss.str());
        if (skipReason) *skipReason = ErrorKind::NoFrame;
        return std::nullopt;
    }

    std::vector<uint8_t> bytes = std::move(m_frame.data);
    m_frame.data.clear();

    auto image = normalizeToRgba(std::move(bytes), format);
    if (!image && skipReason) {
        *skipReason = ErrorKind::UnsupportedPixelFormat;
    }
    return image;
}

} // namespace overlay_ocr
