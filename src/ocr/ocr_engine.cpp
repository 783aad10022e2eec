/**
 * @file ocr_engine.cpp
 * @brief OCR engine interface helpers and guarded access
 */

#include "ocr/ocr_engine.h"

#include <stdexcept>
#include <utility>

namespace overlay_ocr {

cv::Rect2f RecognizedLine::boundingRect() const {
    if (words.empty()) {
        return cv::Rect2f();
    }
    cv::Rect2f r = words.front().rect.boundingRect2f();
    for (size_t i = 1; i < words.size(); i++) {
        r |= words[i].rect.boundingRect2f();
    }
    return r;
}

GuardedOcrEngine::GuardedOcrEngine(std::unique_ptr<OcrEngine> engine)
    : m_engine(std::move(engine)) {
    if (!m_engine) {
        throw std::invalid_argument("GuardedOcrEngine: engine is null");
    }
}

GuardedOcrEngine::Lease GuardedOcrEngine::acquire() {
    return Lease(std::unique_lock<std::mutex>(m_mutex), *m_engine);
}

std::optional<GuardedOcrEngine::Lease> GuardedOcrEngine::tryAcquire() {
    std::unique_lock<std::mutex> lock(m_mutex, std::try_to_lock);
    if (!lock.owns_lock()) {
        return std::nullopt;
    }
    return Lease(std::move(lock), *m_engine);
}

} // namespace overlay_ocr
