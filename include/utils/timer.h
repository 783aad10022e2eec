#pragma once
/**
 * @file timer.h
 * @brief High-resolution timing utilities for performance measurement
 */

#include <chrono>

namespace overlay_ocr {

/**
 * @brief High-resolution CPU timer on the steady clock
 */
class HighResTimer {
public:
    using Clock = std::chrono::steady_clock;

    void start() {
        m_start = Clock::now();
    }

    void stop() {
        m_stop = Clock::now();
    }

    double elapsedMs() const {
        return std::chrono::duration<double, std::milli>(m_stop - m_start).count();
    }

    double elapsedUs() const {
        return std::chrono::duration<double, std::micro>(m_stop - m_start).count();
    }

    double currentElapsedMs() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - m_start).count();
    }

private:
    Clock::time_point m_start = Clock::now();
    Clock::time_point m_stop = m_start;
};

} // namespace overlay_ocr
