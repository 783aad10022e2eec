#pragma once
/**
 * @file frame_channel.h
 * @brief Single-slot, latest-value-wins channel between capture and consumer
 */

#include <mutex>
#include <optional>
#include <utility>

namespace overlay_ocr {

/**
 * @brief Capacity-one channel that keeps only the most recent value
 *
 * publish() drains any unread value before storing the new one, so the
 * producer never waits on the consumer. tryTake() empties the slot.
 * The mutex only guards a move of the value in or out of the slot.
 */
template <typename T>
class LatestValueChannel {
public:
    LatestValueChannel() = default;

    LatestValueChannel(const LatestValueChannel&) = delete;
    LatestValueChannel& operator=(const LatestValueChannel&) = delete;

    /**
     * @brief Store a value, discarding any unread one
     * @return true if an unread value was dropped
     */
    bool publish(T value) {
        std::optional<T> dropped;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            dropped.swap(m_slot);
            m_slot.emplace(std::move(value));
        }
        // Destroy the dropped value outside the lock.
        return dropped.has_value();
    }

    /**
     * @brief Take the most recent value if one is pending
     */
    std::optional<T> tryTake() {
        std::optional<T> out;
        std::lock_guard<std::mutex> lock(m_mutex);
        out.swap(m_slot);
        return out;
    }

    bool hasPending() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_slot.has_value();
    }

private:
    mutable std::mutex m_mutex;
    std::optional<T> m_slot;
};

} // namespace overlay_ocr
