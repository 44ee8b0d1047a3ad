#pragma once

#include <printrelay/core/events/event.hpp>
#include <atomic>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace PrintRelay {

/**
 * @class DeadLetterQueue
 * @brief Makes data loss observable.
 *
 * Receives canonical events the agent gave up on, currently only the
 * oldest records cut by buffer truncation while the collector is down.
 *
 * Features:
 * - Cumulative dropped count (atomic, readable from any thread)
 * - Last MAX_STORED_EVENTS dropped events kept for inspection
 * - Every push is logged at warn level with its reason
 */
class DeadLetterQueue {
public:
    static constexpr size_t MAX_STORED_EVENTS = 1000;

    DeadLetterQueue();
    ~DeadLetterQueue() = default;

    /**
     * @brief Record a batch of dropped events
     * @param events Events that will not be delivered
     * @param reason Short machine-readable cause, e.g. "buffer_overflow"
     */
    void pushBatch(const std::vector<CanonicalEvent>& events, const std::string& reason);

    /**
     * @brief Get total count of events ever dropped
     */
    size_t totalDropped() const {
        return total_dropped_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Get count of currently stored events
     */
    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stored_events_.size();
    }

    /**
     * @brief Recent dropped events, newest first
     */
    std::vector<CanonicalEvent> getRecentEvents(size_t max_count = 100) const;

    std::string lastReason() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_reason_;
    }

    void clear();

private:
    std::atomic<size_t> total_dropped_{0};
    mutable std::mutex mutex_;
    std::deque<CanonicalEvent> stored_events_;
    std::string last_reason_;
};

} // namespace PrintRelay
