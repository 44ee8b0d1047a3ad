#include <printrelay/core/events/dead_letter_queue.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace PrintRelay {

DeadLetterQueue::DeadLetterQueue() {
    spdlog::debug("[DeadLetterQueue] Initialized (max stored: {})", MAX_STORED_EVENTS);
}

void DeadLetterQueue::pushBatch(const std::vector<CanonicalEvent>& events, const std::string& reason) {
    if (events.empty()) return;

    total_dropped_.fetch_add(events.size(), std::memory_order_relaxed);

    {
        std::lock_guard<std::mutex> lock(mutex_);

        for (const auto& evt : events) {
            // Ring buffer: remove oldest if at capacity
            if (stored_events_.size() >= MAX_STORED_EVENTS) {
                stored_events_.pop_front();
            }
            stored_events_.push_back(evt);
        }
        last_reason_ = reason;
    }

    spdlog::warn("[DLQ] DATA LOSS: dropped {} events ({}), ids {}..{} (total dropped: {})",
                 events.size(), reason, events.front().identity(), events.back().identity(),
                 total_dropped_.load(std::memory_order_relaxed));
}

std::vector<CanonicalEvent> DeadLetterQueue::getRecentEvents(size_t max_count) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<CanonicalEvent> result;
    size_t count = std::min(max_count, stored_events_.size());
    result.reserve(count);

    auto it = stored_events_.rbegin();
    for (size_t i = 0; i < count && it != stored_events_.rend(); ++i, ++it) {
        result.push_back(*it);
    }

    return result;
}

void DeadLetterQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    stored_events_.clear();
    spdlog::info("[DLQ] Buffer cleared (total dropped remains: {})",
                 total_dropped_.load(std::memory_order_relaxed));
}

} // namespace PrintRelay
