#pragma once

#include <printrelay/core/config/app_config.hpp>
#include <printrelay/core/delivery/sender.hpp>
#include <printrelay/core/events/dead_letter_queue.hpp>
#include <printrelay/core/events/event.hpp>
#include <printrelay/core/extract/extractor.hpp>
#include <printrelay/core/source/event_source.hpp>
#include <printrelay/core/storage/dedup_store.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

namespace PrintRelay {

// Startup -> CatchUp (optional) -> SteadyPoll (loop) -> Draining -> Stopped
enum class AgentState {
    STARTUP = 0,
    CATCH_UP = 1,
    STEADY_POLL = 2,
    DRAINING = 3,
    STOPPED = 4
};

const char* toString(AgentState state);

struct AgentStats {
    uint64_t ticks = 0;
    uint64_t failed_ticks = 0;
    uint64_t events_buffered = 0;
    uint64_t events_delivered = 0;
    uint64_t events_dropped = 0;
};

/**
 * @class AgentLoop
 * @brief Single-worker orchestrator: poll, extract, buffer, deliver, persist.
 *
 * All buffer and DedupStore mutation happens on one thread (the worker once
 * start() is called, or the caller when step()/pollOnce() are driven directly).
 * Shutdown is only observed between ticks.
 */
class AgentLoop {
public:
    static constexpr size_t BUFFER_LIMIT = 1000;   // truncate when exceeded...
    static constexpr size_t BUFFER_KEEP = 500;     // ...down to the newest 500

    struct CatchUpReport {
        size_t fetched = 0;
        size_t already_delivered = 0;
        size_t new_events = 0;
        size_t extracted = 0;
        uint64_t total_pages = 0;
        size_t multi_page_events = 0;
        bool complete = true;     // false if any batch failed; nothing was marked
    };

    struct TickReport {
        size_t fetched = 0;
        size_t accepted = 0;
        size_t delivered = 0;
        size_t dropped = 0;
        bool delivery_attempted = false;
        bool delivery_ok = false;
    };

    /**
     * @throws std::invalid_argument if config.host_name is empty
     */
    AgentLoop(const AppConfig::AgentConfig& config,
              EventSource& source,
              Sender& sender,
              DedupStore& store,
              DeadLetterQueue* dlq = nullptr);
    ~AgentLoop() noexcept;

    AgentLoop(const AgentLoop&) = delete;
    AgentLoop& operator=(const AgentLoop&) = delete;

    /**
     * @brief Load state and check both ends.
     * @throws std::runtime_error if the event source is unreachable
     */
    void startup();

    /**
     * @brief One all-or-nothing pass over the full source history.
     */
    CatchUpReport runCatchUp();

    /**
     * @brief One steady-state tick. Exceptions propagate to the caller.
     */
    TickReport pollOnce();

    /**
     * @brief Scheduler step: run one tick, never throw.
     * @return check_interval after a clean tick, retry_interval after an error
     */
    std::chrono::milliseconds step();

    /**
     * @brief Final delivery attempt, then persist regardless of the outcome.
     * @return true if the buffer is empty afterwards
     */
    bool drain();

    // Worker lifecycle: start() runs startup() if needed, then launches the worker
    void start();
    void stop();

    AgentState state() const { return state_.load(std::memory_order_acquire); }
    AgentStats stats() const;

    // Worker-thread data: only read while the worker is not running
    const std::vector<CanonicalEvent>& buffer() const { return buffer_; }

private:
    void loop();
    bool deliverBuffer();
    void truncateBuffer();
    void setState(AgentState state);
    bool waitFor(std::chrono::milliseconds delay);

    AppConfig::AgentConfig config_;
    EventSource& source_;
    Sender& sender_;
    DedupStore& store_;
    DeadLetterQueue* dlq_ = nullptr;
    Extractor extractor_;

    std::vector<CanonicalEvent> buffer_;
    uint64_t dropped_through_ = 0;   // highest sequence cut by truncation
    bool started_up_ = false;

    std::atomic<AgentState> state_{AgentState::STARTUP};
    mutable std::mutex stats_mutex_;
    AgentStats stats_;

    std::atomic<bool> running_{false};
    std::thread worker_thread_;

    // For interruptible sleep during shutdown
    std::mutex sleep_mutex_;
    std::condition_variable sleep_cv_;
};

} // namespace PrintRelay
