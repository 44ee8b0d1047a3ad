#include <printrelay/core/agent/agent_loop.hpp>
#include <printrelay/core/events/event_identity.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <unordered_set>

namespace PrintRelay {

const char* toString(AgentState state) {
    switch (state) {
        case AgentState::STARTUP:     return "STARTUP";
        case AgentState::CATCH_UP:    return "CATCH_UP";
        case AgentState::STEADY_POLL: return "STEADY_POLL";
        case AgentState::DRAINING:    return "DRAINING";
        case AgentState::STOPPED:     return "STOPPED";
    }
    return "UNKNOWN";
}

AgentLoop::AgentLoop(const AppConfig::AgentConfig& config,
                     EventSource& source,
                     Sender& sender,
                     DedupStore& store,
                     DeadLetterQueue* dlq)
    : config_(config),
      source_(source),
      sender_(sender),
      store_(store),
      dlq_(dlq),
      extractor_(config.host_name) {
    if (config_.host_name.empty()) {
        throw std::invalid_argument("AgentLoop requires a host name");
    }
}

AgentLoop::~AgentLoop() noexcept {
    if (worker_thread_.joinable()) {
        stop();
    }
}

void AgentLoop::setState(AgentState state) {
    AgentState previous = state_.exchange(state, std::memory_order_acq_rel);
    if (previous != state) {
        spdlog::debug("[AgentLoop] {} -> {}", toString(previous), toString(state));
    }
}

AgentStats AgentLoop::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

// ============================================================================
// STARTUP
// ============================================================================

void AgentLoop::startup() {
    setState(AgentState::STARTUP);
    spdlog::info("[AgentLoop] Machine: {}", config_.host_name);

    auto summary = store_.load();
    spdlog::info("[AgentLoop] {} identities already delivered ({} from this machine), high-water mark {}",
                 summary.total, summary.local, summary.highest_sequence);

    if (!source_.probe()) {
        throw std::runtime_error("Event source is not available");
    }

    if (!sender_.probeCollector()) {
        spdlog::warn("[AgentLoop] Collector may be unavailable, continuing; events will be buffered");
    }

    started_up_ = true;
}

// ============================================================================
// CATCH-UP PASS
// ============================================================================
// All-or-nothing: identities are marked delivered only if every batch of the
// pass succeeded. A partial failure leaves the store untouched and the whole
// pass is retried on the next run.
// ============================================================================

AgentLoop::CatchUpReport AgentLoop::runCatchUp() {
    setState(AgentState::CATCH_UP);
    spdlog::info("[AgentLoop] Catch-up pass started");

    CatchUpReport report;
    auto raw_events = source_.fetchAll();
    report.fetched = raw_events.size();

    if (raw_events.empty()) {
        spdlog::info("[AgentLoop] No events found in the log");
        return report;
    }

    std::unordered_set<std::string> seen;
    std::vector<CanonicalEvent> records;
    for (const auto& raw : raw_events) {
        const std::string& host = raw.host.empty() ? config_.host_name : raw.host;
        const std::string id = makeIdentity(host, raw.sequence);

        if (store_.contains(id)) {
            report.already_delivered++;
            continue;
        }
        if (!seen.insert(id).second) {
            continue;  // same record listed twice by the source
        }
        report.new_events++;

        auto record = extractor_.extract(raw);
        if (!record) {
            continue;
        }
        report.total_pages += record->pages();
        if (record->pages() > 1) {
            report.multi_page_events++;
        }
        records.push_back(std::move(*record));
    }
    report.extracted = records.size();

    spdlog::info("[AgentLoop] Events in log: {}, already delivered: {}, new: {}",
                 report.fetched, report.already_delivered, report.new_events);

    if (records.empty()) {
        spdlog::info("[AgentLoop] Nothing new to send");
        return report;
    }

    spdlog::info("[AgentLoop] {} new events, {} pages, {} with multiple pages",
                 records.size(), report.total_pages, report.multi_page_events);

    size_t samples = 0;
    for (const auto& record : records) {
        if (samples >= 5) break;
        if (record.pages() > 1) {
            spdlog::info("[AgentLoop]   - {} | {} | {:.30} | {} pages",
                         record.date(), record.user(), record.document(), record.pages());
            samples++;
        }
    }

    auto delivery = sender_.deliverAll(records, false);
    if (!delivery.ok()) {
        report.complete = false;
        spdlog::warn("[AgentLoop] Catch-up incomplete: {}/{} batches failed, nothing marked; "
                     "the pass will be retried on the next run",
                     delivery.batches_failed, delivery.batches_total);
        return report;
    }

    for (const auto& record : records) {
        store_.markDelivered(record.identity());
    }
    if (!store_.persist()) {
        spdlog::error("[AgentLoop] Catch-up delivered but state could not be saved");
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.events_delivered += records.size();
    }

    spdlog::info("[AgentLoop] Catch-up complete, high-water mark {}", store_.highestSequence());
    return report;
}

// ============================================================================
// STEADY POLL
// ============================================================================

AgentLoop::TickReport AgentLoop::pollOnce() {
    setState(AgentState::STEADY_POLL);
    TickReport report;

    auto raw_events = source_.fetchSince(config_.lookback);
    report.fetched = raw_events.size();

    // Everything at or below the floor was delivered or dropped already
    const uint64_t skip_through = std::max(store_.highestSequence(), dropped_through_);

    std::vector<CanonicalEvent> accepted;
    for (const auto& raw : raw_events) {
        const std::string& host = raw.host.empty() ? config_.host_name : raw.host;

        // New AND from this machine AND above the high-water mark / dropped floor
        if (host != config_.host_name || raw.sequence <= skip_through) {
            continue;
        }
        const std::string id = makeIdentity(host, raw.sequence);
        if (store_.isKnown(id)) {
            continue;
        }

        auto record = extractor_.extract(raw);
        if (!record) {
            continue;
        }
        store_.markPending(id);
        accepted.push_back(std::move(*record));
    }

    // Keep the buffer in sequence order so truncation drops the oldest records
    std::sort(accepted.begin(), accepted.end(),
              [](const CanonicalEvent& a, const CanonicalEvent& b) { return a.sequence() < b.sequence(); });
    report.accepted = accepted.size();
    buffer_.insert(buffer_.end(), std::make_move_iterator(accepted.begin()),
                   std::make_move_iterator(accepted.end()));

    if (report.accepted > 0) {
        spdlog::info("[AgentLoop] Found {} new events", report.accepted);
    }

    if (!buffer_.empty()) {
        report.delivery_attempted = true;
        const size_t pending = buffer_.size();
        spdlog::info("[AgentLoop] Sending {} buffered events...", pending);

        if (deliverBuffer()) {
            report.delivery_ok = true;
            report.delivered = pending;
            if (!store_.persist()) {
                spdlog::error("[AgentLoop] Delivered {} events but state could not be saved", pending);
            }
            spdlog::info("[AgentLoop] Buffer delivered, high-water mark {}", store_.highestSequence());
        } else {
            spdlog::warn("[AgentLoop] Keeping {} events in buffer", buffer_.size());
            const size_t before = buffer_.size();
            truncateBuffer();
            report.dropped = before - buffer_.size();
        }
    }

    if (store_.needsMemoryCompaction()) {
        store_.compactInMemory();
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.ticks++;
        stats_.events_buffered += report.accepted;
        stats_.events_delivered += report.delivered;
        stats_.events_dropped += report.dropped;
    }
    return report;
}

bool AgentLoop::deliverBuffer() {
    auto delivery = sender_.deliverAll(buffer_, true);
    if (!delivery.ok()) {
        return false;
    }

    for (const auto& record : buffer_) {
        store_.markDelivered(record.identity());
    }
    buffer_.clear();
    return true;
}

void AgentLoop::truncateBuffer() {
    if (buffer_.size() <= BUFFER_LIMIT) {
        return;
    }

    const size_t drop = buffer_.size() - BUFFER_KEEP;
    std::vector<CanonicalEvent> dropped(std::make_move_iterator(buffer_.begin()),
                                        std::make_move_iterator(buffer_.begin() + drop));
    buffer_.erase(buffer_.begin(), buffer_.begin() + drop);

    // Dropped records are no longer pending; the floor keeps them from being buffered again
    for (const auto& record : dropped) {
        dropped_through_ = std::max(dropped_through_, record.sequence());
        store_.forgetPending(record.identity());
    }

    spdlog::warn("[AgentLoop] Buffer exceeded {} events, dropped the oldest {}", BUFFER_LIMIT, drop);
    if (dlq_) {
        dlq_->pushBatch(dropped, "buffer_overflow");
    }
}

std::chrono::milliseconds AgentLoop::step() {
    try {
        pollOnce();
        return std::chrono::duration_cast<std::chrono::milliseconds>(config_.check_interval);
    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.ticks++;
            stats_.failed_ticks++;
        }
        spdlog::error("[AgentLoop] Tick failed: {}", e.what());
        spdlog::info("[AgentLoop] Waiting {}s before next tick", config_.retry_interval.count());
        return std::chrono::duration_cast<std::chrono::milliseconds>(config_.retry_interval);
    }
}

// ============================================================================
// DRAIN & LIFECYCLE
// ============================================================================

bool AgentLoop::drain() {
    setState(AgentState::DRAINING);

    bool drained = true;
    if (!buffer_.empty()) {
        const size_t pending = buffer_.size();
        spdlog::info("[AgentLoop] Sending {} remaining events...", pending);
        if (deliverBuffer()) {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.events_delivered += pending;
        } else {
            drained = false;
            spdlog::warn("[AgentLoop] {} events left undelivered; the next catch-up pass will resend them",
                         buffer_.size());
        }
    }

    if (!store_.persist()) {
        spdlog::error("[AgentLoop] Failed to save final state");
    }

    setState(AgentState::STOPPED);
    return drained;
}

bool AgentLoop::waitFor(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(sleep_mutex_);
    sleep_cv_.wait_for(lock, delay, [this]() {
        return !running_.load(std::memory_order_acquire);
    });
    return running_.load(std::memory_order_acquire);
}

void AgentLoop::loop() {
    if (config_.catch_up_on_start) {
        try {
            runCatchUp();
        } catch (const std::exception& e) {
            spdlog::error("[AgentLoop] Catch-up pass aborted: {}", e.what());
        }
    } else {
        spdlog::info("[AgentLoop] Catch-up on start disabled");
    }

    setState(AgentState::STEADY_POLL);
    spdlog::info("[AgentLoop] Monitoring new events every {}s", config_.check_interval.count());

    while (running_.load(std::memory_order_acquire)) {
        auto delay = step();
        if (!waitFor(delay)) {
            break;
        }
    }
}

void AgentLoop::start() {
    if (!started_up_) {
        startup();
    }
    running_.store(true, std::memory_order_release);
    worker_thread_ = std::thread(&AgentLoop::loop, this);
    spdlog::info("[AgentLoop] Started (check: {}s, retry: {}s, look-back: {}min)",
                 config_.check_interval.count(), config_.retry_interval.count(),
                 config_.lookback.count());
}

void AgentLoop::stop() {
    {
        // Flip under the sleep mutex so a worker between predicate check and wait sees it
        std::lock_guard<std::mutex> lock(sleep_mutex_);
        running_.store(false, std::memory_order_release);
    }
    sleep_cv_.notify_all();
    if (!worker_thread_.joinable()) {
        return;
    }
    worker_thread_.join();

    drain();

    auto s = stats();
    spdlog::info("[AgentLoop] Stopped: ticks={} failed={} buffered={} delivered={} dropped={}",
                 s.ticks, s.failed_ticks, s.events_buffered, s.events_delivered, s.events_dropped);
}

} // namespace PrintRelay
