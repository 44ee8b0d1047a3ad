// Sender Contract
// ---------------
// Input:
//   - Canonical events, already deduplicated
// Guarantees:
//   - At-least-once: a batch is reported sent only on HTTP 200
//   - Independent retry budget per batch
// Output:
//   - true/false per batch, DeliveryReport per multi-batch delivery

#include <printrelay/core/delivery/sender.hpp>
#include <printrelay/core/delivery/batcher.hpp>
#include <printrelay/core/delivery/wire_format.hpp>
#include <spdlog/spdlog.h>
#include <utility>

namespace PrintRelay {

Sender::Sender(const AppConfig::CollectorConfig& config,
               HttpTransport& transport,
               SleepFn sleep)
    : config_(config), transport_(transport), sleep_(std::move(sleep)) {}

bool Sender::deliver(const Batch& batch) {
    if (batch.empty()) {
        return true;
    }

    const std::string body = encodeBatch(batch);

    for (int attempt = 1; attempt <= config_.max_retries; ++attempt) {
        HttpResponse response = transport_.postJson(config_.url, body, config_.request_timeout);

        if (response.status == 200) {
            if (auto message = decodeReplyMessage(response.body)) {
                spdlog::debug("[Sender] Collector replied: {}", *message);
            } else {
                spdlog::warn("[Sender] Collector accepted batch but reply was not understood: {:.200}",
                             response.body);
            }
            return true;
        }

        if (response.timed_out) {
            spdlog::warn("[Sender] Attempt {}/{}: request timed out", attempt, config_.max_retries);
        } else if (response.transportFailed()) {
            spdlog::warn("[Sender] Attempt {}/{}: collector unavailable ({})",
                         attempt, config_.max_retries, response.error);
        } else {
            spdlog::error("[Sender] Attempt {}/{}: HTTP {}: {:.200}",
                          attempt, config_.max_retries, response.status, response.body);
        }

        if (attempt < config_.max_retries) {
            sleep_(std::chrono::duration_cast<std::chrono::milliseconds>(config_.retry_delay));
        }
    }

    return false;
}

Sender::DeliveryReport Sender::deliverAll(const std::vector<CanonicalEvent>& records,
                                          bool stop_on_first_failure) {
    DeliveryReport report;
    report.events_total = records.size();
    if (records.empty()) {
        return report;
    }

    auto batches = chunk(records, config_.batch_size);
    report.batches_total = batches.size();

    spdlog::info("[Sender] Sending {} events in {} batch(es) of up to {}",
                 records.size(), batches.size(), config_.batch_size);

    for (size_t i = 0; i < batches.size(); ++i) {
        spdlog::info("[Sender] Batch {}/{} ({} events)", i + 1, batches.size(), batches[i].size());

        if (deliver(batches[i])) {
            report.batches_sent++;
            report.events_sent += batches[i].size();
        } else {
            report.batches_failed++;
            spdlog::warn("[Sender] Batch {}/{} failed", i + 1, batches.size());
            if (stop_on_first_failure) {
                break;
            }
        }

        if (i + 1 < batches.size()) {
            sleep_(std::chrono::duration_cast<std::chrono::milliseconds>(config_.batch_pause));
        }
    }

    spdlog::info("[Sender] Delivered {}/{} events", report.events_sent, report.events_total);
    return report;
}

bool Sender::probeCollector() {
    const std::string root = collectorRoot(config_.url);
    HttpResponse response = transport_.get(root, config_.probe_timeout);

    if (response.status == 200) {
        spdlog::info("[Sender] Collector reachable at {}", root);
        return true;
    }
    if (response.transportFailed()) {
        spdlog::warn("[Sender] Collector unreachable at {}: {}", root, response.error);
    } else {
        spdlog::warn("[Sender] Collector at {} returned HTTP {}", root, response.status);
    }
    return false;
}

std::string Sender::collectorRoot(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return url;
    }
    auto path_start = url.find('/', scheme_end + 3);
    if (path_start == std::string::npos) {
        return url + "/";
    }
    return url.substr(0, path_start + 1);
}

} // namespace PrintRelay
