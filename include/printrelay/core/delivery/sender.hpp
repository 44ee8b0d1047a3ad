#pragma once

#include <printrelay/core/config/app_config.hpp>
#include <printrelay/core/delivery/http_transport.hpp>
#include <printrelay/core/events/event.hpp>
#include <printrelay/core/utils/clock.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace PrintRelay {

/**
 * @class Sender
 * @brief Delivers batches to the collector with bounded, per-batch retries.
 *
 * - HTTP 200 is success; any other status or transport error is a failure
 * - up to max_retries attempts, retry_delay between attempts, none after the last
 * - batch_pause between consecutive batches of one multi-batch delivery
 */
class Sender {
public:
    struct DeliveryReport {
        size_t batches_total = 0;
        size_t batches_sent = 0;
        size_t batches_failed = 0;
        size_t events_total = 0;
        size_t events_sent = 0;

        bool ok() const { return batches_sent == batches_total; }
    };

    Sender(const AppConfig::CollectorConfig& config,
           HttpTransport& transport,
           SleepFn sleep = Clock::realSleep());

    /**
     * @brief Send one batch as a single request, retrying per the budget.
     */
    bool deliver(const Batch& batch);

    /**
     * @brief Chunk records by batch_size and deliver each batch in order.
     * @param stop_on_first_failure skip the remaining batches once one fails
     */
    DeliveryReport deliverAll(const std::vector<CanonicalEvent>& records,
                              bool stop_on_first_failure);

    /**
     * @brief GET the collector root; true if it answers 200.
     */
    bool probeCollector();

    /**
     * @brief "http://host:5002/api/print_events" -> "http://host:5002/"
     */
    static std::string collectorRoot(const std::string& url);

private:
    AppConfig::CollectorConfig config_;
    HttpTransport& transport_;
    SleepFn sleep_;
};

} // namespace PrintRelay
