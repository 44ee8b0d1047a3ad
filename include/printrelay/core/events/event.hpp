#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace PrintRelay {

/**
 * @brief One log entry exactly as the host's event source reports it.
 */
struct RawEvent {
    uint64_t sequence = 0;      // Per-host, monotonically increasing record id
    std::string timestamp;      // "YYYY-MM-DD HH:MM:SS", may be empty
    std::string host;           // Machine that wrote the record, may be empty
    std::string user_sid;       // Informational only
    std::string message;        // Free-text payload
    std::string level;          // Informational only
};

/**
 * @class CanonicalEvent
 * @brief Normalized, collector-ready print job record.
 *
 * Construction validates every field:
 * - pages must lie in [MIN_PAGES, MAX_PAGES]
 * - date and machine must be non-empty
 * - empty user / document / printer fall back to their sentinels
 *
 * identity and sequence are internal bookkeeping and never leave the agent.
 */
class CanonicalEvent {
public:
    static constexpr uint32_t MIN_PAGES = 1;
    static constexpr uint32_t MAX_PAGES = 10000;

    static constexpr const char* UNKNOWN_USER = "Unknown";
    static constexpr const char* UNKNOWN_DOCUMENT = "Document";
    static constexpr const char* UNKNOWN_PRINTER = "Printer";

    /**
     * @throws std::invalid_argument on out-of-range pages or empty date/machine
     */
    CanonicalEvent(std::string identity,
                   uint64_t sequence,
                   std::string date,
                   std::string user,
                   std::string machine,
                   std::string printer,
                   std::string document,
                   uint32_t pages);

    static bool isValidPageCount(uint64_t pages) {
        return pages >= MIN_PAGES && pages <= MAX_PAGES;
    }

    const std::string& identity() const { return identity_; }
    uint64_t sequence() const { return sequence_; }
    const std::string& date() const { return date_; }
    const std::string& user() const { return user_; }
    const std::string& machine() const { return machine_; }
    const std::string& printer() const { return printer_; }
    const std::string& document() const { return document_; }
    uint32_t pages() const { return pages_; }

private:
    std::string identity_;
    uint64_t sequence_;
    std::string date_;
    std::string user_;
    std::string machine_;
    std::string printer_;
    std::string document_;
    uint32_t pages_;
};

using Batch = std::vector<CanonicalEvent>;

} // namespace PrintRelay
