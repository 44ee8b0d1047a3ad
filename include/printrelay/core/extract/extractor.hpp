#pragma once

#include <printrelay/core/events/event.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace PrintRelay {

enum class MessageLanguage {
    ENGLISH = 0,
    PORTUGUESE = 1
};

/**
 * @class Extractor
 * @brief Turns one RawEvent into a CanonicalEvent. Pure, no I/O apart from logging.
 *
 * Each field category (document/user, printer, pages) is resolved by an
 * ordered pattern list for the detected language; the first match wins.
 * Fields that never match fall back to CanonicalEvent sentinels, so a record
 * is only lost if something unexpected throws.
 */
class Extractor {
public:
    // Only this prefix of a message is matched against the patterns
    static constexpr size_t MAX_SCAN_BYTES = 4096;

    explicit Extractor(std::string local_host);

    /**
     * @return canonical record, or nullopt on an unexpected internal failure
     */
    std::optional<CanonicalEvent> extract(const RawEvent& raw) const;

    static MessageLanguage detectLanguage(const std::string& message);

    /**
     * @brief Page count search, in order: "pages printed", "total pages
     * printed", "<N> page(s)", size-plus-count, generic keyword scan.
     * @return first value inside [1, 10000], nullopt if none
     */
    static std::optional<uint32_t> extractPages(const std::string& message,
                                                MessageLanguage language);

private:
    std::string local_host_;
};

} // namespace PrintRelay
