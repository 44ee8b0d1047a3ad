#include <printrelay/core/extract/extractor.hpp>
#include <printrelay/core/events/event_identity.hpp>
#include <printrelay/core/utils/clock.hpp>
#include <spdlog/spdlog.h>
#include <regex>
#include <stdexcept>
#include <utility>
#include <vector>

namespace PrintRelay {

namespace {

struct LanguagePatterns {
    std::regex document_user;   // group 1 = document, group 2 = user
    std::regex printer;         // group 1 = printer
    std::vector<std::regex> pages;
};

struct PatternTable {
    LanguagePatterns english;
    LanguagePatterns portuguese;
    std::vector<std::regex> generic_pages;
};

constexpr auto ICASE = std::regex::ECMAScript | std::regex::icase;

// Compiled once; std::regex construction is far too slow for the per-event path
const PatternTable& patterns() {
    static const PatternTable table = [] {
        PatternTable t;

        const std::regex size_and_count(
            R"((?:Size in bytes:|Tamanho em bytes:)\s*\d+\.\s*(?:Pages printed:|Páginas impressas:)?\s*(\d+))");

        t.english.document_user = std::regex(R"(Document \d+, (.+?) owned by (.+?) on)");
        t.english.printer = std::regex(R"(was printed on (.+?)(?:\s+through|\s+via|\.|$))");
        t.english.pages = {
            std::regex(R"(Pages printed:\s*(\d+))"),
            std::regex(R"(Total pages printed:\s*(\d+))"),
            std::regex(R"((\d+)\s+pages?\b)", ICASE),
            size_and_count,
        };

        t.portuguese.document_user = std::regex(R"(O documento \d+, (.+?) pertencente a (.+?) em)");
        t.portuguese.printer = std::regex(R"(foi impresso em (.+?)(?:\s+pela porta|\s+através|\.|$))");
        t.portuguese.pages = {
            std::regex(R"(Páginas impressas:\s*(\d+))"),
            std::regex(R"(Total de páginas impressas:\s*(\d+))"),
            std::regex(R"((\d+)\s+páginas?\b)", ICASE),
            size_and_count,
        };

        t.generic_pages = {
            std::regex(R"((?:páginas?|pages?)\s*:\s*(\d+))", ICASE),
            std::regex(R"((\d+)\s*(?:páginas?|pages?))", ICASE),
            std::regex(R"(total\s*:\s*(\d+))", ICASE),
            std::regex(R"((?:impressas?|printed)\s*:\s*(\d+))", ICASE),
        };
        return t;
    }();
    return table;
}

// libstdc++ regex recursion depth grows with input length
std::string scanWindow(const std::string& message) {
    if (message.size() <= Extractor::MAX_SCAN_BYTES) {
        return message;
    }
    return message.substr(0, Extractor::MAX_SCAN_BYTES);
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return {};
    }
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

// Returns the first in-range value across the pattern list, logging rejects
std::optional<uint32_t> firstValidCount(const std::string& message,
                                        const std::vector<std::regex>& list,
                                        const char* group) {
    std::smatch m;
    for (size_t i = 0; i < list.size(); ++i) {
        if (!std::regex_search(message, m, list[i])) {
            continue;
        }
        auto value = parseSequence(m[1].str());
        if (value && CanonicalEvent::isValidPageCount(*value)) {
            spdlog::debug("[Extractor] Pages found ({} pattern {}): {}", group, i + 1, *value);
            return static_cast<uint32_t>(*value);
        }
        spdlog::debug("[Extractor] Rejected page count '{}' ({} pattern {})",
                      m[1].str(), group, i + 1);
    }
    return std::nullopt;
}

} // namespace

Extractor::Extractor(std::string local_host)
    : local_host_(std::move(local_host)) {}

MessageLanguage Extractor::detectLanguage(const std::string& message) {
    if (message.find("pertencente a") != std::string::npos ||
        message.find("foi impresso") != std::string::npos) {
        return MessageLanguage::PORTUGUESE;
    }
    return MessageLanguage::ENGLISH;
}

std::optional<uint32_t> Extractor::extractPages(const std::string& message,
                                                MessageLanguage language) {
    const auto& table = patterns();
    const auto& lang = (language == MessageLanguage::PORTUGUESE) ? table.portuguese : table.english;
    const std::string scan = scanWindow(message);

    if (auto pages = firstValidCount(scan, lang.pages, "language")) {
        return pages;
    }
    return firstValidCount(scan, table.generic_pages, "generic");
}

std::optional<CanonicalEvent> Extractor::extract(const RawEvent& raw) const {
    try {
        if (raw.message.size() > MAX_SCAN_BYTES) {
            spdlog::warn("[Extractor] Message for record {} is {} bytes, scanning the first {}",
                         raw.sequence, raw.message.size(), MAX_SCAN_BYTES);
        }
        const std::string message = scanWindow(raw.message);
        const std::string machine = raw.host.empty() ? local_host_ : raw.host;
        const std::string date = raw.timestamp.empty()
            ? Clock::localTimestamp("%Y-%m-%d %H:%M:%S")
            : raw.timestamp;

        spdlog::debug("[Extractor] Message for record {}: {:.200}", raw.sequence, message);

        auto language = detectLanguage(message);
        const auto& table = patterns();
        const auto& lang = (language == MessageLanguage::PORTUGUESE) ? table.portuguese : table.english;

        std::string document;
        std::string user;
        std::string printer;

        std::smatch m;
        if (std::regex_search(message, m, lang.document_user)) {
            document = trim(m[1].str());
            user = trim(m[2].str());
        }
        if (std::regex_search(message, m, lang.printer)) {
            printer = trim(m[1].str());
        }

        uint32_t pages = CanonicalEvent::MIN_PAGES;
        if (auto found = extractPages(message, language)) {
            pages = *found;
        } else {
            spdlog::warn("[Extractor] No valid page count for record {}, using {}",
                         raw.sequence, CanonicalEvent::MIN_PAGES);
        }

        CanonicalEvent event(makeIdentity(machine, raw.sequence), raw.sequence,
                             date, std::move(user), machine, std::move(printer),
                             std::move(document), pages);

        spdlog::debug("[Extractor] Extracted: id={} user={} doc={:.30} pages={}",
                      event.identity(), event.user(), event.document(), event.pages());
        return event;
    } catch (const std::exception& e) {
        spdlog::error("[Extractor] Failed to extract record {}: {}", raw.sequence, e.what());
        return std::nullopt;
    }
}

} // namespace PrintRelay
