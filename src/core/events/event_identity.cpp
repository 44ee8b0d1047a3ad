#include <printrelay/core/events/event_identity.hpp>
#include <limits>

namespace PrintRelay {

std::string makeIdentity(const std::string& host, uint64_t sequence) {
    std::string id;
    id.reserve(host.size() + 21);
    id.append(host);
    id.push_back('_');
    id.append(std::to_string(sequence));
    return id;
}

std::optional<uint64_t> parseSequence(const std::string& digits) {
    if (digits.empty()) {
        return std::nullopt;
    }

    constexpr uint64_t max = std::numeric_limits<uint64_t>::max();
    uint64_t value = 0;
    for (char c : digits) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (max - digit) / 10) {
            return std::nullopt;  // overflow
        }
        value = value * 10 + digit;
    }
    return value;
}

std::optional<IdentityParts> parseIdentity(const std::string& text,
                                           const std::string& local_host) {
    // Legacy state files stored bare record ids for the local machine
    if (auto legacy = parseSequence(text)) {
        return IdentityParts{local_host, *legacy, true};
    }

    auto pos = text.rfind('_');
    if (pos == std::string::npos || pos == 0) {
        return std::nullopt;
    }

    auto sequence = parseSequence(text.substr(pos + 1));
    if (!sequence) {
        return std::nullopt;
    }
    return IdentityParts{text.substr(0, pos), *sequence, false};
}

} // namespace PrintRelay
