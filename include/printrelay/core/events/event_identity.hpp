#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace PrintRelay {

struct IdentityParts {
    std::string host;
    uint64_t sequence = 0;
    bool legacy = false;   // Was a bare integer, host filled in from local host
};

/**
 * @brief Build the dedup key for (host, sequence): "<host>_<sequence>"
 */
std::string makeIdentity(const std::string& host, uint64_t sequence);

/**
 * @brief Split an identity back into host and sequence.
 *
 * Splits at the last underscore so host names containing '_' survive.
 * A digit-only string is a legacy identity and belongs to local_host.
 * @return nullopt if the text is neither form
 */
std::optional<IdentityParts> parseIdentity(const std::string& text,
                                           const std::string& local_host);

/**
 * @brief Parse an unsigned decimal without sign, whitespace or overflow.
 */
std::optional<uint64_t> parseSequence(const std::string& digits);

} // namespace PrintRelay
