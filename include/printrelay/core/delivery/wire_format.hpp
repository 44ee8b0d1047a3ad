#pragma once

#include <printrelay/core/events/event.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace PrintRelay {

/**
 * @brief Collector representation of one event:
 * {date, user, machine, pages, document, printer}. Identity is not sent.
 */
nlohmann::json toWireJson(const CanonicalEvent& event);

/**
 * @brief Request body for one batch: {"events": [...]}
 */
std::string encodeBatch(const Batch& batch);

/**
 * @brief Extract the human-readable "message" from a collector reply.
 * @return nullopt if the body is not a JSON object with a string message
 */
std::optional<std::string> decodeReplyMessage(const std::string& body);

} // namespace PrintRelay
