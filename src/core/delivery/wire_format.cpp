#include <printrelay/core/delivery/wire_format.hpp>

namespace PrintRelay {

using json = nlohmann::json;

json toWireJson(const CanonicalEvent& event) {
    return json{
        {"date", event.date()},
        {"user", event.user()},
        {"machine", event.machine()},
        {"pages", event.pages()},
        {"document", event.document()},
        {"printer", event.printer()},
    };
}

std::string encodeBatch(const Batch& batch) {
    json events = json::array();
    for (const auto& event : batch) {
        events.push_back(toWireJson(event));
    }
    // Windows event messages are not guaranteed to be valid UTF-8
    return json{{"events", std::move(events)}}.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::optional<std::string> decodeReplyMessage(const std::string& body) {
    json reply = json::parse(body, nullptr, false);
    if (reply.is_discarded() || !reply.is_object()) {
        return std::nullopt;
    }
    auto it = reply.find("message");
    if (it == reply.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

} // namespace PrintRelay
