#include <printrelay/core/events/event.hpp>
#include <stdexcept>
#include <utility>

namespace PrintRelay {

CanonicalEvent::CanonicalEvent(std::string identity,
                               uint64_t sequence,
                               std::string date,
                               std::string user,
                               std::string machine,
                               std::string printer,
                               std::string document,
                               uint32_t pages)
    : identity_(std::move(identity)),
      sequence_(sequence),
      date_(std::move(date)),
      user_(std::move(user)),
      machine_(std::move(machine)),
      printer_(std::move(printer)),
      document_(std::move(document)),
      pages_(pages) {
    if (!isValidPageCount(pages_)) {
        throw std::invalid_argument("page count out of range: " + std::to_string(pages_));
    }
    if (date_.empty()) {
        throw std::invalid_argument("canonical event requires a date");
    }
    if (machine_.empty()) {
        throw std::invalid_argument("canonical event requires a machine");
    }

    if (user_.empty()) user_ = UNKNOWN_USER;
    if (document_.empty()) document_ = UNKNOWN_DOCUMENT;
    if (printer_.empty()) printer_ = UNKNOWN_PRINTER;
}

} // namespace PrintRelay
