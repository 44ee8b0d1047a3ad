#pragma once

#include <printrelay/core/config/app_config.hpp>
#include <printrelay/core/events/event.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace PrintRelay {

/**
 * @class EventSource
 * @brief Enumerates raw log entries on the host.
 *
 * Implementations never throw for an unavailable source and never block
 * without bound: they log and return an empty sequence.
 */
class EventSource {
public:
    virtual ~EventSource() = default;

    virtual std::vector<RawEvent> fetchAll() = 0;
    virtual std::vector<RawEvent> fetchSince(std::chrono::minutes window) = 0;

    // Startup reachability check
    virtual bool probe() = 0;
};

/**
 * @class CommandEventSource
 * @brief Runs an adapter command that prints one JSON object per event.
 *
 * Line format:
 *   {"RecordId":42,"TimeCreated":"2024-05-01 10:00:00","MachineName":"PC1",
 *    "UserId":"S-1-5-21-...","Message":"...","Level":"Information"}
 *
 * Lines not starting with '{' are adapter chatter and only logged.
 */
class CommandEventSource : public EventSource {
public:
    explicit CommandEventSource(const AppConfig::SourceConfig& config);
    ~CommandEventSource() override = default;

    std::vector<RawEvent> fetchAll() override;
    std::vector<RawEvent> fetchSince(std::chrono::minutes window) override;
    bool probe() override;

    /**
     * @brief Parse adapter output; malformed lines are skipped.
     */
    static std::vector<RawEvent> parseEventLines(const std::string& output);

    /**
     * @brief Replace every "{minutes}" in the template.
     */
    static std::string expandCommand(const std::string& command_template,
                                     std::chrono::minutes window);

private:
    struct CommandResult {
        int exit_code = -1;
        bool timed_out = false;
        std::string output;
    };

    // /bin/sh -c <command>, stdout captured, killed after config_.timeout
    std::optional<CommandResult> runCommand(const std::string& command) const;

    std::vector<RawEvent> fetch(const std::string& command, const char* what);

    AppConfig::SourceConfig config_;
};

} // namespace PrintRelay
