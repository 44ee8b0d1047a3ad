#include <printrelay/core/source/event_source.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <poll.h>
#include <sstream>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace PrintRelay {

using json = nlohmann::json;

CommandEventSource::CommandEventSource(const AppConfig::SourceConfig& config)
    : config_(config) {}

std::string CommandEventSource::expandCommand(const std::string& command_template,
                                              std::chrono::minutes window) {
    static const std::string placeholder = "{minutes}";
    std::string command = command_template;
    const std::string value = std::to_string(window.count());

    size_t pos = 0;
    while ((pos = command.find(placeholder, pos)) != std::string::npos) {
        command.replace(pos, placeholder.size(), value);
        pos += value.size();
    }
    return command;
}

std::vector<RawEvent> CommandEventSource::parseEventLines(const std::string& output) {
    std::vector<RawEvent> events;
    std::istringstream stream(output);
    std::string line;
    size_t skipped = 0;

    while (std::getline(stream, line)) {
        auto begin = line.find_first_not_of(" \t\r");
        if (begin == std::string::npos) {
            continue;
        }
        auto end = line.find_last_not_of(" \t\r");
        line = line.substr(begin, end - begin + 1);

        if (line.front() != '{') {
            spdlog::debug("[CommandEventSource] {}", line);
            continue;
        }

        json obj = json::parse(line, nullptr, false);
        if (obj.is_discarded() || !obj.is_object()) {
            skipped++;
            continue;
        }

        auto record_id = obj.find("RecordId");
        if (record_id == obj.end() || !record_id->is_number_unsigned()) {
            skipped++;
            continue;
        }

        auto text = [&obj](const char* key) -> std::string {
            auto it = obj.find(key);
            return (it != obj.end() && it->is_string()) ? it->get<std::string>() : std::string();
        };

        RawEvent event;
        event.sequence = record_id->get<uint64_t>();
        event.timestamp = text("TimeCreated");
        event.host = text("MachineName");
        event.user_sid = text("UserId");
        event.message = text("Message");
        event.level = text("Level");
        events.push_back(std::move(event));
    }

    if (skipped > 0) {
        spdlog::warn("[CommandEventSource] Skipped {} malformed event line(s)", skipped);
    }
    return events;
}

std::optional<CommandEventSource::CommandResult>
CommandEventSource::runCommand(const std::string& command) const {
    int fds[2];
    if (::pipe(fds) != 0) {
        spdlog::error("[CommandEventSource] pipe() failed: {}", std::strerror(errno));
        return std::nullopt;
    }

    const char* cmd = command.c_str();
    pid_t pid = ::fork();
    if (pid < 0) {
        spdlog::error("[CommandEventSource] fork() failed: {}", std::strerror(errno));
        ::close(fds[0]);
        ::close(fds[1]);
        return std::nullopt;
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        ::dup2(fds[1], STDOUT_FILENO);
        ::close(fds[0]);
        ::close(fds[1]);
        ::execl("/bin/sh", "sh", "-c", cmd, static_cast<char*>(nullptr));
        ::_exit(127);
    }

    ::close(fds[1]);

    CommandResult result;
    const auto deadline = std::chrono::steady_clock::now() + config_.timeout;
    char buffer[4096];

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            result.timed_out = true;
            break;
        }

        pollfd pfd{fds[0], POLLIN, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(std::min<long long>(remaining, 1000)));
        if (rc < 0) {
            if (errno == EINTR) continue;
            spdlog::error("[CommandEventSource] poll() failed: {}", std::strerror(errno));
            break;
        }
        if (rc == 0) {
            continue;
        }

        ssize_t n = ::read(fds[0], buffer, sizeof(buffer));
        if (n > 0) {
            result.output.append(buffer, static_cast<size_t>(n));
        } else if (n == 0) {
            break;  // EOF
        } else if (errno != EINTR) {
            spdlog::error("[CommandEventSource] read() failed: {}", std::strerror(errno));
            break;
        }
    }

    ::close(fds[0]);

    if (result.timed_out) {
        ::kill(pid, SIGKILL);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            break;
        }
    }

    if (!result.timed_out && WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    }
    return result;
}

std::vector<RawEvent> CommandEventSource::fetch(const std::string& command, const char* what) {
    auto start = std::chrono::steady_clock::now();
    auto result = runCommand(command);
    if (!result) {
        spdlog::warn("[CommandEventSource] Could not run {} adapter", what);
        return {};
    }
    if (result->timed_out) {
        spdlog::warn("[CommandEventSource] {} adapter timed out after {}s, killed",
                     what, config_.timeout.count());
        return {};
    }
    if (result->exit_code != 0) {
        spdlog::warn("[CommandEventSource] {} adapter exited with code {}", what, result->exit_code);
        return {};
    }

    auto events = parseEventLines(result->output);
    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    spdlog::debug("[CommandEventSource] {} adapter returned {} events in {}ms",
                  what, events.size(), elapsed_ms);
    return events;
}

std::vector<RawEvent> CommandEventSource::fetchAll() {
    spdlog::info("[CommandEventSource] Fetching full event history...");
    auto events = fetch(config_.fetch_all_command, "history");
    spdlog::info("[CommandEventSource] Loaded {} events from history", events.size());
    return events;
}

std::vector<RawEvent> CommandEventSource::fetchSince(std::chrono::minutes window) {
    return fetch(expandCommand(config_.fetch_recent_command, window), "recent");
}

bool CommandEventSource::probe() {
    const std::string command = config_.probe_command.empty()
        ? expandCommand(config_.fetch_recent_command, std::chrono::minutes(1))
        : config_.probe_command;

    auto result = runCommand(command);
    if (!result || result->timed_out || result->exit_code != 0) {
        spdlog::error("[CommandEventSource] Probe failed: {}", command);
        return false;
    }
    spdlog::info("[CommandEventSource] Event source available");
    return true;
}

} // namespace PrintRelay
