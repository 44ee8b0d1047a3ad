#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace AppConfig {

struct AgentConfig {
    std::string host_name;                  // empty until resolved by main
    bool catch_up_on_start = true;
    std::chrono::seconds check_interval{5};
    std::chrono::seconds retry_interval{30};
    std::chrono::minutes lookback{5};
    std::string state_file = "processed_events.json";
};

struct CollectorConfig {
    std::string url;
    size_t batch_size = 50;
    int max_retries = 3;
    std::chrono::seconds retry_delay{5};
    std::chrono::seconds batch_pause{1};
    std::chrono::seconds request_timeout{30};
    std::chrono::seconds probe_timeout{5};
};

struct SourceConfig {
    std::string fetch_all_command;
    std::string fetch_recent_command;       // "{minutes}" is substituted
    std::string probe_command;              // empty: probe runs fetch_recent_command
    std::chrono::seconds timeout{300};
};

struct LoggingConfig {
    std::string level = "info";
    std::string file = "print_monitor.log";  // empty: console only
};

struct AppConfiguration {
    std::string app_name;
    std::string version;
    AgentConfig agent;
    CollectorConfig collector;
    SourceConfig source;
    LoggingConfig logging;
};

} // namespace AppConfig
