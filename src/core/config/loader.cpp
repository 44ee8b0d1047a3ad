#include <printrelay/core/config/loader.hpp>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <stdexcept>

using namespace AppConfig;

namespace {

YAML::Node section(const YAML::Node& root, const char* name, bool required) {
    YAML::Node node = root[name];
    if (!node) {
        if (required) {
            throw std::runtime_error(std::string("Missing required section: ") + name);
        }
        return YAML::Node(YAML::NodeType::Map);
    }
    if (!node.IsMap()) {
        throw std::runtime_error(std::string("Section must be a mapping: ") + name);
    }
    return node;
}

template <typename T>
T requireField(const YAML::Node& node, const std::string& path, const char* key) {
    YAML::Node value = node[key];
    if (!value || value.IsNull()) {
        throw std::runtime_error("Missing required field: " + path + "." + key);
    }
    try {
        return value.as<T>();
    } catch (const YAML::BadConversion&) {
        throw std::runtime_error("Invalid type for field: " + path + "." + key);
    }
}

template <typename T>
T optionalField(const YAML::Node& node, const std::string& path, const char* key, const T& fallback) {
    YAML::Node value = node[key];
    if (!value || value.IsNull()) {
        return fallback;
    }
    try {
        return value.as<T>();
    } catch (const YAML::BadConversion&) {
        throw std::runtime_error("Invalid type for field: " + path + "." + key);
    }
}

void requirePositive(long long value, const char* field) {
    if (value <= 0) {
        throw std::runtime_error(std::string("Invalid value for ") + field + ": must be > 0");
    }
}

bool isValidLogLevel(const std::string& level) {
    return level == "trace" || level == "debug" || level == "info" || level == "warn" ||
           level == "error" || level == "critical" || level == "off";
}

} // namespace

void ConfigLoader::validate(const AppConfiguration& config) {
    const auto& url = config.collector.url;
    if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) {
        throw std::runtime_error("Invalid value for collector.url: must start with http:// or https://");
    }
    requirePositive(static_cast<long long>(config.collector.batch_size), "collector.batch_size");
    requirePositive(config.collector.max_retries, "collector.max_retries");
    requirePositive(config.collector.request_timeout.count(), "collector.request_timeout_seconds");
    requirePositive(config.collector.probe_timeout.count(), "collector.probe_timeout_seconds");
    if (config.collector.retry_delay.count() < 0 || config.collector.batch_pause.count() < 0) {
        throw std::runtime_error("Invalid value for collector delays: must be >= 0");
    }

    requirePositive(config.agent.check_interval.count(), "agent.check_interval_seconds");
    requirePositive(config.agent.retry_interval.count(), "agent.retry_interval_seconds");
    requirePositive(config.agent.lookback.count(), "agent.lookback_minutes");
    if (config.agent.state_file.empty()) {
        throw std::runtime_error("Invalid value for agent.state_file: must not be empty");
    }

    if (config.source.fetch_all_command.empty() || config.source.fetch_recent_command.empty()) {
        throw std::runtime_error("Invalid value for source commands: must not be empty");
    }
    requirePositive(config.source.timeout.count(), "source.timeout_seconds");

    if (!isValidLogLevel(config.logging.level)) {
        throw std::runtime_error("Invalid value for logging.level: " + config.logging.level);
    }
}

AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    if (!std::filesystem::exists(filepath)) {
        throw std::runtime_error("Config file not found: " + filepath);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse config file " + filepath + ": " + e.what());
    }
    if (!root.IsMap()) {
        throw std::runtime_error("Config root must be a mapping: " + filepath);
    }

    AppConfiguration config;
    config.app_name = optionalField<std::string>(root, "root", "app_name", "PrintRelay");
    config.version = optionalField<std::string>(root, "root", "version", "1.0.0");

    // agent
    const YAML::Node agent = section(root, "agent", false);
    const AgentConfig agent_defaults;
    config.agent.host_name = optionalField<std::string>(agent, "agent", "host_name", "");
    config.agent.catch_up_on_start = optionalField<bool>(agent, "agent", "catch_up_on_start",
                                                         agent_defaults.catch_up_on_start);
    config.agent.check_interval = std::chrono::seconds(optionalField<long long>(
        agent, "agent", "check_interval_seconds", agent_defaults.check_interval.count()));
    config.agent.retry_interval = std::chrono::seconds(optionalField<long long>(
        agent, "agent", "retry_interval_seconds", agent_defaults.retry_interval.count()));
    config.agent.lookback = std::chrono::minutes(optionalField<long long>(
        agent, "agent", "lookback_minutes", agent_defaults.lookback.count()));
    config.agent.state_file = optionalField<std::string>(agent, "agent", "state_file",
                                                         agent_defaults.state_file);

    // collector
    const YAML::Node collector = section(root, "collector", true);
    const CollectorConfig collector_defaults;
    config.collector.url = requireField<std::string>(collector, "collector", "url");
    const long long batch_size = optionalField<long long>(
        collector, "collector", "batch_size", static_cast<long long>(collector_defaults.batch_size));
    requirePositive(batch_size, "collector.batch_size");  // checked before the unsigned cast
    config.collector.batch_size = static_cast<size_t>(batch_size);
    config.collector.max_retries = optionalField<int>(collector, "collector", "max_retries",
                                                      collector_defaults.max_retries);
    config.collector.retry_delay = std::chrono::seconds(optionalField<long long>(
        collector, "collector", "retry_delay_seconds", collector_defaults.retry_delay.count()));
    config.collector.batch_pause = std::chrono::seconds(optionalField<long long>(
        collector, "collector", "batch_pause_seconds", collector_defaults.batch_pause.count()));
    config.collector.request_timeout = std::chrono::seconds(optionalField<long long>(
        collector, "collector", "request_timeout_seconds", collector_defaults.request_timeout.count()));
    config.collector.probe_timeout = std::chrono::seconds(optionalField<long long>(
        collector, "collector", "probe_timeout_seconds", collector_defaults.probe_timeout.count()));

    // source
    const YAML::Node source = section(root, "source", true);
    const SourceConfig source_defaults;
    config.source.fetch_all_command = requireField<std::string>(source, "source", "fetch_all_command");
    config.source.fetch_recent_command = requireField<std::string>(source, "source", "fetch_recent_command");
    config.source.probe_command = optionalField<std::string>(source, "source", "probe_command", "");
    config.source.timeout = std::chrono::seconds(optionalField<long long>(
        source, "source", "timeout_seconds", source_defaults.timeout.count()));

    // logging
    const YAML::Node logging = section(root, "logging", false);
    const LoggingConfig logging_defaults;
    config.logging.level = optionalField<std::string>(logging, "logging", "level", logging_defaults.level);
    config.logging.file = optionalField<std::string>(logging, "logging", "file", logging_defaults.file);

    validate(config);
    return config;
}
