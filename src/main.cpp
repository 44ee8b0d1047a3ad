#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <curl/curl.h>
#include <unistd.h>
#include <climits>
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <thread>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <printrelay/core/config/loader.hpp>
#include <printrelay/core/agent/agent_loop.hpp>
#include <printrelay/core/delivery/http_transport.hpp>
#include <printrelay/core/delivery/sender.hpp>
#include <printrelay/core/events/dead_letter_queue.hpp>
#include <printrelay/core/source/event_source.hpp>
#include <printrelay/core/storage/dedup_store.hpp>

using namespace PrintRelay;

// ============================================================================
// Global State
// ============================================================================

static std::atomic<bool> g_running{true};

static void signalHandler(int /*signum*/) {
    g_running.store(false, std::memory_order_release);
}

// ============================================================================
// Initialization Functions
// ============================================================================

static void setupLogging(const AppConfig::AppConfiguration& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!config.logging.file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.logging.file));
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("Cannot open log file {}: {}", config.logging.file, e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("printrelay", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::from_str(config.logging.level));
    spdlog::flush_on(spdlog::level::warn);

    spdlog::info("{} v{} starting...", config.app_name, config.version);
    spdlog::info("Build: {} {}", __DATE__, __TIME__);
}

static void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

static AppConfig::AppConfiguration loadConfiguration(int argc, char* argv[]) {
    const char* configPath = (argc > 1) ? argv[1] : "config/config.yaml";
    spdlog::info("Loading configuration from: {}", configPath);
    return ConfigLoader::loadConfig(configPath);
}

static std::string resolveHostName() {
    char hostname[HOST_NAME_MAX + 1] = {0};
    if (gethostname(hostname, sizeof(hostname)) != 0 || hostname[0] == '\0') {
        throw std::runtime_error("Cannot determine host name; set agent.host_name");
    }
    return hostname;
}

// ============================================================================
// Component Lifecycle
// ============================================================================

struct Components {
    // Order matters for destruction: the agent references everything above it
    std::unique_ptr<CurlTransport> transport;
    std::unique_ptr<Sender> sender;
    std::unique_ptr<CommandEventSource> source;
    std::unique_ptr<DedupStore> store;
    std::unique_ptr<DeadLetterQueue> dlq;
    std::unique_ptr<AgentLoop> agent;
};

static Components initializeComponents(const AppConfig::AppConfiguration& config) {
    Components c;

    c.transport = std::make_unique<CurlTransport>();
    c.sender = std::make_unique<Sender>(config.collector, *c.transport);
    c.source = std::make_unique<CommandEventSource>(config.source);
    c.store = std::make_unique<DedupStore>(config.agent.state_file, config.agent.host_name);
    c.dlq = std::make_unique<DeadLetterQueue>();
    c.agent = std::make_unique<AgentLoop>(config.agent, *c.source, *c.sender, *c.store, c.dlq.get());

    spdlog::info("Collector: {}", config.collector.url);
    spdlog::info("State file: {}", config.agent.state_file);
    spdlog::info("Batch size: {}, max retries: {}", config.collector.batch_size,
                 config.collector.max_retries);
    return c;
}

static void stopComponents(Components& c) {
    spdlog::info("=== SHUTDOWN SEQUENCE ===");

    if (c.agent) c.agent->stop();
    if (c.dlq && c.dlq->totalDropped() > 0) {
        spdlog::warn("{} events were dropped during this run", c.dlq->totalDropped());
    }

    spdlog::info("=== SHUTDOWN COMPLETE ===");
}

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    setupSignalHandlers();

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        spdlog::error("Fatal error: curl_global_init failed");
        return EXIT_FAILURE;
    }

    int exit_code = EXIT_SUCCESS;
    try {
        auto config = loadConfiguration(argc, argv);
        if (config.agent.host_name.empty()) {
            config.agent.host_name = resolveHostName();
        }
        setupLogging(config);
        spdlog::info("Configuration loaded successfully");

        auto components = initializeComponents(config);
        components.agent->start();

        spdlog::info("Print monitor running. Press Ctrl+C to shutdown.");

        while (g_running.load(std::memory_order_acquire)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }
        spdlog::info("Shutdown requested");

        stopComponents(components);

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        exit_code = EXIT_FAILURE;
    }

    curl_global_cleanup();
    if (exit_code == EXIT_SUCCESS) {
        spdlog::info("Print monitor terminated gracefully");
    }
    return exit_code;
}
