#pragma once

#include <chrono>
#include <ctime>
#include <functional>
#include <string>
#include <thread>

namespace PrintRelay {

// Injected wherever the agent waits
using SleepFn = std::function<void(std::chrono::milliseconds)>;

class Clock {
public:
    // Local wall-clock time rendered with strftime
    static inline std::string localTimestamp(const char* format) {
        std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm{};
        localtime_r(&t, &tm);
        char buffer[64];
        size_t n = std::strftime(buffer, sizeof(buffer), format, &tm);
        return std::string(buffer, n);
    }

    static inline SleepFn realSleep() {
        return [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
};

} // namespace PrintRelay
