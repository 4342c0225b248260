#pragma once
#include <atomic>
#include <cstdio>
#include <mutex>
#include <string>

namespace dcp {
enum class LogLevel { Debug = 0, Info = 1, Warning = 2, Error = 3 };

// Parses "debug", "info", "warning"/"warn" or "error"; throws ConfigError otherwise.
LogLevel parse_log_level(const std::string& name);

class Logger {
public:
    static void set_level(LogLevel level) { level_.store(level); }
    static LogLevel level() { return level_.load(); }
    static bool enabled(LogLevel level) { return level >= level_.load(); }

    template <typename... Args>
    static void debug(const char* fmt, Args... args) {
        if (!enabled(LogLevel::Debug)) return;
        std::lock_guard<std::mutex> lk(mu_);
        fprintf(stdout, (std::string("[D] ") + fmt + "\n").c_str(), args...);
    }

    template <typename... Args>
    static void info(const char* fmt, Args... args) {
        if (!enabled(LogLevel::Info)) return;
        std::lock_guard<std::mutex> lk(mu_);
        fprintf(stdout, (std::string("[I] ") + fmt + "\n").c_str(), args...);
    }

    template <typename... Args>
    static void warn(const char* fmt, Args... args) {
        if (!enabled(LogLevel::Warning)) return;
        std::lock_guard<std::mutex> lk(mu_);
        fprintf(stdout, (std::string("[W] ") + fmt + "\n").c_str(), args...);
        fflush(stdout);
    }

    template <typename... Args>
    static void error(const char* fmt, Args... args) {
        std::lock_guard<std::mutex> lk(mu_);
        fprintf(stderr, (std::string("[E] ") + fmt + "\n").c_str(), args...);
    }

private:
    static inline std::mutex mu_{};
    static inline std::atomic<LogLevel> level_{LogLevel::Info};
};
}
