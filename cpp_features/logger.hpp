#pragma once
#include <string>
#include <mutex>
#include <atomic>
#include <iostream>

// Thread-safe, level-filtered logger writing to stderr.
namespace fastsampen {
enum class LogLevel { Error=0, Warn=1, Info=2, Debug=3 };

// Accepts "error", "warn", "info", "debug" (any case). Throws InvalidParameter otherwise.
LogLevel parse_log_level(const std::string& name);

class Logger {
public:
    explicit Logger(LogLevel level = LogLevel::Warn) noexcept : level_(level) {}
    void set_level(LogLevel lvl) noexcept { level_ = lvl; }
    LogLevel level() const noexcept { return level_; }
    bool enabled(LogLevel lvl) const noexcept { return static_cast<int>(lvl) <= static_cast<int>(level_.load()); }

    void error(const std::string& msg) noexcept { log("ERROR", msg, LogLevel::Error); }
    void warn(const std::string& msg) noexcept { log("WARN", msg, LogLevel::Warn); }
    void info(const std::string& msg) noexcept { log("INFO", msg, LogLevel::Info); }
    void debug(const std::string& msg) noexcept { log("DEBUG", msg, LogLevel::Debug); }

private:
    void log(const char* prefix, const std::string& msg, LogLevel msgLvl) noexcept {
        if (!enabled(msgLvl)) return;
        std::scoped_lock lock(mu_);
        std::cerr << "[fastsampen " << prefix << "] " << msg << std::endl;
    }
    std::atomic<LogLevel> level_;
    std::mutex mu_;
};

// Process-wide logger. Initial level comes from FASTSAMPEN_LOG_LEVEL, else Warn.
Logger& logger();
} // namespace fastsampen
