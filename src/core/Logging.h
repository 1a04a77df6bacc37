#pragma once
#include <string>
#include <mutex>
#include <atomic>

namespace open_ports {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3, Trace = 4 };

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level) { level_.store(level); }
    LogLevel level() const { return level_.load(); }
    bool enabled(LogLevel level) const { return static_cast<int>(level) <= static_cast<int>(level_.load()); }

    void log(LogLevel level, const std::string& msg);
    void error(const std::string& msg) { log(LogLevel::Error, msg); }
    void warn(const std::string& msg) { log(LogLevel::Warn, msg); }
    void info(const std::string& msg) { log(LogLevel::Info, msg); }
    void debug(const std::string& msg) { log(LogLevel::Debug, msg); }
    void trace(const std::string& msg) { log(LogLevel::Trace, msg); }

    // Parses "error|warn|info|debug|trace" (case-insensitive). Returns false on unknown names.
    static bool parse_level(const std::string& name, LogLevel& out);

private:
    Logger() = default;
    static const char* prefix(LogLevel level);

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::mutex mutex_;
};

}
