
#pragma once
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <functional>
#include <mutex>
#include <string>

namespace tilecast {

enum class LogLevel { TRACE=0, DEBUG, INFO, WARN, ERROR };

bool parse_log_level(const std::string& s, LogLevel& out);
const char* level_name(LogLevel lvl);

// Process-wide logger. Lines go to stderr unless a log file or a sink is set.
class Logger {
public:
    // Receives one fully formatted line without the trailing newline.
    using Sink = std::function<void(LogLevel, const std::string&)>;

    static Logger& instance();
    void set_level(LogLevel lvl) { level_.store(lvl); }
    LogLevel level() const { return level_.load(); }
    bool enabled(LogLevel lvl) const { return lvl >= level_.load(); }

    // Appends to path; returns false and keeps the current target on failure.
    bool open_file(const std::string& path);
    // Replaces the output target; an empty sink restores the default.
    void set_sink(Sink sink);

    void log(LogLevel lvl, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;
private:
    Logger() = default;
    ~Logger();
    std::mutex mtx_;
    std::atomic<LogLevel> level_{LogLevel::INFO};
    FILE* file_{nullptr};
    Sink sink_;

    std::string stamp() const;
};

} // namespace tilecast
