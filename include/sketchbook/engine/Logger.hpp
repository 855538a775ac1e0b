#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sketchbook {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Fatal
};

[[nodiscard]] const char* toString(LogLevel level) noexcept;
// Accepts the lowercase names used in config files ("info", "warn", ...), in any case.
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view text) noexcept;

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string message;
    std::string category;
    std::string file;
    int line{0};
    std::chrono::system_clock::time_point timestamp;
};

// Destination for formatted log lines. Sinks are called with the logger lock held.
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogEntry& entry, const std::string& line) = 0;
};

// Process-wide log. Keeps the most recent entries in memory and fans each one
// out to stdout, an optional file and any registered callbacks.
class Logger {
public:
    using LogCallback = std::function<void(const LogEntry&)>;

    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string& message, const std::string& category = "");
    void log(LogLevel level, const std::string& message, const char* file, int line, const std::string& category = "");

    void trace(const std::string& message, const std::string& category = "") { log(LogLevel::Trace, message, category); }
    void debug(const std::string& message, const std::string& category = "") { log(LogLevel::Debug, message, category); }
    void info(const std::string& message, const std::string& category = "") { log(LogLevel::Info, message, category); }
    void warning(const std::string& message, const std::string& category = "") { log(LogLevel::Warning, message, category); }
    void error(const std::string& message, const std::string& category = "") { log(LogLevel::Error, message, category); }
    void fatal(const std::string& message, const std::string& category = "") { log(LogLevel::Fatal, message, category); }

    void setMinLevel(LogLevel level);
    [[nodiscard]] LogLevel getMinLevel() const;

    // History
    void setMaxEntries(std::size_t max);
    [[nodiscard]] std::vector<LogEntry> entries() const;
    void clear();

    void setConsoleOutput(bool enabled);

    // Appends to path. Returns false when the file cannot be opened.
    bool setLogFile(const std::string& path);
    void closeLogFile();

    // Callbacks run after the lock is released, so they may log themselves.
    void addCallback(const std::string& name, LogCallback callback);
    void removeCallback(const std::string& name);

    // "HH:MM:SS [LEVEL] [category] message (file:line)"
    [[nodiscard]] static std::string format(const LogEntry& entry);

private:
    Logger();

    void trim();

    LogLevel minLevel{LogLevel::Info};
    std::size_t maxEntries{1000};
    std::deque<LogEntry> history;
    std::unique_ptr<LogSink> console;
    std::unique_ptr<LogSink> file;
    bool consoleEnabled{true};
    std::vector<std::pair<std::string, LogCallback>> callbacks;
    mutable std::mutex mutex;
};

} // namespace sketchbook

#define SKETCHBOOK_LOG(level, msg) sketchbook::Logger::instance().log(level, msg, __FILE__, __LINE__)
#define SKETCHBOOK_LOG_TRACE(msg) SKETCHBOOK_LOG(sketchbook::LogLevel::Trace, msg)
#define SKETCHBOOK_LOG_DEBUG(msg) SKETCHBOOK_LOG(sketchbook::LogLevel::Debug, msg)
#define SKETCHBOOK_LOG_INFO(msg) SKETCHBOOK_LOG(sketchbook::LogLevel::Info, msg)
#define SKETCHBOOK_LOG_WARN(msg) SKETCHBOOK_LOG(sketchbook::LogLevel::Warning, msg)
#define SKETCHBOOK_LOG_ERROR(msg) SKETCHBOOK_LOG(sketchbook::LogLevel::Error, msg)
#define SKETCHBOOK_LOG_FATAL(msg) SKETCHBOOK_LOG(sketchbook::LogLevel::Fatal, msg)
