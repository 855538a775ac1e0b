#include "sketchbook/engine/Logger.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace sketchbook {

namespace {

struct LevelNames {
    LogLevel level;
    const char* name;
    const char* tag; // padded to one width so messages line up
};

constexpr LevelNames kLevels[] = {
    {LogLevel::Trace, "trace", "[TRACE] "},
    {LogLevel::Debug, "debug", "[DEBUG] "},
    {LogLevel::Info, "info", "[INFO]  "},
    {LogLevel::Warning, "warn", "[WARN]  "},
    {LogLevel::Error, "error", "[ERROR] "},
    {LogLevel::Fatal, "fatal", "[FATAL] "},
};

const LevelNames& namesOf(LogLevel level) noexcept
{
    for (const auto& names : kLevels) {
        if (names.level == level) {
            return names;
        }
    }
    return kLevels[0];
}

bool equalsIgnoreCase(std::string_view text, std::string_view lowercase) noexcept
{
    if (text.size() != lowercase.size()) {
        return false;
    }
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(text[i])) != lowercase[i]) {
            return false;
        }
    }
    return true;
}

class ConsoleSink final : public LogSink {
public:
    void write(const LogEntry&, const std::string& line) override
    {
        std::cout << line << '\n';
        std::cout.flush();
    }
};

class FileSink final : public LogSink {
public:
    explicit FileSink(std::ofstream stream)
        : out(std::move(stream))
    {
    }

    void write(const LogEntry&, const std::string& line) override
    {
        out << line << '\n';
        out.flush();
    }

private:
    std::ofstream out;
};

} // namespace

const char* toString(LogLevel level) noexcept
{
    return namesOf(level).name;
}

std::optional<LogLevel> parseLogLevel(std::string_view text) noexcept
{
    if (equalsIgnoreCase(text, "warning")) {
        return LogLevel::Warning;
    }
    for (const auto& names : kLevels) {
        if (equalsIgnoreCase(text, names.name)) {
            return names.level;
        }
    }
    return std::nullopt;
}

Logger& Logger::instance()
{
    static Logger logger;
    return logger;
}

Logger::Logger()
    : console(std::make_unique<ConsoleSink>())
{
}

void Logger::log(LogLevel level, const std::string& message, const std::string& category)
{
    log(level, message, nullptr, 0, category);
}

void Logger::log(LogLevel level, const std::string& message, const char* sourceFile, int line, const std::string& category)
{
    LogEntry entry{level, message, category, sourceFile != nullptr ? sourceFile : "", line, std::chrono::system_clock::now()};

    std::vector<LogCallback> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (level < minLevel) {
            return;
        }

        const std::string text = format(entry);
        if (consoleEnabled) {
            console->write(entry, text);
        }
        if (file) {
            file->write(entry, text);
        }

        history.push_back(entry);
        trim();

        listeners.reserve(callbacks.size());
        for (const auto& registered : callbacks) {
            listeners.push_back(registered.second);
        }
    }

    for (const auto& listener : listeners) {
        listener(entry);
    }
}

std::string Logger::format(const LogEntry& entry)
{
    const std::time_t seconds = std::chrono::system_clock::to_time_t(entry.timestamp);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif

    std::ostringstream out;
    out << std::put_time(&local, "%H:%M:%S") << ' ' << namesOf(entry.level).tag;
    if (!entry.category.empty()) {
        out << '[' << entry.category << "] ";
    }
    out << entry.message;
    if (!entry.file.empty()) {
        out << " (" << entry.file << ':' << entry.line << ')';
    }
    return out.str();
}

void Logger::trim()
{
    while (history.size() > maxEntries) {
        history.pop_front();
    }
}

void Logger::setMinLevel(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mutex);
    minLevel = level;
}

LogLevel Logger::getMinLevel() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return minLevel;
}

void Logger::setMaxEntries(std::size_t max)
{
    std::lock_guard<std::mutex> lock(mutex);
    maxEntries = max;
    trim();
}

std::vector<LogEntry> Logger::entries() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return std::vector<LogEntry>(history.begin(), history.end());
}

void Logger::clear()
{
    std::lock_guard<std::mutex> lock(mutex);
    history.clear();
}

void Logger::setConsoleOutput(bool enabled)
{
    std::lock_guard<std::mutex> lock(mutex);
    consoleEnabled = enabled;
}

bool Logger::setLogFile(const std::string& path)
{
    std::ofstream stream(path, std::ios::app);
    if (!stream.is_open()) {
        return false;
    }
    auto sink = std::make_unique<FileSink>(std::move(stream));
    std::lock_guard<std::mutex> lock(mutex);
    file = std::move(sink);
    return true;
}

void Logger::closeLogFile()
{
    std::lock_guard<std::mutex> lock(mutex);
    file.reset();
}

void Logger::addCallback(const std::string& name, LogCallback callback)
{
    std::lock_guard<std::mutex> lock(mutex);
    for (auto& registered : callbacks) {
        if (registered.first == name) {
            registered.second = std::move(callback);
            return;
        }
    }
    callbacks.emplace_back(name, std::move(callback));
}

void Logger::removeCallback(const std::string& name)
{
    std::lock_guard<std::mutex> lock(mutex);
    for (auto it = callbacks.begin(); it != callbacks.end(); ++it) {
        if (it->first == name) {
            callbacks.erase(it);
            return;
        }
    }
}

} // namespace sketchbook
