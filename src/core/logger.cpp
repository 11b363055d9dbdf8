#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <decima/logger.hpp>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace decima
{

Logger& Logger::instance()
{
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::get_level() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void Logger::add_sink(LogSink sink)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks()
{
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

bool Logger::is_enabled(LogLevel level) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= min_level_;
}

void Logger::log(LogLevel level, std::string_view category, std::string_view message)
{
    const LogEntry entry{.timestamp = std::chrono::system_clock::now(),
                         .level     = level,
                         .category  = std::string(category),
                         .message   = std::string(message)};

    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_)
        return;
    for (const auto& sink : sinks_)
        sink(entry);
}

void Logger::configure_from_env(const char* variable)
{
    const char* value = std::getenv(variable);
    if (!value)
        return;

    if (auto level = level_from_string(value))
        set_level(*level);
    else
        DECIMA_LOG_WARN("logger", "Ignoring unknown log level '{}' in {}", value, variable);
}

std::string Logger::level_to_string(LogLevel level)
{
    switch (level)
    {
        case LogLevel::Trace:
            return "TRACE";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Critical:
            return "CRITICAL";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> Logger::level_from_string(std::string_view name)
{
    std::string lower(name);
    std::transform(lower.begin(),
                   lower.end(),
                   lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace")
        return LogLevel::Trace;
    if (lower == "debug")
        return LogLevel::Debug;
    if (lower == "info")
        return LogLevel::Info;
    if (lower == "warn" || lower == "warning")
        return LogLevel::Warning;
    if (lower == "error")
        return LogLevel::Error;
    if (lower == "critical")
        return LogLevel::Critical;
    return std::nullopt;
}

std::string Logger::timestamp_to_string(const std::chrono::system_clock::time_point& tp)
{
    const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    const auto        millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream ss;
    ss << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
       << millis.count();
    return ss.str();
}

namespace sinks
{

namespace
{

const char* level_color(LogLevel level)
{
    switch (level)
    {
        case LogLevel::Trace:
            return "\033[37m";
        case LogLevel::Debug:
            return "\033[36m";
        case LogLevel::Info:
            return "\033[32m";
        case LogLevel::Warning:
            return "\033[33m";
        case LogLevel::Error:
            return "\033[31m";
        case LogLevel::Critical:
            return "\033[35m";
    }
    return "";
}

}   // namespace

Logger::LogSink console_sink()
{
    return [](const Logger::LogEntry& entry)
    {
        // One write per record so lines from worker threads never interleave.
        std::ostringstream line;
        line << level_color(entry.level) << Logger::timestamp_to_string(entry.timestamp) << ' '
             << std::left << std::setw(5) << Logger::level_to_string(entry.level) << " ["
             << entry.category << "] " << entry.message << "\033[0m\n";
        std::clog << line.str() << std::flush;
    };
}

}   // namespace sinks

}   // namespace decima
