#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace decima
{

enum class LogLevel : int
{
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5   // threshold only: silences everything below it
};

// Process-wide logger.  Messages below the minimum level are dropped before
// formatting; the rest go to every registered sink, in registration order.
class Logger
{
   public:
    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        LogLevel                              level;
        std::string                           category;
        std::string                           message;
    };

    using LogSink = std::function<void(const LogEntry&)>;

    static Logger& instance();

    void     set_level(LogLevel level);
    LogLevel get_level() const;

    void add_sink(LogSink sink);
    void clear_sinks();

    void log(LogLevel level, std::string_view category, std::string_view message);

    // Replaces each `{}` in `format` with the next argument, left to right.
    // Surplus placeholders stay verbatim.
    template <typename... Args>
    void log_formatted(LogLevel         level,
                       std::string_view category,
                       std::string_view format,
                       Args&&... args);

    bool is_enabled(LogLevel level) const;

    // Reads the minimum level from an environment variable such as
    // DECIMA_LOG_LEVEL=debug. Unset or unrecognized values leave the level as is.
    void configure_from_env(const char* variable = "DECIMA_LOG_LEVEL");

    static std::string             level_to_string(LogLevel level);
    static std::optional<LogLevel> level_from_string(std::string_view name);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);

   private:
    Logger()                         = default;
    ~Logger()                        = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    template <typename T>
    static std::string to_text(const T& v)
    {
        if constexpr (std::is_same_v<T, bool>)
            return v ? "true" : "false";
        else if constexpr (std::is_convertible_v<const T&, std::string_view>)
        {
            if constexpr (std::is_pointer_v<T>)
            {
                if (v == nullptr)
                    return "(null)";
            }
            return std::string(std::string_view(v));
        }
        else
            return std::to_string(v);
    }

    mutable std::mutex   mutex_;
    LogLevel             min_level_ = LogLevel::Info;
    std::vector<LogSink> sinks_;
};

template <typename... Args>
void Logger::log_formatted(LogLevel         level,
                           std::string_view category,
                           std::string_view format,
                           Args&&... args)
{
    if (!is_enabled(level))
        return;

    std::string message(format);
    std::size_t cursor = 0;
    auto        substitute = [&](const auto& arg)
    {
        const auto pos = message.find("{}", cursor);
        if (pos == std::string::npos)
            return;
        const std::string text = to_text(arg);
        message.replace(pos, 2, text);
        cursor = pos + text.size();
    };
    (substitute(args), ...);

    log(level, category, message);
}

namespace sinks
{
// Colored single-line records on std::clog.
Logger::LogSink console_sink();
}   // namespace sinks

#define DECIMA_LOG_AT(level, category, ...)                                               \
    do                                                                                     \
    {                                                                                      \
        if (::decima::Logger::instance().is_enabled(level))                                \
            ::decima::Logger::instance().log_formatted(level, category, __VA_ARGS__);      \
    } while (0)

#define DECIMA_LOG_TRACE(category, ...) DECIMA_LOG_AT(::decima::LogLevel::Trace, category, __VA_ARGS__)
#define DECIMA_LOG_DEBUG(category, ...) DECIMA_LOG_AT(::decima::LogLevel::Debug, category, __VA_ARGS__)
#define DECIMA_LOG_INFO(category, ...)  DECIMA_LOG_AT(::decima::LogLevel::Info, category, __VA_ARGS__)
#define DECIMA_LOG_WARN(category, ...)  DECIMA_LOG_AT(::decima::LogLevel::Warning, category, __VA_ARGS__)
#define DECIMA_LOG_ERROR(category, ...) DECIMA_LOG_AT(::decima::LogLevel::Error, category, __VA_ARGS__)

}   // namespace decima
