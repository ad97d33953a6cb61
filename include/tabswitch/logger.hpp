#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace tabswitch
{

enum class LogLevel : int
{
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5
};

// Well-known categories used across the library.
namespace log_category
{
inline constexpr std::string_view Switcher  = "switcher";
inline constexpr std::string_view Matches   = "switcher.matches";
inline constexpr std::string_view Workspace = "workspace";
inline constexpr std::string_view Config    = "config";
inline constexpr std::string_view Commands  = "commands";
}   // namespace log_category

class Logger
{
   public:
    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        LogLevel                              level = LogLevel::Info;
        std::string                           category;
        std::string                           message;
    };

    using LogSink = std::function<void(const LogEntry&)>;

    static Logger& instance();

    void     set_level(LogLevel level);
    LogLevel get_level() const;

    void add_sink(LogSink sink);
    void clear_sinks();

    // Sinks are called outside the lock and may log themselves.
    void log(LogLevel level, std::string_view category, std::string_view message);

    template <typename... Args>
    void log_formatted(LogLevel         level,
                       std::string_view category,
                       std::string_view format,
                       Args&&... args);

    bool is_enabled(LogLevel level) const;

    static std::string level_to_string(LogLevel level);

    // Replaces the first "{}" per argument, left to right. Surplus
    // placeholders are left in place.
    static std::string format_message(std::string_view format, auto&&... args)
    {
        std::string result(format);
        if constexpr (sizeof...(args) > 0)
        {
            size_t search_from  = 0;
            auto   replace_next = [&](auto&& arg)
            {
                auto pos = result.find("{}", search_from);
                if (pos == std::string::npos)
                    return;
                std::string text = arg_to_string(std::forward<decltype(arg)>(arg));
                result.replace(pos, 2, text);
                search_from = pos + text.size();
            };
            (replace_next(std::forward<decltype(args)>(args)), ...);
        }
        return result;
    }

   private:
    Logger()                         = default;
    ~Logger()                        = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex   mutex_;
    LogLevel             min_level_ = LogLevel::Info;
    std::vector<LogSink> sinks_;

    template <typename T>
    static std::string arg_to_string(T&& v)
    {
        using D = std::decay_t<T>;
        if constexpr (std::is_same_v<D, std::string>)
            return v;
        else if constexpr (std::is_same_v<D, std::string_view>)
            return std::string(v);
        else if constexpr (std::is_same_v<D, const char*> || std::is_same_v<D, char*>)
        {
            const char* p = v;
            return p ? std::string(p) : std::string("(null)");
        }
        else if constexpr (std::is_same_v<D, bool>)
            return v ? "true" : "false";
        else if constexpr (std::is_same_v<D, char>)
            return std::string(1, v);
        else
            return std::to_string(v);
    }
};

template <typename... Args>
void Logger::log_formatted(LogLevel         level,
                           std::string_view category,
                           std::string_view format,
                           Args&&... args)
{
    if (!is_enabled(level))
    {
        return;
    }

    try
    {
        std::string formatted = format_message(format, std::forward<Args>(args)...);
        log(level, category, formatted);
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "logger", std::string("Format error: ") + e.what());
    }
}

namespace sinks
{
// "2026-01-31 12:00:00.123 INFO [switcher] opened (3 tabs, current pane)"
std::string format_entry(const Logger::LogEntry& entry);

// Colored by level on stdout.
Logger::LogSink console_sink();
// Appends one line per entry; silently inert if the file cannot be opened.
Logger::LogSink file_sink(const std::string& filename);

// Appends every entry to `out`. Used by tests to assert on emitted records.
Logger::LogSink capture_sink(std::shared_ptr<std::vector<Logger::LogEntry>> out);
}   // namespace sinks

#define TABSWITCH_LOG_AT(lvl, category, ...)                                                 \
    do                                                                                       \
    {                                                                                        \
        if (::tabswitch::Logger::instance().is_enabled(lvl))                                 \
        {                                                                                    \
            ::tabswitch::Logger::instance().log_formatted(lvl, category, __VA_ARGS__);       \
        }                                                                                    \
    } while (0)

#define TABSWITCH_LOG_TRACE(category, ...) \
    TABSWITCH_LOG_AT(::tabswitch::LogLevel::Trace, category, __VA_ARGS__)
#define TABSWITCH_LOG_DEBUG(category, ...) \
    TABSWITCH_LOG_AT(::tabswitch::LogLevel::Debug, category, __VA_ARGS__)
#define TABSWITCH_LOG_INFO(category, ...) \
    TABSWITCH_LOG_AT(::tabswitch::LogLevel::Info, category, __VA_ARGS__)
#define TABSWITCH_LOG_WARN(category, ...) \
    TABSWITCH_LOG_AT(::tabswitch::LogLevel::Warning, category, __VA_ARGS__)
#define TABSWITCH_LOG_ERROR(category, ...) \
    TABSWITCH_LOG_AT(::tabswitch::LogLevel::Error, category, __VA_ARGS__)
#define TABSWITCH_LOG_CRITICAL(category, ...) \
    TABSWITCH_LOG_AT(::tabswitch::LogLevel::Critical, category, __VA_ARGS__)

}   // namespace tabswitch
