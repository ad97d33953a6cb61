#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <tabswitch/logger.hpp>

namespace tabswitch
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

void Logger::log(LogLevel level, std::string_view category, std::string_view message)
{
    std::vector<LogSink> sinks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < min_level_ || sinks_.empty())
            return;
        sinks = sinks_;
    }

    LogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.level     = level;
    entry.category  = std::string(category);
    entry.message   = std::string(message);

    for (const auto& sink : sinks)
        sink(entry);
}

bool Logger::is_enabled(LogLevel level) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= min_level_;
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

// ─── Sinks ───────────────────────────────────────────────────────────────────

namespace sinks
{

std::string format_entry(const Logger::LogEntry& entry)
{
    auto when = std::chrono::system_clock::to_time_t(entry.timestamp);
    auto ms   = std::chrono::duration_cast<std::chrono::milliseconds>(
                  entry.timestamp.time_since_epoch())
              % 1000;

    std::tm local{};
    localtime_r(&when, &local);

    std::ostringstream os;
    os << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
       << std::setw(3) << ms.count() << ' ' << Logger::level_to_string(entry.level) << " ["
       << entry.category << "] " << entry.message;
    return os.str();
}

static const char* level_color(LogLevel level)
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

Logger::LogSink console_sink()
{
    return [](const Logger::LogEntry& entry)
    { std::cout << level_color(entry.level) << format_entry(entry) << "\033[0m" << std::endl; };
}

Logger::LogSink file_sink(const std::string& filename)
{
    auto file = std::make_shared<std::ofstream>(filename, std::ios::app);
    return [file](const Logger::LogEntry& entry)
    {
        if (!file->is_open())
            return;
        *file << format_entry(entry) << '\n';
        file->flush();
    };
}

Logger::LogSink capture_sink(std::shared_ptr<std::vector<Logger::LogEntry>> out)
{
    auto guard = std::make_shared<std::mutex>();
    return [out = std::move(out), guard](const Logger::LogEntry& entry)
    {
        std::lock_guard<std::mutex> lock(*guard);
        out->push_back(entry);
    };
}

}   // namespace sinks

}   // namespace tabswitch
