#include <algorithm>
#include <combopanel/logger.hpp>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>

namespace combopanel
{

Logger& Logger::instance()
{
    static Logger logger;
    return logger;
}

// ─── Thresholds ─────────────────────────────────────────────────────────────

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

void Logger::set_category_level(std::string_view category, LogLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = category_levels_.find(category);
    if (it != category_levels_.end())
        it->second = level;
    else
        category_levels_.emplace(std::string(category), level);
}

void Logger::clear_category_levels()
{
    std::lock_guard<std::mutex> lock(mutex_);
    category_levels_.clear();
}

LogLevel Logger::category_level(std::string_view category) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return threshold_locked(category);
}

LogLevel Logger::threshold_locked(std::string_view category) const
{
    auto it = category_levels_.find(category);
    return it != category_levels_.end() ? it->second : min_level_;
}

LogLevel Logger::lowest_threshold_locked() const
{
    LogLevel lowest = min_level_;
    for (const auto& [name, level] : category_levels_)
        lowest = std::min(lowest, level);
    return lowest;
}

bool Logger::is_enabled(LogLevel level) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level != LogLevel::Off && level >= lowest_threshold_locked();
}

bool Logger::is_enabled(LogLevel level, std::string_view category) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level != LogLevel::Off && level >= threshold_locked(category);
}

// ─── Sinks ──────────────────────────────────────────────────────────────────

Logger::SinkId Logger::add_sink(LogSink sink)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const SinkId                id = next_sink_id_++;
    sinks_.emplace_back(id, std::move(sink));
    return id;
}

bool Logger::remove_sink(SinkId id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(sinks_.begin(), sinks_.end(), [id](const auto& s) { return s.first == id; });
    if (it == sinks_.end())
        return false;
    sinks_.erase(it);
    return true;
}

void Logger::clear_sinks()
{
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::log(LogLevel level, std::string_view category, std::string_view message)
{
    if (!is_enabled(level, category))
        return;

    LogEntry entry{.timestamp = std::chrono::system_clock::now(),
                   .level     = level,
                   .category  = std::string(category),
                   .message   = std::string(message)};

    // Sinks run outside the lock so one may log or remove itself
    std::vector<LogSink> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets.reserve(sinks_.size());
        for (const auto& [id, sink] : sinks_)
            targets.push_back(sink);
    }
    for (const auto& sink : targets)
        sink(entry);
}

// ─── Formatting ─────────────────────────────────────────────────────────────

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
        case LogLevel::Off:
            return "OFF";
    }
    return "UNKNOWN";
}

std::string Logger::timestamp_to_string(const std::chrono::system_clock::time_point& tp)
{
    const std::time_t secs = std::chrono::system_clock::to_time_t(tp);
    const auto        ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&secs, &local);

    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms;
    return out.str();
}

namespace sinks
{

namespace
{

// "2026-01-01 12:00:00.000 WARN [skin] message"
std::string format_line(const Logger::LogEntry& entry)
{
    return Logger::timestamp_to_string(entry.timestamp) + " " + Logger::level_to_string(entry.level)
           + " [" + entry.category + "] " + entry.message;
}

const char* ansi_color(LogLevel level)
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
        case LogLevel::Off:
            break;
    }
    return "";
}

}   // namespace

Logger::LogSink console_sink(bool use_color)
{
    return [use_color](const Logger::LogEntry& entry)
    {
        std::ostream& out = entry.level >= LogLevel::Warning ? std::cerr : std::cout;
        if (use_color)
            out << ansi_color(entry.level) << format_line(entry) << "\033[0m\n";
        else
            out << format_line(entry) << '\n';
        out.flush();
    };
}

Logger::LogSink file_sink(const std::string& filename)
{
    auto file = std::make_shared<std::ofstream>(filename, std::ios::app);
    if (!file->is_open())
        std::cerr << "combopanel: cannot open log file " << filename << '\n';

    return [file](const Logger::LogEntry& entry)
    {
        if (!file->is_open())
            return;
        *file << format_line(entry) << '\n';
        file->flush();
    };
}

Logger::LogSink null_sink()
{
    return [](const Logger::LogEntry&) {};
}

}   // namespace sinks

}   // namespace combopanel
