#pragma once

#include <chrono>
#include <cstddef>
#include <cstdio>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace combopanel
{

enum class LogLevel : int
{
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

// Process-wide diagnostics. Categories name the subsystem ("layout", "theme",
// "panel", "skin", "config", "surface", "scheduler") and can be given their
// own threshold, so a host can turn on layout tracing without drowning in
// per-frame surface messages.
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
    using SinkId  = size_t;

    static Logger& instance();

    // Threshold for categories without an override
    void     set_level(LogLevel level);
    LogLevel get_level() const;

    void     set_category_level(std::string_view category, LogLevel level);
    void     clear_category_levels();
    LogLevel category_level(std::string_view category) const;

    SinkId add_sink(LogSink sink);
    bool   remove_sink(SinkId id);
    void   clear_sinks();

    void log(LogLevel level, std::string_view category, std::string_view message);

    template <typename... Args>
    void log_formatted(LogLevel level, std::string_view category, std::string_view format, Args&&... args);

    // True when some category may log at `level`
    bool is_enabled(LogLevel level) const;
    bool is_enabled(LogLevel level, std::string_view category) const;

    static std::string level_to_string(LogLevel level);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);

    // Replaces each "{}" in order; surplus placeholders stay, surplus args are dropped
    template <typename... Args>
    static std::string format_message(std::string_view format, Args&&... args);

   private:
    Logger()                         = default;
    ~Logger()                        = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel threshold_locked(std::string_view category) const;
    LogLevel lowest_threshold_locked() const;

    template <typename T>
    static std::string arg_to_string(T&& v);

    mutable std::mutex                           mutex_;
    LogLevel                                     min_level_ = LogLevel::Info;
    std::map<std::string, LogLevel, std::less<>> category_levels_;
    std::vector<std::pair<SinkId, LogSink>>      sinks_;
    SinkId                                       next_sink_id_ = 1;
};

template <typename T>
std::string Logger::arg_to_string(T&& v)
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
    else if constexpr (std::is_floating_point_v<D>)
    {
        // Pixel sizes and seconds read better without std::to_string's padding
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%g", static_cast<double>(v));
        return buf;
    }
    else
        return std::to_string(v);
}

template <typename... Args>
std::string Logger::format_message(std::string_view format, Args&&... args)
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
            // Inserted text is never rescanned
            search_from = pos + text.size();
        };
        (replace_next(std::forward<Args>(args)), ...);
    }
    return result;
}

template <typename... Args>
void Logger::log_formatted(LogLevel level, std::string_view category, std::string_view format, Args&&... args)
{
    if (!is_enabled(level, category))
        return;

    try
    {
        log(level, category, format_message(format, std::forward<Args>(args)...));
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "logger", std::string("Format error: ") + e.what());
    }
}

namespace sinks
{
// Colored lines on stdout, warnings and above on stderr
Logger::LogSink console_sink(bool use_color = true);
// Appends to `filename`; lines are flushed as written
Logger::LogSink file_sink(const std::string& filename);
Logger::LogSink null_sink();
}   // namespace sinks

#define COMBOPANEL_LOG(level, category, ...)                                                   \
    do                                                                                         \
    {                                                                                          \
        if (::combopanel::Logger::instance().is_enabled(level, category))                      \
        {                                                                                      \
            ::combopanel::Logger::instance().log_formatted(level, category, __VA_ARGS__);      \
        }                                                                                      \
    } while (0)

#define COMBOPANEL_LOG_TRACE(category, ...) COMBOPANEL_LOG(::combopanel::LogLevel::Trace, category, __VA_ARGS__)
#define COMBOPANEL_LOG_DEBUG(category, ...) COMBOPANEL_LOG(::combopanel::LogLevel::Debug, category, __VA_ARGS__)
#define COMBOPANEL_LOG_INFO(category, ...) COMBOPANEL_LOG(::combopanel::LogLevel::Info, category, __VA_ARGS__)
#define COMBOPANEL_LOG_WARN(category, ...) COMBOPANEL_LOG(::combopanel::LogLevel::Warning, category, __VA_ARGS__)
#define COMBOPANEL_LOG_ERROR(category, ...) COMBOPANEL_LOG(::combopanel::LogLevel::Error, category, __VA_ARGS__)
#define COMBOPANEL_LOG_CRITICAL(category, ...) \
    COMBOPANEL_LOG(::combopanel::LogLevel::Critical, category, __VA_ARGS__)

}   // namespace combopanel
