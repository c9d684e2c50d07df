#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace vellum
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

class Logger
{
   public:
    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        LogLevel                              level;
        std::string                           category;
        std::string                           message;
        std::string                           file;
        int                                   line;
        std::string                           function;
    };

    using LogSink = std::function<void(const LogEntry&)>;

    static Logger& instance();

    void     set_level(LogLevel level);
    LogLevel get_level() const;

    void add_sink(LogSink sink);
    void clear_sinks();

    void log(LogLevel         level,
             std::string_view category,
             std::string_view message,
             std::string_view file     = "",
             int              line     = 0,
             std::string_view function = "");

    template <typename... Args>
    void log_formatted(LogLevel         level,
                       std::string_view category,
                       std::string_view format,
                       Args&&... args);

    bool is_enabled(LogLevel level) const;

    static std::string level_to_string(LogLevel level);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);

    // Replaces "{}" placeholders left to right; surplus arguments are dropped.
    template <typename... Args>
    static std::string format_message(std::string_view format, Args&&... args)
    {
        std::string result(format);
        size_t      cursor = 0;
        auto        replace_next = [&](auto&& arg)
        {
            auto pos = result.find("{}", cursor);
            if (pos == std::string::npos)
                return;
            std::string text = arg_to_string(std::forward<decltype(arg)>(arg));
            result.replace(pos, 2, text);
            cursor = pos + text.size();
        };
        (replace_next(std::forward<Args>(args)), ...);
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
        log(level, category, format_message(format, std::forward<Args>(args)...));
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "logger", std::string("Format error: ") + e.what());
    }
}

namespace sinks
{
Logger::LogSink console_sink();
Logger::LogSink file_sink(const std::string& filename);
Logger::LogSink null_sink();

// Appends every entry to a caller-owned buffer (used by hosts that display
// the log in-app and by tests).
Logger::LogSink memory_sink(std::shared_ptr<std::vector<Logger::LogEntry>> buffer);
}   // namespace sinks

#define VELLUM_LOG_AT(level, category, ...)                                        \
    do                                                                             \
    {                                                                              \
        if (::vellum::Logger::instance().is_enabled(level))                        \
        {                                                                          \
            ::vellum::Logger::instance().log_formatted(level, category, __VA_ARGS__); \
        }                                                                          \
    } while (0)

#define VELLUM_LOG_TRACE(category, ...) \
    VELLUM_LOG_AT(::vellum::LogLevel::Trace, category, __VA_ARGS__)
#define VELLUM_LOG_DEBUG(category, ...) \
    VELLUM_LOG_AT(::vellum::LogLevel::Debug, category, __VA_ARGS__)
#define VELLUM_LOG_INFO(category, ...) \
    VELLUM_LOG_AT(::vellum::LogLevel::Info, category, __VA_ARGS__)
#define VELLUM_LOG_WARN(category, ...) \
    VELLUM_LOG_AT(::vellum::LogLevel::Warning, category, __VA_ARGS__)
#define VELLUM_LOG_ERROR(category, ...) \
    VELLUM_LOG_AT(::vellum::LogLevel::Error, category, __VA_ARGS__)
#define VELLUM_LOG_CRITICAL(category, ...) \
    VELLUM_LOG_AT(::vellum::LogLevel::Critical, category, __VA_ARGS__)

#define VELLUM_LOG_ERROR_HERE(category, fmt, ...)                  \
    VELLUM_LOG_ERROR(category,                                     \
                     fmt " [{}:{}:{}]",                            \
                     __VA_ARGS__ __VA_OPT__(, ) __FILE__,          \
                     __LINE__,                                     \
                     __FUNCTION__)

}   // namespace vellum
