#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vellum/logger.hpp>

namespace vellum
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

void Logger::log(LogLevel         level,
                 std::string_view category,
                 std::string_view message,
                 std::string_view file,
                 int              line,
                 std::string_view function)
{
    if (!is_enabled(level))
        return;

    LogEntry entry{.timestamp = std::chrono::system_clock::now(),
                   .level     = level,
                   .category  = std::string(category),
                   .message   = std::string(message),
                   .file      = std::string(file),
                   .line      = line,
                   .function  = std::string(function)};

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_)
        sink(entry);
}

bool Logger::is_enabled(LogLevel level) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= min_level_;
}

std::string Logger::level_to_string(LogLevel level)
{
    static constexpr const char* NAMES[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "CRITICAL"};
    auto index = static_cast<int>(level);
    if (index < 0 || index >= static_cast<int>(std::size(NAMES)))
        return "UNKNOWN";
    return NAMES[index];
}

// Local time as "YYYY-mm-dd HH:MM:SS.mmm"
std::string Logger::timestamp_to_string(const std::chrono::system_clock::time_point& tp)
{
    using namespace std::chrono;
    std::time_t seconds = system_clock::to_time_t(tp);
    auto        ms      = duration_cast<milliseconds>(tp.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &local);

    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03d", date, static_cast<int>(ms.count()));
    return out;
}

namespace sinks
{

namespace
{

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
    }
    return "";
}

// One line per entry: "<time> <LEVEL> [category] message (file:line in fn)"
void write_line(std::ostream&           os,
                const Logger::LogEntry& entry,
                const char*             prefix = "",
                const char*             suffix = "")
{
    os << prefix << Logger::timestamp_to_string(entry.timestamp) << ' '
       << Logger::level_to_string(entry.level) << " [" << entry.category << "] " << entry.message;
    if (!entry.file.empty())
    {
        os << " (" << entry.file << ':' << entry.line;
        if (!entry.function.empty())
            os << " in " << entry.function;
        os << ')';
    }
    os << suffix << '\n';
    os.flush();
}

}   // anonymous namespace

Logger::LogSink console_sink()
{
    return [](const Logger::LogEntry& entry)
    {
        // Warnings and above go to stderr
        std::ostream& os = entry.level >= LogLevel::Warning ? std::cerr : std::cout;
        write_line(os, entry, ansi_color(entry.level), "\033[0m");
    };
}

Logger::LogSink file_sink(const std::string& filename)
{
    auto file = std::make_shared<std::ofstream>(filename, std::ios::app);
    if (!file->is_open())
        std::cerr << "vellum: cannot open log file '" << filename << "'\n";
    return [file](const Logger::LogEntry& entry)
    {
        if (file->is_open())
            write_line(*file, entry);
    };
}

Logger::LogSink null_sink()
{
    return [](const Logger::LogEntry&) {};
}

Logger::LogSink memory_sink(std::shared_ptr<std::vector<Logger::LogEntry>> buffer)
{
    return [buffer = std::move(buffer)](const Logger::LogEntry& entry)
    {
        if (buffer)
            buffer->push_back(entry);
    };
}

}   // namespace sinks

}   // namespace vellum
