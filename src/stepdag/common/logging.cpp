/**
 * @file logging.cpp
 */
#include "stepdag/common/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>

namespace stepdag
{

namespace
{

LogLevel initial_level()
{
    const char* env = std::getenv("STEPDAG_LOG_LEVEL");
    if (env != nullptr)
    {
        if (auto parsed = parse_log_level(env))
        {
            return *parsed;
        }
    }
    return LogLevel::Warning;
}

std::atomic<LogLevel>& level_slot()
{
    static std::atomic<LogLevel> s_level{initial_level()};
    return s_level;
}

std::atomic<std::ostream*> g_stream{nullptr};

std::mutex g_write_mutex;

const char* level_tag(LogLevel level) noexcept
{
    switch (level)
    {
    case LogLevel::Debug: return "[DEBUG] ";
    case LogLevel::Info: return "[INFO] ";
    case LogLevel::Warning: return "[WARNING] ";
    case LogLevel::Error: return "[ERROR] ";
    case LogLevel::Off: break;
    }
    return "";
}

} // namespace

void set_log_level(LogLevel level) noexcept
{
    level_slot().store(level);
}

LogLevel log_level() noexcept
{
    return level_slot().load();
}

void set_log_stream(std::ostream* stream) noexcept
{
    g_stream.store(stream);
}

std::optional<LogLevel> parse_log_level(const std::string& name)
{
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "debug")
    {
        return LogLevel::Debug;
    }
    if (lowered == "info")
    {
        return LogLevel::Info;
    }
    if (lowered == "warning" || lowered == "warn")
    {
        return LogLevel::Warning;
    }
    if (lowered == "error")
    {
        return LogLevel::Error;
    }
    if (lowered == "off")
    {
        return LogLevel::Off;
    }
    return std::nullopt;
}

namespace detail
{

LogLine::~LogLine()
{
    std::ostream* stream = g_stream.load();
    if (stream == nullptr)
    {
        stream = &std::clog;
    }
    std::lock_guard<std::mutex> lock(g_write_mutex);
    *stream << level_tag(m_level) << m_buffer.str() << "\n" << std::flush;
}

} // namespace detail

} // namespace stepdag
