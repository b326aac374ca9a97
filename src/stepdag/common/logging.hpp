/**
 * @file logging.hpp
 * @brief Minimal leveled stream logger used across stepdag.
 */
#pragma once
#include "stepdag/common/common.hpp"
#include <sstream>

namespace stepdag
{

/**
 * @brief Severity of a log line. `Off` disables all output.
 */
enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error,
    Off
};

/**
 * @brief Set the minimum level that is written.
 */
void set_log_level(LogLevel level) noexcept;

/**
 * @brief Get the minimum level that is written.
 *
 * @details
 * On first use the level is seeded from the `STEPDAG_LOG_LEVEL` environment
 * variable (`debug`, `info`, `warning`, `error`, `off`), defaulting to
 * `Warning`.
 */
LogLevel log_level() noexcept;

/**
 * @brief Redirect log output. Passing nullptr restores `std::clog`.
 * @note The stream must outlive all logging calls made while it is installed.
 */
void set_log_stream(std::ostream* stream) noexcept;

/**
 * @brief Parse a level name. Unknown names yield std::nullopt.
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * @brief Check whether a line at the given level would be written.
 */
inline bool log_enabled(LogLevel level) noexcept
{
    return level != LogLevel::Off && level >= log_level();
}

namespace detail
{

/**
 * @brief Accumulates one log line and flushes it on destruction.
 */
class LogLine
{
public:
    explicit LogLine(LogLevel level)
        : m_level(level)
    {
    }

    ~LogLine();

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    template <typename T>
    LogLine& operator<<(const T& value)
    {
        m_buffer << value;
        return *this;
    }

private:
    LogLevel m_level;
    std::ostringstream m_buffer;
};

} // namespace detail

} // namespace stepdag

#define STEPDAG_LOG(level, expr)                                        \
    do                                                                  \
    {                                                                   \
        if (::stepdag::log_enabled(level))                              \
        {                                                               \
            ::stepdag::detail::LogLine(level) << expr;                  \
        }                                                               \
    } while (false)

#define STEPDAG_LOG_DEBUG(expr) STEPDAG_LOG(::stepdag::LogLevel::Debug, expr)
#define STEPDAG_LOG_INFO(expr) STEPDAG_LOG(::stepdag::LogLevel::Info, expr)
#define STEPDAG_LOG_WARNING(expr) STEPDAG_LOG(::stepdag::LogLevel::Warning, expr)
#define STEPDAG_LOG_ERROR(expr) STEPDAG_LOG(::stepdag::LogLevel::Error, expr)
