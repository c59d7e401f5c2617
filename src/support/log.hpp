//===----------------------------------------------------------------------===//
//
// Part of the Pixart project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/log.hpp
// Purpose: Simple leveled logger writing timestamped lines to a stream.
//
// Log Levels:
//   Debug - Detailed diagnostic information
//   Info  - General informational messages (default)
//   Warn  - Warning conditions
//   Error - Error conditions
//   Off   - Disable all logging
//
// Messages are written with format: [LEVEL] HH:MM:SS message
//
// Ownership/Lifetime: The logger borrows its output stream; the default is
//                     std::cerr. Callers installing another stream must keep
//                     it alive until it is replaced.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <ostream>
#include <string_view>

namespace pixart::support
{

/// @brief Ordered log levels; a message is emitted when its level is at or
///        above the logger threshold.
enum class LogLevel
{
    Debug,
    Info,
    Warn,
    Error,
    Off
};

/// @brief Uppercase level tag used in the line prefix ("DEBUG", "INFO", ...).
const char *logLevelName(LogLevel level);

/// @brief Parse a case-insensitive level name such as "warn" or "off".
/// @return Parsed level or std::nullopt for unknown names.
std::optional<LogLevel> parseLogLevel(std::string_view name);

/// @brief Process-wide leveled logger.
class Logger
{
  public:
    /// @brief Access the shared logger instance.
    static Logger &instance();

    /// @brief Current threshold.
    LogLevel level() const
    {
        return level_;
    }

    /// @brief Replace the threshold.
    void setLevel(LogLevel level)
    {
        level_ = level;
    }

    /// @brief Redirect output to @p os; pass nullptr to restore std::cerr.
    void setStream(std::ostream *os);

    /// @brief Check whether messages at @p level would be written.
    bool enabled(LogLevel level) const;

    /// @brief Write @p message at @p level when enabled.
    void log(LogLevel level, std::string_view message);

    void debug(std::string_view message)
    {
        log(LogLevel::Debug, message);
    }

    void info(std::string_view message)
    {
        log(LogLevel::Info, message);
    }

    void warn(std::string_view message)
    {
        log(LogLevel::Warn, message);
    }

    void error(std::string_view message)
    {
        log(LogLevel::Error, message);
    }

  private:
    Logger() = default;

    LogLevel level_ = LogLevel::Info;
    std::ostream *stream_ = nullptr;
};

} // namespace pixart::support
