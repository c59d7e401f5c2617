//===----------------------------------------------------------------------===//
//
// Part of the Pixart project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the leveled logger.  Each emitted line carries the level tag and
// a wall-clock timestamp so interleaved tool output stays readable.
//
//===----------------------------------------------------------------------===//

#include "support/log.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iostream>
#include <string>

namespace pixart::support
{

namespace
{
std::string toLowerCopy(std::string_view text)
{
    std::string lowered(text.begin(), text.end());
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return lowered;
}

/// @brief Format the local wall-clock time as HH:MM:SS.
std::string timestamp()
{
    const std::time_t now = std::time(nullptr);
    std::tm local{};
#if defined(_WIN32)
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    char buf[16];
    const std::size_t n = std::strftime(buf, sizeof(buf), "%H:%M:%S", &local);
    return std::string(buf, n);
}
} // namespace

const char *logLevelName(LogLevel level)
{
    switch (level)
    {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Off:
            return "OFF";
    }
    return "";
}

std::optional<LogLevel> parseLogLevel(std::string_view name)
{
    const std::string lowered = toLowerCopy(name);
    if (lowered == "debug")
        return LogLevel::Debug;
    if (lowered == "info")
        return LogLevel::Info;
    if (lowered == "warn" || lowered == "warning")
        return LogLevel::Warn;
    if (lowered == "error")
        return LogLevel::Error;
    if (lowered == "off" || lowered == "none")
        return LogLevel::Off;
    return std::nullopt;
}

Logger &Logger::instance()
{
    static Logger logger;
    return logger;
}

void Logger::setStream(std::ostream *os)
{
    stream_ = os;
}

bool Logger::enabled(LogLevel level) const
{
    return level != LogLevel::Off && level >= level_;
}

void Logger::log(LogLevel level, std::string_view message)
{
    if (!enabled(level))
    {
        return;
    }
    std::ostream &os = stream_ ? *stream_ : std::cerr;
    os << '[' << logLevelName(level) << "] " << timestamp() << ' ' << message << '\n';
}

} // namespace pixart::support
