#include "logging.hpp"

#include <cctype>

namespace rtlharvest::lib
{

    const char *logLevelText(LogLevel level) noexcept
    {
        switch (level)
        {
        case LogLevel::Trace:
            return "trace";
        case LogLevel::Debug:
            return "debug";
        case LogLevel::Info:
            return "info";
        case LogLevel::Warn:
            return "warn";
        case LogLevel::Error:
            return "error";
        case LogLevel::Off:
        default:
            return "off";
        }
    }

    std::optional<LogLevel> parseLogLevel(std::string_view text)
    {
        std::string lowered(text);
        for (char &c : lowered)
        {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        if (lowered == "trace")
        {
            return LogLevel::Trace;
        }
        if (lowered == "debug")
        {
            return LogLevel::Debug;
        }
        if (lowered == "info")
        {
            return LogLevel::Info;
        }
        if (lowered == "warn" || lowered == "warning")
        {
            return LogLevel::Warn;
        }
        if (lowered == "error")
        {
            return LogLevel::Error;
        }
        if (lowered == "off" || lowered == "none")
        {
            return LogLevel::Off;
        }
        return std::nullopt;
    }

} // namespace rtlharvest::lib
