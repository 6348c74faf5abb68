#ifndef RTLHARVEST_LOGGING_HPP
#define RTLHARVEST_LOGGING_HPP

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>

namespace rtlharvest::lib
{

    enum class LogLevel
    {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Off = 5
    };

    struct LogEvent
    {
        LogLevel level;
        std::string tag;
        std::string message;
    };

    const char *logLevelText(LogLevel level) noexcept;
    std::optional<LogLevel> parseLogLevel(std::string_view text);

    class Logger
    {
    public:
        using Sink = std::function<void(const LogEvent &)>;

        void setLevel(LogLevel level) noexcept { level_ = level; }
        LogLevel level() const noexcept { return level_; }
        void enable() noexcept { enabled_ = true; }
        void disable() noexcept { enabled_ = false; }
        void setSink(Sink sink) { sink_ = std::move(sink); }

        void allowTag(std::string_view tag)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            tags_.insert(std::string(tag));
        }

        void clearTags()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            tags_.clear();
        }

        bool enabled(LogLevel level, std::string_view tag) const noexcept
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return passes(level, tag);
        }

        void log(LogLevel level, std::string_view tag, std::string_view message)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!passes(level, tag) || !sink_)
            {
                return;
            }
            LogEvent event{level, std::string(tag), std::string(message)};
            sink_(event);
        }

        void trace(std::string_view tag, std::string_view message) { log(LogLevel::Trace, tag, message); }
        void debug(std::string_view tag, std::string_view message) { log(LogLevel::Debug, tag, message); }
        void info(std::string_view tag, std::string_view message) { log(LogLevel::Info, tag, message); }
        void warn(std::string_view tag, std::string_view message) { log(LogLevel::Warn, tag, message); }
        void error(std::string_view tag, std::string_view message) { log(LogLevel::Error, tag, message); }

    private:
        bool passes(LogLevel level, std::string_view tag) const noexcept
        {
            if (!enabled_ || level_ == LogLevel::Off || level == LogLevel::Off)
            {
                return false;
            }
            if (static_cast<int>(level) < static_cast<int>(level_))
            {
                return false;
            }
            if (!tags_.empty() && tags_.find(std::string(tag)) == tags_.end())
            {
                return false;
            }
            return true;
        }

        bool enabled_ = false;
        LogLevel level_ = LogLevel::Warn;
        std::unordered_set<std::string> tags_{};
        Sink sink_{};
        mutable std::mutex mutex_{};
    };

} // namespace rtlharvest::lib

#endif // RTLHARVEST_LOGGING_HPP
