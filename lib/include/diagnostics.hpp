#ifndef RTLHARVEST_DIAGNOSTICS_HPP
#define RTLHARVEST_DIAGNOSTICS_HPP

#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace rtlharvest::lib::diag
{

    enum class DiagnosticKind
    {
        Error,
        Warning,
        Info,
        Debug
    };

    struct Diagnostic
    {
        DiagnosticKind kind = DiagnosticKind::Error;
        std::string message;
        // File or repository the diagnostic is about.
        std::string context;
        // Pipeline stage that produced it (classify, flatten, write, validate, scan, ...).
        std::string stage;
        // Reason tag, e.g. "Timeout" or "ValidationFailed".
        std::string reason;
    };

    class Diagnostics
    {
    public:
        void error(std::string message, std::string context = {});
        void warning(std::string message, std::string context = {});
        void info(std::string message, std::string context = {});
        void debug(std::string message, std::string context = {});

        void setOnError(std::function<void()> callback) { onError_ = std::move(callback); }
        const std::vector<Diagnostic> &messages() const noexcept { return messages_; }
        std::size_t count(DiagnosticKind kind) const;
        bool empty() const noexcept { return messages_.empty(); }
        bool hasError() const noexcept { return hasError_.load(std::memory_order_relaxed); }
        void clear();

    protected:
        void add(DiagnosticKind kind,
                 std::string message,
                 std::string context = {},
                 std::string stage = {},
                 std::string reason = {});

    private:
        std::vector<Diagnostic> messages_;
        std::atomic<bool> hasError_{false};
        std::function<void()> onError_;
        mutable std::mutex mutex_;
    };

} // namespace rtlharvest::lib::diag

#endif // RTLHARVEST_DIAGNOSTICS_HPP
