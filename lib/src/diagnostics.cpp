#include "diagnostics.hpp"

#include <algorithm>
#include <utility>

namespace rtlharvest::lib::diag
{

    void Diagnostics::error(std::string message, std::string context)
    {
        add(DiagnosticKind::Error, std::move(message), std::move(context));
    }

    void Diagnostics::warning(std::string message, std::string context)
    {
        add(DiagnosticKind::Warning, std::move(message), std::move(context));
    }

    void Diagnostics::info(std::string message, std::string context)
    {
        add(DiagnosticKind::Info, std::move(message), std::move(context));
    }

    void Diagnostics::debug(std::string message, std::string context)
    {
        add(DiagnosticKind::Debug, std::move(message), std::move(context));
    }

    std::size_t Diagnostics::count(DiagnosticKind kind) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<std::size_t>(std::count_if(messages_.begin(), messages_.end(),
                                                      [kind](const Diagnostic &diag) { return diag.kind == kind; }));
    }

    void Diagnostics::clear()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            messages_.clear();
        }
        hasError_.store(false, std::memory_order_relaxed);
    }

    void Diagnostics::add(DiagnosticKind kind,
                          std::string message,
                          std::string context,
                          std::string stage,
                          std::string reason)
    {
        const bool isError = kind == DiagnosticKind::Error;
        Diagnostic diag{
            .kind = kind,
            .message = std::move(message),
            .context = std::move(context),
            .stage = std::move(stage),
            .reason = std::move(reason),
        };

        {
            std::lock_guard<std::mutex> lock(mutex_);
            messages_.push_back(std::move(diag));
        }

        if (isError)
        {
            hasError_.store(true, std::memory_order_relaxed);
            if (onError_)
            {
                onError_();
            }
        }
    }

} // namespace rtlharvest::lib::diag
