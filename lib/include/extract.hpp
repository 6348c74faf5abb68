#ifndef RTLHARVEST_EXTRACT_HPP
#define RTLHARVEST_EXTRACT_HPP

#include "diagnostics.hpp"
#include "flatten.hpp"
#include "logging.hpp"
#include "oracle.hpp"
#include "output.hpp"
#include "source.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace rtlharvest::lib::extract
{

    using ExtractDiagnosticKind = rtlharvest::lib::diag::DiagnosticKind;
    using ExtractDiagnostic = rtlharvest::lib::diag::Diagnostic;

    class ExtractDiagnostics : public rtlharvest::lib::diag::Diagnostics
    {
    public:
        using rtlharvest::lib::diag::Diagnostics::Diagnostics;

        void record(ExtractDiagnosticKind kind, std::string stage, std::string reason,
                    std::string message, std::string path)
        {
            add(kind, std::move(message), std::move(path), std::move(stage), std::move(reason));
        }
    };

    enum class ExtractState
    {
        Candidate,
        Classified,
        Flattened,
        Validated,
        Accepted,
        Rejected
    };

    enum class ExtractFailure
    {
        None,
        OracleCrash,
        OracleTimeout,
        NoTopModuleFound,
        UnsupportedSourceKind,
        CandidateUnreadable,
        ArtifactWriteFailed,
        ValidationFailed
    };

    const char *extractStateText(ExtractState state) noexcept;
    const char *extractFailureText(ExtractFailure failure) noexcept;
    ExtractFailure failureForReason(oracle::RejectReason reason) noexcept;

    struct ExtractOutcome
    {
        ExtractState state = ExtractState::Candidate;
        // Last state reached before the terminal one.
        ExtractState lastState = ExtractState::Candidate;
        ExtractFailure failure = ExtractFailure::None;
        std::string detail;
        std::string topModule;
        // Set only for Accepted outcomes.
        std::optional<std::filesystem::path> artifact;

        bool accepted() const noexcept { return state == ExtractState::Accepted; }
    };

    /// Takes one candidate to zero or one validated standalone module on disk:
    /// classify the file alone, flatten its includes, write the artifact, then
    /// classify the written artifact again. A rejected artifact is deleted
    /// before run() returns. Per-candidate failures are returned, never thrown;
    /// only OracleUnavailable escapes.
    class ExtractStep
    {
    public:
        ExtractStep(oracle::Oracle &oracle,
                    output::OutputDirectory &output,
                    flatten::IncludeFlattener flattener = flatten::IncludeFlattener(),
                    Logger *logger = nullptr,
                    ExtractDiagnostics *diagnostics = nullptr);

        ExtractOutcome run(const Candidate &candidate);

    private:
        ExtractOutcome reject(ExtractOutcome outcome, ExtractFailure failure, std::string detail,
                              const Candidate &candidate);
        void log(LogLevel level, std::string_view message) const;

        oracle::Oracle &oracle_;
        output::OutputDirectory &output_;
        flatten::IncludeFlattener flattener_;
        Logger *logger_ = nullptr;
        ExtractDiagnostics *diagnostics_ = nullptr;
    };

} // namespace rtlharvest::lib::extract

#endif // RTLHARVEST_EXTRACT_HPP
