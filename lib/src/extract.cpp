#include "extract.hpp"

#include <array>
#include <utility>

namespace rtlharvest::lib::extract
{

    namespace
    {
        constexpr std::string_view kLogTag = "extract";

        const char *stageOf(ExtractFailure failure) noexcept
        {
            switch (failure)
            {
            case ExtractFailure::CandidateUnreadable:
                return "flatten";
            case ExtractFailure::ArtifactWriteFailed:
                return "write";
            case ExtractFailure::ValidationFailed:
                return "validate";
            case ExtractFailure::None:
                return "";
            default:
                return "classify";
            }
        }

        std::string describe(const oracle::NotSynthesizable &rejection)
        {
            std::string text = oracle::rejectReasonText(rejection.reason);
            if (!rejection.detail.empty())
            {
                text.append(": ");
                text.append(rejection.detail);
            }
            return text;
        }
    } // namespace

    const char *extractStateText(ExtractState state) noexcept
    {
        switch (state)
        {
        case ExtractState::Candidate:
            return "candidate";
        case ExtractState::Classified:
            return "classified";
        case ExtractState::Flattened:
            return "flattened";
        case ExtractState::Validated:
            return "validated";
        case ExtractState::Accepted:
            return "accepted";
        case ExtractState::Rejected:
        default:
            return "rejected";
        }
    }

    const char *extractFailureText(ExtractFailure failure) noexcept
    {
        switch (failure)
        {
        case ExtractFailure::None:
            return "None";
        case ExtractFailure::OracleCrash:
            return "OracleCrash";
        case ExtractFailure::OracleTimeout:
            return "OracleTimeout";
        case ExtractFailure::NoTopModuleFound:
            return "NoTopModuleFound";
        case ExtractFailure::UnsupportedSourceKind:
            return "UnsupportedSourceKind";
        case ExtractFailure::CandidateUnreadable:
            return "CandidateUnreadable";
        case ExtractFailure::ArtifactWriteFailed:
            return "ArtifactWriteFailed";
        case ExtractFailure::ValidationFailed:
        default:
            return "ValidationFailed";
        }
    }

    ExtractFailure failureForReason(oracle::RejectReason reason) noexcept
    {
        switch (reason)
        {
        case oracle::RejectReason::Timeout:
            return ExtractFailure::OracleTimeout;
        case oracle::RejectReason::NoTopModuleFound:
            return ExtractFailure::NoTopModuleFound;
        case oracle::RejectReason::UnsupportedKind:
            return ExtractFailure::UnsupportedSourceKind;
        case oracle::RejectReason::ToolFailure:
        default:
            return ExtractFailure::OracleCrash;
        }
    }

    ExtractStep::ExtractStep(oracle::Oracle &oracle,
                             output::OutputDirectory &output,
                             flatten::IncludeFlattener flattener,
                             Logger *logger,
                             ExtractDiagnostics *diagnostics)
        : oracle_(oracle),
          output_(output),
          flattener_(std::move(flattener)),
          logger_(logger),
          diagnostics_(diagnostics)
    {
    }

    void ExtractStep::log(LogLevel level, std::string_view message) const
    {
        if (logger_)
        {
            logger_->log(level, kLogTag, message);
        }
    }

    ExtractOutcome ExtractStep::reject(ExtractOutcome outcome, ExtractFailure failure, std::string detail,
                                       const Candidate &candidate)
    {
        outcome.lastState = outcome.state;
        outcome.state = ExtractState::Rejected;
        outcome.failure = failure;
        outcome.detail = std::move(detail);
        outcome.artifact.reset();

        const std::string path = candidate.path.string();
        const std::string stage = stageOf(failure);
        // Classification drops are the common case and stay at debug level.
        const bool routine = stage == "classify";
        const LogLevel level = routine ? LogLevel::Debug : LogLevel::Error;

        std::string message = routine ? "Drop \"" : "Reject \"";
        message.append(path);
        message.append("\" [");
        message.append(extractFailureText(failure));
        message.append("]");
        if (!outcome.detail.empty())
        {
            message.append(" ");
            message.append(outcome.detail);
        }
        log(level, message);

        if (diagnostics_)
        {
            diagnostics_->record(routine ? ExtractDiagnosticKind::Debug : ExtractDiagnosticKind::Error,
                                 stage, extractFailureText(failure), outcome.detail, path);
        }
        return outcome;
    }

    ExtractOutcome ExtractStep::run(const Candidate &candidate)
    {
        ExtractOutcome outcome;
        const std::filesystem::path &source = candidate.path;

        // Candidate -> Classified
        const std::array<std::filesystem::path, 1> sourceInputs{source};
        oracle::Classification first = oracle_.classify(sourceInputs, candidate.kind);
        if (const auto *rejection = std::get_if<oracle::NotSynthesizable>(&first))
        {
            return reject(std::move(outcome), failureForReason(rejection->reason), describe(*rejection), candidate);
        }
        outcome.topModule = std::get<oracle::SynthesizableAs>(first).moduleName;
        outcome.state = ExtractState::Classified;

        // Classified -> Flattened
        flatten::FlattenResult flattened = flattener_.flatten(source);
        if (!flattened.success)
        {
            return reject(std::move(outcome), ExtractFailure::CandidateUnreadable, flattened.error, candidate);
        }
        for (const auto &target : flattened.droppedTargets)
        {
            log(LogLevel::Debug, "Dropped missing include \"" + target + "\" in " + source.string());
            if (diagnostics_)
            {
                diagnostics_->record(ExtractDiagnosticKind::Debug, "flatten", "IncludeTargetMissing",
                                     "include target not found: " + target, source.string());
            }
        }
        if (!flattened.complete)
        {
            log(LogLevel::Warn, "Include resolution stopped after " + std::to_string(flattened.passes) +
                                    " passes in " + source.string());
        }

        const std::filesystem::path artifact = output_.reserve(outcome.topModule + source.extension().string());
        output::OutputResult written = output_.write(artifact, flattened.text);
        if (!written.success)
        {
            return reject(std::move(outcome), ExtractFailure::ArtifactWriteFailed, written.error, candidate);
        }
        outcome.state = ExtractState::Flattened;

        // Flattened -> Validated
        const std::array<std::filesystem::path, 1> artifactInputs{artifact};
        oracle::Classification second = [&]() {
            try
            {
                return oracle_.classify(artifactInputs, candidate.kind);
            }
            catch (const oracle::OracleUnavailable &)
            {
                output::OutputResult removed = output_.remove(artifact);
                if (!removed.success)
                {
                    log(LogLevel::Error, removed.error);
                }
                throw;
            }
        }();
        if (const auto *rejection = std::get_if<oracle::NotSynthesizable>(&second))
        {
            output::OutputResult removed = output_.remove(artifact);
            std::string detail = "flattened artifact " + artifact.filename().string() +
                                 " failed re-validation (" + describe(*rejection) + ")";
            if (!removed.success)
            {
                detail.append("; ");
                detail.append(removed.error);
            }
            return reject(std::move(outcome), ExtractFailure::ValidationFailed, std::move(detail), candidate);
        }
        outcome.state = ExtractState::Validated;

        // Validated -> Accepted
        outcome.lastState = outcome.state;
        outcome.state = ExtractState::Accepted;
        outcome.artifact = artifact;
        log(LogLevel::Info, "Extracted " + outcome.topModule + " from " + source.string() + " -> " +
                                artifact.filename().string());
        return outcome;
    }

} // namespace rtlharvest::lib::extract
