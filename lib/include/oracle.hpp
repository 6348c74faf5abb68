#ifndef RTLHARVEST_ORACLE_HPP
#define RTLHARVEST_ORACLE_HPP

#include "logging.hpp"
#include "process.hpp"
#include "source.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace rtlharvest::lib::oracle
{

    enum class RejectReason
    {
        ToolFailure,
        Timeout,
        NoTopModuleFound,
        UnsupportedKind
    };

    const char *rejectReasonText(RejectReason reason) noexcept;

    struct SynthesizableAs
    {
        std::string moduleName;
    };

    struct NotSynthesizable
    {
        RejectReason reason = RejectReason::ToolFailure;
        std::string detail;
    };

    using Classification = std::variant<SynthesizableAs, NotSynthesizable>;

    inline bool isSynthesizable(const Classification &result) noexcept
    {
        return std::holds_alternative<SynthesizableAs>(result);
    }

    /// Raised when the oracle binary cannot be launched at all. This aborts
    /// the run; every other oracle failure is returned as NotSynthesizable.
    class OracleUnavailable : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    enum class TopModuleStatus
    {
        Found,
        NotFound,
        Malformed
    };

    struct TopModuleScan
    {
        TopModuleStatus status = TopModuleStatus::NotFound;
        std::string name;
        // The line that produced the result, for Found and Malformed.
        std::string line;
    };

    /// Scans oracle output line by line for a top-module announcement.
    ///
    /// Two signals are recognized:
    ///   `[NTE:EL0503] ... @<name>"...`  name between the first '@' and the next '"'
    ///                                    (or inside the quotes for `@"<name>"`)
    ///   `Automatically selected <name> as design top module.`
    /// The first signal in output order wins. An EL0503 line without the '@'
    /// or the closing quote stops the scan as Malformed.
    TopModuleScan scanTopModule(std::string_view output);

    class Oracle
    {
    public:
        virtual ~Oracle() = default;

        /// Classifies one or more files of the same kind with a single oracle call.
        virtual Classification classify(std::span<const std::filesystem::path> inputs, SourceKind kind) = 0;
    };

    struct YosysOracleOptions
    {
        std::string binary = "yosys";
        std::chrono::seconds timeout{1000};
        std::string systemVerilogPlugin = "systemverilog";
    };

    /// `$YOSYS_BINARY` if set and non-empty, otherwise "yosys".
    std::string defaultYosysBinary();

    class YosysOracle final : public Oracle
    {
    public:
        explicit YosysOracle(process::ProcessRunner &runner,
                             YosysOracleOptions options = YosysOracleOptions(),
                             Logger *logger = nullptr);

        Classification classify(std::span<const std::filesystem::path> inputs, SourceKind kind) override;

        /// Runs `<binary> -V` and returns the reported version line.
        /// Throws OracleUnavailable if the binary cannot be started or fails.
        std::string probe();

        /// Invocation recipe for a dialect; nullopt for kinds without one.
        std::optional<process::Command> buildCommand(std::span<const std::filesystem::path> inputs,
                                                     SourceKind kind) const;

        const YosysOracleOptions &options() const noexcept { return options_; }

    private:
        process::ProcessRunner &runner_;
        YosysOracleOptions options_;
        Logger *logger_ = nullptr;
    };

} // namespace rtlharvest::lib::oracle

#endif // RTLHARVEST_ORACLE_HPP
