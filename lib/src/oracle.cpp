#include "oracle.hpp"

#include <cstdlib>
#include <regex>
#include <utility>

namespace rtlharvest::lib::oracle
{

    namespace
    {
        constexpr std::string_view kTopLevelNote = "[NTE:EL0503]";
        constexpr std::string_view kLogTag = "oracle";

        const std::regex &autoTopPattern()
        {
            static const std::regex pattern(
                R"(Automatically selected ([a-zA-Z_][a-zA-Z0-9_$]*) as design top module\.)");
            return pattern;
        }

        std::string_view trimLineEnd(std::string_view line)
        {
            while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
            {
                line.remove_suffix(1);
            }
            return line;
        }

        bool quotable(const std::filesystem::path &path)
        {
            const std::string text = path.string();
            return !text.empty() && text.find_first_of("\"\n\r") == std::string::npos;
        }

        std::string quotedFileList(std::span<const std::filesystem::path> inputs)
        {
            std::string out;
            for (const auto &input : inputs)
            {
                if (!out.empty())
                {
                    out.push_back(' ');
                }
                out.push_back('"');
                out.append(input.string());
                out.push_back('"');
            }
            return out;
        }

        std::string firstLine(std::string_view text)
        {
            const std::size_t end = text.find('\n');
            return std::string(trimLineEnd(text.substr(0, end)));
        }

        std::string tailOf(std::string_view text, std::size_t limit)
        {
            while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' '))
            {
                text.remove_suffix(1);
            }
            if (text.size() <= limit)
            {
                return std::string(text);
            }
            std::string out("...");
            out.append(text.substr(text.size() - limit));
            return out;
        }
    } // namespace

    const char *rejectReasonText(RejectReason reason) noexcept
    {
        switch (reason)
        {
        case RejectReason::ToolFailure:
            return "ToolFailure";
        case RejectReason::Timeout:
            return "Timeout";
        case RejectReason::NoTopModuleFound:
            return "NoTopModuleFound";
        case RejectReason::UnsupportedKind:
        default:
            return "UnsupportedKind";
        }
    }

    TopModuleScan scanTopModule(std::string_view output)
    {
        TopModuleScan scan;
        std::size_t pos = 0;
        while (pos < output.size())
        {
            std::size_t end = output.find('\n', pos);
            if (end == std::string_view::npos)
            {
                end = output.size();
            }
            const std::string_view line = trimLineEnd(output.substr(pos, end - pos));
            pos = end + 1;

            if (line.starts_with(kTopLevelNote))
            {
                scan.line = std::string(line);
                const std::size_t at = line.find('@');
                if (at == std::string_view::npos)
                {
                    scan.status = TopModuleStatus::Malformed;
                    return scan;
                }
                std::size_t begin = at + 1;
                std::size_t quote = line.find('"', begin);
                // `@"name"` spelling: the name sits inside the quotes.
                if (quote == begin)
                {
                    begin = quote + 1;
                    quote = line.find('"', begin);
                }
                if (quote == std::string_view::npos || quote == begin)
                {
                    scan.status = TopModuleStatus::Malformed;
                    return scan;
                }
                scan.status = TopModuleStatus::Found;
                scan.name = std::string(line.substr(begin, quote - begin));
                return scan;
            }

            std::match_results<std::string_view::const_iterator> match;
            if (std::regex_search(line.begin(), line.end(), match, autoTopPattern()))
            {
                scan.status = TopModuleStatus::Found;
                scan.name = match[1].str();
                scan.line = std::string(line);
                return scan;
            }
        }
        return scan;
    }

    std::string defaultYosysBinary()
    {
        const char *env = std::getenv("YOSYS_BINARY");
        if (env != nullptr && *env != '\0')
        {
            return env;
        }
        return "yosys";
    }

    YosysOracle::YosysOracle(process::ProcessRunner &runner, YosysOracleOptions options, Logger *logger)
        : runner_(runner), options_(std::move(options)), logger_(logger)
    {
    }

    std::optional<process::Command> YosysOracle::buildCommand(std::span<const std::filesystem::path> inputs,
                                                              SourceKind kind) const
    {
        process::Command command;
        command.executable = options_.binary;
        command.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(options_.timeout);
        command.mergeOutput = true;

        switch (kind)
        {
        case SourceKind::SystemVerilog:
        {
            std::string script = "plugin -i " + options_.systemVerilogPlugin + "; read_systemverilog -synth ";
            script.append(quotedFileList(inputs));
            command.arguments = {"-qq", "-p", std::move(script)};
            return command;
        }
        case SourceKind::Verilog:
        {
            std::string script = "read_verilog ";
            script.append(quotedFileList(inputs));
            script.append("; synth -auto-top");
            command.arguments = {"-p", std::move(script)};
            return command;
        }
        case SourceKind::Unknown:
        default:
            return std::nullopt;
        }
    }

    Classification YosysOracle::classify(std::span<const std::filesystem::path> inputs, SourceKind kind)
    {
        if (inputs.empty())
        {
            return NotSynthesizable{RejectReason::ToolFailure, "no input files"};
        }
        for (const auto &input : inputs)
        {
            if (!quotable(input))
            {
                return NotSynthesizable{RejectReason::ToolFailure,
                                        "path cannot be quoted in an oracle script: " + input.string()};
            }
        }

        auto command = buildCommand(inputs, kind);
        if (!command)
        {
            return NotSynthesizable{RejectReason::UnsupportedKind,
                                    "no oracle recipe for source kind " + std::string(sourceKindName(kind))};
        }

        if (logger_)
        {
            logger_->trace(kLogTag, command->toString());
        }
        process::ProcessResult run = runner_.run(*command);

        switch (run.status)
        {
        case process::ProcessStatus::LaunchFailed:
            throw OracleUnavailable("cannot launch oracle '" + options_.binary + "': " + run.launchError);
        case process::ProcessStatus::TimedOut:
            return NotSynthesizable{RejectReason::Timeout,
                                    "exceeded " + std::to_string(options_.timeout.count()) + "s"};
        case process::ProcessStatus::Signaled:
            return NotSynthesizable{RejectReason::ToolFailure,
                                    "oracle killed by signal " + std::to_string(run.signal)};
        case process::ProcessStatus::Exited:
            break;
        }

        if (run.exitCode != 0)
        {
            std::string detail = "oracle exited with code " + std::to_string(run.exitCode);
            if (logger_ && logger_->enabled(LogLevel::Trace, kLogTag))
            {
                logger_->trace(kLogTag, tailOf(run.output, 2000));
            }
            return NotSynthesizable{RejectReason::ToolFailure, std::move(detail)};
        }

        TopModuleScan scan = scanTopModule(run.output);
        switch (scan.status)
        {
        case TopModuleStatus::Found:
            return SynthesizableAs{std::move(scan.name)};
        case TopModuleStatus::Malformed:
            return NotSynthesizable{RejectReason::NoTopModuleFound, "malformed top-module note: " + scan.line};
        case TopModuleStatus::NotFound:
        default:
            return NotSynthesizable{RejectReason::NoTopModuleFound, "no top-module signal in oracle output"};
        }
    }

    std::string YosysOracle::probe()
    {
        process::Command command;
        command.executable = options_.binary;
        command.arguments = {"-V"};
        command.timeout = std::chrono::seconds(60);
        command.mergeOutput = true;

        process::ProcessResult run = runner_.run(command);
        if (run.status == process::ProcessStatus::LaunchFailed)
        {
            throw OracleUnavailable("cannot launch oracle '" + options_.binary + "': " + run.launchError);
        }
        if (!run.success())
        {
            throw OracleUnavailable("oracle '" + options_.binary + "' failed its version check (" +
                                    process::processStatusText(run.status) + ", code " +
                                    std::to_string(run.exitCode) + ")");
        }
        return firstLine(run.output);
    }

} // namespace rtlharvest::lib::oracle
