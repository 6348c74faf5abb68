#ifndef RTLHARVEST_PROCESS_HPP
#define RTLHARVEST_PROCESS_HPP

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rtlharvest::lib::process
{

    enum class ProcessStatus
    {
        Exited,
        Signaled,
        TimedOut,
        LaunchFailed
    };

    const char *processStatusText(ProcessStatus status) noexcept;

    struct Command
    {
        // Looked up in PATH when it contains no '/'.
        std::string executable;
        std::vector<std::string> arguments;
        std::filesystem::path workingDirectory;
        // Added to (or replacing entries of) the parent's environment.
        std::map<std::string, std::string> environment;
        std::optional<std::chrono::milliseconds> timeout;
        // Capture stderr into the same stream as stdout, preserving write order.
        bool mergeOutput = false;

        std::string toString() const;
    };

    struct ProcessResult
    {
        ProcessStatus status = ProcessStatus::LaunchFailed;
        int exitCode = -1;
        int signal = 0;
        std::string output;
        std::string errorOutput;
        std::string launchError;

        bool success() const noexcept { return status == ProcessStatus::Exited && exitCode == 0; }
        explicit operator bool() const noexcept { return success(); }
    };

    class ProcessRunner
    {
    public:
        virtual ~ProcessRunner() = default;

        virtual ProcessResult run(const Command &command) = 0;
    };

    /// Runs commands as child processes of this one. The child gets its own
    /// process group so that a timeout kills everything it spawned.
    class LocalProcessRunner final : public ProcessRunner
    {
    public:
        ProcessResult run(const Command &command) override;
    };

} // namespace rtlharvest::lib::process

#endif // RTLHARVEST_PROCESS_HPP
