#include "process.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>

#include <csignal>

using namespace rtlharvest::lib::process;

namespace
{

    int fail(const std::string &message)
    {
        std::cerr << "[process_runner] " << message << '\n';
        return 1;
    }

    Command shell(std::string script)
    {
        Command command;
        command.executable = "/bin/sh";
        command.arguments = {"-c", std::move(script)};
        return command;
    }

} // namespace

int main()
{
#ifndef RTLHARVEST_TEST_ARTIFACT_DIR
#error "RTLHARVEST_TEST_ARTIFACT_DIR must be defined"
#endif
    const std::filesystem::path artifactDir = RTLHARVEST_TEST_ARTIFACT_DIR;
    std::filesystem::remove_all(artifactDir);
    std::filesystem::create_directories(artifactDir);

    LocalProcessRunner runner;

    // Case 1: stdout is captured and exit code 0 reported
    ProcessResult echoed = runner.run(shell("echo hello"));
    if (echoed.status != ProcessStatus::Exited || echoed.exitCode != 0 || !echoed)
    {
        return fail("Expected a clean exit for echo");
    }
    if (echoed.output != "hello\n")
    {
        return fail("Unexpected stdout: '" + echoed.output + "'");
    }

    // Case 2: non-zero exit codes are reported as data
    ProcessResult failed = runner.run(shell("exit 3"));
    if (failed.status != ProcessStatus::Exited || failed.exitCode != 3 || failed.success())
    {
        return fail("Expected exit code 3");
    }

    // Case 3: stderr is captured separately by default
    ProcessResult split = runner.run(shell("echo out; echo err 1>&2"));
    if (split.output != "out\n" || split.errorOutput != "err\n")
    {
        return fail("stdout and stderr should be captured separately");
    }

    // Case 4: merged output keeps write order
    Command merged = shell("echo a; echo b 1>&2; echo c");
    merged.mergeOutput = true;
    ProcessResult mergedResult = runner.run(merged);
    if (mergedResult.output != "a\nb\nc\n" || !mergedResult.errorOutput.empty())
    {
        return fail("Merged output should interleave in write order, got '" + mergedResult.output + "'");
    }

    // Case 5: a timeout kills the child
    Command slow = shell("sleep 5");
    slow.timeout = std::chrono::milliseconds(200);
    const auto slowStart = std::chrono::steady_clock::now();
    ProcessResult slowResult = runner.run(slow);
    const auto slowElapsed = std::chrono::steady_clock::now() - slowStart;
    if (slowResult.status != ProcessStatus::TimedOut)
    {
        return fail("Expected TimedOut for sleep 5 with a 200ms limit");
    }
    if (slowElapsed > std::chrono::seconds(3))
    {
        return fail("Timed out child was not killed promptly");
    }

    // Case 6: the timeout also kills grandchildren holding the output pipe
    Command grandchild = shell("sleep 5 & wait");
    grandchild.timeout = std::chrono::milliseconds(200);
    const auto grandStart = std::chrono::steady_clock::now();
    ProcessResult grandResult = runner.run(grandchild);
    if (grandResult.status != ProcessStatus::TimedOut ||
        std::chrono::steady_clock::now() - grandStart > std::chrono::seconds(3))
    {
        return fail("Expected the whole process group to be killed on timeout");
    }

    // Case 7: a missing executable is a launch failure, not an exit code
    Command missing;
    missing.executable = (artifactDir / "no-such-tool").string();
    ProcessResult missingResult = runner.run(missing);
    if (missingResult.status != ProcessStatus::LaunchFailed || missingResult.launchError.empty())
    {
        return fail("Expected LaunchFailed with a message for a missing executable");
    }

    // Case 8: environment overrides reach the child
    Command env = shell("printf %s \"$RTLHARVEST_PROBE\"");
    env.environment = {{"RTLHARVEST_PROBE", "42"}};
    ProcessResult envResult = runner.run(env);
    if (envResult.output != "42")
    {
        return fail("Environment override not visible to the child");
    }

    // Case 9: the working directory is applied
    Command pwd = shell("pwd -P");
    pwd.workingDirectory = artifactDir;
    ProcessResult pwdResult = runner.run(pwd);
    const std::string expectedDir = std::filesystem::canonical(artifactDir).string() + "\n";
    if (pwdResult.output != expectedDir)
    {
        return fail("Expected working directory " + expectedDir + ", got " + pwdResult.output);
    }

    // Case 10: death by signal is reported as Signaled
    ProcessResult killed = runner.run(shell("kill -9 $$"));
    if (killed.status != ProcessStatus::Signaled || killed.signal != SIGKILL)
    {
        return fail("Expected Signaled with SIGKILL");
    }

    // Case 11: toString quotes arguments with spaces
    Command printable;
    printable.executable = "yosys";
    printable.arguments = {"-p", "read_verilog a.v"};
    if (printable.toString() != "\"yosys\" -p 'read_verilog a.v'")
    {
        return fail("Unexpected command rendering: " + printable.toString());
    }

    return 0;
}
