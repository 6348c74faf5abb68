#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "slang/util/CommandLine.h"

#include "corpus.hpp"
#include "extract.hpp"
#include "flatten.hpp"
#include "logging.hpp"
#include "oracle.hpp"
#include "output.hpp"
#include "process.hpp"
#include "scan.hpp"

namespace {
class Watchdog {
public:
    explicit Watchdog(std::chrono::seconds timeout)
        : timeout_(timeout),
          thread_([this]() { run(); })
    {
    }

    Watchdog(const Watchdog&) = delete;
    Watchdog& operator=(const Watchdog&) = delete;

    ~Watchdog()
    {
        cancel();
        if (thread_.joinable())
        {
            thread_.join();
        }
    }

    void cancel()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_one();
    }

private:
    void run()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (cv_.wait_for(lock, timeout_, [this]() { return cancelled_; }))
        {
            return;
        }
        std::cerr << "[timeout] Exceeded " << timeout_.count() << " seconds; terminating\n";
        std::cerr.flush();
        std::exit(124);
    }

    std::chrono::seconds timeout_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_ = false;
    std::thread thread_;
};

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitOracleUnavailable = 2;
constexpr int kExitRepositoryList = 3;
constexpr int kExitOutputDirectory = 4;

// `MM-DD HH:MM`, local time.
std::string timestampText()
{
    const std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    char buffer[32];
    if (std::strftime(buffer, sizeof(buffer), "%m-%d %H:%M", &local) == 0)
    {
        return {};
    }
    return buffer;
}

} // namespace

namespace rtlharvest::app::cli
{

int run(int argc, char **argv)
{
    slang::CommandLine cmdLine;

    std::optional<bool> showHelp;
    cmdLine.add("-h,--help", showHelp, "Display available options");
    std::optional<std::string> reposPath;
    cmdLine.add("--repos", reposPath, "Repository list, one owner/name per line (default repos.txt)", "<file>",
                slang::CommandLineFlags::FilePath);
    std::vector<std::string> scanDirs;
    cmdLine.add("--scan", scanDirs, "Scan a local directory instead of cloning (repeatable)", "<dir>",
                slang::CommandLineFlags::FilePath);
    std::optional<std::string> outputDir;
    cmdLine.add("--output-dir", outputDir, "Directory that collects extracted modules (default ./rtl)", "<dir>",
                slang::CommandLineFlags::FilePath);
    std::optional<std::string> workDir;
    cmdLine.add("--work-dir", workDir, "Directory repositories are cloned into (default current directory)",
                "<dir>", slang::CommandLineFlags::FilePath);
    std::optional<std::string> yosysBinary;
    cmdLine.add("--yosys", yosysBinary, "Yosys binary (default $YOSYS_BINARY, else yosys)", "<path>");
    std::optional<int64_t> oracleTimeout;
    cmdLine.add("--oracle-timeout", oracleTimeout, "Per-call yosys timeout in seconds (default 1000)", "<sec>");
    std::optional<int64_t> maxIncludePasses;
    cmdLine.add("--max-include-passes", maxIncludePasses, "Include flattening passes per file (default 5)",
                "<count>");
    std::optional<bool> keepClones;
    cmdLine.add("--keep-clones", keepClones, "Keep cloned repositories after scanning");
    std::optional<std::string> logLevel;
    cmdLine.add("--log", logLevel, "Log level: none|error|warn|info|debug|trace", "<level>");
    std::optional<std::string> logFile;
    cmdLine.add("--log-file", logFile, "Append log lines to a file instead of stderr", "<path>",
                slang::CommandLineFlags::FilePath);
    std::optional<uint64_t> seed;
    cmdLine.add("--seed", seed, "Seed for collision prefixes", "<n>");
    std::optional<int64_t> timeoutSeconds;
    cmdLine.add("--timeout", timeoutSeconds, "Terminate if runtime exceeds timeout seconds", "<sec>");

    if (!cmdLine.parse(argc, argv))
    {
        for (const auto &error : cmdLine.getErrors())
        {
            std::cerr << "[cli] " << error << '\n';
        }
        return kExitUsage;
    }
    if (showHelp == true)
    {
        std::cout << cmdLine.getHelpText("rtlharvest: collect standalone synthesizable HDL modules");
        return kExitOk;
    }

    if (timeoutSeconds && *timeoutSeconds <= 0) {
        std::cerr << "[timeout] Value must be a positive number of seconds\n";
        return kExitUsage;
    }
    if (oracleTimeout && *oracleTimeout <= 0)
    {
        std::cerr << "[cli] --oracle-timeout must be a positive number of seconds\n";
        return kExitUsage;
    }
    if (maxIncludePasses && *maxIncludePasses < 0)
    {
        std::cerr << "[cli] --max-include-passes must not be negative\n";
        return kExitUsage;
    }
    std::optional<Watchdog> watchdog;
    if (timeoutSeconds) {
        watchdog.emplace(std::chrono::seconds(*timeoutSeconds));
    }

    rtlharvest::lib::LogLevel globalLogLevel = rtlharvest::lib::LogLevel::Info;
    if (logLevel && !logLevel->empty())
    {
        const auto parsed = rtlharvest::lib::parseLogLevel(*logLevel);
        if (!parsed.has_value())
        {
            std::cerr << "[log] Unknown log level: " << *logLevel << '\n';
            return kExitUsage;
        }
        globalLogLevel = *parsed;
    }

    std::ofstream logStream;
    if (logFile && !logFile->empty())
    {
        logStream.open(*logFile, std::ios::app);
        if (!logStream)
        {
            std::cerr << "[log] Cannot open log file: " << *logFile << '\n';
            return kExitUsage;
        }
    }
    auto logLine = [&](rtlharvest::lib::LogLevel level, std::string_view prefix,
                       std::string_view tag, std::string_view message) {
        std::ostream &out = logStream.is_open() ? static_cast<std::ostream &>(logStream) : std::cerr;
        if (logStream.is_open())
        {
            out << timestampText() << ' ';
        }
        out << "[" << prefix << "] [" << rtlharvest::lib::logLevelText(level) << "]";
        if (!tag.empty())
        {
            out << " [" << tag << "]";
        }
        out << " " << message << '\n';
        out.flush();
    };

    rtlharvest::lib::Logger logger;
    logger.setLevel(globalLogLevel);
    if (globalLogLevel != rtlharvest::lib::LogLevel::Off)
    {
        logger.enable();
    }
    logger.setSink([&](const rtlharvest::lib::LogEvent &event) {
        logLine(event.level, "rtlharvest", event.tag, event.message);
    });

    rtlharvest::lib::process::LocalProcessRunner runner;

    rtlharvest::lib::oracle::YosysOracleOptions oracleOptions;
    oracleOptions.binary = yosysBinary && !yosysBinary->empty() ? *yosysBinary
                                                               : rtlharvest::lib::oracle::defaultYosysBinary();
    if (oracleTimeout)
    {
        oracleOptions.timeout = std::chrono::seconds(*oracleTimeout);
    }
    rtlharvest::lib::oracle::YosysOracle oracle(runner, oracleOptions, &logger);
    try
    {
        const std::string version = oracle.probe();
        logger.info("oracle", "Using " + version);
    }
    catch (const rtlharvest::lib::oracle::OracleUnavailable &ex)
    {
        logger.error("oracle", ex.what());
        return kExitOracleUnavailable;
    }

    const std::filesystem::path outputRoot = outputDir && !outputDir->empty() ? *outputDir : "./rtl";
    std::optional<rtlharvest::lib::output::OutputDirectory> output;
    if (seed)
    {
        output.emplace(outputRoot, *seed);
    }
    else
    {
        output.emplace(outputRoot);
    }
    const rtlharvest::lib::output::OutputResult prepared = output->prepare();
    if (!prepared.success)
    {
        logger.error("output", prepared.error);
        return kExitOutputDirectory;
    }

    rtlharvest::lib::flatten::FlattenOptions flattenOptions;
    if (maxIncludePasses)
    {
        flattenOptions.maxPasses = static_cast<int>(*maxIncludePasses);
    }

    rtlharvest::lib::extract::ExtractDiagnostics diagnostics;
    rtlharvest::lib::extract::ExtractStep step(oracle, *output,
                                               rtlharvest::lib::flatten::IncludeFlattener(flattenOptions),
                                               &logger, &diagnostics);
    rtlharvest::lib::scan::CorpusScanner scanner(step, &logger);

    std::vector<std::string> identifiers;
    std::unique_ptr<rtlharvest::lib::corpus::RepositoryProvider> provider;
    if (!scanDirs.empty())
    {
        identifiers = scanDirs;
        provider = std::make_unique<rtlharvest::lib::corpus::LocalRepositoryProvider>();
    }
    else
    {
        const std::filesystem::path listPath = reposPath && !reposPath->empty() ? *reposPath : "repos.txt";
        rtlharvest::lib::corpus::RepositoryList list = rtlharvest::lib::corpus::readRepositoryList(listPath);
        if (!list.success)
        {
            logger.error("corpus", list.error);
            return kExitRepositoryList;
        }
        identifiers = std::move(list.identifiers);

        rtlharvest::lib::corpus::GitProviderOptions gitOptions;
        if (workDir && !workDir->empty())
        {
            gitOptions.workDirectory = *workDir;
        }
        gitOptions.keepCheckouts = keepClones == true;
        provider = std::make_unique<rtlharvest::lib::corpus::GitRepositoryProvider>(runner, gitOptions, &logger);
    }

    rtlharvest::lib::corpus::CorpusRunner corpusRunner(*provider, scanner, &diagnostics, &logger);
    try
    {
        (void)corpusRunner.run(identifiers);
    }
    catch (const rtlharvest::lib::oracle::OracleUnavailable &ex)
    {
        logger.error("oracle", ex.what());
        return kExitOracleUnavailable;
    }

    return kExitOk;
}

} // namespace rtlharvest::app::cli

int main(int argc, char **argv)
{
    return rtlharvest::app::cli::run(argc, argv);
}
