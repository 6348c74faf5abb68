#include "corpus.hpp"

#include "flatten.hpp"
#include "oracle.hpp"

#include <cctype>
#include <system_error>
#include <utility>

namespace rtlharvest::lib::corpus
{

    namespace
    {
        constexpr std::string_view kLogTag = "corpus";

        std::string_view trim(std::string_view text)
        {
            while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
            {
                text.remove_prefix(1);
            }
            while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
            {
                text.remove_suffix(1);
            }
            return text;
        }

        std::string lastLine(std::string_view text)
        {
            text = trim(text);
            const std::size_t pos = text.rfind('\n');
            return std::string(pos == std::string_view::npos ? text : text.substr(pos + 1));
        }
    } // namespace

    std::vector<std::string> parseRepositoryList(std::string_view text)
    {
        std::vector<std::string> identifiers;
        std::size_t pos = 0;
        while (pos <= text.size())
        {
            std::size_t end = text.find('\n', pos);
            if (end == std::string_view::npos)
            {
                end = text.size();
            }
            const std::string_view line = trim(text.substr(pos, end - pos));
            if (!line.empty())
            {
                identifiers.emplace_back(line);
            }
            pos = end + 1;
        }
        return identifiers;
    }

    RepositoryList readRepositoryList(const std::filesystem::path &path)
    {
        RepositoryList list;
        auto contents = flatten::readSourceFile(path);
        if (!contents)
        {
            list.success = false;
            list.error = "cannot read repository list " + path.string();
            return list;
        }
        list.identifiers = parseRepositoryList(*contents);
        return list;
    }

    Checkout LocalRepositoryProvider::acquire(const std::string &identifier)
    {
        Checkout checkout;
        checkout.root = std::filesystem::path(identifier);
        return checkout;
    }

    ReleaseResult LocalRepositoryProvider::release(const Checkout &)
    {
        return ReleaseResult{};
    }

    GitRepositoryProvider::GitRepositoryProvider(process::ProcessRunner &runner, GitProviderOptions options,
                                                 Logger *logger)
        : runner_(runner), options_(std::move(options)), logger_(logger)
    {
    }

    std::optional<std::string> GitRepositoryProvider::checkoutName(std::string_view identifier)
    {
        identifier = trim(identifier);
        const std::size_t slash = identifier.find('/');
        const std::string_view name = slash == std::string_view::npos ? identifier : identifier.substr(slash + 1);
        if (name.empty())
        {
            return std::nullopt;
        }
        const std::filesystem::path relative(name);
        if (relative.is_absolute())
        {
            return std::nullopt;
        }
        for (const auto &part : relative)
        {
            if (part == "." || part == ".." || part.empty())
            {
                return std::nullopt;
            }
        }
        return std::string(name);
    }

    Checkout GitRepositoryProvider::acquire(const std::string &identifier)
    {
        Checkout checkout;
        const auto name = checkoutName(identifier);
        if (!name)
        {
            checkout.success = false;
            checkout.error = "invalid repository identifier '" + identifier + "'";
            return checkout;
        }

        const std::filesystem::path workDirectory =
            options_.workDirectory.empty() ? std::filesystem::current_path() : options_.workDirectory;
        const std::filesystem::path destination = workDirectory / *name;

        std::error_code ec;
        if (std::filesystem::exists(std::filesystem::symlink_status(destination, ec)))
        {
            checkout.success = false;
            checkout.error = "clone destination already exists: " + destination.string();
            return checkout;
        }

        process::Command command;
        command.executable = options_.gitBinary;
        command.arguments = {"clone", "--quiet", options_.urlPrefix + std::string(trim(identifier)) + ".git", *name};
        command.workingDirectory = workDirectory;
        command.environment = {{"GIT_TERMINAL_PROMPT", "0"}};
        if (options_.cloneTimeout)
        {
            command.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(*options_.cloneTimeout);
        }

        if (logger_)
        {
            logger_->debug(kLogTag, command.toString());
        }
        process::ProcessResult cloned = runner_.run(command);
        if (cloned.success())
        {
            checkout.root = destination;
            return checkout;
        }

        checkout.success = false;
        if (cloned.status == process::ProcessStatus::LaunchFailed)
        {
            checkout.error = "cannot launch git: " + cloned.launchError;
            return checkout;
        }
        checkout.error = "git clone " + identifier + " " + process::processStatusText(cloned.status);
        if (cloned.status == process::ProcessStatus::Exited)
        {
            checkout.error += " with code " + std::to_string(cloned.exitCode);
        }
        const std::string reason = lastLine(cloned.errorOutput);
        if (!reason.empty())
        {
            checkout.error += ": " + reason;
        }

        // The destination did not exist before the clone, so anything there is a partial clone.
        std::filesystem::remove_all(destination, ec);
        if (ec && logger_)
        {
            logger_->warn(kLogTag, "cannot remove partial clone " + destination.string() + ": " + ec.message());
        }
        return checkout;
    }

    ReleaseResult GitRepositoryProvider::release(const Checkout &checkout)
    {
        ReleaseResult result;
        if (options_.keepCheckouts || checkout.root.empty())
        {
            return result;
        }
        std::error_code ec;
        std::filesystem::remove_all(checkout.root, ec);
        if (ec)
        {
            result.success = false;
            result.error = "cannot remove clone " + checkout.root.string() + ": " + ec.message();
        }
        return result;
    }

    CorpusRunner::CorpusRunner(RepositoryProvider &provider,
                               scan::CorpusScanner &scanner,
                               extract::ExtractDiagnostics *diagnostics,
                               Logger *logger)
        : provider_(provider), scanner_(scanner), diagnostics_(diagnostics), logger_(logger)
    {
    }

    void CorpusRunner::collectReasons(RunSummary &summary)
    {
        if (!diagnostics_)
        {
            return;
        }
        for (const auto &message : diagnostics_->messages())
        {
            if (!message.reason.empty())
            {
                ++summary.reasons[message.reason];
            }
        }
        diagnostics_->clear();
    }

    RunSummary CorpusRunner::run(std::span<const std::string> identifiers)
    {
        RunSummary summary;
        for (const auto &identifier : identifiers)
        {
            ++summary.repositories;
            if (logger_)
            {
                logger_->info(kLogTag, "Start analyzing [ " + identifier + " ].");
            }

            Checkout checkout = provider_.acquire(identifier);
            if (!checkout.success)
            {
                ++summary.failedRepositories;
                if (logger_)
                {
                    logger_->error(kLogTag, checkout.error);
                }
                continue;
            }

            scan::ScanResult scanned;
            try
            {
                scanned = scanner_.scan(checkout.root);
            }
            catch (const oracle::OracleUnavailable &)
            {
                ReleaseResult released = provider_.release(checkout);
                if (!released.success && logger_)
                {
                    logger_->warn(kLogTag, released.error);
                }
                throw;
            }
            if (scanned.success)
            {
                summary.tally += scanned.tally;
            }
            else
            {
                ++summary.failedRepositories;
                ++summary.reasons["RepositoryEnumerationFailed"];
            }
            collectReasons(summary);

            ReleaseResult released = provider_.release(checkout);
            if (!released.success && logger_)
            {
                logger_->warn(kLogTag, released.error);
            }
        }

        if (logger_)
        {
            for (const auto &[reason, count] : summary.reasons)
            {
                logger_->debug(kLogTag, reason + ": " + std::to_string(count));
            }
            if (summary.failedRepositories > 0)
            {
                logger_->warn(kLogTag, std::to_string(summary.failedRepositories) + " of " +
                                           std::to_string(summary.repositories) +
                                           " repositories could not be scanned");
            }
            logger_->info(kLogTag, "Summary: " + std::to_string(summary.tally.extracted) + "/" +
                                       std::to_string(summary.tally.total));
        }
        return summary;
    }

} // namespace rtlharvest::lib::corpus
