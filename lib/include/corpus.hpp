#ifndef RTLHARVEST_CORPUS_HPP
#define RTLHARVEST_CORPUS_HPP

#include "extract.hpp"
#include "logging.hpp"
#include "process.hpp"
#include "scan.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rtlharvest::lib::corpus
{

    struct RepositoryList
    {
        bool success = true;
        std::string error;
        std::vector<std::string> identifiers;
    };

    /// One identifier per line; surrounding whitespace trimmed, blank lines skipped.
    std::vector<std::string> parseRepositoryList(std::string_view text);
    RepositoryList readRepositoryList(const std::filesystem::path &path);

    struct Checkout
    {
        bool success = true;
        std::string error;
        std::filesystem::path root;
    };

    struct ReleaseResult
    {
        bool success = true;
        std::string error;
    };

    class RepositoryProvider
    {
    public:
        virtual ~RepositoryProvider() = default;

        virtual Checkout acquire(const std::string &identifier) = 0;
        virtual ReleaseResult release(const Checkout &checkout) = 0;
    };

    /// Treats each identifier as a directory that already exists.
    class LocalRepositoryProvider final : public RepositoryProvider
    {
    public:
        Checkout acquire(const std::string &identifier) override;
        ReleaseResult release(const Checkout &checkout) override;
    };

    struct GitProviderOptions
    {
        std::string gitBinary = "git";
        std::string urlPrefix = "https://github.com/";
        std::filesystem::path workDirectory;
        std::optional<std::chrono::seconds> cloneTimeout;
        bool keepCheckouts = false;
    };

    /// `owner/name` is cloned from `<urlPrefix>owner/name.git` into
    /// `<workDirectory>/name` and removed again on release. A destination
    /// that already exists is never reused, so release only ever deletes
    /// what this provider cloned.
    class GitRepositoryProvider final : public RepositoryProvider
    {
    public:
        GitRepositoryProvider(process::ProcessRunner &runner, GitProviderOptions options, Logger *logger = nullptr);

        Checkout acquire(const std::string &identifier) override;
        ReleaseResult release(const Checkout &checkout) override;

        /// Part of the identifier after the first '/'; nullopt if it is
        /// empty or would leave the work directory.
        static std::optional<std::string> checkoutName(std::string_view identifier);

    private:
        process::ProcessRunner &runner_;
        GitProviderOptions options_;
        Logger *logger_ = nullptr;
    };

    struct RunSummary
    {
        scan::ExtractionTally tally;
        std::size_t repositories = 0;
        std::size_t failedRepositories = 0;
        // Counts keyed by reason tag, including RepositoryEnumerationFailed for unreadable roots.
        std::map<std::string, std::size_t> reasons;
    };

    /// Drives acquire, scan and release for each repository in turn and sums
    /// the tallies. A repository that cannot be acquired or enumerated is
    /// counted as failed and skipped; the run continues.
    class CorpusRunner
    {
    public:
        CorpusRunner(RepositoryProvider &provider,
                     scan::CorpusScanner &scanner,
                     extract::ExtractDiagnostics *diagnostics = nullptr,
                     Logger *logger = nullptr);

        RunSummary run(std::span<const std::string> identifiers);

    private:
        void collectReasons(RunSummary &summary);

        RepositoryProvider &provider_;
        scan::CorpusScanner &scanner_;
        extract::ExtractDiagnostics *diagnostics_ = nullptr;
        Logger *logger_ = nullptr;
    };

} // namespace rtlharvest::lib::corpus

#endif // RTLHARVEST_CORPUS_HPP
