#ifndef RTLHARVEST_SCAN_HPP
#define RTLHARVEST_SCAN_HPP

#include "extract.hpp"
#include "logging.hpp"
#include "source.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace rtlharvest::lib::scan
{

    struct ExtractionTally
    {
        std::size_t extracted = 0;
        std::size_t total = 0;

        ExtractionTally &operator+=(const ExtractionTally &other) noexcept
        {
            extracted += other.extracted;
            total += other.total;
            return *this;
        }
    };

    struct KindTally
    {
        SourceKind kind = SourceKind::Unknown;
        ExtractionTally tally;
    };

    struct CandidateListing
    {
        bool success = true;
        std::string error;
        // Set when the walk stopped early; candidates found so far are kept.
        std::string warning;
        std::vector<Candidate> candidates;
    };

    /// Regular files under root whose extension names a recognized kind,
    /// grouped by kind in recognizedSourceKinds() order and sorted by path.
    CandidateListing listCandidates(const std::filesystem::path &root);

    struct ScanResult
    {
        // False only when the root could not be enumerated.
        bool success = true;
        std::string error;
        ExtractionTally tally;
        std::vector<KindTally> perKind;
    };

    class CorpusScanner
    {
    public:
        explicit CorpusScanner(extract::ExtractStep &step, Logger *logger = nullptr);

        ScanResult scan(const std::filesystem::path &repositoryRoot);

    private:
        extract::ExtractStep &step_;
        Logger *logger_ = nullptr;
    };

} // namespace rtlharvest::lib::scan

#endif // RTLHARVEST_SCAN_HPP
