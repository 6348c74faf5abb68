#include "scan.hpp"

#include <algorithm>
#include <system_error>

namespace rtlharvest::lib::scan
{

    namespace
    {
        constexpr std::string_view kLogTag = "scan";

        std::size_t kindOrder(SourceKind kind)
        {
            const auto kinds = recognizedSourceKinds();
            for (std::size_t i = 0; i < kinds.size(); ++i)
            {
                if (kinds[i].kind == kind)
                {
                    return i;
                }
            }
            return kinds.size();
        }
    } // namespace

    CandidateListing listCandidates(const std::filesystem::path &root)
    {
        CandidateListing listing;
        std::error_code ec;
        if (!std::filesystem::is_directory(root, ec))
        {
            listing.success = false;
            listing.error = ec ? "cannot stat " + root.string() + ": " + ec.message()
                               : "not a directory: " + root.string();
            return listing;
        }

        std::filesystem::recursive_directory_iterator it(
            root, std::filesystem::directory_options::skip_permission_denied, ec);
        if (ec)
        {
            listing.success = false;
            listing.error = "cannot enumerate " + root.string() + ": " + ec.message();
            return listing;
        }

        for (const std::filesystem::recursive_directory_iterator end{}; it != end; it.increment(ec))
        {
            if (ec)
            {
                break;
            }
            std::error_code entryEc;
            if (!it->is_regular_file(entryEc) || entryEc)
            {
                continue;
            }
            const SourceKind kind = sourceKindForPath(it->path());
            if (kind == SourceKind::Unknown)
            {
                continue;
            }
            listing.candidates.push_back(Candidate{it->path(), kind});
        }
        if (ec)
        {
            listing.warning = "enumeration of " + root.string() + " stopped early: " + ec.message();
        }

        std::sort(listing.candidates.begin(), listing.candidates.end(),
                  [](const Candidate &lhs, const Candidate &rhs) {
                      const std::size_t lhsOrder = kindOrder(lhs.kind);
                      const std::size_t rhsOrder = kindOrder(rhs.kind);
                      if (lhsOrder != rhsOrder)
                      {
                          return lhsOrder < rhsOrder;
                      }
                      return lhs.path < rhs.path;
                  });
        return listing;
    }

    CorpusScanner::CorpusScanner(extract::ExtractStep &step, Logger *logger)
        : step_(step), logger_(logger)
    {
    }

    ScanResult CorpusScanner::scan(const std::filesystem::path &repositoryRoot)
    {
        ScanResult result;
        CandidateListing listing = listCandidates(repositoryRoot);
        if (!listing.success)
        {
            result.success = false;
            result.error = std::move(listing.error);
            if (logger_)
            {
                logger_->error(kLogTag, result.error);
            }
            return result;
        }
        if (!listing.warning.empty() && logger_)
        {
            logger_->warn(kLogTag, listing.warning);
        }

        for (const auto &info : recognizedSourceKinds())
        {
            KindTally kindTally{info.kind, {}};
            for (const auto &candidate : listing.candidates)
            {
                if (candidate.kind != info.kind)
                {
                    continue;
                }
                ++kindTally.tally.total;
                if (step_.run(candidate).accepted())
                {
                    ++kindTally.tally.extracted;
                }
            }
            if (logger_ && kindTally.tally.total > 0)
            {
                logger_->debug(kLogTag, std::string(info.name) + ": " + std::to_string(kindTally.tally.extracted) +
                                            "/" + std::to_string(kindTally.tally.total));
            }
            result.tally += kindTally.tally;
            result.perKind.push_back(kindTally);
        }

        if (logger_)
        {
            logger_->info(kLogTag, "Extracted " + std::to_string(result.tally.extracted) +
                                       " standalone modules out of " + std::to_string(result.tally.total) +
                                       " files.");
        }
        return result;
    }

} // namespace rtlharvest::lib::scan
