#include "scan.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace rtlharvest::lib;
using namespace rtlharvest::lib::scan;

namespace
{

    int fail(const std::string &message)
    {
        std::cerr << "[corpus_scan] " << message << '\n';
        return 1;
    }

    void writeFile(const std::filesystem::path &path, const std::string &text)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream stream(path, std::ios::binary);
        stream << text;
    }

    // Synthesizable as the file stem when the text contains "module",
    // timeout when it contains "slow", no top otherwise.
    class ContentOracle : public oracle::Oracle
    {
    public:
        std::size_t calls = 0;

        oracle::Classification classify(std::span<const std::filesystem::path> inputs, SourceKind) override
        {
            ++calls;
            auto text = flatten::readSourceFile(inputs.front());
            if (!text)
            {
                return oracle::NotSynthesizable{oracle::RejectReason::ToolFailure, "unreadable"};
            }
            if (text->find("slow") != std::string::npos)
            {
                return oracle::NotSynthesizable{oracle::RejectReason::Timeout, "scripted"};
            }
            if (text->find("module") == std::string::npos)
            {
                return oracle::NotSynthesizable{oracle::RejectReason::NoTopModuleFound, "scripted"};
            }
            std::string stem = inputs.front().stem().string();
            return oracle::SynthesizableAs{stem};
        }
    };

} // namespace

int main()
{
#ifndef RTLHARVEST_TEST_ARTIFACT_DIR
#error "RTLHARVEST_TEST_ARTIFACT_DIR must be defined"
#endif
    const std::filesystem::path artifactDir = RTLHARVEST_TEST_ARTIFACT_DIR;
    std::filesystem::remove_all(artifactDir);
    const std::filesystem::path repo = artifactDir / "repo";

    writeFile(repo / "b.v", "module b; endmodule\n");
    writeFile(repo / "a.sv", "module a; endmodule\n");
    writeFile(repo / "sub" / "c.v", "module c; endmodule\n");
    writeFile(repo / "sub" / "defs.v", "`define ONLY_MACROS\n");
    writeFile(repo / "sub" / "deep" / "slow.v", "module slow; endmodule\n");
    writeFile(repo / "README.md", "module lookalike\n");
    writeFile(repo / "upper.V", "module upper; endmodule\n");
    std::filesystem::create_directories(repo / "dir.v");

    // Case 1: only regular files with a recognized extension are listed, SystemVerilog first
    CandidateListing listing = listCandidates(repo);
    if (!listing.success || !listing.warning.empty())
    {
        return fail("Listing a readable tree should succeed: " + listing.error);
    }
    const std::vector<std::filesystem::path> expected{
        repo / "a.sv", repo / "b.v", repo / "sub" / "c.v", repo / "sub" / "deep" / "slow.v", repo / "sub" / "defs.v"};
    if (listing.candidates.size() != expected.size())
    {
        return fail("Unexpected candidate count " + std::to_string(listing.candidates.size()));
    }
    for (std::size_t i = 0; i < expected.size(); ++i)
    {
        if (listing.candidates[i].path != expected[i])
        {
            return fail("Unexpected candidate order at " + listing.candidates[i].path.string());
        }
    }
    if (listing.candidates[0].kind != SourceKind::SystemVerilog || listing.candidates[1].kind != SourceKind::Verilog)
    {
        return fail("Candidates should carry their source kind");
    }

    // Case 2: a missing root cannot be enumerated
    if (listCandidates(artifactDir / "nowhere").success)
    {
        return fail("Listing a missing root should fail");
    }

    // Case 3: the scan tallies every candidate once and extracts the synthesizable ones
    output::OutputDirectory output(artifactDir / "rtl", 11);
    if (!output.prepare().success)
    {
        return fail("Cannot prepare the output directory");
    }
    ContentOracle contentOracle;
    extract::ExtractDiagnostics diagnostics;
    extract::ExtractStep step(contentOracle, output, flatten::IncludeFlattener(), nullptr, &diagnostics);
    CorpusScanner scanner(step);
    ScanResult result = scanner.scan(repo);
    if (!result.success)
    {
        return fail("Scan should succeed: " + result.error);
    }
    if (result.tally.total != 5 || result.tally.extracted != 3)
    {
        return fail("Expected 3/5, got " + std::to_string(result.tally.extracted) + "/" +
                    std::to_string(result.tally.total));
    }
    if (result.perKind.size() != 2 || result.perKind[0].kind != SourceKind::SystemVerilog ||
        result.perKind[0].tally.total != 1 || result.perKind[0].tally.extracted != 1 ||
        result.perKind[1].tally.total != 4 || result.perKind[1].tally.extracted != 2)
    {
        return fail("Unexpected per-kind tallies");
    }
    for (const char *name : {"a.sv", "b.v", "c.v"})
    {
        if (!std::filesystem::exists(output.root() / name))
        {
            return fail(std::string("Missing artifact ") + name);
        }
    }
    if (std::filesystem::exists(output.root() / "slow.v") || std::filesystem::exists(output.root() / "defs.v"))
    {
        return fail("Rejected candidates must not produce artifacts");
    }

    // Case 4: rejections are recorded with their reason
    std::size_t timeouts = 0;
    std::size_t noTop = 0;
    for (const auto &message : diagnostics.messages())
    {
        timeouts += message.reason == "OracleTimeout" ? 1 : 0;
        noTop += message.reason == "NoTopModuleFound" ? 1 : 0;
    }
    if (timeouts != 1 || noTop != 1)
    {
        return fail("Expected one timeout and one missing top module in diagnostics");
    }

    // Case 5: rescanning the same tree collides with the first run's artifacts but conserves the tally
    ScanResult again = scanner.scan(repo);
    if (again.tally.total != 5 || again.tally.extracted != 3 || output.collisions() != 3)
    {
        return fail("A second scan should extract under prefixed names");
    }

    // Case 6: an unreadable root fails the scan without touching the oracle
    const std::size_t callsBefore = contentOracle.calls;
    ScanResult missing = scanner.scan(artifactDir / "nowhere");
    if (missing.success || missing.tally.total != 0 || contentOracle.calls != callsBefore)
    {
        return fail("Scanning a missing root should fail cleanly");
    }

    // Case 7: an empty tree reports 0/0
    std::filesystem::create_directories(artifactDir / "empty");
    ScanResult empty = scanner.scan(artifactDir / "empty");
    if (!empty.success || empty.tally.total != 0 || empty.tally.extracted != 0)
    {
        return fail("An empty tree should scan as 0/0");
    }

    return 0;
}
