#include "diagnostics.hpp"
#include "logging.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace rtlharvest::lib;

namespace
{

    int fail(const std::string &message)
    {
        std::cerr << "[logging] " << message << '\n';
        return 1;
    }

    class TestDiagnostics : public diag::Diagnostics
    {
    public:
        void tagged(std::string message, std::string reason)
        {
            add(diag::DiagnosticKind::Warning, std::move(message), "file.v", "scan", std::move(reason));
        }
    };

} // namespace

int main()
{
    // Case 1: level names parse case-insensitively, with aliases
    if (parseLogLevel("DEBUG") != LogLevel::Debug || parseLogLevel("warning") != LogLevel::Warn ||
        parseLogLevel("none") != LogLevel::Off || parseLogLevel("trace") != LogLevel::Trace)
    {
        return fail("Unexpected parse result for a known level name");
    }
    if (parseLogLevel("verbose").has_value())
    {
        return fail("Unknown level names must not parse");
    }
    if (std::string(logLevelText(LogLevel::Error)) != "error")
    {
        return fail("logLevelText(Error) should be 'error'");
    }

    // Case 2: a disabled logger drops everything
    std::vector<LogEvent> events;
    Logger logger;
    logger.setSink([&](const LogEvent &event) { events.push_back(event); });
    logger.error("extract", "dropped");
    if (!events.empty())
    {
        return fail("Logger should start disabled");
    }

    // Case 3: events below the threshold are filtered
    logger.enable();
    logger.setLevel(LogLevel::Info);
    logger.debug("extract", "too verbose");
    logger.info("extract", "kept");
    logger.warn("scan", "also kept");
    if (events.size() != 2 || events[0].message != "kept" || events[1].tag != "scan")
    {
        return fail("Expected exactly the info and warn events to reach the sink");
    }
    if (logger.enabled(LogLevel::Debug, "extract"))
    {
        return fail("Debug should be disabled at info level");
    }

    // Case 4: the tag allow-list restricts output
    events.clear();
    logger.allowTag("corpus");
    logger.info("extract", "filtered");
    logger.info("corpus", "passed");
    if (events.size() != 1 || events[0].tag != "corpus")
    {
        return fail("Only allow-listed tags should be logged");
    }
    logger.clearTags();
    logger.info("extract", "passes again");
    if (events.size() != 2)
    {
        return fail("Clearing the allow-list should admit all tags");
    }

    // Case 5: Off silences the logger entirely
    events.clear();
    logger.setLevel(LogLevel::Off);
    logger.error("extract", "silenced");
    if (!events.empty())
    {
        return fail("Level Off should silence all events");
    }

    // Case 6: diagnostics track errors and carry stage and reason
    TestDiagnostics diagnostics;
    int errorCallbacks = 0;
    diagnostics.setOnError([&]() { ++errorCallbacks; });
    diagnostics.info("scanning", "repo");
    diagnostics.tagged("odd file", "Suspicious");
    if (diagnostics.hasError())
    {
        return fail("Info and warning diagnostics must not count as errors");
    }
    diagnostics.error("broken", "repo");
    if (!diagnostics.hasError() || errorCallbacks != 1)
    {
        return fail("Error diagnostics should set hasError and fire the callback");
    }
    if (diagnostics.count(diag::DiagnosticKind::Warning) != 1 || diagnostics.messages().size() != 3)
    {
        return fail("Unexpected diagnostic counts");
    }
    const auto &tagged = diagnostics.messages()[1];
    if (tagged.stage != "scan" || tagged.reason != "Suspicious" || tagged.context != "file.v")
    {
        return fail("Stage, reason and context should be recorded as given");
    }
    diagnostics.clear();
    if (!diagnostics.empty() || diagnostics.hasError())
    {
        return fail("clear() should reset messages and the error flag");
    }

    return 0;
}
