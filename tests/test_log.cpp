#include "etherstream/log/Log.hpp"

#include "TestSupport.hpp"

#include <string>
#include <vector>

using namespace etherstream;
using etherstream::log::Level;

static void testRoutingByLevel() {
    std::vector<std::string> info, warning, error;
    setLogHandlers(
        [&](std::string_view m) { info.emplace_back(m); },
        [&](std::string_view m) { warning.emplace_back(m); },
        [&](std::string_view m) { error.emplace_back(m); });

    logInfo("plain\n");
    logInfo("[Component] points=", 42, " rate=", 30000u, "\n");
    logWarning("underrun ", 'd', "\n");
    logError("failed: ", std::string("refused"), "\n");
    log::log(Level::Warning, "direct\n");

    // Restore before asserting: the assert macros log errors themselves.
    resetLogHandlers();

    ASSERT_EQ(info.size(), std::size_t{2}, "two info lines");
    ASSERT_EQ(warning.size(), std::size_t{2}, "two warning lines");
    ASSERT_EQ(error.size(), std::size_t{1}, "one error line");
    ASSERT_TRUE(info.size() == 2 && info[1] == "[Component] points=42 rate=30000\n",
                "variadic arguments are streamed in order");
    ASSERT_TRUE(warning.size() == 2 && warning[0] == "underrun d\n", "chars stream as characters");
    ASSERT_TRUE(error.size() == 1 && error[0] == "failed: refused\n", "strings stream verbatim");
}

static void testEmptyHandlerRestoresDefault() {
    int calls = 0;
    setLogHandler(Level::Info, [&](std::string_view) { ++calls; });
    logInfo("captured\n");
    setLogHandler(Level::Info, nullptr);
    logInfo("log: default info sink restored\n");
    ASSERT_EQ(calls, 1, "empty handler detaches the custom sink");
    resetLogHandlers();
}

static void testHandlerMayLog() {
    std::vector<std::string> errors;
    setLogHandler(Level::Warning, [](std::string_view m) { logError("escalated: ", m); });
    setLogHandler(Level::Error, [&](std::string_view m) { errors.emplace_back(m); });
    logWarning("nested\n");
    resetLogHandlers();
    ASSERT_TRUE(errors.size() == 1 && errors[0] == "escalated: nested\n", "handlers can log without deadlock");
}

static void testLevelNames() {
    ASSERT_TRUE(std::string(log::toString(Level::Info)) == "info", "info name");
    ASSERT_TRUE(std::string(log::toString(Level::Warning)) == "warning", "warning name");
    ASSERT_TRUE(std::string(log::toString(Level::Error)) == "error", "error name");
}

int main() {
    testRoutingByLevel();
    testEmptyHandlerRestoresDefault();
    testHandlerMayLog();
    testLevelNames();
    return finishTests("Log tests");
}
