/**
 * @file TestCore.cpp
 * @brief Unit tests for Error/Expected and the Log façade.
 */

#include <catch2/catch_test_macros.hpp>

#include <orb/core/Expected.hpp>
#include <orb/core/Log.hpp>

#include <string>
#include <vector>

using namespace orb::core;

namespace {

ExpectedVoid failWhen(bool fail)
{
    if (fail)
        return makeError(ErrorCode::kGraphCycle, "loop");
    return {};
}

ExpectedVoid chain(bool fail)
{
    ORB_TRY_VOID(failWhen(false));
    ORB_TRY_VOID(failWhen(fail));
    return {};
}

struct CaptureLogger final : ILogger {
    struct Entry {
        LogLevel    level;
        std::string tag;
        std::string message;
    };

    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        entries.push_back({level, std::string{tag}, std::string{message}});
    }

    std::vector<Entry> entries;
};

} // anonymous namespace

TEST_CASE("makeError carries code, message and origin", "[core][error]")
{
    Expected<int> result = makeError(ErrorCode::kNotFound, "no such participant");

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == ErrorCode::kNotFound);
    REQUIRE(result.error().message() == "no such participant");
    REQUIRE(result.error().location().line() > 0);
    REQUIRE(toString(ErrorCode::kNotFound) == "NotFound");
}

TEST_CASE("ORB_TRY_VOID propagates the first failure", "[core][error]")
{
    REQUIRE(chain(false).has_value());

    auto failed = chain(true);
    REQUIRE_FALSE(failed.has_value());
    REQUIRE(failed.error().code() == ErrorCode::kGraphCycle);
}

TEST_CASE("Log filters below the minimum level", "[core][log]")
{
    CaptureLogger capture;
    ILogger *previousLogger = Log::setLogger(&capture);
    const LogLevel previous = Log::minLevel();
    Log::setMinLevel(LogLevel::kWarn);

    REQUIRE_FALSE(Log::enabled(LogLevel::kInfo));
    REQUIRE(Log::enabled(LogLevel::kError));

    Log::debug("ctx", "hidden");
    Log::info("ctx", "hidden");
    Log::warn("ctx", "resume failed");
    Log::error("shown");

    Log::setMinLevel(previous);
    REQUIRE(Log::setLogger(previousLogger) == &capture);

    REQUIRE(capture.entries.size() == 2);
    REQUIRE(capture.entries[0].level == LogLevel::kWarn);
    REQUIRE(capture.entries[0].tag == "ctx");
    REQUIRE(capture.entries[0].message == "resume failed");
    REQUIRE(capture.entries[1].tag == "orb");
}
