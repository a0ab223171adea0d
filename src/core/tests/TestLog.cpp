/**
 * @file TestLog.cpp
 * @brief Unit tests for the spx::core::Log façade.
 */

#include <catch2/catch_test_macros.hpp>

#include <spx/core/Log.hpp>

#include <string>
#include <vector>

using namespace spx::core;

namespace {

struct Entry {
    LogLevel level;
    std::string tag;
    std::string message;
};

class CapturingLogger final : public ILogger {
public:
    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        entries.push_back({level, std::string(tag), std::string(message)});
    }

    std::vector<Entry> entries;
};

/// Installs a logger for the scope of a test and restores the defaults.
class ScopedLogger {
public:
    explicit ScopedLogger(ILogger &logger, LogLevel level)
        : _previousLevel(Log::minLevel())
    {
        Log::setLogger(&logger);
        Log::setMinLevel(level);
    }

    ~ScopedLogger()
    {
        Log::setLogger(nullptr);
        Log::setMinLevel(_previousLevel);
    }

private:
    LogLevel _previousLevel;
};

} // namespace

TEST_CASE("Log dispatches to the installed logger", "[core][log]")
{
    CapturingLogger logger;
    ScopedLogger scope(logger, LogLevel::kDebug);

    Log::info("DSP", "plan created");
    Log::error("MATH", "did not converge");

    REQUIRE(logger.entries.size() == 2);
    REQUIRE(logger.entries[0].level == LogLevel::kInfo);
    REQUIRE(logger.entries[0].tag == "DSP");
    REQUIRE(logger.entries[0].message == "plan created");
    REQUIRE(logger.entries[1].level == LogLevel::kError);
    REQUIRE(logger.entries[1].tag == "MATH");
}

TEST_CASE("Log filters below the minimum level", "[core][log]")
{
    CapturingLogger logger;
    ScopedLogger scope(logger, LogLevel::kWarn);

    Log::debug("MATH", "hidden");
    Log::info("MATH", "hidden");
    Log::warn("MATH", "shown");
    Log::error("MATH", "shown");

    REQUIRE(logger.entries.size() == 2);
    REQUIRE(logger.entries[0].level == LogLevel::kWarn);
    REQUIRE(logger.entries[1].level == LogLevel::kError);

    REQUIRE_FALSE(Log::enabled(LogLevel::kDebug));
    REQUIRE_FALSE(Log::enabled(LogLevel::kInfo));
    REQUIRE(Log::enabled(LogLevel::kWarn));
    REQUIRE(Log::enabled(LogLevel::kError));
}

TEST_CASE("Log falls back to the default sink", "[core][log]")
{
    CapturingLogger logger;
    {
        ScopedLogger scope(logger, LogLevel::kInfo);
        Log::info("SRC", "captured");
    }
    Log::info("SRC", "goes to stderr");

    REQUIRE(logger.entries.size() == 1);
}
