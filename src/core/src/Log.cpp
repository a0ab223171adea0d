/**
 * @file Log.cpp
 * @brief Level filtering and the default stderr sink.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#include "spx/core/Log.hpp"

#include <cstdio>

namespace spx::core {

namespace {

constexpr const char *levelName(LogLevel level) noexcept
{
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo:  return "INFO ";
        case LogLevel::kWarn:  return "WARN ";
        case LogLevel::kError: return "ERROR";
    }
    return "?????";
}

class StderrLogger final : public ILogger {
public:
    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        std::fprintf(stderr, "[%s][%.*s] %.*s\n", levelName(level),
                     static_cast<int>(tag.size()), tag.data(),
                     static_cast<int>(message.size()), message.data());
    }
};

StderrLogger  gStderrLogger;
ILogger      *gSink     = &gStderrLogger;
LogLevel      gMinLevel = LogLevel::kInfo;

void dispatch(LogLevel level, std::string_view tag, std::string_view msg)
{
    if (level < gMinLevel)
        return;
    gSink->write(level, tag, msg);
}

} // namespace

void Log::setLogger(ILogger *logger)  { gSink = logger ? logger : &gStderrLogger; }
void Log::setMinLevel(LogLevel level) { gMinLevel = level; }
LogLevel Log::minLevel()              { return gMinLevel; }
bool Log::enabled(LogLevel level)     { return level >= gMinLevel; }

void Log::debug(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kDebug, tag, msg); }
void Log::info (std::string_view tag, std::string_view msg) { dispatch(LogLevel::kInfo,  tag, msg); }
void Log::warn (std::string_view tag, std::string_view msg) { dispatch(LogLevel::kWarn,  tag, msg); }
void Log::error(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kError, tag, msg); }

} // namespace spx::core
