/**
 * @file Log.hpp
 * @brief Tagged logging façade with runtime severity filtering.
 *
 * Every entry carries a subsystem tag ("DSP", "MATH", "SRC") and is
 * forwarded to the installed ILogger.  Without one, entries go to stderr
 * as "[LEVEL][TAG] message" lines.  Messages below minLevel() are dropped
 * before reaching the sink; callers that build an expensive message test
 * enabled() first.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef SPX_CORE_LOG_HPP
    #define SPX_CORE_LOG_HPP

    #include "Types.hpp"

    #include <string_view>

namespace spx::core {

enum class LogLevel : u8 {
    kDebug = 0,
    kInfo,
    kWarn,
    kError
};

/**
 * @brief Sink receiving the entries that pass the level filter.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

class Log final {
public:
    Log() = delete;

    /// Installs @p logger, or restores the stderr sink when null.
    static void setLogger(ILogger *logger);
    static void setMinLevel(LogLevel level);
    [[nodiscard]] static LogLevel minLevel();
    [[nodiscard]] static bool enabled(LogLevel level);

    static void debug(std::string_view tag, std::string_view msg);
    static void info (std::string_view tag, std::string_view msg);
    static void warn (std::string_view tag, std::string_view msg);
    static void error(std::string_view tag, std::string_view msg);
};

} // namespace spx::core

#endif // SPX_CORE_LOG_HPP
