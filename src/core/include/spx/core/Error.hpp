/**
 * @file Error.hpp
 * @brief Structured error type with source location tracking.
 *
 * Defines the error codes reported by the spectral transforms, the
 * covariance estimator and the collaborator adapters, and a lightweight
 * Error value carrying the code, a human-readable message and the source
 * location where the error was raised.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef SPX_CORE_ERROR_HPP
    #define SPX_CORE_ERROR_HPP

    #include "Types.hpp"

    #include <expected>
    #include <source_location>
    #include <string>
    #include <string_view>
    #include <utility>

namespace spx::core {

/**
 * @brief Library-wide error code enumeration.
 */
enum class ErrorCode : u8 {
    kNone = 0,

    /// A length precondition failed (empty input, non-power-of-two FFT size).
    kLengthError,
    /// An argument or its metadata is inconsistent (hop, window, orientation).
    kConfigError,
    /// The input is too small for the requested statistic.
    kDegenerateInput,

    kNotSymmetric,
    kDecompositionFailed,
};

/**
 * @brief Returns a short, stable label for the given error code.
 */
[[nodiscard]] constexpr std::string_view errorCodeName(ErrorCode code) noexcept
{
    switch (code) {
        case ErrorCode::kNone:                return "None";
        case ErrorCode::kLengthError:         return "LengthError";
        case ErrorCode::kConfigError:         return "ConfigError";
        case ErrorCode::kDegenerateInput:     return "DegenerateInput";
        case ErrorCode::kNotSymmetric:        return "NotSymmetric";
        case ErrorCode::kDecompositionFailed: return "DecompositionFailed";
    }
    return "Unknown";
}

/**
 * @brief Structured error value carrying a code, message, and origin.
 *
 * Intended to be stored inside Expected<T>.
 */
class Error final {
public:
    /**
     * @brief Construct an error from a code and message.
     * @param code    Enumerated error code.
     * @param message Human-readable description.
     * @param loc     Source location (auto-filled by the compiler).
     */
    explicit Error(
        ErrorCode code,
        std::string message,
        std::source_location loc = std::source_location::current()
    ) : _code(code), _message(std::move(message)), _location(loc) {}

    [[nodiscard]] ErrorCode           code()     const { return _code; }
    [[nodiscard]] const std::string & message()  const { return _message; }
    [[nodiscard]] std::source_location location() const { return _location; }

    /**
     * @brief Formats the error as "[Code] message (file:line)".
     */
    [[nodiscard]] std::string format() const;

private:
    ErrorCode            _code;
    std::string          _message;
    std::source_location _location;
};

/// @brief Convenience alias for std::unexpected<Error>.
using Unexpected = std::unexpected<Error>;

/// @brief Factory function to create an unexpected error.
/// @param code Error code.
/// @param message Human-readable description.
/// @param loc Source location (auto-filled).
/// @return std::unexpected<Error>.
[[nodiscard]] inline auto makeError(
    ErrorCode code,
    std::string message,
    std::source_location loc = std::source_location::current())
{
    return std::unexpected<Error>(Error{code, std::move(message), loc});
}

} // namespace spx::core

#endif // SPX_CORE_ERROR_HPP
