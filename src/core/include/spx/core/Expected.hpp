/**
 * @file Expected.hpp
 * @brief Monadic error-handling type built on std::expected.
 *
 * Provides Expected<T> as an alias for std::expected<T, Error> and the
 * SPX_TRY / SPX_TRY_VOID macros for early-return propagation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef SPX_CORE_EXPECTED_HPP
    #define SPX_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>
    #include <utility>

namespace spx::core {

/**
 * @brief Alias for an expected value or a structured Error.
 * @tparam T The success-path value type.
 */
template <typename T>
using Expected = std::expected<T, Error>;

/**
 * @brief Alias for operations that succeed with no value.
 */
using ExpectedVoid = Expected<void>;

} // namespace spx::core

/**
 * @brief Propagate an error from an Expected expression.
 *
 * Evaluates @p expr once.  If the result holds an error, the enclosing
 * function immediately returns that error wrapped in an unexpected.
 * Otherwise the macro yields the contained value.
 *
 * @param expr An expression of type spx::core::Expected<U>.
 */
#define SPX_TRY(expr)                                                     \
    ({                                                                     \
        auto &&_spx_result = (expr);                                       \
        if (!_spx_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_spx_result.error()));         \
        std::move(_spx_result.value());                                    \
    })

/**
 * @brief Propagate an error from an ExpectedVoid expression.
 * @param expr An expression of type spx::core::ExpectedVoid.
 */
#define SPX_TRY_VOID(expr)                                                \
    do {                                                                    \
        auto &&_spx_result = (expr);                                       \
        if (!_spx_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_spx_result.error()));         \
    } while (false)

#endif // SPX_CORE_EXPECTED_HPP
