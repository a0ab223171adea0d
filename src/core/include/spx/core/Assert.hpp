/**
 * @file Assert.hpp
 * @brief Debug assertions for internal invariants.
 *
 * SPX_ASSERT is evaluated only when SPX_DEBUG is defined and aborts with
 * the failing expression and its source location. It guards invariants
 * the library establishes itself (table sizes, loop bounds); caller input
 * is always validated through Expected instead.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef SPX_CORE_ASSERT_HPP
    #define SPX_CORE_ASSERT_HPP

    #include "Platform.hpp"

    #include <cstdio>
    #include <cstdlib>
    #include <source_location>

namespace spx::core::detail {

[[noreturn]] inline void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
) {
    std::fprintf(
        stderr,
        "[SPX ASSERT] %s:%u in %s: \"%s\" failed\n",
        loc.file_name(), loc.line(), loc.function_name(), expr
    );
    std::abort();
}

} // namespace spx::core::detail

    #ifdef SPX_DEBUG
        #define SPX_ASSERT(cond)                                          \
            do {                                                           \
                if (SPX_UNLIKELY(!(cond)))                                 \
                    ::spx::core::detail::assertFail(#cond);                \
            } while (false)
    #else
        #define SPX_ASSERT(cond) ((void)0)
    #endif

#endif // SPX_CORE_ASSERT_HPP
