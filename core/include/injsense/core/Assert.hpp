/**
 * @file Assert.hpp
 * @brief Debug assertions with source location.
 *
 * INJSENSE_ASSERT checks internal invariants in debug builds (defined
 * INJSENSE_DEBUG) and compiles to nothing otherwise.  It never replaces
 * error propagation: caller-facing failures go through Expected<T>.
 *
 * @author InjSense Team
 * @version 0.1.0
 * @date 2026-10-16
 * @copyright MIT License
 */
#pragma once

#ifndef INJSENSE_CORE_ASSERT_HPP
    #define INJSENSE_CORE_ASSERT_HPP

    #include "Platform.hpp"

    #include <cstdio>
    #include <cstdlib>
    #include <source_location>

namespace injsense::core::detail {

[[noreturn]] inline void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
) {
    std::fprintf(
        stderr,
        "[INJSENSE ASSERT] %s:%u in %s: \"%s\" failed\n",
        loc.file_name(), static_cast<unsigned>(loc.line()), loc.function_name(), expr
    );
    std::abort();
}

} // namespace injsense::core::detail

    #ifdef INJSENSE_DEBUG
        #define INJSENSE_ASSERT(cond)                                     \
            do {                                                           \
                if (INJSENSE_UNLIKELY(!(cond)))                            \
                    ::injsense::core::detail::assertFail(#cond);           \
            } while (false)
    #else
        #define INJSENSE_ASSERT(cond) ((void)0)
    #endif

#endif // INJSENSE_CORE_ASSERT_HPP
