/**
 * @file Expected.hpp
 * @brief Monadic error-handling type built on std::expected.
 *
 * Provides Expected<T> as an alias for std::expected<T, Error> and the
 * INJSENSE_TRY convenience macros for early-return propagation.
 *
 * @author InjSense Team
 * @version 0.1.0
 * @date 2026-10-16
 * @copyright MIT License
 */
#pragma once

#ifndef INJSENSE_CORE_EXPECTED_HPP
    #define INJSENSE_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>

namespace injsense::core {

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

} // namespace injsense::core

/**
 * @brief Propagate an error from an Expected expression.
 *
 * Evaluates @p expr once.  If the result holds an error, the enclosing
 * function immediately returns that error wrapped in an unexpected.
 * Otherwise the macro yields the contained value.
 *
 * @param expr An expression of type injsense::core::Expected<U>.
 */
#define INJSENSE_TRY(expr)                                                \
    ({                                                                     \
        auto &&_injsense_result = (expr);                                  \
        if (!_injsense_result.has_value()) [[unlikely]]                    \
            return std::unexpected(std::move(_injsense_result.error()));    \
        std::move(_injsense_result.value());                               \
    })

/**
 * @brief Propagate an error from an ExpectedVoid expression.
 * @param expr An expression of type injsense::core::ExpectedVoid.
 */
#define INJSENSE_TRY_VOID(expr)                                           \
    do {                                                                    \
        auto &&_injsense_result = (expr);                                  \
        if (!_injsense_result.has_value()) [[unlikely]]                    \
            return std::unexpected(std::move(_injsense_result.error()));    \
    } while (false)

#endif // INJSENSE_CORE_EXPECTED_HPP
