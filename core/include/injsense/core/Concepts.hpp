/**
 * @file Concepts.hpp
 * @brief C++20 concepts constraining generic interfaces.
 *
 * @author InjSense Team
 * @version 0.1.0
 * @date 2026-10-16
 * @copyright MIT License
 */
#pragma once

#ifndef INJSENSE_CORE_CONCEPTS_HPP
    #define INJSENSE_CORE_CONCEPTS_HPP

    #include "Types.hpp"

    #include <concepts>
    #include <type_traits>

namespace injsense::core {

/**
 * @brief A type that is trivially copyable and standard-layout, making it
 *        safe to hash or serialize as raw bytes.
 */
template <typename T>
concept Blittable = std::is_trivially_copyable_v<T> && std::is_standard_layout_v<T>;

} // namespace injsense::core

#endif // INJSENSE_CORE_CONCEPTS_HPP
