/**
 * @file NonCopyable.hpp
 * @brief CRTP base class that deletes copy operations.
 *
 * @author InjSense Team
 * @version 0.1.0
 * @date 2026-10-16
 * @copyright MIT License
 */
#pragma once

#ifndef INJSENSE_CORE_NON_COPYABLE_HPP
    #define INJSENSE_CORE_NON_COPYABLE_HPP

namespace injsense::core {

/**
 * @brief Inherit (privately) to disable copy construction and assignment.
 * @tparam Derived The CRTP derived class.
 */
template <typename Derived>
class NonCopyable {
protected:
    NonCopyable()  = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable &)            = delete;
    NonCopyable &operator=(const NonCopyable &)  = delete;

    NonCopyable(NonCopyable &&)                 = default;
    NonCopyable &operator=(NonCopyable &&)       = default;
};

} // namespace injsense::core

#endif // INJSENSE_CORE_NON_COPYABLE_HPP
