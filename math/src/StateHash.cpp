/**
 * @file StateHash.cpp
 * @brief FNV-1a byte loop.
 *
 * @author InjSense Team
 * @version 0.1.0
 * @date 2026-10-16
 * @copyright MIT License
 */
#include "injsense/math/StateHash.hpp"

namespace injsense::math {

StateHash &StateHash::hashBytes(std::span<const core::byte> data)
{
    for (const core::byte b : data) {
        _hash ^= static_cast<core::u64>(b);
        _hash *= kPrime;
    }
    return *this;
}

} // namespace injsense::math
