/**
 * @file StateHash.hpp
 * @brief FNV-1a incremental hash used to checksum model artifacts.
 *
 * The model artifact writer feeds every serialized byte through the hasher
 * and appends the 8-byte digest.  The reader recomputes it and rejects the
 * artifact on mismatch.
 *
 * @author InjSense Team
 * @version 0.1.0
 * @date 2026-10-16
 * @copyright MIT License
 */
#pragma once

#ifndef INJSENSE_MATH_STATE_HASH_HPP
    #define INJSENSE_MATH_STATE_HASH_HPP

    #include "injsense/core/Concepts.hpp"
    #include "injsense/core/Types.hpp"

    #include <span>

namespace injsense::math {

/**
 * @brief Incremental FNV-1a hasher.
 */
class StateHash final {
public:
    static constexpr core::u64 kOffsetBasis = 14695981039346656037ULL;
    static constexpr core::u64 kPrime       = 1099511628211ULL;

    constexpr StateHash() = default;

    /**
     * @brief Feed a span of raw bytes into the hash.
     * @param data Byte span.
     * @return Reference to this hasher (for chaining).
     */
    StateHash &hashBytes(std::span<const core::byte> data);

    /**
     * @brief Feed a trivially-copyable value into the hash.
     * @tparam T Blittable type.
     * @param value Value to hash.
     * @return Reference to this hasher (for chaining).
     */
    template <core::Blittable T>
    StateHash &combine(const T &value)
    {
        const auto *ptr = reinterpret_cast<const core::byte *>(&value);
        return hashBytes({ptr, sizeof(T)});
    }

    /**
     * @brief Return the current digest.
     * @return 64-bit FNV-1a hash.
     */
    [[nodiscard]] constexpr core::u64 digest() const { return _hash; }

    /**
     * @brief Reset the hasher to its initial state.
     */
    constexpr void reset() { _hash = kOffsetBasis; }

private:
    core::u64 _hash = kOffsetBasis;
};

} // namespace injsense::math

#endif // INJSENSE_MATH_STATE_HASH_HPP
