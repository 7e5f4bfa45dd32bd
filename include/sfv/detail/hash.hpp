#pragma once

/// @file hash.hpp
/// @brief Hash combining for structural hashing of ordered containers.
///
/// Uses the wyhash multiply-mix: each element hash is folded into the running
/// state with one xor and one multiply, followed by a final avalanche. Order
/// of combination is significant, so two sequences hash equal only when their
/// element hashes appear in the same order.

#include <cstddef>
#include <cstdint>

namespace sfv::detail {

// Constants from wyhash v4 (public domain, Wang Yi).
inline constexpr uint64_t kHashSeed  = 0xa0761d6478bd642fULL;
inline constexpr uint64_t kHashSeed2 = 0xe7037ed1a0b428dbULL;

/// @brief Initial state for a sequence of @p len elements.
inline uint64_t hash_init(size_t len) noexcept {
    return kHashSeed ^ (static_cast<uint64_t>(len) * kHashSeed2);
}

/// @brief Fold one element hash into the running state.
inline uint64_t hash_combine(uint64_t h, uint64_t v) noexcept {
    h ^= v;
    h *= kHashSeed2;
    h ^= h >> 29;
    return h;
}

/// @brief Final avalanche.
inline size_t hash_finish(uint64_t h) noexcept {
    h ^= h >> 32;
    h *= kHashSeed;
    h ^= h >> 29;
    return static_cast<size_t>(h);
}

} // namespace sfv::detail
