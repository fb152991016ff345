#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

namespace uuidforge::util {

// MurmurHash3 64-bit finalizer
[[nodiscard]] inline constexpr auto murmur3_mix64(std::uint64_t h) noexcept
    -> std::uint64_t {
  h ^= h >> 33;
  h *= 0xff51afd7ed558ccdULL;
  h ^= h >> 33;
  h *= 0xc4ceb9fe1a85ec53ULL;
  h ^= h >> 33;
  return h;
}

template <typename T>
inline auto mix_into(std::size_t &seed, const T &value) noexcept -> void {
  constexpr std::size_t kMagic = 0x9e3779b97f4a7c15ULL;
  seed ^= std::hash<T>{}(value) + kMagic + (seed << 6) + (seed >> 2);
}

// Hash a 128-bit value given as two big-endian halves. UUID bytes are
// already uniformly distributed for v5/v7, but nil and namespace constants
// are not, so the halves are still finalized before combining.
[[nodiscard]] inline auto hash_u128(std::uint64_t hi, std::uint64_t lo) noexcept
    -> std::size_t {
  std::size_t seed = 0;
  mix_into(seed, murmur3_mix64(hi));
  mix_into(seed, murmur3_mix64(lo));
  return seed;
}

} // namespace uuidforge::util
