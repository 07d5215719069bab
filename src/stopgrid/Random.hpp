#pragma once

#include <cstdint>

namespace stopgrid {

// SplitMix64: small, fast generator for reproducible synthetic stop sets.
inline std::uint64_t SplitMix64Next(std::uint64_t& state)
{
  std::uint64_t z = (state += 0x9E3779B97F4A7C15ULL);
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
  return z ^ (z >> 31);
}

struct RNG {
  std::uint64_t state = 0;

  explicit RNG(std::uint64_t seed)
      : state(seed ? seed : 0x12345678ABCDEF00ULL)
  {}

  std::uint64_t nextU64() { return SplitMix64Next(state); }

  // [0, 1) with 53 bits of mantissa.
  double nextF64()
  {
    return static_cast<double>(nextU64() >> 11) * (1.0 / 9007199254740992.0);
  }

  // [lo, hi)
  double uniform(double lo, double hi) { return lo + (hi - lo) * nextF64(); }
};

} // namespace stopgrid
