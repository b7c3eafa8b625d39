#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace hexregion {

// SplitMix64: small, fast generator used for every seeded decision in the
// generation pipeline. Each pass constructs its own RNG from (seed + offset),
// so passes never share draw order.
inline std::uint64_t SplitMix64Next(std::uint64_t& state)
{
  std::uint64_t z = (state += 0x9E3779B97F4A7C15ULL);
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
  return z ^ (z >> 31);
}

inline std::uint64_t TimeSeed()
{
  const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
  std::uint64_t s = static_cast<std::uint64_t>(now);
  return SplitMix64Next(s);
}

// Seed for a generation pass: global seed plus the pass's fixed offset.
// Computed in 64-bit so negative seeds and large offsets stay well-defined.
inline std::uint64_t PassSeed(std::int32_t seed, int offset)
{
  return static_cast<std::uint64_t>(static_cast<std::int64_t>(seed) + static_cast<std::int64_t>(offset));
}

// 32-bit noise seed derived from a pass seed.
inline std::uint32_t NoiseSeed32(std::uint64_t seed)
{
  return static_cast<std::uint32_t>(seed) ^ static_cast<std::uint32_t>(seed >> 32) ^ 0x5bd1e995u;
}

struct RNG {
  std::uint64_t state = 0;

  explicit RNG(std::uint64_t seed)
      : state(seed ? seed : 0x12345678ABCDEF00ULL)
  {}

  std::uint64_t nextU64() { return SplitMix64Next(state); }

  std::uint32_t nextU32() { return static_cast<std::uint32_t>(nextU64() >> 32); }

  // Uniform integer in [0, maxExclusive), rejection sampled to avoid modulo bias.
  std::uint32_t rangeU32(std::uint32_t maxExclusive)
  {
    if (maxExclusive <= 1u) return 0u;
    if ((maxExclusive & (maxExclusive - 1u)) == 0u) {
      return nextU32() & (maxExclusive - 1u);
    }
    const std::uint32_t threshold = static_cast<std::uint32_t>((std::uint64_t{1} << 32) % maxExclusive);
    while (true) {
      const std::uint32_t r = nextU32();
      if (r >= threshold) return r % maxExclusive;
    }
  }

  // [0, 1)
  float nextF01()
  {
    const std::uint32_t u = nextU32() >> 8;
    return static_cast<float>(u) / static_cast<float>(1u << 24);
  }

  // Inclusive range. Returns minInclusive when the range is empty.
  int rangeInt(int minInclusive, int maxInclusive)
  {
    if (maxInclusive <= minInclusive) return minInclusive;
    const std::int64_t span = static_cast<std::int64_t>(maxInclusive) - static_cast<std::int64_t>(minInclusive) + 1;
    if (span > static_cast<std::int64_t>(0xFFFFFFFFu)) {
      return static_cast<int>(minInclusive + static_cast<std::int64_t>(nextU64() % static_cast<std::uint64_t>(span)));
    }
    return static_cast<int>(static_cast<std::int64_t>(minInclusive) +
                            static_cast<std::int64_t>(rangeU32(static_cast<std::uint32_t>(span))));
  }

  float rangeFloat(float minInclusive, float maxInclusive)
  {
    return minInclusive + (maxInclusive - minInclusive) * nextF01();
  }

  bool chance(float p) { return nextF01() < p; }

  // Index into weights chosen with probability proportional to its weight.
  // Non-positive weights are never picked. Returns -1 when all weights are <= 0.
  int pickWeighted(const std::vector<float>& weights)
  {
    double total = 0.0;
    for (float w : weights) {
      if (w > 0.0f) total += static_cast<double>(w);
    }
    if (total <= 0.0) return -1;

    double r = static_cast<double>(nextF01()) * total;
    int last = -1;
    for (std::size_t i = 0; i < weights.size(); ++i) {
      const float w = weights[i];
      if (w <= 0.0f) continue;
      last = static_cast<int>(i);
      r -= static_cast<double>(w);
      if (r < 0.0) return last;
    }
    // Floating point leftovers land on the last positive weight.
    return last;
  }
};

// Deterministic 2D integer hash -> uint32.
inline std::uint32_t HashCoords32(int x, int y, std::uint32_t seed)
{
  std::uint64_t v = static_cast<std::uint64_t>(static_cast<std::uint32_t>(x));
  v |= (static_cast<std::uint64_t>(static_cast<std::uint32_t>(y)) << 32);
  v ^= (static_cast<std::uint64_t>(seed) * 0xD6E8FEB86659FD93ULL);

  v ^= v >> 30;
  v *= 0xBF58476D1CE4E5B9ULL;
  v ^= v >> 27;
  v *= 0x94D049BB133111EBULL;
  v ^= v >> 31;

  return static_cast<std::uint32_t>(v & 0xFFFFFFFFu);
}

} // namespace hexregion
