#pragma once

#include "hexregion/Random.hpp"

#include <cmath>
#include <cstdint>
#include <limits>

namespace hexregion {

inline float Lerp(float a, float b, float t) { return a + (b - a) * t; }

inline float SmoothStep(float t) { return t * t * (3.0f - 2.0f * t); }

// Lattice point hash in [0, 1].
inline float Hash01(int ix, int iy, std::uint32_t seed)
{
  const std::uint32_t h = HashCoords32(ix, iy, seed);
  return static_cast<float>(h) / static_cast<float>(std::numeric_limits<std::uint32_t>::max());
}

// 2D value noise in [0, 1] with smoothstep interpolation between lattice hashes.
inline float ValueNoise2D(float x, float y, std::uint32_t seed)
{
  const int x0 = static_cast<int>(std::floor(x));
  const int y0 = static_cast<int>(std::floor(y));

  const float tx = SmoothStep(x - static_cast<float>(x0));
  const float ty = SmoothStep(y - static_cast<float>(y0));

  const float a = Lerp(Hash01(x0, y0, seed), Hash01(x0 + 1, y0, seed), tx);
  const float b = Lerp(Hash01(x0, y0 + 1, seed), Hash01(x0 + 1, y0 + 1, seed), tx);
  return Lerp(a, b, ty);
}

// Fractal Brownian motion over ValueNoise2D, normalized back to [0, 1].
//
// Each octave uses its own derived seed so octaves do not line up on the
// lattice.
inline float FBm2D(float x, float y, std::uint32_t seed, int octaves = 5, float lacunarity = 2.0f, float gain = 0.5f)
{
  float sum = 0.0f;
  float amp = 1.0f;
  float freq = 1.0f;
  float norm = 0.0f;
  for (int i = 0; i < octaves; ++i) {
    const std::uint32_t octaveSeed = seed + static_cast<std::uint32_t>(i) * 1013u;
    sum += amp * ValueNoise2D(x * freq, y * freq, octaveSeed);
    norm += amp;
    amp *= gain;
    freq *= lacunarity;
  }
  return (norm > 0.0f) ? (sum / norm) : 0.0f;
}

} // namespace hexregion
