#pragma once

#include <cmath>
#include <cstdint>
#include <cstring>

namespace hexregion {

// IEEE 754 binary16 conversion (round to nearest, ties to even).
//
// Used only for the packed moisture field; values in [0, 1] keep about 3
// significant decimal digits.

inline std::uint16_t FloatToHalf(float value)
{
  std::uint32_t f = 0;
  std::memcpy(&f, &value, sizeof(f));

  const std::uint16_t sign = static_cast<std::uint16_t>((f >> 16) & 0x8000u);
  const int exp = static_cast<int>((f >> 23) & 0xFFu);
  std::uint32_t mant = f & 0x7FFFFFu;

  if (exp == 0xFF) {
    // Inf / NaN (keep NaN quiet).
    return static_cast<std::uint16_t>(sign | 0x7C00u | (mant ? 0x200u : 0u));
  }

  const int e = exp - 127 + 15;
  if (e >= 0x1F) return static_cast<std::uint16_t>(sign | 0x7C00u);

  if (e <= 0) {
    if (e < -10) return sign;
    mant |= 0x800000u;
    const int shift = 14 - e;
    std::uint32_t h = mant >> shift;
    const std::uint32_t rem = mant & ((1u << shift) - 1u);
    const std::uint32_t halfway = 1u << (shift - 1);
    if (rem > halfway || (rem == halfway && (h & 1u))) ++h;
    return static_cast<std::uint16_t>(sign | h);
  }

  std::uint32_t h = (static_cast<std::uint32_t>(e) << 10) | (mant >> 13);
  const std::uint32_t rem = mant & 0x1FFFu;
  // A carry out of the mantissa correctly bumps the exponent.
  if (rem > 0x1000u || (rem == 0x1000u && (h & 1u))) ++h;
  return static_cast<std::uint16_t>(sign | h);
}

inline float HalfToFloat(std::uint16_t h)
{
  const std::uint32_t sign = static_cast<std::uint32_t>(h & 0x8000u) << 16;
  const int exp = (h >> 10) & 0x1F;
  const std::uint32_t mant = h & 0x3FFu;

  if (exp == 0) {
    const float v = std::ldexp(static_cast<float>(mant), -24);
    return sign ? -v : v;
  }

  std::uint32_t bits = 0;
  if (exp == 0x1F) {
    bits = sign | 0x7F800000u | (mant << 13);
  } else {
    bits = sign | (static_cast<std::uint32_t>(exp - 15 + 127) << 23) | (mant << 13);
  }

  float out = 0.0f;
  std::memcpy(&out, &bits, sizeof(out));
  return out;
}

} // namespace hexregion
