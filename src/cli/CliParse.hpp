#pragma once

// Argument parsing helpers shared by hexregion_cli.
//
// All parsers are strict: the whole token must be consumed, numbers must be
// finite and in range, and a failed parse leaves the output untouched.

#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>

#include "hexregion/HexMetrics.hpp"

namespace hexregion::cli {

inline bool EnsureParentDir(const std::filesystem::path& file)
{
  if (file.empty()) return false;
  const std::filesystem::path parent = file.parent_path();
  if (parent.empty()) return true;
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  return !ec;
}

inline bool ParseI32(std::string_view s, int* out)
{
  if (!out) return false;
  // from_chars rejects a leading '+'.
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return false;

  int v = 0;
  const char* end = s.data() + s.size();
  const auto res = std::from_chars(s.data(), end, v, 10);
  if (res.ec != std::errc() || res.ptr != end) return false;
  *out = v;
  return true;
}

inline bool ParseF64(std::string_view s, double* out)
{
  if (!out || s.empty()) return false;
  if (std::isspace(static_cast<unsigned char>(s.front())) != 0) return false;

  const std::string tmp(s);
  char* end = nullptr;
  errno = 0;
  const double v = std::strtod(tmp.c_str(), &end);
  if (errno != 0 || !end || *end != '\0') return false;
  if (!std::isfinite(v)) return false;
  *out = v;
  return true;
}

inline bool ParseF32(std::string_view s, float* out)
{
  if (!out) return false;
  double v = 0.0;
  if (!ParseF64(s, &v)) return false;
  if (std::fabs(v) > static_cast<double>(std::numeric_limits<float>::max())) return false;
  *out = static_cast<float>(v);
  return true;
}

// 0/1, true/false, on/off, yes/no in any letter case.
inline bool ParseBool01(std::string_view s, bool* out)
{
  if (!out) return false;
  std::string lower;
  lower.reserve(s.size());
  for (char c : s) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

  if (lower == "0" || lower == "false" || lower == "off" || lower == "no") {
    *out = false;
    return true;
  }
  if (lower == "1" || lower == "true" || lower == "on" || lower == "yes") {
    *out = true;
    return true;
  }
  return false;
}

inline bool ParseWxH(std::string_view s, int* outW, int* outH)
{
  if (!outW || !outH) return false;
  const std::size_t pos = s.find_first_of("xX");
  if (pos == std::string_view::npos) return false;
  int w = 0;
  int h = 0;
  if (!ParseI32(s.substr(0, pos), &w) || !ParseI32(s.substr(pos + 1), &h)) return false;
  if (w <= 0 || h <= 0) return false;
  *outW = w;
  *outH = h;
  return true;
}

// "x,z" offset coordinate; both parts must be non-negative.
inline bool ParseCellCoord(std::string_view s, OffsetCoord* out)
{
  if (!out) return false;
  const std::size_t pos = s.find(',');
  if (pos == std::string_view::npos) return false;
  int x = 0;
  int z = 0;
  if (!ParseI32(s.substr(0, pos), &x) || !ParseI32(s.substr(pos + 1), &z)) return false;
  if (x < 0 || z < 0) return false;
  *out = OffsetCoord{x, z};
  return true;
}

} // namespace hexregion::cli
