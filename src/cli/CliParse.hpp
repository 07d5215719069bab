#pragma once

// Strict argument parsing + small filesystem helpers for the StopGrid CLI.
//
// All parsers are locale-independent, reject trailing garbage and never throw.

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace stopgrid::cli {

inline bool EnsureParentDir(const std::filesystem::path& file)
{
  if (file.empty()) return false;
  const std::filesystem::path parent = file.parent_path();
  if (parent.empty()) return true;
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  return !ec;
}

inline std::string_view TrimView(std::string_view s)
{
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())) != 0) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())) != 0) s.remove_suffix(1);
  return s;
}

inline bool ParseI32(std::string_view s, int* out)
{
  if (!out) return false;
  // from_chars does not accept a leading '+'.
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return false;

  int v = 0;
  const char* end = s.data() + s.size();
  const auto res = std::from_chars(s.data(), end, v, 10);
  if (res.ec != std::errc() || res.ptr != end) return false;
  *out = v;
  return true;
}

// Finite doubles only. "nan", "inf" and out-of-range exponents are rejected.
inline bool ParseF64(std::string_view s, double* out)
{
  if (!out) return false;
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return false;

  double v = 0.0;
  const char* end = s.data() + s.size();
  const auto res = std::from_chars(s.data(), end, v, std::chars_format::general);
  if (res.ec != std::errc() || res.ptr != end) return false;
  if (!std::isfinite(v)) return false;
  *out = v;
  return true;
}

// Comma separated doubles, e.g. "500,1000,2000". Whitespace around items is
// ignored; empty items are an error.
inline bool ParseF64List(std::string_view s, std::vector<double>* out)
{
  if (!out) return false;

  std::vector<double> values;
  for (;;) {
    const std::size_t comma = s.find(',');
    double v = 0.0;
    if (!ParseF64(TrimView(s.substr(0, comma)), &v)) return false;
    values.push_back(v);
    if (comma == std::string_view::npos) break;
    s.remove_prefix(comma + 1);
  }

  *out = std::move(values);
  return true;
}

// "lat,lon" in degrees. Range is checked here; the index itself would clamp.
inline bool ParseLatLon(std::string_view s, double* outLat, double* outLon)
{
  if (!outLat || !outLon) return false;
  std::vector<double> v;
  if (!ParseF64List(s, &v) || v.size() != 2) return false;
  if (v[0] < -90.0 || v[0] > 90.0 || v[1] < -180.0 || v[1] > 180.0) return false;
  *outLat = v[0];
  *outLon = v[1];
  return true;
}

inline std::string HexU64(std::uint64_t v)
{
  std::ostringstream oss;
  oss << "0x" << std::hex << std::setw(16) << std::setfill('0') << v;
  return oss.str();
}

} // namespace stopgrid::cli
