#include "stopgrid/Hash.hpp"

#include "stopgrid/StopIndex.hpp"

#include <cstring>
#include <string>

namespace stopgrid {

namespace {

// 64-bit FNV-1a
constexpr std::uint64_t kFNVOffset = 1469598103934665603ull;
constexpr std::uint64_t kFNVPrime = 1099511628211ull;

inline void HashByte(std::uint64_t& h, std::uint8_t b)
{
  h ^= static_cast<std::uint64_t>(b);
  h *= kFNVPrime;
}

inline void HashU64(std::uint64_t& h, std::uint64_t v)
{
  for (int shift = 0; shift < 64; shift += 8) {
    HashByte(h, static_cast<std::uint8_t>((v >> shift) & 0xFFull));
  }
}

inline void HashI32(std::uint64_t& h, int v)
{
  const std::int32_t sv = static_cast<std::int32_t>(v);
  std::uint32_t uv = 0;
  std::memcpy(&uv, &sv, sizeof(uv));
  HashU64(h, static_cast<std::uint64_t>(uv));
}

inline void HashF64(std::uint64_t& h, double v)
{
  static_assert(sizeof(double) == 8, "double must be 64-bit");
  // Fold -0.0 into +0.0 so equal coordinates hash equally.
  if (v == 0.0) v = 0.0;
  std::uint64_t bits = 0;
  std::memcpy(&bits, &v, sizeof(bits));
  HashU64(h, bits);
}

inline void HashString(std::uint64_t& h, const std::string& s)
{
  // Length prefix keeps ("ab","c") distinct from ("a","bc").
  HashU64(h, static_cast<std::uint64_t>(s.size()));
  for (char c : s) HashByte(h, static_cast<std::uint8_t>(c));
}

} // namespace

std::uint64_t HashStops(const std::vector<StopPoint>& stops, const StopIndexConfig& cfg)
{
  std::uint64_t h = kFNVOffset;

  HashF64(h, cfg.cellSizeMeters);
  HashI32(h, cfg.maxRings);
  HashI32(h, cfg.minK);
  HashI32(h, cfg.maxK);

  HashU64(h, static_cast<std::uint64_t>(stops.size()));
  for (const StopPoint& s : stops) {
    HashString(h, s.id);
    HashString(h, s.name);
    HashF64(h, s.lat);
    HashF64(h, s.lon);
  }
  return h;
}

} // namespace stopgrid
