#pragma once

#include <cstdint>
#include <vector>

namespace stopgrid {

struct StopPoint;
struct StopIndexConfig;

// Stable, endianness-independent 64-bit FNV-1a hash of a stop snapshot.
//
// Used to memoize index builds: the same stops (ids, names, coordinate bit
// patterns, order) under the same index config hash to the same value, so a
// refresh that delivers unchanged data does not trigger a rebuild.
//
// NOTE: hash values are not a persisted contract; compare hashes produced by
// the same build only.
std::uint64_t HashStops(const std::vector<StopPoint>& stops, const StopIndexConfig& cfg);

} // namespace stopgrid
