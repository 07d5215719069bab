#pragma once

#include "stopgrid/Projection.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace stopgrid {

// -----------------------------------------------------------------------------
// Uniform-grid proximity index over transit stops
//
// Stops are projected onto the Mercator plane (see Projection.hpp) and binned
// into square cells of cellSizeMeters. Queries search outward from the query's
// home cell in square rings of increasing Chebyshev radius and stop as soon as
// no unvisited ring can hold anything closer.
//
// Properties:
// - Immutable after construction. A data refresh builds a new index; see
//   StopIndexStore for the publish/swap side.
// - Deterministic: same stops + same config => identical results.
// - Queries never throw. An empty index yields "no result" values.
//
// Known limitation: nearest/k-nearest searches give up after cfg.maxRings
// rings (24 * 900 m ~= 21.6 km by default). A stop farther than that from the
// query is not found; the cap hit is reported via StopQueryStats.
//
// Out-of-range input is clamped, never rejected:
// - latitude to [-90,90], longitude to [-180,180] (then [-85,85] by the projector)
// - k to [cfg.minK, cfg.maxK]
// - a negative radius counts as 0
// Non-finite stops are skipped at build time; non-finite queries return no result.
// -----------------------------------------------------------------------------

struct StopPoint {
  std::string id;
  std::string name;
  double lat = 0.0;
  double lon = 0.0;
};

struct StopDistance {
  std::string id;
  double meters = 0.0;
};

struct StopIndexConfig {
  // Grid cell edge length on the projection plane. Tuned so typical urban stop
  // density gives a handful of stops per cell.
  double cellSizeMeters = 900.0;

  // Ring-expansion cap for nearest / k-nearest queries (in cells).
  int maxRings = 24;

  // Supported k range for NearestK. Requests outside are clamped.
  int minK = 1;
  int maxK = 32;
};

// Replace invalid config values with defaults (cell size must be finite and >= 1 m,
// rings >= 0, 1 <= minK <= maxK).
StopIndexConfig SanitizeStopIndexConfig(const StopIndexConfig& cfg);

// Optional per-query diagnostics.
struct StopQueryStats {
  int ringsSearched = 0;
  int cellsVisited = 0;  // non-empty cells whose stops were tested
  int stopsTested = 0;

  // The ring cap was reached before the answer was proven complete. The result
  // is the best found within the cap (possibly empty).
  bool searchBoundExceeded = false;
};

class StopIndex {
public:
  StopIndex() = default;

  // Takes ownership of `stops`.
  explicit StopIndex(std::vector<StopPoint> stops, const StopIndexConfig& cfg = {});

  bool empty() const { return m_points.empty(); }
  std::size_t size() const { return m_points.size(); }
  std::size_t cellCount() const { return m_cells.size(); }

  // Stops rejected at build time (non-finite coordinates).
  int skippedStops() const { return m_skipped; }

  const StopIndexConfig& config() const { return m_cfg; }
  double cellSizeMeters() const { return m_cfg.cellSizeMeters; }

  // Indexed stops in insertion order (coordinates after clamping).
  const std::vector<StopPoint>& stops() const { return m_stops; }

  // Distance to the closest stop, or nullopt when the index is empty or nothing
  // lies within the ring cap.
  std::optional<double> nearestDistanceMeters(double lat, double lon, StopQueryStats* stats = nullptr) const;

  // Up to k closest stops sorted ascending by distance. Equal distances keep
  // the order in which the search met them.
  std::vector<StopDistance> nearestK(double lat, double lon, int k, StopQueryStats* stats = nullptr) const;

  // Exact number of stops with planar distance <= radiusMeters.
  int countWithinRadius(double lat, double lon, double radiusMeters, StopQueryStats* stats = nullptr) const;

private:
  struct ProjectedStop {
    std::uint32_t stop = 0; // index into m_stops
    double x = 0.0;
    double y = 0.0;
    int ix = 0;
    int iy = 0;
  };

  // Half-open range into m_points.
  struct CellRange {
    std::uint32_t begin = 0;
    std::uint32_t end = 0;
  };

  struct QueryOrigin {
    double x = 0.0;
    double y = 0.0;
    int ix = 0;
    int iy = 0;
    // Distance from the query to the nearest edge of its home cell.
    double edgeSlack = 0.0;
  };

  static std::uint64_t CellKey(int ix, int iy);

  bool makeOrigin(double lat, double lon, QueryOrigin& out) const;
  const CellRange* findCell(int ix, int iy) const;

  // Smallest possible distance from the query to any cell of ring r.
  double ringLowerBound(const QueryOrigin& q, int r) const;

  // Visit every stored stop in ring r (dx-major, dy ascending). fn(const ProjectedStop&, double distSq).
  template <typename Fn>
  int visitRing(const QueryOrigin& q, int r, StopQueryStats* stats, Fn&& fn) const;

  StopIndexConfig m_cfg{};
  std::vector<StopPoint> m_stops;
  std::vector<ProjectedStop> m_points; // grouped by cell; insertion order within a cell
  std::unordered_map<std::uint64_t, CellRange> m_cells;
  int m_skipped = 0;
};

} // namespace stopgrid
