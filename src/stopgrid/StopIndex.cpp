#include "stopgrid/StopIndex.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace stopgrid {

namespace {

// Keeps cell coordinates well inside int range for any clamped coordinate.
constexpr double kMinCellSizeMeters = 1.0;
constexpr int kRingLimit = 4096;

inline int CellCoord(double v, double cellSize)
{
  return static_cast<int>(std::floor(v / cellSize));
}

} // namespace

StopIndexConfig SanitizeStopIndexConfig(const StopIndexConfig& cfg)
{
  const StopIndexConfig def{};
  StopIndexConfig out = cfg;

  if (!std::isfinite(out.cellSizeMeters) || out.cellSizeMeters <= 0.0) {
    out.cellSizeMeters = def.cellSizeMeters;
  }
  out.cellSizeMeters = std::max(kMinCellSizeMeters, out.cellSizeMeters);

  if (out.maxRings < 0) out.maxRings = def.maxRings;
  out.maxRings = std::min(out.maxRings, kRingLimit);

  out.minK = std::max(1, out.minK);
  out.maxK = std::max(out.minK, out.maxK);
  return out;
}

StopIndex::StopIndex(std::vector<StopPoint> stops, const StopIndexConfig& cfg)
    : m_cfg(SanitizeStopIndexConfig(cfg))
{
  const double cell = m_cfg.cellSizeMeters;

  std::vector<ProjectedStop> projected;
  projected.reserve(stops.size());
  m_stops.reserve(stops.size());

  for (StopPoint& s : stops) {
    if (!IsFiniteLatLon({s.lat, s.lon})) {
      ++m_skipped;
      continue;
    }

    const LatLon c = ClampLatLon({s.lat, s.lon});
    s.lat = c.lat;
    s.lon = c.lon;

    const PlanarXY xy = ProjectMercatorMeters(c);
    ProjectedStop p{};
    p.stop = static_cast<std::uint32_t>(m_stops.size());
    p.x = xy.x;
    p.y = xy.y;
    p.ix = CellCoord(xy.x, cell);
    p.iy = CellCoord(xy.y, cell);

    projected.push_back(p);
    m_stops.push_back(std::move(s));
  }

  // Group stops by cell. stable_sort keeps insertion order inside each cell so
  // tie-breaking stays deterministic across rebuilds.
  std::stable_sort(projected.begin(), projected.end(), [](const ProjectedStop& a, const ProjectedStop& b) {
    return CellKey(a.ix, a.iy) < CellKey(b.ix, b.iy);
  });
  m_points = std::move(projected);

  m_cells.reserve(m_points.size());
  std::size_t i = 0;
  while (i < m_points.size()) {
    const std::uint64_t key = CellKey(m_points[i].ix, m_points[i].iy);
    std::size_t j = i + 1;
    while (j < m_points.size() && CellKey(m_points[j].ix, m_points[j].iy) == key) ++j;

    CellRange range{};
    range.begin = static_cast<std::uint32_t>(i);
    range.end = static_cast<std::uint32_t>(j);
    m_cells.emplace(key, range);
    i = j;
  }
}

std::uint64_t StopIndex::CellKey(int ix, int iy)
{
  return (static_cast<std::uint64_t>(static_cast<std::uint32_t>(ix)) << 32) |
         static_cast<std::uint64_t>(static_cast<std::uint32_t>(iy));
}

bool StopIndex::makeOrigin(double lat, double lon, QueryOrigin& out) const
{
  if (!IsFiniteLatLon({lat, lon})) return false;

  const double cell = m_cfg.cellSizeMeters;
  const PlanarXY xy = ProjectMercatorMeters(ClampLatLon({lat, lon}));
  out.x = xy.x;
  out.y = xy.y;
  out.ix = CellCoord(xy.x, cell);
  out.iy = CellCoord(xy.y, cell);

  const double fx = std::clamp(xy.x - static_cast<double>(out.ix) * cell, 0.0, cell);
  const double fy = std::clamp(xy.y - static_cast<double>(out.iy) * cell, 0.0, cell);
  out.edgeSlack = std::min(std::min(fx, cell - fx), std::min(fy, cell - fy));
  return true;
}

const StopIndex::CellRange* StopIndex::findCell(int ix, int iy) const
{
  const auto it = m_cells.find(CellKey(ix, iy));
  return it == m_cells.end() ? nullptr : &it->second;
}

double StopIndex::ringLowerBound(const QueryOrigin& q, int r) const
{
  // Ring r starts (r-1) full cells past the home cell's nearest edge.
  if (r <= 0) return 0.0;
  return static_cast<double>(r - 1) * m_cfg.cellSizeMeters + q.edgeSlack;
}

template <typename Fn>
int StopIndex::visitRing(const QueryOrigin& q, int r, StopQueryStats* stats, Fn&& fn) const
{
  int tested = 0;
  for (int dx = -r; dx <= r; ++dx) {
    // Edge columns contribute every row; inner columns only the top and bottom rows.
    const bool edgeColumn = (dx == -r || dx == r);
    const int step = edgeColumn ? 1 : 2 * r;
    for (int dy = -r; dy <= r; dy += step) {
      const CellRange* cell = findCell(q.ix + dx, q.iy + dy);
      if (!cell) continue;
      if (stats) ++stats->cellsVisited;

      for (std::uint32_t i = cell->begin; i < cell->end; ++i) {
        const ProjectedStop& p = m_points[i];
        const double ddx = p.x - q.x;
        const double ddy = p.y - q.y;
        fn(p, ddx * ddx + ddy * ddy);
        ++tested;
      }
    }
  }

  if (stats) {
    ++stats->ringsSearched;
    stats->stopsTested += tested;
  }
  return tested;
}

std::optional<double> StopIndex::nearestDistanceMeters(double lat, double lon, StopQueryStats* stats) const
{
  if (stats) *stats = StopQueryStats{};
  if (m_points.empty()) return std::nullopt;

  QueryOrigin q{};
  if (!makeOrigin(lat, lon, q)) return std::nullopt;

  double bestSq = std::numeric_limits<double>::infinity();
  bool found = false;
  bool complete = false;
  std::size_t seen = 0;

  for (int r = 0; r <= m_cfg.maxRings; ++r) {
    if (found) {
      const double lb = ringLowerBound(q, r);
      if (lb * lb > bestSq) {
        complete = true;
        break;
      }
    }

    seen += static_cast<std::size_t>(visitRing(q, r, stats, [&](const ProjectedStop&, double d2) {
      found = true;
      if (d2 < bestSq) bestSq = d2;
    }));

    if (seen == m_points.size()) {
      complete = true;
      break;
    }
  }

  if (!complete) {
    // Out of rings. The best so far is still exact if the next ring cannot beat it.
    const double lb = ringLowerBound(q, m_cfg.maxRings + 1);
    complete = found && lb * lb >= bestSq;
  }
  if (!complete && stats) stats->searchBoundExceeded = true;

  if (!found) return std::nullopt;
  return std::sqrt(bestSq);
}

std::vector<StopDistance> StopIndex::nearestK(double lat, double lon, int k, StopQueryStats* stats) const
{
  if (stats) *stats = StopQueryStats{};

  std::vector<StopDistance> out;
  if (m_points.empty()) return out;

  QueryOrigin q{};
  if (!makeOrigin(lat, lon, q)) return out;

  const std::size_t capacity = static_cast<std::size_t>(std::clamp(k, m_cfg.minK, m_cfg.maxK));
  const std::size_t want = std::min(capacity, m_points.size());

  struct Candidate {
    std::uint32_t stop = 0;
    double distSq = 0.0;
  };

  // Fixed-capacity candidate set; k is small so a linear worst-scan is enough.
  std::vector<Candidate> best;
  best.reserve(capacity);
  std::size_t worstIdx = 0;
  double worstSq = std::numeric_limits<double>::infinity();

  auto recomputeWorst = [&]() {
    worstIdx = 0;
    worstSq = best[0].distSq;
    for (std::size_t i = 1; i < best.size(); ++i) {
      if (best[i].distSq > worstSq) {
        worstSq = best[i].distSq;
        worstIdx = i;
      }
    }
  };

  auto offer = [&](const ProjectedStop& p, double d2) {
    if (best.size() < capacity) {
      best.push_back(Candidate{p.stop, d2});
      if (best.size() == capacity) recomputeWorst();
      return;
    }
    if (d2 < worstSq) {
      best[worstIdx] = Candidate{p.stop, d2};
      recomputeWorst();
    }
  };

  bool complete = false;
  std::size_t seen = 0;

  for (int r = 0; r <= m_cfg.maxRings; ++r) {
    if (best.size() >= want) {
      const double lb = ringLowerBound(q, r);
      if (lb * lb > worstSq) {
        complete = true;
        break;
      }
    }

    seen += static_cast<std::size_t>(visitRing(q, r, stats, offer));

    if (seen == m_points.size()) {
      complete = true;
      break;
    }
  }

  if (!complete) {
    const double lb = ringLowerBound(q, m_cfg.maxRings + 1);
    complete = best.size() >= want && lb * lb >= worstSq;
  }
  if (!complete && stats) stats->searchBoundExceeded = true;

  std::stable_sort(best.begin(), best.end(),
                   [](const Candidate& a, const Candidate& b) { return a.distSq < b.distSq; });

  out.reserve(best.size());
  for (const Candidate& c : best) {
    out.push_back(StopDistance{m_stops[c.stop].id, std::sqrt(c.distSq)});
  }
  return out;
}

int StopIndex::countWithinRadius(double lat, double lon, double radiusMeters, StopQueryStats* stats) const
{
  if (stats) *stats = StopQueryStats{};
  if (m_points.empty()) return 0;
  if (std::isnan(radiusMeters)) return 0;

  QueryOrigin q{};
  if (!makeOrigin(lat, lon, q)) return 0;

  const double radius = std::max(0.0, radiusMeters);
  const double r2 = radius * radius;

  auto within = [&](const ProjectedStop& p) {
    const double ddx = p.x - q.x;
    const double ddy = p.y - q.y;
    return ddx * ddx + ddy * ddy <= r2;
  };

  const double ringsD = std::ceil(radius / m_cfg.cellSizeMeters);
  const double side = 2.0 * ringsD + 1.0;

  int count = 0;

  // Block bigger than the whole stop set (or unbounded): one linear pass is
  // cheaper and just as exact.
  if (!(side * side <= static_cast<double>(m_points.size()))) {
    for (const ProjectedStop& p : m_points) {
      if (within(p)) ++count;
    }
    if (stats) stats->stopsTested = static_cast<int>(m_points.size());
    return count;
  }

  const int rings = static_cast<int>(ringsD);
  for (int dx = -rings; dx <= rings; ++dx) {
    for (int dy = -rings; dy <= rings; ++dy) {
      const CellRange* cell = findCell(q.ix + dx, q.iy + dy);
      if (!cell) continue;
      if (stats) {
        ++stats->cellsVisited;
        stats->stopsTested += static_cast<int>(cell->end - cell->begin);
      }
      for (std::uint32_t i = cell->begin; i < cell->end; ++i) {
        if (within(m_points[i])) ++count;
      }
    }
  }
  if (stats) stats->ringsSearched = rings + 1;
  return count;
}

} // namespace stopgrid
