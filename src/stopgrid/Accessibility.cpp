#include "stopgrid/Accessibility.hpp"

#include <algorithm>
#include <cmath>

namespace stopgrid {

namespace {

inline std::uint8_t RoundChannel(double v)
{
  // Half-up rounding, matching the reference colour ramp.
  const double r = std::floor(v + 0.5);
  return static_cast<std::uint8_t>(std::clamp(r, 0.0, 255.0));
}

inline double Lerp(double a, double b, double u) { return a + (b - a) * u; }

} // namespace

AccessibilityConfig SanitizeAccessibilityConfig(const AccessibilityConfig& cfg)
{
  const AccessibilityConfig def{};
  AccessibilityConfig out = cfg;

  out.radiiMeters.clear();
  for (double r : cfg.radiiMeters) {
    if (std::isfinite(r) && r >= 0.0) out.radiiMeters.push_back(r);
  }

  out.kNearest = std::max(0, out.kNearest);

  if (!std::isfinite(out.heatRadiusMeters) || out.heatRadiusMeters <= 0.0) {
    out.heatRadiusMeters = def.heatRadiusMeters;
  }
  out.heatGridSize = std::clamp(out.heatGridSize, 1, kMaxHeatGridSize);

  if (!std::isfinite(out.heatMaxMeters) || out.heatMaxMeters < 0.0) out.heatMaxMeters = 0.0;

  if (!std::isfinite(out.heatFillOpacity)) out.heatFillOpacity = def.heatFillOpacity;
  out.heatFillOpacity = std::clamp(out.heatFillOpacity, 0.0f, 1.0f);
  return out;
}

double HeatValue01(double meters, double maxMeters)
{
  if (!(maxMeters > 0.0) || std::isnan(meters)) return 1.0;
  return std::clamp(meters / maxMeters, 0.0, 1.0);
}

Rgb8 HeatColorForValue(double t01)
{
  const double t = std::isnan(t01) ? 1.0 : std::clamp(t01, 0.0, 1.0);

  Rgb8 c{};
  if (t < 0.5) {
    const double u = t / 0.5;
    c.r = RoundChannel(Lerp(40.0, 255.0, u));
    c.g = RoundChannel(Lerp(200.0, 220.0, u));
    c.b = RoundChannel(Lerp(60.0, 60.0, u));
  } else {
    const double u = (t - 0.5) / 0.5;
    c.r = RoundChannel(Lerp(255.0, 220.0, u));
    c.g = RoundChannel(Lerp(220.0, 40.0, u));
    c.b = RoundChannel(Lerp(60.0, 40.0, u));
  }
  return c;
}

Rgb8 HeatColorForDistance(double meters, double maxMeters)
{
  return HeatColorForValue(HeatValue01(meters, maxMeters));
}

AccessibilitySummary ComputeAccessibilitySummary(const StopIndex& index, const LatLon& at,
                                                 const AccessibilityConfig& cfgIn)
{
  const AccessibilityConfig cfg = SanitizeAccessibilityConfig(cfgIn);

  AccessibilitySummary out{};
  out.at = at;
  out.stopCount = index.size();

  StopQueryStats qs{};
  out.nearestStopMeters = index.nearestDistanceMeters(at.lat, at.lon, &qs);
  out.searchBoundExceeded = qs.searchBoundExceeded;

  out.within.reserve(cfg.radiiMeters.size());
  for (double r : cfg.radiiMeters) {
    out.within.push_back(RadiusCount{r, index.countWithinRadius(at.lat, at.lon, r)});
  }

  if (cfg.kNearest > 0) {
    out.nearest = index.nearestK(at.lat, at.lon, cfg.kNearest, &qs);
    out.searchBoundExceeded = out.searchBoundExceeded || qs.searchBoundExceeded;
  }
  return out;
}

HeatGrid RasterizeHeatGrid(const StopIndex& index, const LatLon& centerIn, const AccessibilityConfig& cfgIn)
{
  const AccessibilityConfig cfg = SanitizeAccessibilityConfig(cfgIn);

  HeatGrid grid{};
  grid.radiusMeters = cfg.heatRadiusMeters;
  grid.maxMeters = cfg.heatMaxMeters > 0.0 ? cfg.heatMaxMeters : cfg.heatRadiusMeters;
  grid.fillOpacity = cfg.heatFillOpacity;

  if (!IsFiniteLatLon(centerIn)) return grid;

  const LatLon center = ClampLatLon(centerIn);
  grid.center = center;
  grid.size = cfg.heatGridSize;

  const double latDelta = MetersToLatDegrees(cfg.heatRadiusMeters);
  const double lonDelta = MetersToLonDegrees(cfg.heatRadiusMeters, center.lat);

  grid.latMin = center.lat - latDelta;
  grid.latMax = center.lat + latDelta;
  grid.lonMin = center.lon - lonDelta;
  grid.lonMax = center.lon + lonDelta;

  const int n = grid.size;
  const double latStep = (grid.latMax - grid.latMin) / static_cast<double>(n);
  const double lonStep = (grid.lonMax - grid.lonMin) / static_cast<double>(n);

  grid.cells.reserve(static_cast<std::size_t>(n) * static_cast<std::size_t>(n));
  for (int i = 0; i < n; ++i) {
    for (int j = 0; j < n; ++j) {
      HeatCell c{};
      c.row = i;
      c.col = j;
      c.south = grid.latMin + static_cast<double>(i) * latStep;
      c.north = grid.latMin + static_cast<double>(i + 1) * latStep;
      c.west = grid.lonMin + static_cast<double>(j) * lonStep;
      c.east = grid.lonMin + static_cast<double>(j + 1) * lonStep;
      c.center.lat = grid.latMin + (static_cast<double>(i) + 0.5) * latStep;
      c.center.lon = grid.lonMin + (static_cast<double>(j) + 0.5) * lonStep;

      c.nearestMeters = index.nearestDistanceMeters(c.center.lat, c.center.lon);
      if (c.nearestMeters) {
        c.displayMeters = std::min(*c.nearestMeters, grid.maxMeters);
      } else {
        c.displayMeters = grid.maxMeters;
        ++grid.unresolvedCells;
      }
      c.color = HeatColorForDistance(c.displayMeters, grid.maxMeters);

      grid.cells.push_back(c);
    }
  }
  return grid;
}

} // namespace stopgrid
