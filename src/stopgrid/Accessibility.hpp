#pragma once

#include "stopgrid/Projection.hpp"
#include "stopgrid/StopIndex.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace stopgrid {

// -----------------------------------------------------------------------------
// Transit accessibility metrics on top of a StopIndex
//
// - nearest-stop distance at a location
// - stop counts at a small set of radii
// - a heat grid of nearest-stop distance around a location, with a fixed
//   three-stop colour ramp (near = green, mid = yellow, far = red)
//
// Everything here is a pure function of (index, location, config).
// -----------------------------------------------------------------------------

struct AccessibilityConfig {
  // Radii for the "stops within" counts.
  std::vector<double> radiiMeters{500.0, 1000.0, 2000.0};

  // How many nearest stops to list in a summary (clamped by the index's k range).
  int kNearest = 5;

  // Heat grid window: a square of +/- heatRadiusMeters around the centre,
  // split into heatGridSize x heatGridSize cells.
  double heatRadiusMeters = 3000.0;
  int heatGridSize = 42;

  // Distance mapped to the far end of the ramp. <= 0 means "use heatRadiusMeters".
  double heatMaxMeters = 0.0;

  // Fill opacity suggested to renderers (carried through exports only).
  float heatFillOpacity = 0.28f;
};

// Replace invalid values with defaults (negative/non-finite radii dropped,
// grid size clamped to [1, kMaxHeatGridSize], ...).
inline constexpr int kMaxHeatGridSize = 512;
AccessibilityConfig SanitizeAccessibilityConfig(const AccessibilityConfig& cfg);

struct Rgb8 {
  std::uint8_t r = 0;
  std::uint8_t g = 0;
  std::uint8_t b = 0;
};

inline bool operator==(const Rgb8& a, const Rgb8& b) { return a.r == b.r && a.g == b.g && a.b == b.b; }

// clamp(meters / maxMeters, 0, 1). A non-positive maxMeters or NaN distance maps to 1 (far).
double HeatValue01(double meters, double maxMeters);

// Two-segment ramp: t in [0,0.5) blends near->mid, t in [0.5,1] blends mid->far.
// Anchors: t=0 (40,200,60), t=0.5 (255,220,60), t=1 (220,40,40).
Rgb8 HeatColorForValue(double t01);
Rgb8 HeatColorForDistance(double meters, double maxMeters);

struct RadiusCount {
  double radiusMeters = 0.0;
  int count = 0;
};

struct AccessibilitySummary {
  LatLon at{};
  std::size_t stopCount = 0;

  std::optional<double> nearestStopMeters;
  std::vector<RadiusCount> within;
  std::vector<StopDistance> nearest;

  // Any of the underlying queries hit the ring cap.
  bool searchBoundExceeded = false;
};

AccessibilitySummary ComputeAccessibilitySummary(const StopIndex& index, const LatLon& at,
                                                 const AccessibilityConfig& cfg = {});

struct HeatCell {
  int row = 0; // 0 = southernmost row
  int col = 0; // 0 = westernmost column

  double south = 0.0;
  double west = 0.0;
  double north = 0.0;
  double east = 0.0;
  LatLon center{};

  // Raw nearest-stop distance (nullopt when no stop was found within the cap).
  std::optional<double> nearestMeters;

  // min(nearest, maxMeters), or maxMeters when unresolved.
  double displayMeters = 0.0;
  Rgb8 color{};
};

struct HeatGrid {
  int size = 0;
  LatLon center{};
  double radiusMeters = 0.0;
  double maxMeters = 0.0;
  float fillOpacity = 0.0f;

  double latMin = 0.0;
  double latMax = 0.0;
  double lonMin = 0.0;
  double lonMax = 0.0;

  // Row-major, size * size entries.
  std::vector<HeatCell> cells;

  int unresolvedCells = 0;

  const HeatCell& at(int row, int col) const
  {
    return cells[static_cast<std::size_t>(row) * static_cast<std::size_t>(size) + static_cast<std::size_t>(col)];
  }
};

// Evaluate nearestDistanceMeters at the centre of every cell of the window.
// The window extent uses the equirectangular approximation from Projection.hpp.
HeatGrid RasterizeHeatGrid(const StopIndex& index, const LatLon& center, const AccessibilityConfig& cfg = {});

} // namespace stopgrid
