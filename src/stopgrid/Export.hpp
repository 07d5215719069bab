#pragma once

#include "stopgrid/Accessibility.hpp"
#include "stopgrid/ConfigIO.hpp"
#include "stopgrid/Json.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace stopgrid {

// -----------------------------------------------------------------------------
// Export helpers for heat grids and accessibility summaries
//
// All writers return false and fill outError on failure; nothing here throws.
// -----------------------------------------------------------------------------

struct PpmImage {
  int width = 0;
  int height = 0;
  // RGB bytes, row-major (y major), size = width * height * 3
  std::vector<std::uint8_t> rgb;
};

// One pixel per heat cell, north-up: image row 0 is the grid's northernmost row.
PpmImage RenderHeatGridPpm(const HeatGrid& grid);

// Nearest-neighbor upscaling. factor <= 1 returns src unchanged.
PpmImage ScaleNearest(const PpmImage& src, int factor);

// Binary PPM (P6).
bool WritePpm(const std::string& path, const PpmImage& img, std::string& outError);
bool ReadPpm(const std::string& path, PpmImage& outImg, std::string& outError);

// FeatureCollection of Polygon cells. Properties: row, col, meters (null when
// unresolved), display_meters, fill ("rgb(r,g,b)"), fill_opacity.
JsonValue HeatGridToGeoJson(const HeatGrid& grid);
bool WriteHeatGridGeoJson(const std::string& path, const HeatGrid& grid, std::string& outError);

// Columns: row,col,center_lat,center_lon,meters,r,g,b (meters empty when unresolved).
bool WriteHeatGridCsv(const std::string& path, const HeatGrid& grid, std::string& outError);

struct AccessibilityReport {
  std::string inputPath;
  int stopsLoaded = 0;
  int stopsIndexed = 0;
  int cells = 0;
  StopGridConfig config{};
  AccessibilitySummary summary{};
};

JsonValue AccessibilitySummaryToJson(const AccessibilitySummary& s);
JsonValue AccessibilityReportToJson(const AccessibilityReport& r);
bool WriteAccessibilityReportJson(const std::string& path, const AccessibilityReport& r, std::string& outError);

// "rgb(r,g,b)"
std::string CssRgb(const Rgb8& c);

} // namespace stopgrid
