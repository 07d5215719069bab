#pragma once

#include "stopgrid/StopIndex.hpp"

#include <string>
#include <vector>

namespace stopgrid {

// Local stop-list loaders.
//
// Supported inputs:
//  - GTFS stops.txt (CSV with a header row; stop_id, stop_lat, stop_lon
//    required, stop_name optional)
//  - JSON: an array of {"id","lat","lon","name"} objects (stop_* key variants
//    accepted), {"stops": {"<id>": {...}}}, or a GeoJSON FeatureCollection of
//    Point features
//
// Rows with a missing id or an unusable coordinate are skipped, not fatal.
// Duplicate ids keep the first occurrence.

struct StopsLoadStats {
  int rows = 0;            // data rows / entries seen
  int accepted = 0;
  int skippedInvalid = 0;
  int duplicateIds = 0;
};

bool LoadStopsCsv(const std::string& path, std::vector<StopPoint>& outStops, std::string& outError,
                  StopsLoadStats* outStats = nullptr);

bool LoadStopsJson(const std::string& path, std::vector<StopPoint>& outStops, std::string& outError,
                   StopsLoadStats* outStats = nullptr);

// Dispatch on extension: .json / .geojson => JSON, anything else => CSV.
bool LoadStopsFile(const std::string& path, std::vector<StopPoint>& outStops, std::string& outError,
                   StopsLoadStats* outStats = nullptr);

// Parse CSV text already in memory (exposed for tests and piping).
bool ParseStopsCsvText(const std::string& text, std::vector<StopPoint>& outStops, std::string& outError,
                       StopsLoadStats* outStats = nullptr);

// Split one CSV record. Handles "quoted, fields" and "" escapes.
std::vector<std::string> SplitCsvRecord(const std::string& line);

} // namespace stopgrid
