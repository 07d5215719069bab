#pragma once

#include "stopgrid/Accessibility.hpp"
#include "stopgrid/Json.hpp"
#include "stopgrid/StopIndex.hpp"

#include <string>

namespace stopgrid {

// JSON helpers for StopIndexConfig and AccessibilityConfig.
//
// Merge semantics: missing keys leave the existing config unchanged, so a
// config file only needs to name what it overrides. Field names are snake_case.
//
// File layout:
//   {
//     "index": { "cell_size_meters": 900, "max_rings": 24, "min_k": 1, "max_k": 32 },
//     "accessibility": { "radii_meters": [500, 1000, 2000], "k_nearest": 5, ... }
//   }

struct StopGridConfig {
  StopIndexConfig index{};
  AccessibilityConfig accessibility{};
};

JsonValue StopIndexConfigToJsonValue(const StopIndexConfig& cfg);
JsonValue AccessibilityConfigToJsonValue(const AccessibilityConfig& cfg);
JsonValue StopGridConfigToJsonValue(const StopGridConfig& cfg);

std::string StopGridConfigToJson(const StopGridConfig& cfg, int indentSpaces = 2);

// Apply JSON overrides into an existing config (merge semantics).
bool ApplyStopIndexConfigJson(const JsonValue& root, StopIndexConfig& ioCfg, std::string& outError);
bool ApplyAccessibilityConfigJson(const JsonValue& root, AccessibilityConfig& ioCfg, std::string& outError);
bool ApplyStopGridConfigJson(const JsonValue& root, StopGridConfig& ioCfg, std::string& outError);

// Values are not sanitized here; consumers run the Sanitize* functions.
bool LoadStopGridConfigJsonFile(const std::string& path, StopGridConfig& ioCfg, std::string& outError);
bool WriteStopGridConfigJsonFile(const std::string& path, const StopGridConfig& cfg, std::string& outError,
                                 int indentSpaces = 2);

} // namespace stopgrid
