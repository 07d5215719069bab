#include "stopgrid/ConfigIO.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <utility>
#include <vector>

namespace stopgrid {

namespace {

bool RequireFiniteNumber(const JsonValue& v, const std::string& key, std::string& err)
{
  if (!v.isNumber()) {
    err = "expected number for key '" + key + "'";
    return false;
  }
  if (!std::isfinite(v.numberValue)) {
    err = "non-finite number for key '" + key + "'";
    return false;
  }
  return true;
}

bool ApplyI32(const JsonValue& root, const char* key, int& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true; // missing => keep
  if (!RequireFiniteNumber(*v, key, err)) return false;

  const double dv = v->numberValue;
  if (dv < static_cast<double>(std::numeric_limits<int>::min()) ||
      dv > static_cast<double>(std::numeric_limits<int>::max())) {
    err = std::string("out-of-range integer for key '") + key + "'";
    return false;
  }
  io = static_cast<int>(std::lround(dv));
  return true;
}

bool ApplyF64(const JsonValue& root, const char* key, double& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!RequireFiniteNumber(*v, key, err)) return false;
  io = v->numberValue;
  return true;
}

bool ApplyF32(const JsonValue& root, const char* key, float& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!RequireFiniteNumber(*v, key, err)) return false;

  const double dv = v->numberValue;
  if (dv < -static_cast<double>(std::numeric_limits<float>::max()) ||
      dv > static_cast<double>(std::numeric_limits<float>::max())) {
    err = std::string("out-of-range float for key '") + key + "'";
    return false;
  }
  io = static_cast<float>(dv);
  return true;
}

bool ApplyF64List(const JsonValue& root, const char* key, std::vector<double>& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isArray()) {
    err = std::string("expected array for key '") + key + "'";
    return false;
  }

  std::vector<double> out;
  out.reserve(v->arrayValue.size());
  for (std::size_t i = 0; i < v->arrayValue.size(); ++i) {
    const std::string elemKey = std::string(key) + "[" + std::to_string(i) + "]";
    if (!RequireFiniteNumber(v->arrayValue[i], elemKey, err)) return false;
    out.push_back(v->arrayValue[i].numberValue);
  }
  io = std::move(out);
  return true;
}

} // namespace

JsonValue StopIndexConfigToJsonValue(const StopIndexConfig& cfg)
{
  JsonValue o = JsonValue::MakeObject();
  o.add("cell_size_meters", JsonValue::MakeNumber(cfg.cellSizeMeters));
  o.add("max_rings", JsonValue::MakeNumber(cfg.maxRings));
  o.add("min_k", JsonValue::MakeNumber(cfg.minK));
  o.add("max_k", JsonValue::MakeNumber(cfg.maxK));
  return o;
}

JsonValue AccessibilityConfigToJsonValue(const AccessibilityConfig& cfg)
{
  JsonValue radii = JsonValue::MakeArray();
  for (double r : cfg.radiiMeters) radii.push(JsonValue::MakeNumber(r));

  JsonValue o = JsonValue::MakeObject();
  o.add("radii_meters", std::move(radii));
  o.add("k_nearest", JsonValue::MakeNumber(cfg.kNearest));
  o.add("heat_radius_meters", JsonValue::MakeNumber(cfg.heatRadiusMeters));
  o.add("heat_grid_size", JsonValue::MakeNumber(cfg.heatGridSize));
  o.add("heat_max_meters", JsonValue::MakeNumber(cfg.heatMaxMeters));
  // Round away float widening noise.
  const double opacity = std::round(static_cast<double>(cfg.heatFillOpacity) * 1e6) / 1e6;
  o.add("heat_fill_opacity", JsonValue::MakeNumber(opacity));
  return o;
}

JsonValue StopGridConfigToJsonValue(const StopGridConfig& cfg)
{
  JsonValue o = JsonValue::MakeObject();
  o.add("index", StopIndexConfigToJsonValue(cfg.index));
  o.add("accessibility", AccessibilityConfigToJsonValue(cfg.accessibility));
  return o;
}

std::string StopGridConfigToJson(const StopGridConfig& cfg, int indentSpaces)
{
  JsonWriteOptions opt{};
  opt.pretty = true;
  opt.indent = std::max(0, indentSpaces);
  return JsonStringify(StopGridConfigToJsonValue(cfg), opt) + "\n";
}

bool ApplyStopIndexConfigJson(const JsonValue& root, StopIndexConfig& ioCfg, std::string& outError)
{
  if (!root.isObject()) {
    outError = "index config JSON must be an object";
    return false;
  }

  // Apply into a copy so a failure leaves ioCfg untouched.
  StopIndexConfig cfg = ioCfg;
  std::string err;
  if (!ApplyF64(root, "cell_size_meters", cfg.cellSizeMeters, err) ||
      !ApplyI32(root, "max_rings", cfg.maxRings, err) ||
      !ApplyI32(root, "min_k", cfg.minK, err) ||
      !ApplyI32(root, "max_k", cfg.maxK, err)) {
    outError = err;
    return false;
  }

  ioCfg = cfg;
  outError.clear();
  return true;
}

bool ApplyAccessibilityConfigJson(const JsonValue& root, AccessibilityConfig& ioCfg, std::string& outError)
{
  if (!root.isObject()) {
    outError = "accessibility config JSON must be an object";
    return false;
  }

  AccessibilityConfig cfg = ioCfg;
  std::string err;
  if (!ApplyF64List(root, "radii_meters", cfg.radiiMeters, err) ||
      !ApplyI32(root, "k_nearest", cfg.kNearest, err) ||
      !ApplyF64(root, "heat_radius_meters", cfg.heatRadiusMeters, err) ||
      !ApplyI32(root, "heat_grid_size", cfg.heatGridSize, err) ||
      !ApplyF64(root, "heat_max_meters", cfg.heatMaxMeters, err) ||
      !ApplyF32(root, "heat_fill_opacity", cfg.heatFillOpacity, err)) {
    outError = err;
    return false;
  }

  ioCfg = std::move(cfg);
  outError.clear();
  return true;
}

bool ApplyStopGridConfigJson(const JsonValue& root, StopGridConfig& ioCfg, std::string& outError)
{
  if (!root.isObject()) {
    outError = "config JSON must be an object";
    return false;
  }

  StopGridConfig cfg = ioCfg;
  std::string err;

  if (const JsonValue* index = FindJsonMember(root, "index")) {
    if (!ApplyStopIndexConfigJson(*index, cfg.index, err)) {
      outError = "index: " + err;
      return false;
    }
  }

  if (const JsonValue* access = FindJsonMember(root, "accessibility")) {
    if (!ApplyAccessibilityConfigJson(*access, cfg.accessibility, err)) {
      outError = "accessibility: " + err;
      return false;
    }
  }

  ioCfg = std::move(cfg);
  outError.clear();
  return true;
}

bool LoadStopGridConfigJsonFile(const std::string& path, StopGridConfig& ioCfg, std::string& outError)
{
  JsonValue root;
  std::string err;
  if (!ReadJsonFile(path, root, err)) {
    outError = err;
    return false;
  }

  if (!ApplyStopGridConfigJson(root, ioCfg, err)) {
    outError = path + ": " + err;
    return false;
  }

  outError.clear();
  return true;
}

bool WriteStopGridConfigJsonFile(const std::string& path, const StopGridConfig& cfg, std::string& outError,
                                 int indentSpaces)
{
  JsonWriteOptions opt{};
  opt.pretty = true;
  opt.indent = std::max(0, indentSpaces);
  return WriteJsonFile(path, StopGridConfigToJsonValue(cfg), outError, opt);
}

} // namespace stopgrid
