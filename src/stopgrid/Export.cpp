#include "stopgrid/Export.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <fstream>
#include <iomanip>
#include <optional>
#include <sstream>
#include <utility>

namespace stopgrid {

namespace {

JsonValue Num(double v)
{
  return JsonValue::MakeNumber(v);
}

JsonValue LonLat(double lon, double lat)
{
  JsonValue p = JsonValue::MakeArray();
  p.push(Num(lon));
  p.push(Num(lat));
  return p;
}

JsonValue OptionalMeters(const std::optional<double>& m)
{
  return m ? Num(*m) : JsonValue::MakeNull();
}

bool ReadPpmToken(std::istream& in, std::string& out)
{
  out.clear();

  char c = 0;
  // Skip whitespace and comments.
  while (in.get(c)) {
    if (std::isspace(static_cast<unsigned char>(c)) != 0) continue;
    if (c == '#') {
      std::string dummy;
      std::getline(in, dummy);
      continue;
    }
    out.push_back(c);
    break;
  }
  if (out.empty()) return false;

  // Exactly one whitespace byte terminates the last header token.
  while (in.get(c)) {
    if (std::isspace(static_cast<unsigned char>(c)) != 0) break;
    out.push_back(c);
  }
  return true;
}

bool ParsePositiveToken(const std::string& tok, int& out)
{
  if (tok.empty()) return false;
  int v = 0;
  for (char c : tok) {
    if (c < '0' || c > '9') return false;
    v = v * 10 + (c - '0');
    if (v > 1 << 24) return false;
  }
  if (v <= 0) return false;
  out = v;
  return true;
}

} // namespace

std::string CssRgb(const Rgb8& c)
{
  std::ostringstream oss;
  oss << "rgb(" << static_cast<int>(c.r) << "," << static_cast<int>(c.g) << "," << static_cast<int>(c.b) << ")";
  return oss.str();
}

PpmImage RenderHeatGridPpm(const HeatGrid& grid)
{
  PpmImage img{};
  if (grid.size <= 0) return img;
  const std::size_t n = static_cast<std::size_t>(grid.size);
  if (grid.cells.size() != n * n) return img;

  img.width = grid.size;
  img.height = grid.size;
  img.rgb.resize(n * n * 3u);

  for (int row = 0; row < grid.size; ++row) {
    const int y = grid.size - 1 - row;
    for (int col = 0; col < grid.size; ++col) {
      const Rgb8 c = grid.at(row, col).color;
      const std::size_t idx = (static_cast<std::size_t>(y) * n + static_cast<std::size_t>(col)) * 3u;
      img.rgb[idx + 0] = c.r;
      img.rgb[idx + 1] = c.g;
      img.rgb[idx + 2] = c.b;
    }
  }
  return img;
}

PpmImage ScaleNearest(const PpmImage& src, int factor)
{
  if (factor <= 1) return src;
  if (src.width <= 0 || src.height <= 0) return src;
  if (src.rgb.size() != static_cast<std::size_t>(src.width) * static_cast<std::size_t>(src.height) * 3u) return src;

  PpmImage out{};
  out.width = src.width * factor;
  out.height = src.height * factor;
  out.rgb.resize(static_cast<std::size_t>(out.width) * static_cast<std::size_t>(out.height) * 3u);

  for (int y = 0; y < out.height; ++y) {
    const std::size_t srow = static_cast<std::size_t>(y / factor) * static_cast<std::size_t>(src.width);
    const std::size_t drow = static_cast<std::size_t>(y) * static_cast<std::size_t>(out.width);
    for (int x = 0; x < out.width; ++x) {
      const std::size_t sidx = (srow + static_cast<std::size_t>(x / factor)) * 3u;
      const std::size_t didx = (drow + static_cast<std::size_t>(x)) * 3u;
      std::copy_n(src.rgb.begin() + static_cast<std::ptrdiff_t>(sidx), 3,
                  out.rgb.begin() + static_cast<std::ptrdiff_t>(didx));
    }
  }
  return out;
}

bool WritePpm(const std::string& path, const PpmImage& img, std::string& outError)
{
  if (img.width <= 0 || img.height <= 0) {
    outError = "invalid image dimensions";
    return false;
  }
  const std::size_t expected = static_cast<std::size_t>(img.width) * static_cast<std::size_t>(img.height) * 3u;
  if (img.rgb.size() != expected) {
    std::ostringstream oss;
    oss << "invalid image buffer size (expected " << expected << ", got " << img.rgb.size() << ")";
    outError = oss.str();
    return false;
  }

  std::ofstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open '" + path + "' for writing";
    return false;
  }

  f << "P6\n" << img.width << " " << img.height << "\n255\n";
  f.write(reinterpret_cast<const char*>(img.rgb.data()), static_cast<std::streamsize>(img.rgb.size()));
  if (!f) {
    outError = "failed while writing '" + path + "'";
    return false;
  }
  outError.clear();
  return true;
}

bool ReadPpm(const std::string& path, PpmImage& outImg, std::string& outError)
{
  outImg = PpmImage{};

  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open '" + path + "'";
    return false;
  }

  std::string tok;
  if (!ReadPpmToken(f, tok) || tok != "P6") {
    outError = "invalid PPM magic (expected P6)";
    return false;
  }

  int w = 0;
  int h = 0;
  int maxv = 0;
  if (!ReadPpmToken(f, tok) || !ParsePositiveToken(tok, w) || !ReadPpmToken(f, tok) ||
      !ParsePositiveToken(tok, h)) {
    outError = "invalid PPM dimensions";
    return false;
  }
  if (!ReadPpmToken(f, tok) || !ParsePositiveToken(tok, maxv) || maxv != 255) {
    outError = "unsupported PPM maxval (expected 255)";
    return false;
  }

  const std::size_t expected = static_cast<std::size_t>(w) * static_cast<std::size_t>(h) * 3u;
  std::vector<std::uint8_t> buf(expected);
  f.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
  if (static_cast<std::size_t>(f.gcount()) != expected) {
    outError = "truncated PPM pixel data";
    return false;
  }

  outImg.width = w;
  outImg.height = h;
  outImg.rgb = std::move(buf);
  outError.clear();
  return true;
}

JsonValue HeatGridToGeoJson(const HeatGrid& grid)
{
  JsonValue features = JsonValue::MakeArray();

  for (const HeatCell& c : grid.cells) {
    JsonValue ring = JsonValue::MakeArray();
    ring.push(LonLat(c.west, c.south));
    ring.push(LonLat(c.east, c.south));
    ring.push(LonLat(c.east, c.north));
    ring.push(LonLat(c.west, c.north));
    ring.push(LonLat(c.west, c.south));

    JsonValue rings = JsonValue::MakeArray();
    rings.push(std::move(ring));

    JsonValue geom = JsonValue::MakeObject();
    geom.add("type", JsonValue::MakeString("Polygon"));
    geom.add("coordinates", std::move(rings));

    JsonValue props = JsonValue::MakeObject();
    props.add("row", Num(c.row));
    props.add("col", Num(c.col));
    props.add("meters", OptionalMeters(c.nearestMeters));
    props.add("display_meters", Num(c.displayMeters));
    props.add("fill", JsonValue::MakeString(CssRgb(c.color)));
    props.add("fill_opacity", Num(std::round(static_cast<double>(grid.fillOpacity) * 1e6) / 1e6));

    JsonValue f = JsonValue::MakeObject();
    f.add("type", JsonValue::MakeString("Feature"));
    f.add("geometry", std::move(geom));
    f.add("properties", std::move(props));
    features.push(std::move(f));
  }

  JsonValue center = JsonValue::MakeObject();
  center.add("lat", Num(grid.center.lat));
  center.add("lon", Num(grid.center.lon));

  JsonValue root = JsonValue::MakeObject();
  root.add("type", JsonValue::MakeString("FeatureCollection"));
  root.add("center", std::move(center));
  root.add("radius_meters", Num(grid.radiusMeters));
  root.add("max_meters", Num(grid.maxMeters));
  root.add("grid_size", Num(grid.size));
  root.add("unresolved_cells", Num(grid.unresolvedCells));
  root.add("features", std::move(features));
  return root;
}

bool WriteHeatGridGeoJson(const std::string& path, const HeatGrid& grid, std::string& outError)
{
  JsonWriteOptions opt{};
  opt.pretty = false;
  return WriteJsonFile(path, HeatGridToGeoJson(grid), outError, opt);
}

bool WriteHeatGridCsv(const std::string& path, const HeatGrid& grid, std::string& outError)
{
  std::ofstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open '" + path + "' for writing";
    return false;
  }

  f << "row,col,center_lat,center_lon,meters,r,g,b\n";
  f << std::fixed;
  for (const HeatCell& c : grid.cells) {
    f << c.row << ',' << c.col << ',' << std::setprecision(7) << c.center.lat << ',' << c.center.lon << ',';
    if (c.nearestMeters) f << std::setprecision(2) << *c.nearestMeters;
    f << ',' << static_cast<int>(c.color.r) << ',' << static_cast<int>(c.color.g) << ','
      << static_cast<int>(c.color.b) << '\n';
  }

  if (!f) {
    outError = "failed while writing '" + path + "'";
    return false;
  }
  outError.clear();
  return true;
}

JsonValue AccessibilitySummaryToJson(const AccessibilitySummary& s)
{
  JsonValue at = JsonValue::MakeObject();
  at.add("lat", Num(s.at.lat));
  at.add("lon", Num(s.at.lon));

  JsonValue within = JsonValue::MakeArray();
  for (const RadiusCount& rc : s.within) {
    JsonValue o = JsonValue::MakeObject();
    o.add("radius_meters", Num(rc.radiusMeters));
    o.add("count", Num(rc.count));
    within.push(std::move(o));
  }

  JsonValue nearest = JsonValue::MakeArray();
  for (const StopDistance& d : s.nearest) {
    JsonValue o = JsonValue::MakeObject();
    o.add("id", JsonValue::MakeString(d.id));
    o.add("meters", Num(d.meters));
    nearest.push(std::move(o));
  }

  JsonValue o = JsonValue::MakeObject();
  o.add("at", std::move(at));
  o.add("stop_count", Num(static_cast<double>(s.stopCount)));
  o.add("nearest_stop_meters", OptionalMeters(s.nearestStopMeters));
  o.add("within", std::move(within));
  o.add("nearest", std::move(nearest));
  o.add("search_bound_exceeded", JsonValue::MakeBool(s.searchBoundExceeded));
  return o;
}

JsonValue AccessibilityReportToJson(const AccessibilityReport& r)
{
  JsonValue o = JsonValue::MakeObject();
  o.add("file", JsonValue::MakeString(r.inputPath));
  o.add("stops_loaded", Num(r.stopsLoaded));
  o.add("stops_indexed", Num(r.stopsIndexed));
  o.add("cells", Num(r.cells));
  o.add("config", StopGridConfigToJsonValue(r.config));
  o.add("summary", AccessibilitySummaryToJson(r.summary));
  return o;
}

bool WriteAccessibilityReportJson(const std::string& path, const AccessibilityReport& r, std::string& outError)
{
  return WriteJsonFile(path, AccessibilityReportToJson(r), outError);
}

} // namespace stopgrid
