#include "stopgrid/ConfigIO.hpp"
#include "stopgrid/Export.hpp"
#include "stopgrid/Json.hpp"
#include "stopgrid/LogTee.hpp"
#include "stopgrid/StopsIO.hpp"

#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                    \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";   \
    }                                                                                                                \
  } while (0)

#define EXPECT_NEAR(a, b, eps)                                                                                        \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    const auto _e = (eps);                                                                                           \
    if (std::fabs((_a) - (_b)) > (_e)) {                                                                             \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NEAR failed: " << #a << " ~= " << #b << " (eps=" << _e   \
                << ")\n";                                                                                            \
    }                                                                                                                \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                    \
      return;                                                                                                        \
    }                                                                                                                \
  } while (0)

namespace {

using namespace stopgrid;

fs::path MakeTempDir(const std::string& prefix)
{
  static std::uint64_t counter = 0;
  ++counter;

  std::error_code ec;
  fs::path root = fs::temp_directory_path(ec);
  if (ec || root.empty()) root = fs::path(".");

  const auto stamp = static_cast<std::uint64_t>(std::chrono::high_resolution_clock::now().time_since_epoch().count());
  const fs::path dir = root / (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter));
  fs::create_directories(dir, ec);
  return dir;
}

void WriteText(const fs::path& p, const std::string& text)
{
  std::ofstream f(p, std::ios::binary);
  f << text;
}

std::string ReadText(const fs::path& p)
{
  std::ifstream f(p, std::ios::binary);
  std::ostringstream oss;
  oss << f.rdbuf();
  return oss.str();
}

std::vector<std::string> ReadLines(const fs::path& p)
{
  std::ifstream f(p, std::ios::binary);
  std::vector<std::string> out;
  std::string line;
  while (std::getline(f, line)) out.push_back(line);
  return out;
}

StopPoint MakeStop(const std::string& id, double lat, double lon)
{
  StopPoint s{};
  s.id = id;
  s.lat = lat;
  s.lon = lon;
  return s;
}

void TestJsonParse()
{
  JsonValue v;
  std::string err;

  ASSERT_TRUE(ParseJson(R"({"a": 1, "b": [true, false, null], "c": "x\"y\\u00e9", "d": -2.5e2})", v, err));
  ASSERT_TRUE(v.isObject());
  const JsonValue* a = FindJsonMember(v, "a");
  ASSERT_TRUE(a && a->isNumber());
  EXPECT_EQ(a->numberValue, 1.0);

  const JsonValue* b = FindJsonMember(v, "b");
  ASSERT_TRUE(b && b->isArray() && b->arrayValue.size() == 3);
  EXPECT_TRUE(b->arrayValue[0].boolValue);
  EXPECT_TRUE(b->arrayValue[2].isNull());

  const JsonValue* c = FindJsonMember(v, "c");
  ASSERT_TRUE(c && c->isString());
  EXPECT_EQ(c->stringValue, std::string("x\"y\\u00e9"));
  EXPECT_EQ(FindJsonMember(v, "d")->numberValue, -250.0);

  // \u escapes decode to UTF-8, including surrogate pairs.
  ASSERT_TRUE(ParseJson(R"(["\u00e9", "\ud83d\ude8c"])", v, err));
  EXPECT_EQ(v.arrayValue[0].stringValue, std::string("\xC3\xA9"));
  EXPECT_EQ(v.arrayValue[1].stringValue, std::string("\xF0\x9F\x9A\x8C"));

  // Strict: no trailing commas, comments, trailing data or bare leading zeros.
  EXPECT_FALSE(ParseJson("[1,2,]", v, err));
  EXPECT_FALSE(ParseJson("{\"a\":1} x", v, err));
  EXPECT_TRUE(err.find("trailing") != std::string::npos);
  EXPECT_FALSE(ParseJson("// c\n{}", v, err));
  EXPECT_FALSE(ParseJson("01", v, err));
  EXPECT_FALSE(ParseJson("\"\\ud83d\"", v, err));
  EXPECT_FALSE(ParseJson("", v, err));
}

void TestJsonWrite()
{
  JsonValue root = JsonValue::MakeObject();
  root.add("b", JsonValue::MakeNumber(2.5));
  JsonValue arr = JsonValue::MakeArray();
  arr.push(JsonValue::MakeBool(true));
  arr.push(JsonValue::MakeNull());
  arr.push(JsonValue::MakeString("q\"\n"));
  root.add("a", std::move(arr));
  root.add("n", JsonValue::MakeNumber(900));

  JsonWriteOptions compact{};
  compact.pretty = false;
  EXPECT_EQ(JsonStringify(root, compact), std::string(R"({"b":2.5,"a":[true,null,"q\"\n"],"n":900})"));

  compact.sortKeys = true;
  EXPECT_EQ(JsonStringify(root, compact), std::string(R"({"a":[true,null,"q\"\n"],"b":2.5,"n":900})"));

  JsonValue small = JsonValue::MakeObject();
  small.add("k", JsonValue::MakeNumber(1));
  EXPECT_EQ(JsonStringify(small), std::string("{\n  \"k\": 1\n}"));

  // Non-finite numbers: rejected by WriteJson, null in JsonStringify.
  JsonValue bad = JsonValue::MakeArray();
  bad.push(JsonValue::MakeNumber(std::nan("")));
  std::ostringstream oss;
  std::string err;
  EXPECT_FALSE(WriteJson(oss, bad, err, compact));
  EXPECT_FALSE(err.empty());
  EXPECT_EQ(JsonStringify(bad, compact), std::string("[null]"));

  // Writer output parses back to the same structure.
  JsonValue back;
  ASSERT_TRUE(ParseJson(JsonStringify(root), back, err));
  EXPECT_EQ(JsonStringify(back, compact), JsonStringify(root, compact));
}

void TestConfigJson()
{
  const fs::path dir = MakeTempDir("stopgrid_config");

  StopGridConfig cfg{};
  cfg.index.maxRings = 40;
  cfg.accessibility.radiiMeters = {250.0, 800.0};
  const fs::path path = dir / "cfg.json";

  std::string err;
  ASSERT_TRUE(WriteStopGridConfigJsonFile(path.string(), cfg, err));

  StopGridConfig loaded{};
  ASSERT_TRUE(LoadStopGridConfigJsonFile(path.string(), loaded, err));
  EXPECT_EQ(loaded.index.maxRings, 40);
  EXPECT_EQ(loaded.index.cellSizeMeters, 900.0);
  ASSERT_TRUE(loaded.accessibility.radiiMeters.size() == 2);
  EXPECT_EQ(loaded.accessibility.radiiMeters[1], 800.0);
  EXPECT_NEAR(static_cast<double>(loaded.accessibility.heatFillOpacity), 0.28, 1e-6);
  EXPECT_TRUE(ReadText(path).find("\"heat_fill_opacity\": 0.28") != std::string::npos);

  // Merge semantics: only named keys change.
  JsonValue patch;
  ASSERT_TRUE(ParseJson(R"({"index": {"cell_size_meters": 450}, "accessibility": {"k_nearest": 9}})", patch, err));
  StopGridConfig merged = loaded;
  ASSERT_TRUE(ApplyStopGridConfigJson(patch, merged, err));
  EXPECT_EQ(merged.index.cellSizeMeters, 450.0);
  EXPECT_EQ(merged.index.maxRings, 40);
  EXPECT_EQ(merged.accessibility.kNearest, 9);
  EXPECT_EQ(merged.accessibility.heatGridSize, 42);

  // Type errors name the key and leave the config untouched.
  ASSERT_TRUE(ParseJson(R"({"index": {"max_rings": "many"}})", patch, err));
  StopGridConfig untouched{};
  EXPECT_FALSE(ApplyStopGridConfigJson(patch, untouched, err));
  EXPECT_TRUE(err.find("max_rings") != std::string::npos);
  EXPECT_EQ(untouched.index.maxRings, 24);

  ASSERT_TRUE(ParseJson(R"({"accessibility": {"radii_meters": [500, "x"]}})", patch, err));
  EXPECT_FALSE(ApplyStopGridConfigJson(patch, untouched, err));
  EXPECT_TRUE(err.find("radii_meters[1]") != std::string::npos);

  WriteText(dir / "broken.json", "{\"index\": ");
  EXPECT_FALSE(LoadStopGridConfigJsonFile((dir / "broken.json").string(), untouched, err));
  EXPECT_FALSE(LoadStopGridConfigJsonFile((dir / "missing.json").string(), untouched, err));

  std::error_code ec;
  fs::remove_all(dir, ec);
}

void TestStopsCsv()
{
  const std::string text =
      "\xEF\xBB\xBF"
      "stop_id,stop_code,stop_name,stop_desc,stop_lat,stop_lon,zone_id\r\n"
      "1,001,\"King George Square, stop 91\",,-27.4683,153.0237,1\r\n"
      "2,002,\"The \"\"Valley\"\"\",,-27.4575, 153.0355 ,1\r\n"
      "\r\n"
      "3,003,No coords,,,,1\r\n"
      "1,001,Duplicate,,-27.0,153.0,1\r\n"
      ",004,No id,,-27.1,153.1,1\r\n"
      "5,005,Bad lat,,abc,153.1,1\r\n"
      "6,006,Last row without newline,,-27.5,153.0,2";

  std::vector<StopPoint> stops;
  StopsLoadStats stats{};
  std::string err;
  ASSERT_TRUE(ParseStopsCsvText(text, stops, err, &stats));

  ASSERT_TRUE(stops.size() == 3);
  EXPECT_EQ(stops[0].id, std::string("1"));
  EXPECT_EQ(stops[0].name, std::string("King George Square, stop 91"));
  EXPECT_EQ(stops[0].lat, -27.4683);
  EXPECT_EQ(stops[1].name, std::string("The \"Valley\""));
  EXPECT_EQ(stops[1].lon, 153.0355);
  EXPECT_EQ(stops[2].id, std::string("6"));

  EXPECT_EQ(stats.rows, 7);
  EXPECT_EQ(stats.accepted, 3);
  EXPECT_EQ(stats.skippedInvalid, 3);
  EXPECT_EQ(stats.duplicateIds, 1);

  EXPECT_FALSE(ParseStopsCsvText("id,lat,lon\n1,2,3\n", stops, err));
  EXPECT_TRUE(err.find("stop_id") != std::string::npos);
  EXPECT_FALSE(ParseStopsCsvText("", stops, err));

  const std::vector<std::string> rec = SplitCsvRecord("a,\"b,c\",,\"d\"\"e\"");
  ASSERT_TRUE(rec.size() == 4);
  EXPECT_EQ(rec[1], std::string("b,c"));
  EXPECT_EQ(rec[2], std::string());
  EXPECT_EQ(rec[3], std::string("d\"e"));
}

void TestStopsJsonAndDispatch()
{
  const fs::path dir = MakeTempDir("stopgrid_stops");
  std::string err;
  std::vector<StopPoint> stops;
  StopsLoadStats stats{};

  WriteText(dir / "array.json",
            R"([{"id": "A", "lat": -27.4698, "lon": 153.0251, "name": "Alpha"},
                {"stop_id": 600029, "stop_lat": "-27.47", "stop_lon": "153.026"},
                {"id": "C", "lat": null, "lon": 153.0}])");
  ASSERT_TRUE(LoadStopsFile((dir / "array.json").string(), stops, err, &stats));
  ASSERT_TRUE(stops.size() == 2);
  EXPECT_EQ(stops[0].name, std::string("Alpha"));
  EXPECT_EQ(stops[1].id, std::string("600029"));
  EXPECT_EQ(stops[1].lat, -27.47);
  EXPECT_EQ(stats.skippedInvalid, 1);

  WriteText(dir / "map.json", R"({"stops": {"X1": {"stop_lat": -27.1, "stop_lon": 153.2, "stop_name": "Ex"},
                                            "X2": {"lat": -27.2, "lon": 153.3}}})");
  ASSERT_TRUE(LoadStopsJson((dir / "map.json").string(), stops, err, &stats));
  ASSERT_TRUE(stops.size() == 2);
  EXPECT_EQ(stops[0].id, std::string("X1"));
  EXPECT_EQ(stops[0].name, std::string("Ex"));
  EXPECT_EQ(stops[1].lon, 153.3);

  WriteText(dir / "stops.geojson",
            R"({"type": "FeatureCollection", "features": [
                 {"type": "Feature", "properties": {"stop_id": "G1"}, "geometry": {"type": "Point", "coordinates": [153.0, -27.3]}},
                 {"type": "Feature", "id": "G2", "properties": {}, "geometry": {"type": "Point", "coordinates": [153.1]}}]})");
  ASSERT_TRUE(LoadStopsFile((dir / "stops.geojson").string(), stops, err, &stats));
  ASSERT_TRUE(stops.size() == 1);
  EXPECT_EQ(stops[0].id, std::string("G1"));
  EXPECT_EQ(stops[0].lat, -27.3);
  EXPECT_EQ(stops[0].lon, 153.0);
  EXPECT_EQ(stats.skippedInvalid, 1);

  WriteText(dir / "stops.txt", "stop_id,stop_lat,stop_lon\nT1,-27.0,153.0\n");
  ASSERT_TRUE(LoadStopsFile((dir / "stops.txt").string(), stops, err));
  ASSERT_TRUE(stops.size() == 1);
  EXPECT_EQ(stops[0].id, std::string("T1"));

  WriteText(dir / "wrong.json", R"({"routes": []})");
  EXPECT_FALSE(LoadStopsFile((dir / "wrong.json").string(), stops, err));
  EXPECT_FALSE(LoadStopsFile((dir / "nope.txt").string(), stops, err));

  std::error_code ec;
  fs::remove_all(dir, ec);
}

HeatGrid SmallGrid(bool withStop)
{
  std::vector<StopPoint> stops;
  if (withStop) stops.push_back(MakeStop("A", -27.4698, 153.0251));
  const StopIndex idx(stops);

  AccessibilityConfig cfg{};
  cfg.heatGridSize = 3;
  cfg.heatRadiusMeters = 1500.0;
  return RasterizeHeatGrid(idx, {-27.4698, 153.0251}, cfg);
}

void TestHeatPpm()
{
  const fs::path dir = MakeTempDir("stopgrid_ppm");
  const HeatGrid grid = SmallGrid(true);
  ASSERT_TRUE(grid.size == 3);

  const PpmImage img = RenderHeatGridPpm(grid);
  ASSERT_TRUE(img.width == 3 && img.height == 3);

  // North-up: image row 0 is the northernmost grid row.
  for (int y = 0; y < 3; ++y) {
    for (int x = 0; x < 3; ++x) {
      const Rgb8 c = grid.at(2 - y, x).color;
      const std::size_t idx = (static_cast<std::size_t>(y) * 3u + static_cast<std::size_t>(x)) * 3u;
      EXPECT_EQ(img.rgb[idx + 0], c.r);
      EXPECT_EQ(img.rgb[idx + 1], c.g);
      EXPECT_EQ(img.rgb[idx + 2], c.b);
    }
  }

  const PpmImage big = ScaleNearest(img, 4);
  EXPECT_EQ(big.width, 12);
  EXPECT_EQ(big.height, 12);
  EXPECT_EQ(big.rgb[(5u * 12u + 7u) * 3u], img.rgb[(1u * 3u + 1u) * 3u]);

  std::string err;
  const fs::path path = dir / "heat.ppm";
  ASSERT_TRUE(WritePpm(path.string(), big, err));

  PpmImage back{};
  ASSERT_TRUE(ReadPpm(path.string(), back, err));
  EXPECT_EQ(back.width, 12);
  EXPECT_TRUE(back.rgb == big.rgb);

  EXPECT_FALSE(WritePpm((dir / "empty.ppm").string(), PpmImage{}, err));

  std::error_code ec;
  fs::remove_all(dir, ec);
}

void TestHeatGeoJsonAndCsv()
{
  const fs::path dir = MakeTempDir("stopgrid_heat");
  std::string err;

  {
    const HeatGrid grid = SmallGrid(true);
    const fs::path path = dir / "heat.geojson";
    ASSERT_TRUE(WriteHeatGridGeoJson(path.string(), grid, err));

    JsonValue root;
    ASSERT_TRUE(ReadJsonFile(path.string(), root, err));
    EXPECT_EQ(FindJsonMember(root, "type")->stringValue, std::string("FeatureCollection"));
    const JsonValue* features = FindJsonMember(root, "features");
    ASSERT_TRUE(features && features->arrayValue.size() == 9);

    const JsonValue& f0 = features->arrayValue[0];
    const JsonValue* geom = FindJsonMember(f0, "geometry");
    ASSERT_TRUE(geom);
    EXPECT_EQ(FindJsonMember(*geom, "type")->stringValue, std::string("Polygon"));
    const JsonValue& ring = FindJsonMember(*geom, "coordinates")->arrayValue[0];
    ASSERT_TRUE(ring.arrayValue.size() == 5);
    // [lon, lat] order, closed ring.
    EXPECT_NEAR(ring.arrayValue[0].arrayValue[0].numberValue, grid.at(0, 0).west, 1e-9);
    EXPECT_NEAR(ring.arrayValue[0].arrayValue[1].numberValue, grid.at(0, 0).south, 1e-9);
    EXPECT_NEAR(ring.arrayValue[4].arrayValue[0].numberValue, ring.arrayValue[0].arrayValue[0].numberValue, 0.0);

    const JsonValue* props = FindJsonMember(f0, "properties");
    ASSERT_TRUE(props);
    EXPECT_EQ(FindJsonMember(*props, "fill")->stringValue, CssRgb(grid.at(0, 0).color));
    EXPECT_NEAR(FindJsonMember(*props, "fill_opacity")->numberValue, 0.28, 1e-12);
    EXPECT_NEAR(FindJsonMember(*props, "meters")->numberValue, *grid.at(0, 0).nearestMeters, 1e-6);
  }

  {
    const HeatGrid grid = SmallGrid(false);
    const fs::path gj = dir / "empty.geojson";
    ASSERT_TRUE(WriteHeatGridGeoJson(gj.string(), grid, err));
    JsonValue root;
    ASSERT_TRUE(ReadJsonFile(gj.string(), root, err));
    const JsonValue& props = *FindJsonMember(FindJsonMember(root, "features")->arrayValue[4], "properties");
    EXPECT_TRUE(FindJsonMember(props, "meters")->isNull());
    EXPECT_EQ(FindJsonMember(props, "fill")->stringValue, std::string("rgb(220,40,40)"));
    EXPECT_EQ(FindJsonMember(root, "unresolved_cells")->numberValue, 9.0);

    const fs::path csv = dir / "heat.csv";
    ASSERT_TRUE(WriteHeatGridCsv(csv.string(), grid, err));
    const std::vector<std::string> lines = ReadLines(csv);
    ASSERT_TRUE(lines.size() == 10);
    EXPECT_EQ(lines[0], std::string("row,col,center_lat,center_lon,meters,r,g,b"));
    EXPECT_TRUE(lines[1].rfind("0,0,", 0) == 0);
    EXPECT_TRUE(lines[1].find(",,220,40,40") != std::string::npos);
    EXPECT_TRUE(lines[9].rfind("2,2,", 0) == 0);
  }

  EXPECT_EQ(CssRgb(Rgb8{1, 2, 3}), std::string("rgb(1,2,3)"));

  std::error_code ec;
  fs::remove_all(dir, ec);
}

void TestReportJson()
{
  const fs::path dir = MakeTempDir("stopgrid_report");

  std::vector<StopPoint> stops;
  stops.push_back(MakeStop("A", -27.4698, 153.0251));
  stops.push_back(MakeStop("B", -27.4700, 153.0260));
  const StopIndex idx(stops);

  AccessibilityReport r{};
  r.inputPath = "stops.txt";
  r.stopsLoaded = 2;
  r.stopsIndexed = static_cast<int>(idx.size());
  r.cells = static_cast<int>(idx.cellCount());
  r.summary = ComputeAccessibilitySummary(idx, {-27.4698, 153.0251}, r.config.accessibility);

  std::string err;
  const fs::path path = dir / "out" / "report.json";
  fs::create_directories(path.parent_path());
  ASSERT_TRUE(WriteAccessibilityReportJson(path.string(), r, err));

  JsonValue root;
  ASSERT_TRUE(ReadJsonFile(path.string(), root, err));
  EXPECT_EQ(FindJsonMember(root, "file")->stringValue, std::string("stops.txt"));
  EXPECT_EQ(FindJsonMember(root, "stops_indexed")->numberValue, 2.0);

  const JsonValue* cfg = FindJsonMember(root, "config");
  ASSERT_TRUE(cfg);
  EXPECT_EQ(FindJsonMember(*FindJsonMember(*cfg, "index"), "max_rings")->numberValue, 24.0);

  const JsonValue* s = FindJsonMember(root, "summary");
  ASSERT_TRUE(s);
  EXPECT_NEAR(FindJsonMember(*s, "nearest_stop_meters")->numberValue, 0.0, 1e-6);
  EXPECT_FALSE(FindJsonMember(*s, "search_bound_exceeded")->boolValue);
  const JsonValue* within = FindJsonMember(*s, "within");
  ASSERT_TRUE(within && within->arrayValue.size() == 3);
  EXPECT_EQ(FindJsonMember(within->arrayValue[0], "count")->numberValue, 2.0);
  const JsonValue* nearest = FindJsonMember(*s, "nearest");
  ASSERT_TRUE(nearest && nearest->arrayValue.size() == 2);
  EXPECT_EQ(FindJsonMember(nearest->arrayValue[1], "id")->stringValue, std::string("B"));

  std::error_code ec;
  fs::remove_all(dir, ec);
}

void TestLogTee()
{
  const fs::path dir = MakeTempDir("stopgrid_log");
  const fs::path path = dir / "logs" / "run.log";

  LogTeeOptions opt{};
  opt.path = path;
  opt.keepFiles = 2;
  opt.mirrorStdout = false;

  std::string err;
  {
    LogTee log;
    ASSERT_TRUE(log.start(opt, err));
    EXPECT_TRUE(log.active());
    std::cout << "first run\n" << std::flush;
  }

  const std::vector<std::string> lines = ReadLines(path);
  ASSERT_TRUE(lines.size() == 1);
  // 2026-03-02T08:15:00.123Z [OUT] first run
  EXPECT_EQ(lines[0].size(), std::string("YYYY-MM-DDTHH:MM:SS.mmmZ [OUT] first run").size());
  EXPECT_EQ(lines[0][10], 'T');
  EXPECT_EQ(lines[0][23], 'Z');
  EXPECT_TRUE(lines[0].find(" [OUT] first run") != std::string::npos);

  {
    LogTee log;
    ASSERT_TRUE(log.start(opt, err));
    std::cout << "second " << "run" << std::endl;
    log.stop();
    EXPECT_FALSE(log.active());
  }

  // The previous log was rotated aside.
  EXPECT_TRUE(fs::exists(dir / "logs" / "run.log.1"));
  EXPECT_TRUE(ReadText(dir / "logs" / "run.log.1").find("first run") != std::string::npos);
  EXPECT_TRUE(ReadText(path).find("[OUT] second run") != std::string::npos);

  // Stderr lines are tagged separately (and still reach the console).
  {
    LogTee log;
    opt.teeStdout = false;
    ASSERT_TRUE(log.start(opt, err));
    std::cerr << "stopgrid log tee self-test (expected)\n";
  }
  EXPECT_TRUE(ReadText(path).find("[ERR] stopgrid log tee self-test") != std::string::npos);
  EXPECT_TRUE(fs::exists(dir / "logs" / "run.log.2"));

  LogTee none;
  LogTeeOptions emptyPath{};
  EXPECT_FALSE(none.start(emptyPath, err));
  EXPECT_FALSE(none.active());

  std::error_code ec;
  fs::remove_all(dir, ec);
}

} // namespace

int main()
{
  TestJsonParse();
  TestJsonWrite();
  TestConfigJson();
  TestStopsCsv();
  TestStopsJsonAndDispatch();
  TestHeatPpm();
  TestHeatGeoJsonAndCsv();
  TestReportJson();
  TestLogTee();

  if (g_failures == 0) {
    std::cout << "stopgrid_io_tests: OK\n";
    return 0;
  }

  std::cerr << "stopgrid_io_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
