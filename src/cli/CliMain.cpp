#include "cli/CliMain.hpp"
#include "cli/CliParse.hpp"

#include "stopgrid/AccessibilityService.hpp"
#include "stopgrid/ConfigIO.hpp"
#include "stopgrid/Export.hpp"
#include "stopgrid/LogTee.hpp"
#include "stopgrid/StopsIO.hpp"

#include <cstdint>
#include <exception>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace stopgrid {

namespace {

void PrintHelp()
{
  std::cout
      << "stopgrid_cli (transit stop proximity / accessibility report)\n\n"
      << "Usage:\n"
      << "  stopgrid_cli <stops.txt|stops.json> --at <lat,lon> [options]\n"
      << "  stopgrid_cli --write-config <out.json> [config options]\n\n"
      << "Options:\n"
      << "  --at <lat,lon>             Query location in degrees.\n"
      << "  --config <cfg.json>        Load index/accessibility config (missing keys keep defaults).\n"
      << "  --write-config <out.json>  Write the effective config and continue.\n"
      << "  --cell-size <m>            Grid cell size in meters (default: 900).\n"
      << "  --max-rings <N>            Ring cap for nearest searches (default: 24).\n"
      << "  --k <N>                    Nearest stops to list (default: 5).\n"
      << "  --radii <a,b,...>          Count radii in meters (default: 500,1000,2000).\n"
      << "  --heat-radius <m>          Heat grid half-extent in meters (default: 3000).\n"
      << "  --heat-grid <N>            Heat grid cells per side (default: 42).\n"
      << "  --heat-ppm <out.ppm>       Write the heat grid as a PPM image (north-up).\n"
      << "  --heat-scale <N>           Nearest-neighbor upscale for --heat-ppm (default: 8).\n"
      << "  --heat-geojson <out>       Write the heat grid as GeoJSON polygons.\n"
      << "  --heat-csv <out.csv>       Write the heat grid as CSV.\n"
      << "  --json <out.json>          Write a JSON report.\n"
      << "  --log <file>               Copy console output to a timestamped log file.\n"
      << "  --quiet                    Suppress stdout summary (errors still print).\n"
      << "  -h, --help                 Show this help.\n";
}

struct CliArgs {
  std::string inPath;
  std::optional<LatLon> at;

  std::string configPath;
  std::string writeConfigPath;

  std::optional<double> cellSize;
  std::optional<int> maxRings;
  std::optional<int> k;
  std::optional<std::vector<double>> radii;
  std::optional<double> heatRadius;
  std::optional<int> heatGrid;

  std::string heatPpm;
  int heatScale = 8;
  std::string heatGeoJson;
  std::string heatCsv;
  std::string jsonPath;
  std::string logPath;
  bool quiet = false;
  bool help = false;

  bool wantsHeatGrid() const { return !heatPpm.empty() || !heatGeoJson.empty() || !heatCsv.empty(); }
};

// Returns false on a usage error (message already printed).
bool ParseArgs(int argc, char** argv, CliArgs& a)
{
  auto needValue = [&](int& i, const std::string& flag) -> const char* {
    if (i + 1 >= argc) {
      std::cerr << "Missing value for " << flag << "\n";
      return nullptr;
    }
    return argv[++i];
  };
  auto bad = [](const std::string& flag, const char* what) {
    std::cerr << "Invalid " << flag << " value (expected " << what << ")\n";
    return false;
  };

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i] ? std::string(argv[i]) : std::string();

    if (arg == "-h" || arg == "--help") {
      a.help = true;
      return true;
    }
    if (arg == "--quiet") {
      a.quiet = true;
      continue;
    }

    if (arg.size() > 2 && arg[0] == '-' && arg[1] == '-') {
      const char* v = needValue(i, arg);
      if (!v) return false;

      if (arg == "--at") {
        double lat = 0.0;
        double lon = 0.0;
        if (!cli::ParseLatLon(v, &lat, &lon)) return bad(arg, "lat,lon within [-90,90],[-180,180]");
        a.at = LatLon{lat, lon};
      } else if (arg == "--config") {
        a.configPath = v;
      } else if (arg == "--write-config") {
        a.writeConfigPath = v;
      } else if (arg == "--cell-size") {
        double d = 0.0;
        if (!cli::ParseF64(v, &d) || d <= 0.0) return bad(arg, "positive meters");
        a.cellSize = d;
      } else if (arg == "--max-rings") {
        int n = 0;
        if (!cli::ParseI32(v, &n) || n < 0) return bad(arg, "integer >= 0");
        a.maxRings = n;
      } else if (arg == "--k") {
        int n = 0;
        if (!cli::ParseI32(v, &n) || n < 0) return bad(arg, "integer >= 0");
        a.k = n;
      } else if (arg == "--radii") {
        std::vector<double> r;
        if (!cli::ParseF64List(v, &r)) return bad(arg, "comma separated meters");
        a.radii = std::move(r);
      } else if (arg == "--heat-radius") {
        double d = 0.0;
        if (!cli::ParseF64(v, &d) || d <= 0.0) return bad(arg, "positive meters");
        a.heatRadius = d;
      } else if (arg == "--heat-grid") {
        int n = 0;
        if (!cli::ParseI32(v, &n) || n < 1 || n > kMaxHeatGridSize) return bad(arg, "integer in [1,512]");
        a.heatGrid = n;
      } else if (arg == "--heat-ppm") {
        a.heatPpm = v;
      } else if (arg == "--heat-scale") {
        if (!cli::ParseI32(v, &a.heatScale) || a.heatScale < 1 || a.heatScale > 64) {
          return bad(arg, "integer in [1,64]");
        }
      } else if (arg == "--heat-geojson") {
        a.heatGeoJson = v;
      } else if (arg == "--heat-csv") {
        a.heatCsv = v;
      } else if (arg == "--json") {
        a.jsonPath = v;
      } else if (arg == "--log") {
        a.logPath = v;
      } else {
        std::cerr << "Unknown option: " << arg << "\n";
        return false;
      }
      continue;
    }

    if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Unknown option: " << arg << "\n";
      return false;
    }
    if (!a.inPath.empty()) {
      std::cerr << "Unexpected extra argument: " << arg << "\n";
      return false;
    }
    a.inPath = arg;
  }
  return true;
}

void ApplyOverrides(const CliArgs& a, StopGridConfig& cfg)
{
  if (a.cellSize) cfg.index.cellSizeMeters = *a.cellSize;
  if (a.maxRings) cfg.index.maxRings = *a.maxRings;
  if (a.k) cfg.accessibility.kNearest = *a.k;
  if (a.radii) cfg.accessibility.radiiMeters = *a.radii;
  if (a.heatRadius) cfg.accessibility.heatRadiusMeters = *a.heatRadius;
  if (a.heatGrid) cfg.accessibility.heatGridSize = *a.heatGrid;
}

bool PrepareOutput(const std::string& path, std::string& err)
{
  if (cli::EnsureParentDir(path)) return true;
  err = "cannot create parent directory for '" + path + "'";
  return false;
}

std::string FormatMeters(const std::optional<double>& m)
{
  if (!m) return "none";
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(1) << *m << " m";
  return oss.str();
}

void PrintSummary(const AccessibilitySummary& s, const StopsLoadStats& load, const StopIndex& index,
                  std::uint64_t hash)
{
  std::cout << "StopGrid accessibility summary\n";
  std::cout << "- stops: " << load.accepted << " loaded, " << index.size() << " indexed in " << index.cellCount()
            << " cells (snapshot " << cli::HexU64(hash) << ")\n";
  std::cout << "- at: " << std::fixed << std::setprecision(6) << s.at.lat << "," << s.at.lon << "\n";
  std::cout << "- nearest stop: " << FormatMeters(s.nearestStopMeters) << "\n";
  for (const RadiusCount& rc : s.within) {
    std::cout << "- within " << std::setprecision(0) << rc.radiusMeters << " m: " << rc.count << "\n";
  }
  if (!s.nearest.empty()) {
    std::cout << "- nearest " << s.nearest.size() << ":\n";
    for (const StopDistance& d : s.nearest) {
      std::cout << "  - " << d.id << ": " << FormatMeters(d.meters) << "\n";
    }
  }
  std::cout << std::defaultfloat << std::setprecision(6);
}

int Run(const CliArgs& a)
{
  StopGridConfig cfg{};
  std::string err;

  if (!a.configPath.empty() && !LoadStopGridConfigJsonFile(a.configPath, cfg, err)) {
    std::cerr << "Failed to load config: " << err << "\n";
    return 1;
  }
  ApplyOverrides(a, cfg);
  cfg.index = SanitizeStopIndexConfig(cfg.index);
  cfg.accessibility = SanitizeAccessibilityConfig(cfg.accessibility);

  if (!a.writeConfigPath.empty()) {
    if (!PrepareOutput(a.writeConfigPath, err) || !WriteStopGridConfigJsonFile(a.writeConfigPath, cfg, err)) {
      std::cerr << "Failed to write config: " << err << "\n";
      return 1;
    }
    if (a.inPath.empty()) return 0;
  }

  if (a.inPath.empty() || !a.at) {
    std::cerr << (a.inPath.empty() ? "Missing stops file\n" : "Missing --at <lat,lon>\n");
    PrintHelp();
    return 2;
  }

  std::vector<StopPoint> stops;
  StopsLoadStats load{};
  if (!LoadStopsFile(a.inPath, stops, err, &load)) {
    std::cerr << "Failed to load stops: " << err << "\n";
    return 1;
  }
  if (load.skippedInvalid > 0 || load.duplicateIds > 0) {
    std::cerr << "warning: " << a.inPath << ": skipped " << load.skippedInvalid << " invalid rows, "
              << load.duplicateIds << " duplicate ids\n";
  }

  AccessibilityService service(cfg.index, cfg.accessibility);
  try {
    service.updateStops(std::move(stops));
  } catch (const std::exception& e) {
    std::cerr << "Failed to build stop index: " << e.what() << "\n";
    return 1;
  }
  const StopIndexSnapshot snap = service.snapshot();
  if (!snap.index) {
    std::cerr << "Failed to build stop index\n";
    return 1;
  }

  const AccessibilitySummary summary = service.summarize(*a.at);
  if (summary.searchBoundExceeded) {
    std::cerr << "warning: search bound exceeded (" << cfg.index.maxRings << " rings of " << cfg.index.cellSizeMeters
              << " m); results only cover stops within the cap\n";
  }

  if (!a.quiet || !a.logPath.empty()) PrintSummary(summary, load, *snap.index, snap.hash);

  if (a.wantsHeatGrid()) {
    const HeatGrid grid = service.heatGrid(*a.at);
    if (grid.unresolvedCells > 0) {
      std::cerr << "warning: " << grid.unresolvedCells << " heat cells had no stop within the search bound\n";
    }

    if (!a.heatPpm.empty()) {
      const PpmImage img = ScaleNearest(RenderHeatGridPpm(grid), a.heatScale);
      if (!PrepareOutput(a.heatPpm, err) || !WritePpm(a.heatPpm, img, err)) {
        std::cerr << "Failed to write heat PPM: " << err << "\n";
        return 1;
      }
    }
    if (!a.heatGeoJson.empty()) {
      if (!PrepareOutput(a.heatGeoJson, err) || !WriteHeatGridGeoJson(a.heatGeoJson, grid, err)) {
        std::cerr << "Failed to write heat GeoJSON: " << err << "\n";
        return 1;
      }
    }
    if (!a.heatCsv.empty()) {
      if (!PrepareOutput(a.heatCsv, err) || !WriteHeatGridCsv(a.heatCsv, grid, err)) {
        std::cerr << "Failed to write heat CSV: " << err << "\n";
        return 1;
      }
    }
  }

  if (!a.jsonPath.empty()) {
    AccessibilityReport report{};
    report.inputPath = a.inPath;
    report.stopsLoaded = load.accepted;
    report.stopsIndexed = static_cast<int>(snap.index->size());
    report.cells = static_cast<int>(snap.index->cellCount());
    report.config = cfg;
    report.summary = summary;
    if (!PrepareOutput(a.jsonPath, err) || !WriteAccessibilityReportJson(a.jsonPath, report, err)) {
      std::cerr << "Failed to write JSON report: " << err << "\n";
      return 1;
    }
  }

  return 0;
}

} // namespace

int StopGridCliMain(int argc, char** argv)
{
  CliArgs args{};
  if (!ParseArgs(argc, argv, args)) return 2;
  if (args.help) {
    PrintHelp();
    return 0;
  }

  LogTee log;
  if (!args.logPath.empty()) {
    LogTeeOptions opt{};
    opt.path = args.logPath;
    opt.mirrorStdout = !args.quiet;
    std::string err;
    if (!log.start(opt, err)) {
      std::cerr << "Failed to start log: " << err << "\n";
      return 1;
    }
  }

  return Run(args);
}

} // namespace stopgrid
