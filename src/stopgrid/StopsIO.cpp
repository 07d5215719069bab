#include "stopgrid/StopsIO.hpp"

#include "stopgrid/Json.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <system_error>
#include <unordered_set>
#include <utility>

namespace stopgrid {

namespace {

bool ReadFileText(const std::string& path, std::string& out)
{
  std::ifstream f(path, std::ios::binary);
  if (!f) return false;
  std::ostringstream oss;
  oss << f.rdbuf();
  out = oss.str();
  return true;
}

void StripBom(std::string& s)
{
  if (s.size() >= 3 && static_cast<unsigned char>(s[0]) == 0xEF && static_cast<unsigned char>(s[1]) == 0xBB &&
      static_cast<unsigned char>(s[2]) == 0xBF) {
    s.erase(0, 3);
  }
}

std::string Trim(const std::string& s)
{
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b])) != 0) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])) != 0) --e;
  return s.substr(b, e - b);
}

std::string ToLower(std::string s)
{
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

bool ParseCoord(const std::string& field, double& out)
{
  const std::string t = Trim(field);
  if (t.empty()) return false;

  const char* first = t.data();
  const char* last = t.data() + t.size();
  if (*first == '+') ++first;

  double v = 0.0;
  const auto res = std::from_chars(first, last, v);
  if (res.ec != std::errc() || res.ptr != last) return false;
  if (!std::isfinite(v)) return false;
  out = v;
  return true;
}

// Next CSV record starting at `pos`. Quoted fields may span lines.
bool NextCsvRecord(const std::string& text, std::size_t& pos, std::vector<std::string>& out)
{
  out.clear();
  if (pos >= text.size()) return false;

  std::string field;
  bool inQuotes = false;
  while (pos < text.size()) {
    const char c = text[pos++];
    if (inQuotes) {
      if (c == '"') {
        if (pos < text.size() && text[pos] == '"') {
          field.push_back('"');
          ++pos;
        } else {
          inQuotes = false;
        }
      } else {
        field.push_back(c);
      }
      continue;
    }

    if (c == '"') {
      inQuotes = true;
    } else if (c == ',') {
      out.push_back(std::move(field));
      field.clear();
    } else if (c == '\n') {
      break;
    } else if (c == '\r') {
      if (pos < text.size() && text[pos] == '\n') ++pos;
      break;
    } else {
      field.push_back(c);
    }
  }
  out.push_back(std::move(field));
  return true;
}

bool IsBlankRecord(const std::vector<std::string>& rec)
{
  return rec.size() == 1 && Trim(rec[0]).empty();
}

int FindColumn(const std::vector<std::string>& header, const char* name)
{
  for (std::size_t i = 0; i < header.size(); ++i) {
    if (ToLower(Trim(header[i])) == name) return static_cast<int>(i);
  }
  return -1;
}

// First present key wins.
const JsonValue* FindAnyMember(const JsonValue& obj, std::initializer_list<const char*> keys)
{
  for (const char* k : keys) {
    if (const JsonValue* v = FindJsonMember(obj, k)) return v;
  }
  return nullptr;
}

bool JsonToCoord(const JsonValue* v, double& out)
{
  if (!v) return false;
  if (v->isNumber()) {
    if (!std::isfinite(v->numberValue)) return false;
    out = v->numberValue;
    return true;
  }
  if (v->isString()) return ParseCoord(v->stringValue, out);
  return false;
}

std::string JsonToText(const JsonValue* v)
{
  if (!v) return {};
  if (v->isString()) return v->stringValue;
  if (v->isNumber()) return JsonStringify(*v, JsonWriteOptions{false, 0, false});
  return {};
}

class StopCollector {
public:
  StopCollector(std::vector<StopPoint>& out, StopsLoadStats& stats) : m_out(out), m_stats(stats) {}

  void add(std::string id, std::string name, bool latOk, double lat, bool lonOk, double lon)
  {
    ++m_stats.rows;
    id = Trim(id);
    if (id.empty() || !latOk || !lonOk) {
      ++m_stats.skippedInvalid;
      return;
    }
    if (!m_seen.insert(id).second) {
      ++m_stats.duplicateIds;
      return;
    }

    StopPoint p{};
    p.id = std::move(id);
    p.name = Trim(name);
    p.lat = lat;
    p.lon = lon;
    m_out.push_back(std::move(p));
    ++m_stats.accepted;
  }

private:
  std::vector<StopPoint>& m_out;
  StopsLoadStats& m_stats;
  std::unordered_set<std::string> m_seen;
};

void AddJsonStop(StopCollector& sink, const JsonValue& obj, const std::string* keyId)
{
  if (!obj.isObject()) {
    sink.add({}, {}, false, 0.0, false, 0.0);
    return;
  }

  std::string id = JsonToText(FindAnyMember(obj, {"id", "stop_id"}));
  if (id.empty() && keyId) id = *keyId;
  const std::string name = JsonToText(FindAnyMember(obj, {"name", "stop_name"}));

  double lat = 0.0;
  double lon = 0.0;
  const bool latOk = JsonToCoord(FindAnyMember(obj, {"lat", "stop_lat", "latitude"}), lat);
  const bool lonOk = JsonToCoord(FindAnyMember(obj, {"lon", "stop_lon", "lng", "longitude"}), lon);
  sink.add(std::move(id), name, latOk, lat, lonOk, lon);
}

// GeoJSON Point feature: id from properties (or the feature id), coordinates [lon, lat].
void AddGeoJsonFeature(StopCollector& sink, const JsonValue& feature)
{
  const JsonValue* props = FindJsonMember(feature, "properties");
  const JsonValue* geom = FindJsonMember(feature, "geometry");
  const JsonValue* coords = geom ? FindJsonMember(*geom, "coordinates") : nullptr;

  std::string id;
  std::string name;
  if (props && props->isObject()) {
    id = JsonToText(FindAnyMember(*props, {"id", "stop_id"}));
    name = JsonToText(FindAnyMember(*props, {"name", "stop_name"}));
  }
  if (id.empty()) id = JsonToText(FindJsonMember(feature, "id"));

  double lat = 0.0;
  double lon = 0.0;
  bool ok = coords && coords->isArray() && coords->arrayValue.size() >= 2;
  if (ok) {
    ok = JsonToCoord(&coords->arrayValue[0], lon) && JsonToCoord(&coords->arrayValue[1], lat);
  }
  sink.add(std::move(id), name, ok, lat, ok, lon);
}

bool HasExtension(const std::string& path, const char* ext)
{
  const std::string lower = ToLower(path);
  const std::string e(ext);
  return lower.size() >= e.size() && lower.compare(lower.size() - e.size(), e.size(), e) == 0;
}

} // namespace

std::vector<std::string> SplitCsvRecord(const std::string& line)
{
  std::vector<std::string> out;
  std::size_t pos = 0;
  if (!NextCsvRecord(line, pos, out)) out.emplace_back();
  return out;
}

bool ParseStopsCsvText(const std::string& text, std::vector<StopPoint>& outStops, std::string& outError,
                       StopsLoadStats* outStats)
{
  std::string body = text;
  StripBom(body);

  std::size_t pos = 0;
  std::vector<std::string> header;
  do {
    if (!NextCsvRecord(body, pos, header)) {
      outError = "missing CSV header row";
      return false;
    }
  } while (IsBlankRecord(header));

  const int colId = FindColumn(header, "stop_id");
  const int colName = FindColumn(header, "stop_name");
  const int colLat = FindColumn(header, "stop_lat");
  const int colLon = FindColumn(header, "stop_lon");
  if (colId < 0 || colLat < 0 || colLon < 0) {
    outError = "CSV header must contain stop_id, stop_lat and stop_lon";
    return false;
  }

  std::vector<StopPoint> stops;
  StopsLoadStats stats{};
  StopCollector sink(stops, stats);

  auto field = [](const std::vector<std::string>& rec, int col) -> std::string {
    if (col < 0 || static_cast<std::size_t>(col) >= rec.size()) return {};
    return rec[static_cast<std::size_t>(col)];
  };

  std::vector<std::string> rec;
  while (NextCsvRecord(body, pos, rec)) {
    if (IsBlankRecord(rec)) continue;

    double lat = 0.0;
    double lon = 0.0;
    const bool latOk = ParseCoord(field(rec, colLat), lat);
    const bool lonOk = ParseCoord(field(rec, colLon), lon);
    sink.add(field(rec, colId), field(rec, colName), latOk, lat, lonOk, lon);
  }

  outStops = std::move(stops);
  if (outStats) *outStats = stats;
  outError.clear();
  return true;
}

bool LoadStopsCsv(const std::string& path, std::vector<StopPoint>& outStops, std::string& outError,
                  StopsLoadStats* outStats)
{
  std::string text;
  if (!ReadFileText(path, text)) {
    outError = "failed to read '" + path + "'";
    return false;
  }

  std::string err;
  if (!ParseStopsCsvText(text, outStops, err, outStats)) {
    outError = path + ": " + err;
    return false;
  }
  outError.clear();
  return true;
}

bool LoadStopsJson(const std::string& path, std::vector<StopPoint>& outStops, std::string& outError,
                   StopsLoadStats* outStats)
{
  JsonValue root;
  std::string err;
  if (!ReadJsonFile(path, root, err)) {
    outError = err;
    return false;
  }

  std::vector<StopPoint> stops;
  StopsLoadStats stats{};
  StopCollector sink(stops, stats);

  if (root.isArray()) {
    for (const JsonValue& v : root.arrayValue) AddJsonStop(sink, v, nullptr);
  } else if (root.isObject()) {
    const JsonValue* map = FindJsonMember(root, "stops");
    const JsonValue* features = FindJsonMember(root, "features");
    if (!map && features && features->isArray()) {
      for (const JsonValue& f : features->arrayValue) AddGeoJsonFeature(sink, f);
    } else if (!map) {
      outError = path + ": expected an array of stops, a 'stops' member or GeoJSON features";
      return false;
    } else if (map->isArray()) {
      for (const JsonValue& v : map->arrayValue) AddJsonStop(sink, v, nullptr);
    } else if (map->isObject()) {
      for (const auto& kv : map->objectValue) AddJsonStop(sink, kv.second, &kv.first);
    } else {
      outError = path + ": 'stops' must be an array or an object";
      return false;
    }
  } else {
    outError = path + ": stop list JSON must be an array or an object";
    return false;
  }

  outStops = std::move(stops);
  if (outStats) *outStats = stats;
  outError.clear();
  return true;
}

bool LoadStopsFile(const std::string& path, std::vector<StopPoint>& outStops, std::string& outError,
                   StopsLoadStats* outStats)
{
  if (HasExtension(path, ".json") || HasExtension(path, ".geojson")) {
    return LoadStopsJson(path, outStops, outError, outStats);
  }
  return LoadStopsCsv(path, outStops, outError, outStats);
}

} // namespace stopgrid
