#include "stopgrid/Projection.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace stopgrid {

namespace {

constexpr double kDegToRad = std::numbers::pi / 180.0;

} // namespace

PlanarXY ProjectMercatorMeters(double latDeg, double lonDeg)
{
  const double lat = std::clamp(latDeg, -kMaxProjectedLatDeg, kMaxProjectedLatDeg);

  PlanarXY out{};
  out.x = kEarthRadiusMeters * lonDeg * kDegToRad;
  out.y = kEarthRadiusMeters * std::log(std::tan(std::numbers::pi / 4.0 + (lat * kDegToRad) / 2.0));
  return out;
}

double PlanarDistanceMeters(const LatLon& a, const LatLon& b)
{
  const PlanarXY pa = ProjectMercatorMeters(a);
  const PlanarXY pb = ProjectMercatorMeters(b);
  return std::hypot(pa.x - pb.x, pa.y - pb.y);
}

LatLon ClampLatLon(const LatLon& p)
{
  LatLon out = p;
  if (std::isfinite(out.lat)) out.lat = std::clamp(out.lat, -90.0, 90.0);
  if (std::isfinite(out.lon)) out.lon = std::clamp(out.lon, -180.0, 180.0);
  return out;
}

bool IsFiniteLatLon(const LatLon& p)
{
  return std::isfinite(p.lat) && std::isfinite(p.lon);
}

double MetersToLatDegrees(double meters)
{
  return meters / kMetersPerDegreeLat;
}

double MetersToLonDegrees(double meters, double atLatDeg)
{
  const double cosLat = std::max(kMinLonScale, std::cos(atLatDeg * kDegToRad));
  return meters / (kMetersPerDegreeLat * cosLat);
}

} // namespace stopgrid
