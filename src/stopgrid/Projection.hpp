#pragma once

namespace stopgrid {

// -----------------------------------------------------------------------------
// Planar projection for proximity comparisons
//
// Geographic coordinates are mapped onto a spherical Web-Mercator plane in
// meters:
//
//   x = R * lon_rad
//   y = R * ln(tan(pi/4 + lat_rad/2))
//
// This is an approximation, not geodesic truth. Mercator inflates lengths by
// 1/cos(lat), so absolute distances are overstated away from the equator
// (about +13% at 27 degrees). The inflation is locally uniform, which keeps
// nearest-neighbour *ordering* stable at city scale (tens of km), and that is
// the only thing the index relies on.
//
// Latitude is clamped to [-85, 85] before the transform to stay clear of the
// pole singularity. Results outside that band are not meaningful.
// -----------------------------------------------------------------------------

inline constexpr double kEarthRadiusMeters = 6378137.0;
inline constexpr double kMaxProjectedLatDeg = 85.0;

// Equirectangular window helpers (used for heat-grid extents, not distances).
inline constexpr double kMetersPerDegreeLat = 111320.0;
inline constexpr double kMinLonScale = 0.15;

struct LatLon {
  double lat = 0.0;
  double lon = 0.0;
};

struct PlanarXY {
  double x = 0.0;
  double y = 0.0;
};

// Project degrees onto the Mercator plane (meters). Pure and deterministic.
PlanarXY ProjectMercatorMeters(double latDeg, double lonDeg);

inline PlanarXY ProjectMercatorMeters(const LatLon& p) { return ProjectMercatorMeters(p.lat, p.lon); }

// Euclidean distance between two points on the projection plane.
double PlanarDistanceMeters(const LatLon& a, const LatLon& b);

// Clamp a coordinate into the valid geographic range ([-90,90] x [-180,180]).
// Non-finite components are returned unchanged; callers check IsFiniteLatLon.
LatLon ClampLatLon(const LatLon& p);

bool IsFiniteLatLon(const LatLon& p);

// Convert a north/south extent in meters to degrees of latitude.
double MetersToLatDegrees(double meters);

// Convert an east/west extent in meters to degrees of longitude at `atLatDeg`.
// The cos(lat) scale is floored at kMinLonScale to avoid blow-up near the poles.
double MetersToLonDegrees(double meters, double atLatDeg);

} // namespace stopgrid
