#pragma once
#include <string>
#include <vector>

namespace core {

// Meters spanned by one degree of latitude (and of longitude at the equator).
constexpr double kMetersPerDegree = 111320.0;

struct Point2D {
  double x{0.0};
  double y{0.0};

  Point2D() = default;
  Point2D(double x_, double y_) : x(x_), y(y_) {}

  bool operator==(const Point2D& o) const { return x == o.x && y == o.y; }
};

struct Glyph {
  std::string id;
  double latitude{0.0};   // WGS84 degrees
  double longitude{0.0};  // WGS84 degrees

  Glyph() = default;
  Glyph(std::string id_, double lat_, double lon_) : id(std::move(id_)), latitude(lat_), longitude(lon_) {}
};

// Euclidean distance on raw coordinates (no meters correction).
double euclidean(const Point2D& a, const Point2D& b);

// (lat, lon) as a plain 2-vector.
inline Point2D toPoint(const Glyph& g) { return {g.latitude, g.longitude}; }

// Euclidean distance in meters using an equirectangular approximation at the
// mean latitude of the pair.
double metersDistance(const Glyph& a, const Glyph& b);

// Euclidean distance on raw (lat, lon) degrees.
double degreeDistance(const Glyph& a, const Glyph& b);

// True iff the two circles touch or overlap (meters, scaled radii).
bool isOverlapping(const Glyph& a, double radius_a, const Glyph& b, double radius_b, double radius_scale = 1.0);
inline bool isOverlapping(const Glyph& a, const Glyph& b, double radius, double radius_scale = 1.0) {
  return isOverlapping(a, radius, b, radius, radius_scale);
}

// Lens area of two circles. The center distance is taken in degree space while
// the radii are in meters; overlap ranking depends on this, keep it as is.
double intersectionArea(const Glyph& a, double radius_a, const Glyph& b, double radius_b);
inline double intersectionArea(const Glyph& a, const Glyph& b, double radius) {
  return intersectionArea(a, radius, b, radius);
}

// Lens area for a known center distance d.
double lensArea(double d, double r1, double r2);

} // namespace core
