#include "geometry.h"
#include <algorithm>
#include <cmath>

namespace core {

namespace {
  inline double deg2rad(double deg) {
    return deg * (M_PI / 180.0);
  }

  inline double clampUnit(double v) {
    return std::max(-1.0, std::min(1.0, v));
  }
}

double euclidean(const Point2D& a, const Point2D& b) {
  const double dx = a.x - b.x;
  const double dy = a.y - b.y;
  return std::sqrt(dx * dx + dy * dy);
}

double metersDistance(const Glyph& a, const Glyph& b) {
  const double lat_diff = (a.latitude - b.latitude) * kMetersPerDegree;
  const double lon_diff = (a.longitude - b.longitude) * kMetersPerDegree *
                          std::cos(deg2rad((a.latitude + b.latitude) / 2.0));
  return std::sqrt(lat_diff * lat_diff + lon_diff * lon_diff);
}

double degreeDistance(const Glyph& a, const Glyph& b) {
  const double dlat = a.latitude - b.latitude;
  const double dlon = a.longitude - b.longitude;
  return std::sqrt(dlat * dlat + dlon * dlon);
}

bool isOverlapping(const Glyph& a, double radius_a, const Glyph& b, double radius_b, double radius_scale) {
  return metersDistance(a, b) <= (radius_a + radius_b) * radius_scale;
}

double lensArea(double d, double r1, double r2) {
  if (d >= r1 + r2) return 0.0;
  if (d <= std::abs(r1 - r2)) {
    const double r = std::min(r1, r2);
    return M_PI * r * r;
  }

  const double part1 = r1 * r1 * std::acos(clampUnit((d * d + r1 * r1 - r2 * r2) / (2.0 * d * r1)));
  const double part2 = r2 * r2 * std::acos(clampUnit((d * d + r2 * r2 - r1 * r1) / (2.0 * d * r2)));
  const double heron = (-d + r1 + r2) * (d + r1 - r2) * (d - r1 + r2) * (d + r1 + r2);
  const double part3 = 0.5 * std::sqrt(std::max(0.0, heron));

  return std::max(0.0, part1 + part2 - part3);
}

double intersectionArea(const Glyph& a, double radius_a, const Glyph& b, double radius_b) {
  return lensArea(degreeDistance(a, b), radius_a, radius_b);
}

} // namespace core
