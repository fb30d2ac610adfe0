#include "zoom.h"
#include <algorithm>
#include <cmath>

namespace core {

double metersPerPixel(double zoom, double latitude_deg) {
  return kMetersPerPixelZoom0 * std::cos(latitude_deg * M_PI / 180.0) / std::pow(2.0, zoom);
}

int ZoomModel::levelForZoom(double zoom) const {
  if (cfg_.num_levels <= 1 || cfg_.max_zoom <= cfg_.min_zoom) return 0;
  const double clamped = std::clamp(zoom, cfg_.min_zoom, cfg_.max_zoom);
  const double scaled = (clamped - cfg_.min_zoom) / (cfg_.max_zoom - cfg_.min_zoom) * (cfg_.num_levels - 1);
  return static_cast<int>(std::lround(scaled));
}

double ZoomModel::zoomForLevel(int level) const {
  level = std::clamp(level, 0, std::max(0, cfg_.num_levels - 1));
  if (static_cast<int>(cfg_.level_zooms.size()) == cfg_.num_levels) {
    return cfg_.level_zooms[level];
  }
  if (cfg_.num_levels <= 1) return cfg_.min_zoom;
  return cfg_.min_zoom + (static_cast<double>(level) / (cfg_.num_levels - 1)) * (cfg_.max_zoom - cfg_.min_zoom);
}

double ZoomModel::radiusForLevel(int level) const {
  return metersPerPixel(zoomForLevel(level), cfg_.reference_latitude) * cfg_.glyph_radius_px;
}

int clusterCountForLevel(const KMeansConfig& cfg, int level) {
  auto it = cfg.cluster_counts.find(level);
  return it != cfg.cluster_counts.end() ? it->second : cfg.default_clusters;
}

} // namespace core
