#pragma once
#include "config/config.h"

namespace core {

// Web-mercator ground resolution at the equator for zoom 0 [m/px].
constexpr double kMetersPerPixelZoom0 = 156543.03392;

// Maps a continuous map zoom onto the discrete levels layers are computed for.
class ZoomModel {
public:
  explicit ZoomModel(const ZoomConfig& cfg) : cfg_(cfg) {}

  int levelCount() const { return cfg_.num_levels; }

  // Clamps to [min_zoom, max_zoom] and rounds onto [0, num_levels-1].
  int levelForZoom(double zoom) const;

  // Map zoom a level's glyphs are sized for.
  double zoomForLevel(int level) const;

  // Glyph radius in meters for a level.
  double radiusForLevel(int level) const;

private:
  ZoomConfig cfg_;
};

double metersPerPixel(double zoom, double latitude_deg);

// k for the clustering strategy at a level, from the configured table.
int clusterCountForLevel(const KMeansConfig& cfg, int level);

} // namespace core
