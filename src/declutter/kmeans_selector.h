#pragma once

#include <span>
#include "config/config.h"
#include "core/geometry.h"
#include "declutter/kmeans.h"
#include "declutter/selection.h"

// Declutters by grouping glyph positions with k-means and keeping, per group,
// the member nearest the group centroid. Every representative gets a count
// entry equal to its group size, singleton groups included.
class KMeansSelector {
    KMeansConfig config_;
    mutable KMeansResult last_run_;

public:
    explicit KMeansSelector(const KMeansConfig& config = KMeansConfig{}) : config_(config) {}

    // Empty input yields an empty result. k is capped at the number of glyphs.
    SelectionResult select(std::span<const core::Glyph> glyphs, int k) const;

    // k taken from the configured zoom-level table
    SelectionResult selectForLevel(std::span<const core::Glyph> glyphs, int zoom_level) const;

    const KMeansResult& getLastRun() const { return last_run_; }
    const KMeansConfig& getConfig() const { return config_; }
};
