#pragma once

#include <span>
#include <string>
#include <vector>
#include "core/geometry.h"
#include "declutter/selection.h"

// Statistics of the last run, for logging
struct GreedyStats {
    size_t input_glyphs{0};
    size_t overlap_edges{0};
    size_t prehidden{0};      // dropped for overlapping an already-visible glyph
    size_t picks{0};          // glyphs kept by the max-conflict loop
    double processing_time_us{0.0};
};

class GreedySelector {
    double radius_scale_;
    mutable GreedyStats stats_;

public:
    explicit GreedySelector(double radius_scale = 1.0) : radius_scale_(radius_scale) {}

    // Picks a non-overlapping subset of glyphs.
    // Repeatedly keeps the glyph with the largest total overlap against the
    // remaining working set and drops everything it overlaps, until no two
    // remaining glyphs overlap. Ties go to the first glyph in input order.
    SelectionResult select(std::span<const core::Glyph> glyphs, double radius) const;

    // Same, but glyphs overlapping any id of already_visible (typically the
    // visible set of a coarser zoom level) start out hidden.
    SelectionResult select(std::span<const core::Glyph> glyphs, double radius,
                           const std::vector<std::string>& already_visible) const;

    void setRadiusScale(double s) { radius_scale_ = s; }
    double radiusScale() const { return radius_scale_; }

    const GreedyStats& getLastStats() const { return stats_; }

private:
    SelectionResult run(std::span<const core::Glyph> glyphs, double radius,
                        const std::vector<std::string>* already_visible) const;
};
