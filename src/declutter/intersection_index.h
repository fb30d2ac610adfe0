#pragma once

#include <span>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "core/geometry.h"

// Sparse overlap graph over one batch of same-sized glyphs.
// Edge (i, j) exists iff the glyphs overlap and their lens area is positive;
// it is stored under both endpoints with the same area.
class IntersectionIndex {
public:
    using Edge = std::pair<size_t, double>; // (neighbor index, area)

    IntersectionIndex(std::span<const core::Glyph> glyphs, double radius, double radius_scale = 1.0);

    size_t size() const { return adjacency_.size(); }
    size_t edgeCount() const { return edge_count_; }

    // 0 when the pair does not overlap
    double area(size_t i, size_t j) const;
    bool overlaps(size_t i, size_t j) const { return area(i, j) > 0.0; }

    // Sorted by neighbor index
    const std::vector<Edge>& neighbors(size_t i) const { return adjacency_.at(i); }

    // -1 when the id is not part of the batch
    long indexOf(const std::string& id) const;

private:
    std::vector<std::vector<Edge>> adjacency_;
    std::unordered_map<std::string, size_t> id_index_;
    size_t edge_count_{0};
};
