#include "intersection_index.h"
#include <algorithm>

IntersectionIndex::IntersectionIndex(std::span<const core::Glyph> glyphs, double radius, double radius_scale) {
    const size_t N = glyphs.size();
    adjacency_.resize(N);
    id_index_.reserve(N);

    for (size_t i = 0; i < N; ++i) {
        id_index_.emplace(glyphs[i].id, i); // first occurrence wins
    }

    // Both orders are evaluated so each endpoint holds its own lookup;
    // j ascends, so every adjacency list comes out sorted.
    for (size_t i = 0; i < N; ++i) {
        for (size_t j = 0; j < N; ++j) {
            if (i == j) continue;
            if (!core::isOverlapping(glyphs[i], glyphs[j], radius, radius_scale)) continue;

            const double a = core::intersectionArea(glyphs[i], glyphs[j], radius);
            if (a > 0.0) {
                adjacency_[i].emplace_back(j, a);
                if (i < j) ++edge_count_;
            }
        }
    }
}

double IntersectionIndex::area(size_t i, size_t j) const {
    if (i >= adjacency_.size()) return 0.0;
    const auto& adj = adjacency_[i];
    auto it = std::lower_bound(adj.begin(), adj.end(), j,
                               [](const Edge& e, size_t key) { return e.first < key; });
    if (it != adj.end() && it->first == j) return it->second;
    return 0.0;
}

long IntersectionIndex::indexOf(const std::string& id) const {
    auto it = id_index_.find(id);
    return it == id_index_.end() ? -1 : static_cast<long>(it->second);
}
