#include "kmeans_selector.h"
#include "core/zoom.h"
#include <iostream>
#include <limits>
#include <map>

SelectionResult KMeansSelector::select(std::span<const core::Glyph> glyphs, int k) const {
    SelectionResult result;
    last_run_ = KMeansResult{};
    if (glyphs.empty()) return result;

    if (k > static_cast<int>(glyphs.size())) {
        std::cout << "[KMeansSelector] k=" << k << " exceeds " << glyphs.size()
                  << " glyphs, using k=" << glyphs.size() << std::endl;
        k = static_cast<int>(glyphs.size());
    }

    std::vector<core::Point2D> points;
    points.reserve(glyphs.size());
    for (const auto& g : glyphs) points.push_back(core::toPoint(g));

    KMeansPP kmeans(k, config_.max_iterations, config_.workers, config_.seed, config_.verbose);
    last_run_ = kmeans.run(points);

    // Group members by cluster, clusters in order of first appearance
    std::vector<int> order;
    std::map<int, std::vector<size_t>> groups;
    for (size_t i = 0; i < glyphs.size(); ++i) {
        const int c = last_run_.assignments[i];
        auto [it, inserted] = groups.try_emplace(c);
        if (inserted) order.push_back(c);
        it->second.push_back(i);
    }

    std::vector<bool> keep(glyphs.size(), false);
    for (int c : order) {
        const auto& members = groups[c];
        const core::Point2D& centroid = last_run_.centroids[c];

        size_t best = members.front();
        double min_distance = std::numeric_limits<double>::infinity();
        for (size_t m : members) {
            const double d = core::euclidean(points[m], centroid);
            if (d < min_distance) {
                min_distance = d;
                best = m;
            }
        }

        keep[best] = true;
        result.hidden_count_by_visible[glyphs[best].id] = static_cast<int>(members.size());
    }

    for (size_t i = 0; i < glyphs.size(); ++i) {
        (keep[i] ? result.visible : result.hidden).push_back(glyphs[i].id);
    }
    return result;
}

SelectionResult KMeansSelector::selectForLevel(std::span<const core::Glyph> glyphs, int zoom_level) const {
    return select(glyphs, core::clusterCountForLevel(config_, zoom_level));
}
