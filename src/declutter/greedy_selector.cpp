#include "greedy_selector.h"
#include "declutter/intersection_index.h"
#include <chrono>

SelectionResult GreedySelector::select(std::span<const core::Glyph> glyphs, double radius) const {
    return run(glyphs, radius, nullptr);
}

SelectionResult GreedySelector::select(std::span<const core::Glyph> glyphs, double radius,
                                       const std::vector<std::string>& already_visible) const {
    return run(glyphs, radius, &already_visible);
}

SelectionResult GreedySelector::run(std::span<const core::Glyph> glyphs, double radius,
                                    const std::vector<std::string>* already_visible) const {
    auto start_time = std::chrono::high_resolution_clock::now();
    stats_ = GreedyStats{};
    stats_.input_glyphs = glyphs.size();

    SelectionResult result;
    if (glyphs.empty()) return result;

    const size_t N = glyphs.size();

    // Step 1: overlap graph
    IntersectionIndex index(glyphs, radius, radius_scale_);
    stats_.overlap_edges = index.edgeCount();

    // Step 2: working set, minus glyphs covered by already visible ones
    std::vector<bool> in_set(N, true);
    if (already_visible) {
        for (const auto& id : *already_visible) {
            const long p = index.indexOf(id);
            if (p < 0) continue;
            for (const auto& [neighbor, area] : index.neighbors(static_cast<size_t>(p))) {
                if (in_set[neighbor]) {
                    in_set[neighbor] = false;
                    stats_.prehidden++;
                }
            }
        }
    }

    // Step 3: max-conflict elimination
    std::vector<bool> picked(N, false);
    for (;;) {
        long best = -1;
        double best_score = -1.0;

        for (size_t s = 0; s < N; ++s) {
            if (!in_set[s]) continue;
            double score = 0.0;
            for (const auto& [other, area] : index.neighbors(s)) {
                if (in_set[other]) score += area;
            }
            if (score > best_score) {
                best = static_cast<long>(s);
                best_score = score;
            }
        }

        if (best < 0 || best_score == 0.0) break; // empty, or nothing overlaps any more

        picked[best] = true;
        stats_.picks++;
        in_set[best] = false;
        for (const auto& [other, area] : index.neighbors(static_cast<size_t>(best))) {
            in_set[other] = false;
        }
    }

    // Step 4: visible = picks + non-overlapping remainder
    std::vector<size_t> visible_idx;
    std::vector<size_t> hidden_idx;
    for (size_t i = 0; i < N; ++i) {
        if (picked[i] || in_set[i]) {
            visible_idx.push_back(i);
            result.visible.push_back(glyphs[i].id);
        } else {
            hidden_idx.push_back(i);
            result.hidden.push_back(glyphs[i].id);
        }
    }

    // Step 5: attribute each hidden glyph to the visible one it overlaps most
    for (size_t h : hidden_idx) {
        long best_visible = -1;
        double best_area = 0.0;
        for (size_t v : visible_idx) {
            const double a = index.area(v, h);
            if (a > best_area) {
                best_area = a;
                best_visible = static_cast<long>(v);
            }
        }
        if (best_visible >= 0) {
            result.hidden_count_by_visible[glyphs[best_visible].id] += 1;
        }
    }

    // Badge counts include the visible glyph itself
    for (auto& [id, count] : result.hidden_count_by_visible) {
        count += 1;
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    stats_.processing_time_us = std::chrono::duration<double, std::micro>(end_time - start_time).count();

    return result;
}
