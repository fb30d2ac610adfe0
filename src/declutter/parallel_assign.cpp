#include "parallel_assign.h"
#include "core/errors.h"
#include <algorithm>
#include <future>
#include <limits>

ParallelAssigner::ParallelAssigner(int workers)
    : workers_(std::max(1, workers)), partition_fn_(&ParallelAssigner::nearestCentroids) {}

std::vector<int> ParallelAssigner::nearestCentroids(std::span<const core::Point2D> points,
                                                   const std::vector<core::Point2D>& centroids) {
    std::vector<int> out;
    out.reserve(points.size());
    for (const auto& p : points) {
        int best = 0;
        double best_dist = std::numeric_limits<double>::infinity();
        for (size_t c = 0; c < centroids.size(); ++c) {
            const double d = core::euclidean(p, centroids[c]);
            if (d < best_dist) {
                best_dist = d;
                best = static_cast<int>(c);
            }
        }
        out.push_back(best);
    }
    return out;
}

std::vector<std::pair<size_t, size_t>> ParallelAssigner::partitions(size_t n) const {
    std::vector<std::pair<size_t, size_t>> parts;
    const size_t w = std::max<size_t>(1, std::min<size_t>(static_cast<size_t>(workers_), n));
    const size_t base = n / w;

    size_t begin = 0;
    for (size_t i = 0; i < w; ++i) {
        const size_t end = (i + 1 == w) ? n : begin + base;
        parts.emplace_back(begin, end);
        begin = end;
    }
    return parts;
}

std::vector<int> ParallelAssigner::assign(std::span<const core::Point2D> points,
                                          const std::vector<core::Point2D>& centroids) const {
    const auto parts = partitions(points.size());

    // Fan out
    std::vector<std::future<std::vector<int>>> pending;
    pending.reserve(parts.size());
    for (const auto& [begin, end] : parts) {
        pending.push_back(std::async(std::launch::async, partition_fn_,
                                     points.subspan(begin, end - begin), std::cref(centroids)));
    }

    // Fan in, in partition order. Every future is drained before reporting a
    // failure so no task outlives this call.
    std::vector<std::vector<int>> partials(parts.size());
    bool failed = false;
    size_t failed_partition = 0;
    std::string failure;

    for (size_t i = 0; i < pending.size(); ++i) {
        try {
            partials[i] = pending[i].get();
        } catch (const std::exception& e) {
            if (!failed) {
                failed = true;
                failed_partition = i;
                failure = e.what();
            }
        }
    }
    if (failed) {
        throw core::WorkerFailureError(failed_partition, failure);
    }

    std::vector<int> combined;
    combined.reserve(points.size());
    for (size_t i = 0; i < partials.size(); ++i) {
        const size_t expected = parts[i].second - parts[i].first;
        if (partials[i].size() != expected) {
            throw core::WorkerFailureError(i, "returned " + std::to_string(partials[i].size()) +
                                              " assignments for " + std::to_string(expected) + " points");
        }
        combined.insert(combined.end(), partials[i].begin(), partials[i].end());
    }
    return combined;
}
