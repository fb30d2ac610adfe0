#pragma once

#include <functional>
#include <span>
#include <utility>
#include <vector>
#include "core/geometry.h"

// Fan-out/fan-in nearest-centroid assignment.
// Points are cut into contiguous partitions, each partition runs on its own
// task, and the partial vectors are concatenated in partition order once every
// task has returned. A failing partition fails the whole call.
class ParallelAssigner {
public:
    using PartitionFn = std::function<std::vector<int>(std::span<const core::Point2D>,
                                                       const std::vector<core::Point2D>&)>;

    explicit ParallelAssigner(int workers = 2);

    // Throws core::WorkerFailureError if any partition throws or returns a
    // vector of the wrong length.
    std::vector<int> assign(std::span<const core::Point2D> points,
                            const std::vector<core::Point2D>& centroids) const;

    // [begin, end) ranges; all but the last hold n / workers points.
    std::vector<std::pair<size_t, size_t>> partitions(size_t n) const;

    int workers() const { return workers_; }

    // Replaces the per-partition computation (tests inject failures here).
    void setPartitionFunction(PartitionFn fn) { partition_fn_ = std::move(fn); }

    // Index of the nearest centroid for every point; first index wins ties.
    static std::vector<int> nearestCentroids(std::span<const core::Point2D> points,
                                             const std::vector<core::Point2D>& centroids);

private:
    int workers_;
    PartitionFn partition_fn_;
};
