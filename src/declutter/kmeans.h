#pragma once

#include <cstdint>
#include <random>
#include <span>
#include <vector>
#include "core/geometry.h"
#include "declutter/parallel_assign.h"

struct KMeansResult {
    std::vector<int> assignments;            // point index -> cluster index
    std::vector<core::Point2D> centroids;
    int iterations{0};                       // assignment passes performed
    int reseeds{0};                          // empty centroids re-initialized
    bool converged{false};                   // false => max_iterations reached
    double heterogeneity{0.0};               // sum of point-to-centroid distances
};

// k-means with k-means++ seeding on raw 2D coordinates.
//
// Seeding and empty-cluster repair draw indices from a replicated list:
// each index appears ceil(100 * weight) times, weight being its distance to
// the nearest chosen centroid over the sum of those distances. Results are
// reproducible for a fixed seed.
//
// The assignment step of every iteration runs on a ParallelAssigner; the
// centroid update runs as one separate task. An iteration completes fully
// before the next one is dispatched.
class KMeansPP {
    int k_;
    int max_iterations_;
    bool verbose_;
    std::mt19937 rng_;
    ParallelAssigner assigner_;
    std::vector<core::Point2D> trained_;

public:
    // seed == 0 draws a seed from std::random_device
    KMeansPP(int k, int max_iterations, int workers = 2, uint32_t seed = 0, bool verbose = false);

    // Throws core::InvalidInputError when k <= 0 or points is empty,
    // core::WorkerFailureError when an assignment partition fails.
    KMeansResult run(std::span<const core::Point2D> points);

    // Nearest centroid of the last run; throws std::logic_error before run().
    int classify(const core::Point2D& point) const;

    const std::vector<core::Point2D>& centroids() const { return trained_; }
    int k() const { return k_; }

    ParallelAssigner& assigner() { return assigner_; }

private:
    std::vector<core::Point2D> smartInit(std::span<const core::Point2D> points);
    core::Point2D reseedCentroid(std::span<const core::Point2D> points,
                                 const std::vector<core::Point2D>& centroids);
    size_t drawWeighted(const std::vector<double>& distances);

    static std::vector<double> minDistanceToCentroid(std::span<const core::Point2D> points,
                                                     const std::vector<core::Point2D>& centroids);
    static std::vector<core::Point2D> moveCentroids(std::span<const core::Point2D> points,
                                                    const std::vector<core::Point2D>& centroids,
                                                    const std::vector<int>& assignments);
    static double heterogeneity(std::span<const core::Point2D> points,
                                const std::vector<core::Point2D>& centroids,
                                const std::vector<int>& assignments);
};

// Builds the replicated index list used for weighted draws.
std::vector<size_t> generateWeightedList(const std::vector<double>& weights);
