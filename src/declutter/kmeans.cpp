#include "kmeans.h"
#include "core/errors.h"
#include <algorithm>
#include <future>
#include <iostream>
#include <limits>
#include <numeric>
#include <stdexcept>

std::vector<size_t> generateWeightedList(const std::vector<double>& weights) {
    std::vector<size_t> list;
    for (size_t i = 0; i < weights.size(); ++i) {
        const double multiples = weights[i] * 100.0;
        for (int j = 0; j < multiples; ++j) {
            list.push_back(i);
        }
    }
    return list;
}

KMeansPP::KMeansPP(int k, int max_iterations, int workers, uint32_t seed, bool verbose)
    : k_(k), max_iterations_(std::max(1, max_iterations)), verbose_(verbose),
      rng_(seed != 0 ? seed : std::random_device{}()), assigner_(workers) {}

std::vector<double> KMeansPP::minDistanceToCentroid(std::span<const core::Point2D> points,
                                                    const std::vector<core::Point2D>& centroids) {
    std::vector<double> out;
    out.reserve(points.size());
    for (const auto& p : points) {
        double best = std::numeric_limits<double>::infinity();
        for (const auto& c : centroids) {
            best = std::min(best, core::euclidean(p, c));
        }
        out.push_back(best);
    }
    return out;
}

size_t KMeansPP::drawWeighted(const std::vector<double>& distances) {
    const double total = std::accumulate(distances.begin(), distances.end(), 0.0);

    std::vector<size_t> list;
    if (total > 0.0) {
        std::vector<double> weights(distances.size());
        std::transform(distances.begin(), distances.end(), weights.begin(),
                       [total](double d) { return d / total; });
        list = generateWeightedList(weights);
    }

    // Every point already sits on a centroid: nothing to weight by
    if (list.empty()) {
        std::uniform_int_distribution<size_t> any(0, distances.size() - 1);
        return any(rng_);
    }

    std::uniform_int_distribution<size_t> pick(0, list.size() - 1);
    return list[pick(rng_)];
}

std::vector<core::Point2D> KMeansPP::smartInit(std::span<const core::Point2D> points) {
    std::vector<core::Point2D> centroids;
    centroids.reserve(k_);

    std::uniform_int_distribution<size_t> first(0, points.size() - 1);
    centroids.push_back(points[first(rng_)]);

    while (static_cast<int>(centroids.size()) < k_) {
        const auto distances = minDistanceToCentroid(points, centroids);
        centroids.push_back(points[drawWeighted(distances)]);
    }
    return centroids;
}

core::Point2D KMeansPP::reseedCentroid(std::span<const core::Point2D> points,
                                       const std::vector<core::Point2D>& centroids) {
    return points[drawWeighted(minDistanceToCentroid(points, centroids))];
}

std::vector<core::Point2D> KMeansPP::moveCentroids(std::span<const core::Point2D> points,
                                                   const std::vector<core::Point2D>& centroids,
                                                   const std::vector<int>& assignments) {
    std::vector<core::Point2D> sums(centroids.size());
    std::vector<size_t> counts(centroids.size(), 0);

    for (size_t i = 0; i < points.size(); ++i) {
        const int c = assignments[i];
        sums[c].x += points[i].x;
        sums[c].y += points[i].y;
        counts[c]++;
    }

    std::vector<core::Point2D> moved(centroids.size());
    for (size_t c = 0; c < centroids.size(); ++c) {
        if (counts[c] == 0) {
            moved[c] = centroids[c];
        } else {
            moved[c] = {sums[c].x / counts[c], sums[c].y / counts[c]};
        }
    }
    return moved;
}

double KMeansPP::heterogeneity(std::span<const core::Point2D> points,
                               const std::vector<core::Point2D>& centroids,
                               const std::vector<int>& assignments) {
    double total = 0.0;
    for (size_t i = 0; i < points.size(); ++i) {
        total += core::euclidean(points[i], centroids[assignments[i]]);
    }
    return total;
}

KMeansResult KMeansPP::run(std::span<const core::Point2D> points) {
    if (k_ <= 0) {
        throw core::InvalidInputError("kmeans: k must be positive, got " + std::to_string(k_));
    }
    if (points.empty()) {
        throw core::InvalidInputError("kmeans: no points to cluster (k=" + std::to_string(k_) + ")");
    }

    KMeansResult result;
    std::vector<core::Point2D> centroids = smartInit(points);
    std::vector<int> previous;
    std::vector<int> assignments;
    int iter = 0;

    for (;;) {
        // Barrier 1: all partitions must report back
        assignments = assigner_.assign(points, centroids);
        ++iter;

        std::vector<int> members(k_, 0);
        for (int c : assignments) members[c]++;

        bool empty_clusters = false;
        for (int c = 0; c < k_; ++c) {
            if (members[c] == 0) {
                empty_clusters = true;
                break;
            }
        }

        if (empty_clusters) {
            if (iter >= max_iterations_) break;
            for (int c = 0; c < k_; ++c) {
                if (members[c] != 0) continue;
                if (verbose_) {
                    std::cout << "[KMeans] empty cluster " << c << " at iteration " << iter << ", re-seeding" << std::endl;
                }
                centroids[c] = reseedCentroid(points, centroids);
                result.reseeds++;
            }
            continue; // classify again with the repaired centroids
        }

        if (assignments == previous) {
            result.converged = true;
            break;
        }
        if (iter >= max_iterations_) break;
        previous = assignments;

        // Barrier 2: centroid update
        auto moved = std::async(std::launch::async, &KMeansPP::moveCentroids,
                                points, std::cref(centroids), std::cref(assignments));
        centroids = moved.get();

        if (verbose_) {
            std::cout << "[KMeans] iteration " << iter << " centroids:";
            for (const auto& c : centroids) std::cout << " (" << c.x << "," << c.y << ")";
            std::cout << std::endl;
        }
    }

    if (result.converged) {
        std::cout << "[KMeans] k=" << k_ << " converged after " << iter << " iterations" << std::endl;
    } else {
        std::cerr << "[KMeans] k=" << k_ << " stopped at max_iterations=" << max_iterations_
                  << " without converging (reseeds=" << result.reseeds << ")" << std::endl;
    }

    result.iterations = iter;
    result.heterogeneity = heterogeneity(points, centroids, assignments);
    result.assignments = std::move(assignments);
    result.centroids = centroids;
    trained_ = std::move(centroids);
    return result;
}

int KMeansPP::classify(const core::Point2D& point) const {
    if (trained_.empty()) {
        throw std::logic_error("kmeans: classify() called before run()");
    }
    const core::Point2D one[] = {point};
    return ParallelAssigner::nearestCentroids(one, trained_).front();
}
