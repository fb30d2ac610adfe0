#include <gtest/gtest.h>
#include <algorithm>
#include <numeric>
#include <stdexcept>
#include "core/errors.h"
#include "declutter/kmeans.h"
#include "declutter/kmeans_selector.h"
#include "declutter/parallel_assign.h"

using core::Glyph;
using core::Point2D;

namespace {

std::vector<Point2D> twoBlobs() {
    return {
        {0.0, 0.0}, {0.1, 0.0}, {0.0, 0.1}, {0.1, 0.1},
        {10.0, 10.0}, {10.1, 10.0}, {10.0, 10.1}, {10.1, 10.1},
    };
}

std::vector<Point2D> line(size_t n) {
    std::vector<Point2D> pts;
    for (size_t i = 0; i < n; ++i) pts.emplace_back(static_cast<double>(i), 0.0);
    return pts;
}

} // namespace

TEST(WeightedListTest, ReplicatesIndicesByWeight) {
    auto list = generateWeightedList({0.5, 0.25, 0.25});
    ASSERT_EQ(list.size(), 100u);
    EXPECT_EQ(std::count(list.begin(), list.end(), 0u), 50);
    EXPECT_EQ(std::count(list.begin(), list.end(), 1u), 25);
    EXPECT_EQ(std::count(list.begin(), list.end(), 2u), 25);
}

TEST(WeightedListTest, FractionalWeightsRoundUp) {
    auto list = generateWeightedList({1.0 / 3.0, 0.0});
    EXPECT_EQ(list.size(), 34u);
    EXPECT_EQ(std::count(list.begin(), list.end(), 1u), 0);
}

TEST(WeightedListTest, ZeroWeightsGiveEmptyList) {
    EXPECT_TRUE(generateWeightedList({0.0, 0.0}).empty());
}

TEST(ParallelAssignerTest, PartitionsAreContiguousWithRemainderLast) {
    ParallelAssigner assigner(3);
    auto parts = assigner.partitions(10);
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], (std::pair<size_t, size_t>{0, 3}));
    EXPECT_EQ(parts[1], (std::pair<size_t, size_t>{3, 6}));
    EXPECT_EQ(parts[2], (std::pair<size_t, size_t>{6, 10}));
}

TEST(ParallelAssignerTest, NeverMorePartitionsThanPoints) {
    ParallelAssigner assigner(4);
    EXPECT_EQ(assigner.partitions(2).size(), 2u);
    EXPECT_EQ(ParallelAssigner(0).workers(), 1);
}

TEST(ParallelAssignerTest, ConcatenatesInPartitionOrder) {
    auto pts = line(101);
    std::vector<Point2D> centroids = {{0.0, 0.0}, {50.0, 0.0}, {100.0, 0.0}};

    ParallelAssigner assigner(4);
    EXPECT_EQ(assigner.assign(pts, centroids), ParallelAssigner::nearestCentroids(pts, centroids));
}

TEST(ParallelAssignerTest, TiesGoToFirstCentroid) {
    std::vector<Point2D> pts = {{1.0, 0.0}};
    std::vector<Point2D> centroids = {{0.0, 0.0}, {2.0, 0.0}};
    EXPECT_EQ(ParallelAssigner::nearestCentroids(pts, centroids), std::vector<int>{0});
}

TEST(ParallelAssignerTest, FailingPartitionFailsWholeRun) {
    auto pts = line(20);
    std::vector<Point2D> centroids = {{0.0, 0.0}};

    ParallelAssigner assigner(4);
    assigner.setPartitionFunction([](std::span<const Point2D> part, const std::vector<Point2D>& c) {
        if (part.front().x >= 10.0) throw std::runtime_error("worker crashed");
        return ParallelAssigner::nearestCentroids(part, c);
    });

    try {
        assigner.assign(pts, centroids);
        FAIL() << "expected WorkerFailureError";
    } catch (const core::WorkerFailureError& e) {
        EXPECT_EQ(e.partition(), 2u);
    }
}

TEST(ParallelAssignerTest, ShortPartitionResultIsAFailure) {
    auto pts = line(8);
    std::vector<Point2D> centroids = {{0.0, 0.0}};

    ParallelAssigner assigner(2);
    assigner.setPartitionFunction([](std::span<const Point2D> part, const std::vector<Point2D>&) {
        return std::vector<int>(part.size() - 1, 0);
    });
    EXPECT_THROW(assigner.assign(pts, centroids), core::WorkerFailureError);
}

TEST(KMeansTest, RejectsInvalidInput) {
    auto pts = twoBlobs();
    EXPECT_THROW(KMeansPP(0, 100, 2, 1).run(pts), core::InvalidInputError);
    EXPECT_THROW(KMeansPP(-3, 100, 2, 1).run(pts), core::InvalidInputError);
    EXPECT_THROW(KMeansPP(2, 100, 2, 1).run(std::span<const Point2D>{}), core::InvalidInputError);
}

TEST(KMeansTest, ClassifyBeforeRunThrows) {
    KMeansPP kmeans(2, 100, 2, 7);
    EXPECT_THROW(kmeans.classify({0.0, 0.0}), std::logic_error);
}

TEST(KMeansTest, SeparatesTwoBlobs) {
    auto pts = twoBlobs();
    KMeansPP kmeans(2, 100, 2, 42);
    KMeansResult r = kmeans.run(pts);

    EXPECT_TRUE(r.converged);
    ASSERT_EQ(r.assignments.size(), pts.size());
    ASSERT_EQ(r.centroids.size(), 2u);
    for (size_t i = 1; i < 4; ++i) EXPECT_EQ(r.assignments[i], r.assignments[0]);
    for (size_t i = 5; i < 8; ++i) EXPECT_EQ(r.assignments[i], r.assignments[4]);
    EXPECT_NE(r.assignments[0], r.assignments[4]);

    EXPECT_EQ(kmeans.classify({0.05, 0.02}), r.assignments[0]);
    EXPECT_EQ(kmeans.classify({9.9, 10.2}), r.assignments[4]);
    EXPECT_LT(r.heterogeneity, 1.0);
}

TEST(KMeansTest, SingleClusterCentroidIsTheMean) {
    auto pts = line(5);
    KMeansResult r = KMeansPP(1, 100, 3, 5).run(pts);
    EXPECT_TRUE(r.converged);
    ASSERT_EQ(r.centroids.size(), 1u);
    EXPECT_DOUBLE_EQ(r.centroids[0].x, 2.0);
    EXPECT_DOUBLE_EQ(r.centroids[0].y, 0.0);
}

TEST(KMeansTest, FixedSeedIsReproducible) {
    auto pts = line(40);
    KMeansResult a = KMeansPP(5, 1000, 3, 1234).run(pts);
    KMeansResult b = KMeansPP(5, 1000, 3, 1234).run(pts);
    EXPECT_EQ(a.assignments, b.assignments);
    ASSERT_EQ(a.centroids.size(), b.centroids.size());
    for (size_t i = 0; i < a.centroids.size(); ++i) {
        EXPECT_EQ(a.centroids[i], b.centroids[i]);
    }
    EXPECT_EQ(a.iterations, b.iterations);
}

TEST(KMeansTest, EveryClusterIsNonEmptyAfterConvergence) {
    auto pts = line(30);
    KMeansResult r = KMeansPP(6, 1000, 2, 99).run(pts);
    ASSERT_TRUE(r.converged);
    std::vector<int> members(6, 0);
    for (int c : r.assignments) members[c]++;
    for (int m : members) EXPECT_GT(m, 0);
}

TEST(KMeansTest, IterationBudgetIsHonoured) {
    auto pts = twoBlobs();
    KMeansResult r = KMeansPP(2, 1, 2, 3).run(pts);
    EXPECT_FALSE(r.converged);
    EXPECT_EQ(r.iterations, 1);
    EXPECT_EQ(r.assignments.size(), pts.size());
}

TEST(KMeansTest, WorkerFailureAbortsRun) {
    auto pts = twoBlobs();
    KMeansPP kmeans(2, 100, 2, 11);
    kmeans.assigner().setPartitionFunction([](std::span<const Point2D>, const std::vector<Point2D>&) -> std::vector<int> {
        throw std::runtime_error("boom");
    });
    EXPECT_THROW(kmeans.run(pts), core::WorkerFailureError);
}

TEST(KMeansSelectorTest, EmptyInputGivesEmptyResult) {
    KMeansSelector selector;
    EXPECT_TRUE(selector.select({}, 3).empty());
}

TEST(KMeansSelectorTest, SingleGroupKeepsGlyphNearestMean) {
    std::vector<Glyph> glyphs = {
        {"a", 0.0, 0.0}, {"b", 0.0, 2.0}, {"c", 2.0, 0.0}, {"d", 2.0, 2.0}, {"e", 1.0, 1.1},
    };
    KMeansConfig cfg;
    cfg.seed = 17;
    SelectionResult r = KMeansSelector(cfg).select(glyphs, 1);

    EXPECT_EQ(r.visible, std::vector<std::string>{"e"});
    EXPECT_EQ(r.hidden, (std::vector<std::string>{"a", "b", "c", "d"}));
    EXPECT_EQ(r.hidden_count_by_visible.at("e"), 5);
}

TEST(KMeansSelectorTest, SingletonGroupsStillGetACount) {
    std::vector<Glyph> glyphs = {{"a", 0.0, 0.0}, {"b", 5.0, 5.0}, {"c", -5.0, 5.0}};
    KMeansConfig cfg;
    cfg.seed = 3;
    SelectionResult r = KMeansSelector(cfg).select(glyphs, 10);  // capped to 3

    EXPECT_EQ(r.visible, (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_TRUE(r.hidden.empty());
    ASSERT_EQ(r.hidden_count_by_visible.size(), 3u);
    for (const auto& [id, count] : r.hidden_count_by_visible) EXPECT_EQ(count, 1);
}

TEST(KMeansSelectorTest, CountsSumToInputSize) {
    std::vector<Glyph> glyphs;
    for (int i = 0; i < 40; ++i) {
        glyphs.emplace_back("s" + std::to_string(i), 52.0 + (i % 8) * 0.01, 4.0 + (i / 8) * 0.01);
    }
    KMeansConfig cfg;
    cfg.seed = 8;
    KMeansSelector selector(cfg);
    SelectionResult r = selector.selectForLevel(glyphs, 2);  // 9 clusters

    EXPECT_EQ(r.size(), glyphs.size());
    EXPECT_EQ(r.visible.size(), r.hidden_count_by_visible.size());
    int total = 0;
    for (const auto& [id, count] : r.hidden_count_by_visible) total += count;
    EXPECT_EQ(total, 40);
}
