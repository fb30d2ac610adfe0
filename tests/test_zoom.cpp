#include <gtest/gtest.h>
#include <cmath>
#include "core/zoom.h"

namespace {
ZoomConfig evenLevels() {
    ZoomConfig cfg;
    cfg.level_zooms.clear();
    return cfg;
}
}

TEST(ZoomModelTest, LevelForZoomClampsAndRounds) {
    core::ZoomModel zoom(ZoomConfig{});
    EXPECT_EQ(zoom.levelForZoom(12.0), 0);
    EXPECT_EQ(zoom.levelForZoom(20.0), 4);
    EXPECT_EQ(zoom.levelForZoom(16.0), 2);
    EXPECT_EQ(zoom.levelForZoom(13.0), 1);   // 0.5 rounds up
    EXPECT_EQ(zoom.levelForZoom(12.9), 0);
    EXPECT_EQ(zoom.levelForZoom(3.0), 0);
    EXPECT_EQ(zoom.levelForZoom(25.0), 4);
}

TEST(ZoomModelTest, SingleLevelAlwaysMapsToZero) {
    ZoomConfig cfg = evenLevels();
    cfg.num_levels = 1;
    core::ZoomModel zoom(cfg);
    EXPECT_EQ(zoom.levelForZoom(18.0), 0);
    EXPECT_DOUBLE_EQ(zoom.zoomForLevel(0), cfg.min_zoom);
}

TEST(ZoomModelTest, ConfiguredLevelZoomsAreUsed) {
    core::ZoomModel zoom(ZoomConfig{});
    EXPECT_DOUBLE_EQ(zoom.zoomForLevel(0), 15.0);
    EXPECT_DOUBLE_EQ(zoom.zoomForLevel(1), 15.0);
    EXPECT_DOUBLE_EQ(zoom.zoomForLevel(4), 18.0);
}

TEST(ZoomModelTest, EvenlySpacedWithoutLevelZooms) {
    core::ZoomModel zoom(evenLevels());
    EXPECT_DOUBLE_EQ(zoom.zoomForLevel(0), 12.0);
    EXPECT_DOUBLE_EQ(zoom.zoomForLevel(2), 16.0);
    EXPECT_DOUBLE_EQ(zoom.zoomForLevel(4), 20.0);
}

TEST(ZoomModelTest, RadiusHalvesPerZoomStep) {
    EXPECT_NEAR(core::metersPerPixel(16.0, 0.0) / core::metersPerPixel(15.0, 0.0), 0.5, 1e-12);

    ZoomConfig cfg = evenLevels();
    cfg.min_zoom = 15.0;
    cfg.max_zoom = 19.0;
    core::ZoomModel zoom(cfg);
    for (int level = 1; level < zoom.levelCount(); ++level) {
        EXPECT_NEAR(zoom.radiusForLevel(level) / zoom.radiusForLevel(level - 1), 0.5, 1e-12);
    }
}

TEST(ZoomModelTest, RadiusAtEquator) {
    core::ZoomModel zoom(ZoomConfig{});
    EXPECT_NEAR(zoom.radiusForLevel(0), core::kMetersPerPixelZoom0 / std::pow(2.0, 15) * 40.0, 1e-9);
}

TEST(ZoomModelTest, ClusterCountFallsBackToDefault) {
    KMeansConfig cfg;
    EXPECT_EQ(core::clusterCountForLevel(cfg, 0), 1);
    EXPECT_EQ(core::clusterCountForLevel(cfg, 2), 9);
    EXPECT_EQ(core::clusterCountForLevel(cfg, 4), 24);
    EXPECT_EQ(core::clusterCountForLevel(cfg, 7), 8);
}
