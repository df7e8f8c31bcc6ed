/**
 * @file test_watermark_coordinator.cpp
 * @brief Unit tests for WatermarkCoordinator
 */

#include <gtest/gtest.h>
#include "shopstream/compute/watermark_coordinator.h"

using namespace shopstream;
using namespace shopstream::compute;

class WatermarkCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        coordinator = std::make_unique<WatermarkCoordinator>(1000);
        coordinator->registerSource(StreamKind::Products, false, 0);
        coordinator->registerSource(StreamKind::Users, false, 0);
        coordinator->registerSource(StreamKind::Sales, true, 0);
        coordinator->registerSource(StreamKind::Views, true, 0);
    }

    std::unique_ptr<WatermarkCoordinator> coordinator;
};

TEST_F(WatermarkCoordinatorTest, GlobalIsMinimumOfBoundedSources) {
    EXPECT_EQ(coordinator->globalWatermark(), NO_WATERMARK);

    // Not every bounded source has reported yet
    EXPECT_FALSE(coordinator->updateSourceWatermark(StreamKind::Views, 500, 10));
    EXPECT_EQ(coordinator->globalWatermark(), NO_WATERMARK);

    EXPECT_TRUE(coordinator->updateSourceWatermark(StreamKind::Sales, 300, 10));
    EXPECT_EQ(coordinator->globalWatermark(), 300);

    EXPECT_TRUE(coordinator->updateSourceWatermark(StreamKind::Sales, 800, 20));
    EXPECT_EQ(coordinator->globalWatermark(), 500);

    EXPECT_EQ(coordinator->sourceWatermark(StreamKind::Sales), 800);
    EXPECT_EQ(coordinator->sourceWatermark(StreamKind::Products), NO_WATERMARK);
}

TEST_F(WatermarkCoordinatorTest, NeverRegresses) {
    coordinator->updateSourceWatermark(StreamKind::Views, 500, 10);
    coordinator->updateSourceWatermark(StreamKind::Sales, 500, 10);
    ASSERT_EQ(coordinator->globalWatermark(), 500);

    EXPECT_FALSE(coordinator->updateSourceWatermark(StreamKind::Sales, 100, 20));
    EXPECT_EQ(coordinator->globalWatermark(), 500);
    EXPECT_EQ(coordinator->sourceWatermark(StreamKind::Sales), 500);

    int64_t previous = coordinator->globalWatermark();
    for (int64_t wm : {400, 600, 550, 900, 700}) {
        coordinator->updateSourceWatermark(StreamKind::Views, wm, 30);
        coordinator->updateSourceWatermark(StreamKind::Sales, wm - 50, 30);
        EXPECT_GE(coordinator->globalWatermark(), previous);
        previous = coordinator->globalWatermark();
    }
    EXPECT_GT(coordinator->getStats()["ignored_regressions"], 0);
}

TEST_F(WatermarkCoordinatorTest, UnregisteredSourceThrows) {
    WatermarkCoordinator fresh;
    EXPECT_THROW(fresh.updateSourceWatermark(StreamKind::Views, 1), std::invalid_argument);
    EXPECT_THROW(WatermarkCoordinator bad(0), std::invalid_argument);
}

TEST_F(WatermarkCoordinatorTest, StalledSourceFreezesGlobalAndIsReported) {
    coordinator->updateSourceWatermark(StreamKind::Views, 500, 100);
    coordinator->updateSourceWatermark(StreamKind::Sales, 400, 100);

    // Views keep moving, sales do not
    coordinator->updateSourceWatermark(StreamKind::Views, 5000, 1500);
    EXPECT_EQ(coordinator->globalWatermark(), 400);

    auto stalled = coordinator->stalledSources(1500);
    ASSERT_EQ(stalled.size(), 1u);
    EXPECT_EQ(stalled[0], StreamKind::Sales);

    auto health = coordinator->health(1500);
    EXPECT_TRUE(health.stalled);
    EXPECT_EQ(health.global_watermark, 400);
    ASSERT_EQ(health.sources.size(), 4u);
    for (const auto& source : health.sources) {
        EXPECT_EQ(source.stalled, source.kind == StreamKind::Sales);
    }

    coordinator->updateSourceWatermark(StreamKind::Sales, 450, 1600);
    EXPECT_TRUE(coordinator->stalledSources(1600).empty());
    EXPECT_FALSE(coordinator->health(1600).stalled);
}

TEST_F(WatermarkCoordinatorTest, AvailabilityIsReported) {
    coordinator->reportAvailability(StreamKind::Sales, false);
    auto health = coordinator->health(0);
    for (const auto& source : health.sources) {
        EXPECT_EQ(source.available, source.kind != StreamKind::Sales);
    }
    EXPECT_EQ(coordinator->getStats()["available.sales"], 0);
}

TEST_F(WatermarkCoordinatorTest, Restore) {
    coordinator->restore({{StreamKind::Sales, 700}, {StreamKind::Views, 900}}, 700, 0);
    EXPECT_EQ(coordinator->globalWatermark(), 700);
    EXPECT_EQ(coordinator->sourceWatermark(StreamKind::Views), 900);

    EXPECT_TRUE(coordinator->updateSourceWatermark(StreamKind::Sales, 800, 10));
    EXPECT_EQ(coordinator->globalWatermark(), 800);
}
