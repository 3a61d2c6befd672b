/**
 * @file test_learning_updater.cpp
 * @brief Unit tests for observation-driven embedding updates
 */

#include <gtest/gtest.h>
#include <learning/learning_updater.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <atomic>
#include <cmath>
#include <limits>

using namespace Strata;

class LearningUpdaterTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::set_level(Logger::Level::Off);

        RowMatrix table(3, 2);
        table << 0.0, 0.0,
                 1.0, -1.0,
                 0.3, 0.7;
        std::vector<std::unique_ptr<EmbeddingStore>> stores;
        stores.push_back(std::make_unique<EmbeddingStore>("A", table));
        registry = std::make_unique<ScaleRegistry>(ScaleSchema({{"A", 3}}), 2, std::move(stores));
        updater = std::make_unique<LearningUpdater>(*registry);
    }

    void TearDown() override {
        Logger::set_level(Logger::Level::Info);
    }

    static Vector obs(double x, double y) {
        Vector v(2);
        v << x, y;
        return v;
    }

    std::unique_ptr<ScaleRegistry> registry;
    std::unique_ptr<LearningUpdater> updater;
};

TEST_F(LearningUpdaterTest, PullsTowardObservation) {
    updater->update_from_observation("A", 0, obs(1.0, 0.0), 0.5);
    Vector e = registry->store("A").get(0);
    EXPECT_DOUBLE_EQ(e[0], 0.5);
    EXPECT_DOUBLE_EQ(e[1], 0.0);
}

TEST_F(LearningUpdaterTest, RateOneStoresObservationExactly) {
    Vector o = obs(0.1234567890123, -9.87654321e-5);
    updater->update_from_observation("A", 2, o, 1.0);
    EXPECT_EQ(registry->store("A").get(2), o);
}

TEST_F(LearningUpdaterTest, RateZeroLeavesEmbeddingUnchanged) {
    Vector before = registry->store("A").get(2);
    updater->update_from_observation("A", 2, obs(100.0, 100.0), 0.0);
    EXPECT_EQ(registry->store("A").get(2), before);
}

TEST_F(LearningUpdaterTest, DistanceShrinksMonotonically) {
    Vector o = obs(5.0, -3.0);
    double prev = (o - registry->store("A").get(1)).norm();
    for (int step = 0; step < 50; ++step) {
        updater->update_from_observation("A", 1, o, 0.2);
        double now = (o - registry->store("A").get(1)).norm();
        EXPECT_LE(now, prev);
        EXPECT_NEAR(now, 0.8 * prev, 1e-12);
        prev = now;
    }
}

TEST_F(LearningUpdaterTest, OnlyTargetComponentChanges) {
    RowMatrix before = registry->store("A").matrix();
    updater->update_from_observation("A", 1, obs(2.0, 2.0), 0.3);
    RowMatrix after = registry->store("A").matrix();

    EXPECT_EQ(after.row(0), before.row(0));
    EXPECT_EQ(after.row(2), before.row(2));
    EXPECT_NE(after.row(1), before.row(1));
}

TEST_F(LearningUpdaterTest, ValidationHappensBeforeWrite) {
    RowMatrix before = registry->store("A").matrix();

    EXPECT_THROW(updater->update_from_observation("A", 0, obs(1, 1), 1.5), ArgumentError);
    EXPECT_THROW(updater->update_from_observation("A", 0, obs(1, 1), -0.1), ArgumentError);
    EXPECT_THROW(updater->update_from_observation("A", 0, obs(1, 1), std::nan("")), ArgumentError);
    EXPECT_THROW(updater->update_from_observation("A", 3, obs(1, 1), 0.5), IndexError);
    EXPECT_THROW(updater->update_from_observation("Z", 0, obs(1, 1), 0.5), UnknownScaleError);
    EXPECT_THROW(updater->update_from_observation("A", 0, Vector::Ones(3), 0.5), DimensionError);
    EXPECT_THROW(updater->update_from_observation("A", 0, obs(std::numeric_limits<double>::infinity(), 0), 0.5),
                 NumericError);

    EXPECT_EQ(registry->store("A").matrix(), before);
}

TEST_F(LearningUpdaterTest, BatchAppliesInOrder) {
    std::vector<Observation> batch = {
        {0, obs(1.0, 1.0)},
        {0, obs(3.0, 3.0)},
        {2, obs(0.0, 0.0)},
    };
    EXPECT_EQ(updater->update_batch("A", batch, 1.0), 3u);
    EXPECT_EQ(registry->store("A").get(0), obs(3.0, 3.0));
    EXPECT_EQ(registry->store("A").get(2), obs(0.0, 0.0));
}

TEST_F(LearningUpdaterTest, BatchStopsAtFirstInvalidItem) {
    std::vector<Observation> batch = {
        {0, obs(1.0, 1.0)},
        {7, obs(2.0, 2.0)},
        {2, obs(9.0, 9.0)},
    };
    Vector untouched = registry->store("A").get(2);

    EXPECT_THROW(updater->update_batch("A", batch, 1.0), IndexError);
    EXPECT_EQ(registry->store("A").get(0), obs(1.0, 1.0));
    EXPECT_EQ(registry->store("A").get(2), untouched);
}

TEST_F(LearningUpdaterTest, BatchHonoursCancelFlag) {
    std::vector<Observation> batch = {
        {0, obs(1.0, 1.0)},
        {1, obs(2.0, 2.0)},
    };
    Vector before = registry->store("A").get(0);

    std::atomic<bool> cancel{true};
    EXPECT_EQ(updater->update_batch("A", batch, 1.0, &cancel), 0u);
    EXPECT_EQ(registry->store("A").get(0), before);

    cancel = false;
    EXPECT_EQ(updater->update_batch("A", batch, 1.0, &cancel), 2u);
}

TEST_F(LearningUpdaterTest, BatchValidatesRateAndScaleUpFront) {
    std::vector<Observation> empty;
    EXPECT_THROW(updater->update_batch("A", empty, 2.0), ArgumentError);
    EXPECT_THROW(updater->update_batch("Z", empty, 0.5), UnknownScaleError);
    EXPECT_EQ(updater->update_batch("A", empty, 0.5), 0u);
}
