/**
 * @file test_signal_propagator.cpp
 * @brief Unit tests for cross-scale signal propagation
 */

#include <gtest/gtest.h>
#include <cognitive/signal_propagator.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <cmath>
#include <limits>

using namespace Strata;

class SignalPropagatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::set_level(Logger::Level::Off);

        RowMatrix a(2, 3);
        a << 1, 0, 0,
             0, 2, 0;
        RowMatrix b(4, 3);
        b << 1, 0, 0,
             0, 1, 0,
             -1, 0, 0,
             1, 1, 0;

        std::vector<std::unique_ptr<EmbeddingStore>> stores;
        stores.push_back(std::make_unique<EmbeddingStore>("A", a));
        stores.push_back(std::make_unique<EmbeddingStore>("B", b));
        ScaleSchema schema({{"A", 2}, {"B", 4}});

        registry = std::make_unique<ScaleRegistry>(schema, 3, std::move(stores));
        transformer = std::make_unique<CrossScaleTransformer>(schema, 3);
        transformer->set_matrix("A", "B", Matrix::Identity(3, 3));
        propagator = std::make_unique<SignalPropagator>(*registry, *transformer);
    }

    void TearDown() override {
        Logger::set_level(Logger::Level::Info);
    }

    std::unique_ptr<ScaleRegistry> registry;
    std::unique_ptr<CrossScaleTransformer> transformer;
    std::unique_ptr<SignalPropagator> propagator;
};

TEST_F(SignalPropagatorTest, OneNonNegativeEntryPerTargetComponent) {
    ActivationMap act = propagator->propagate("A", 0, "B", 1.0);

    ASSERT_EQ(act.size(), 4u);
    EXPECT_EQ(act.at(0), 1.0);
    EXPECT_EQ(act.at(1), 0.0);
    EXPECT_EQ(act.at(2), 0.0);          // anti-aligned is clamped, not negative
    EXPECT_NEAR(act.at(3), std::sqrt(0.5), 1e-15);
    for (const auto& [id, value] : act) {
        EXPECT_GE(value, 0.0) << "component " << id;
    }
}

TEST_F(SignalPropagatorTest, StrengthScalesLinearly) {
    ActivationMap unit = propagator->propagate("A", 1, "B", 1.0);
    ActivationMap scaled = propagator->propagate("A", 1, "B", 2.5);

    EXPECT_EQ(scaled.at(1), 2.5);
    for (const auto& [id, value] : unit) {
        EXPECT_DOUBLE_EQ(scaled.at(id), 2.5 * value);
    }

    ActivationMap zero = propagator->propagate("A", 1, "B", 0.0);
    for (const auto& [id, value] : zero) {
        EXPECT_EQ(value, 0.0) << "component " << id;
    }
}

TEST_F(SignalPropagatorTest, SameScaleUsesIdentity) {
    ActivationMap act = propagator->propagate("B", 3, "B", 0.75);
    EXPECT_EQ(act.at(3), 0.75);
}

TEST_F(SignalPropagatorTest, Errors) {
    EXPECT_THROW(propagator->propagate("B", 0, "A", 1.0), MissingTransformError);
    EXPECT_THROW(propagator->propagate("A", 2, "B", 1.0), IndexError);
    EXPECT_THROW(propagator->propagate("Z", 0, "B", 1.0), UnknownScaleError);
    EXPECT_THROW(propagator->propagate("A", 0, "Z", 1.0), UnknownScaleError);
    EXPECT_THROW(propagator->propagate("A", 0, "B", -1.0), ArgumentError);
    EXPECT_THROW(propagator->propagate("A", 0, "B", std::numeric_limits<double>::infinity()), ArgumentError);
}

TEST_F(SignalPropagatorTest, DoesNotMutateFabric) {
    RowMatrix a_before = registry->store("A").matrix();
    RowMatrix b_before = registry->store("B").matrix();
    Matrix m_before = transformer->matrix("A", "B");

    propagator->propagate("A", 0, "B", 3.0);

    EXPECT_EQ(registry->store("A").matrix(), a_before);
    EXPECT_EQ(registry->store("B").matrix(), b_before);
    EXPECT_EQ(transformer->matrix("A", "B"), m_before);
}
