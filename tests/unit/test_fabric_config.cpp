/**
 * @file test_fabric_config.cpp
 * @brief Unit tests for FabricConfig defaults, validation and environment overrides
 */

#include <gtest/gtest.h>
#include <core/fabric_config.hpp>
#include <core/errors.hpp>
#include <cmath>
#include <cstdlib>
#include <limits>

using namespace Strata;

class FabricConfigEnvTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const char* var : {"STRATA_DIMENSION", "STRATA_INIT_STD", "STRATA_LEARNING_RATE",
                                "STRATA_SEED", "STRATA_TRANSFORM_INIT"}) {
            unsetenv(var);
        }
    }
};

TEST(FabricConfigTest, Defaults) {
    FabricConfig config;
    EXPECT_EQ(config.dimension, 128u);
    EXPECT_DOUBLE_EQ(config.init_std, 0.01);
    EXPECT_DOUBLE_EQ(config.learning_rate, 0.01);
    EXPECT_FALSE(config.seed.has_value());
    EXPECT_EQ(config.transform_init, TransformInit::Gaussian);
    EXPECT_EQ(config.schema, ScaleSchema::skin_default());
    EXPECT_NO_THROW(config.validate());
}

TEST(FabricConfigTest, ValidateRejectsOutOfRangeValues) {
    FabricConfig config;

    config.dimension = 0;
    EXPECT_THROW(config.validate(), ArgumentError);
    config.dimension = 8;

    config.init_std = -0.1;
    EXPECT_THROW(config.validate(), ArgumentError);
    config.init_std = std::numeric_limits<double>::infinity();
    EXPECT_THROW(config.validate(), ArgumentError);
    config.init_std = 0.0;
    EXPECT_NO_THROW(config.validate());

    config.learning_rate = 1.5;
    EXPECT_THROW(config.validate(), ArgumentError);
    config.learning_rate = std::nan("");
    EXPECT_THROW(config.validate(), ArgumentError);
    config.learning_rate = 1.0;
    EXPECT_NO_THROW(config.validate());

    config.schema = ScaleSchema({{"a", 2}, {"a", 2}});
    EXPECT_THROW(config.validate(), ArgumentError);
}

TEST(FabricConfigTest, TransformInitNames) {
    EXPECT_EQ(to_string(TransformInit::Gaussian), "gaussian");
    EXPECT_EQ(to_string(TransformInit::IdentityNoise), "identity_noise");
    EXPECT_EQ(parse_transform_init("identity_noise"), TransformInit::IdentityNoise);
    EXPECT_THROW(parse_transform_init("orthogonal"), ArgumentError);
}

TEST_F(FabricConfigEnvTest, ReadsOverrides) {
    setenv("STRATA_DIMENSION", "16", 1);
    setenv("STRATA_INIT_STD", "0.5", 1);
    setenv("STRATA_LEARNING_RATE", "0.25", 1);
    setenv("STRATA_SEED", "42", 1);
    setenv("STRATA_TRANSFORM_INIT", "identity_noise", 1);

    FabricConfig config = FabricConfig::from_env();
    EXPECT_EQ(config.dimension, 16u);
    EXPECT_DOUBLE_EQ(config.init_std, 0.5);
    EXPECT_DOUBLE_EQ(config.learning_rate, 0.25);
    ASSERT_TRUE(config.seed.has_value());
    EXPECT_EQ(*config.seed, 42u);
    EXPECT_EQ(config.transform_init, TransformInit::IdentityNoise);
}

TEST_F(FabricConfigEnvTest, EmptyVariablesAreIgnored) {
    setenv("STRATA_DIMENSION", "", 1);
    setenv("STRATA_SEED", "", 1);

    FabricConfig config = FabricConfig::from_env();
    EXPECT_EQ(config.dimension, 128u);
    EXPECT_FALSE(config.seed.has_value());
}

TEST_F(FabricConfigEnvTest, RejectsUnparsableValues) {
    setenv("STRATA_DIMENSION", "12abc", 1);
    EXPECT_THROW(FabricConfig::from_env(), ArgumentError);
    unsetenv("STRATA_DIMENSION");

    setenv("STRATA_SEED", "-3", 1);
    EXPECT_THROW(FabricConfig::from_env(), ArgumentError);
    unsetenv("STRATA_SEED");

    setenv("STRATA_LEARNING_RATE", "2.0", 1);
    EXPECT_THROW(FabricConfig::from_env(), ArgumentError);
    unsetenv("STRATA_LEARNING_RATE");

    setenv("STRATA_TRANSFORM_INIT", "orthogonal", 1);
    EXPECT_THROW(FabricConfig::from_env(), ArgumentError);
}
