/**
 * @file test_end_to_end_pipeline.cpp
 * @brief End-to-end: create -> transform -> propagate -> query -> learn -> snapshot
 */

#include <gtest/gtest.h>
#include <fabric.hpp>
#include <integration/collaborators.hpp>
#include <integration/concept_map.hpp>
#include <persistence/persistence_manager.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <filesystem>
#include <random>

using namespace Strata;
namespace fs = std::filesystem;

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::set_level(Logger::Level::Off);
    }

    void TearDown() override {
        Logger::set_level(Logger::Level::Info);
    }

    static FabricConfig two_scale_config(uint64_t seed) {
        FabricConfig config;
        config.dimension = 4;
        config.init_std = 0.1;
        config.seed = seed;
        config.schema = ScaleSchema({{"A", 3}, {"B", 2}});
        return config;
    }

    // Identity plus small noise drawn from its own generator
    static Matrix noisy_identity(uint64_t seed) {
        std::mt19937_64 rng(seed);
        std::normal_distribution<double> noise(0.0, 0.01);
        Matrix m = Matrix::Identity(4, 4);
        for (Eigen::Index i = 0; i < m.size(); ++i) m(i) += noise(rng);
        return m;
    }

    static ActivationMap run_scenario(uint64_t seed) {
        auto fabric = create_fabric(two_scale_config(seed));
        fabric->register_transform("A", "B", noisy_identity(seed));

        Vector unit = Vector::Zero(4);
        unit[0] = 1.0;
        fabric->set_embedding("A", 0, unit);

        return fabric->propagate_signal("A", 0, "B", 10.0);
    }
};

TEST_F(PipelineTest, TwoScalePropagation) {
    ActivationMap act = run_scenario(314);

    ASSERT_EQ(act.size(), 2u);
    for (const auto& [id, value] : act) {
        EXPECT_LT(id, 2u);
        EXPECT_GE(value, 0.0);
        EXPECT_LE(value, 10.0);
    }
}

TEST_F(PipelineTest, PropagationIsReproducibleForSeed) {
    ActivationMap first = run_scenario(314);
    ActivationMap second = run_scenario(314);
    EXPECT_EQ(first, second);
}

TEST_F(PipelineTest, IdentityTransformQueryAndLearn) {
    auto fabric = create_fabric(two_scale_config(8));
    fabric->register_transform("A", "B", Matrix::Identity(4, 4));

    // Transformed A[1] is found verbatim once B[1] is taught to match it.
    Vector a1 = fabric->get_embedding("A", 1);
    Vector projected = fabric->transform_across_scales(a1, "A", "B");
    EXPECT_EQ(projected, a1);

    fabric->update_from_observation("B", 1, projected, 1.0);
    auto hits = fabric->query_similar(projected, "B", 2);
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].id, 1u);
    EXPECT_EQ(hits[0].score, 1.0);

    ActivationMap act = fabric->propagate_signal("A", 1, "B", 1.0);
    EXPECT_EQ(act.at(1), 1.0);

    // Same-scale transform is the identity regardless of registered pairs
    EXPECT_EQ(fabric->transform_across_scales(a1, "A", "A"), a1);

    // B->A was drawn at creation; removing it makes the pair missing
    fabric->transformer().remove("B", "A");
    EXPECT_THROW(fabric->transform_across_scales(a1, "B", "A"), MissingTransformError);
}

TEST_F(PipelineTest, SnapshotRoundTrip) {
    auto fabric = create_integrated_fabric(two_scale_config(21));
    ConceptMap concepts(*fabric);
    concepts.bind("barrier", "A");
    fabric->update_from_observation("B", 0, Vector::Constant(4, 0.3), 0.25);
    fabric->train_transform("A", 2, "B", 1, 0.1);

    fs::path path = fs::temp_directory_path() / "strata_e2e_snapshot.json";
    fabric->save(path);

    LoadOptions options;
    options.expected_schema = two_scale_config(21).schema;
    options.expected_dimension = 4;
    auto loaded = Fabric::load(path, options);
    fs::remove(path);

    for (const auto& spec : fabric->schema()) {
        for (size_t id = 0; id < spec.cardinality; ++id) {
            Vector diff = loaded->get_embedding(spec.name, id) - fabric->get_embedding(spec.name, id);
            EXPECT_LE(diff.cwiseAbs().maxCoeff(), 1e-6) << spec.name << "[" << id << "]";
            EXPECT_EQ(loaded->get_metadata(spec.name, id), fabric->get_metadata(spec.name, id));
        }
    }
    Matrix dm = loaded->transformer().matrix("A", "B") - fabric->transformer().matrix("A", "B");
    EXPECT_LE(dm.cwiseAbs().maxCoeff(), 1e-6);

    EXPECT_EQ(loaded->collaborators(), fabric->collaborators());
    ConceptMap restored(*loaded);
    ASSERT_TRUE(restored.lookup("barrier").has_value());
    EXPECT_EQ(restored.lookup("barrier")->id, 0u);

    // The restored fabric keeps working
    auto act_live = fabric->propagate_signal("A", 0, "B", 2.0);
    auto act_loaded = loaded->propagate_signal("A", 0, "B", 2.0);
    ASSERT_EQ(act_live.size(), act_loaded.size());
    for (const auto& [id, value] : act_live) {
        EXPECT_NEAR(act_loaded.at(id), value, 1e-6);
    }
}
