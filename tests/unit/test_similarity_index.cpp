/**
 * @file test_similarity_index.cpp
 * @brief Unit tests for cosine similarity and top-k ranking
 */

#include <gtest/gtest.h>
#include <query/similarity_index.hpp>
#include <core/errors.hpp>
#include <cmath>
#include <limits>
#include <random>

using namespace Strata;

static Vector vec(std::initializer_list<double> values) {
    Vector v(static_cast<Eigen::Index>(values.size()));
    Eigen::Index i = 0;
    for (double x : values) v[i++] = x;
    return v;
}

// =============================================================================
//  cosine_similarity
// =============================================================================

TEST(CosineSimilarityTest, IdenticalVectorsGiveExactlyOne) {
    std::mt19937_64 rng(7);
    std::normal_distribution<double> normal(0.0, 3.0);
    for (int trial = 0; trial < 200; ++trial) {
        Vector v(16);
        for (Eigen::Index i = 0; i < v.size(); ++i) v[i] = normal(rng);
        EXPECT_EQ(cosine_similarity(v, v), 1.0);
    }
}

TEST(CosineSimilarityTest, KnownValues) {
    EXPECT_DOUBLE_EQ(cosine_similarity(vec({1, 0}), vec({0, 1})), 0.0);
    EXPECT_DOUBLE_EQ(cosine_similarity(vec({1, 0}), vec({-1, 0})), -1.0);
    EXPECT_NEAR(cosine_similarity(vec({1, 1}), vec({1, 0})), std::sqrt(0.5), 1e-15);
    EXPECT_EQ(cosine_similarity(vec({2, 0, 0}), vec({5, 0, 0})), 1.0);
}

TEST(CosineSimilarityTest, Symmetric) {
    Vector a = vec({0.3, -1.2, 4.4, 0.01});
    Vector b = vec({-2.0, 0.5, 1.5, 9.0});
    EXPECT_EQ(cosine_similarity(a, b), cosine_similarity(b, a));
}

TEST(CosineSimilarityTest, ZeroNormGivesZero) {
    EXPECT_EQ(cosine_similarity(vec({0, 0, 0}), vec({1, 2, 3})), 0.0);
    EXPECT_EQ(cosine_similarity(vec({1, 2, 3}), vec({0, 0, 0})), 0.0);
    EXPECT_EQ(cosine_similarity(vec({1e-12, 0, 0}), vec({1e-12, 0, 0})), 0.0);
}

TEST(CosineSimilarityTest, StaysInRangeForExtremeMagnitudes) {
    // ‖u‖²·‖v‖² overflows even though each squared norm is finite
    Vector big = vec({1e150, 3e150, -2e150});
    Vector small = vec({1e100, 3e100, -2e100});
    double s = cosine_similarity(big, small);
    EXPECT_GE(s, -1.0);
    EXPECT_LE(s, 1.0);
    EXPECT_NEAR(s, 1.0, 1e-12);
}

TEST(CosineSimilarityTest, HugeIdenticalVectorsGiveExactlyOne) {
    // Unscaled squared sums of these entries overflow to Inf
    Vector big = Vector::Constant(4, 1e160);
    EXPECT_EQ(cosine_similarity(big, big), 1.0);

    Vector mixed = vec({1e300, -3e299, 7e200, 1.0});
    EXPECT_EQ(cosine_similarity(mixed, mixed), 1.0);
    EXPECT_EQ(cosine_similarity(mixed, -mixed), -1.0);

    Vector near_max = Vector::Constant(3, std::numeric_limits<double>::max());
    EXPECT_EQ(cosine_similarity(near_max, near_max), 1.0);
    EXPECT_EQ(cosine_similarity(near_max, Vector::Constant(3, 1e-3)), 1.0);
}

TEST(CosineSimilarityTest, NonFiniteInputThrows) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    EXPECT_THROW(cosine_similarity(vec({nan, 1}), vec({1, 1})), NumericError);
    EXPECT_THROW(cosine_similarity(vec({1, 1}), vec({inf, 1})), NumericError);
}

TEST(CosineSimilarityTest, LengthMismatchThrows) {
    EXPECT_THROW(cosine_similarity(vec({1, 2}), vec({1, 2, 3})), DimensionError);
}

// =============================================================================
//  SimilarityIndex
// =============================================================================

class SimilarityIndexTest : public ::testing::Test {
protected:
    void SetUp() override {
        RowMatrix table(5, 3);
        table << 1, 0, 0,
                 0, 1, 0,
                 1, 0, 0,     // duplicate of 0
                 0, 0, 0,     // zero-norm component
                 -1, 0, 0;

        std::vector<std::unique_ptr<EmbeddingStore>> stores;
        stores.push_back(std::make_unique<EmbeddingStore>("A", table));
        registry = std::make_unique<ScaleRegistry>(ScaleSchema({{"A", 5}}), 3, std::move(stores));
        index = std::make_unique<SimilarityIndex>(*registry);
    }

    std::unique_ptr<ScaleRegistry> registry;
    std::unique_ptr<SimilarityIndex> index;
};

TEST_F(SimilarityIndexTest, RanksDescendingWithIdTieBreak) {
    auto hits = index->query(vec({1, 0, 0}), "A", 5);
    ASSERT_EQ(hits.size(), 5u);

    EXPECT_EQ(hits[0].id, 0u);  EXPECT_EQ(hits[0].score, 1.0);
    EXPECT_EQ(hits[1].id, 2u);  EXPECT_EQ(hits[1].score, 1.0);
    EXPECT_EQ(hits[2].id, 1u);  EXPECT_EQ(hits[2].score, 0.0);
    EXPECT_EQ(hits[3].id, 3u);  EXPECT_EQ(hits[3].score, 0.0);
    EXPECT_EQ(hits[4].id, 4u);  EXPECT_EQ(hits[4].score, -1.0);
}

TEST_F(SimilarityIndexTest, TopKTruncation) {
    EXPECT_EQ(index->query(vec({0, 1, 0}), "A", 2).size(), 2u);
    EXPECT_EQ(index->query(vec({0, 1, 0}), "A", 50).size(), 5u);
    EXPECT_TRUE(index->query(vec({0, 1, 0}), "A", 0).empty());

    auto top = index->query(vec({0, 1, 0}), "A", 1);
    EXPECT_EQ(top[0].id, 1u);
}

TEST_F(SimilarityIndexTest, ZeroQueryScoresEverythingZero) {
    auto hits = index->query(vec({0, 0, 0}), "A", 5);
    ASSERT_EQ(hits.size(), 5u);
    for (size_t i = 0; i < hits.size(); ++i) {
        EXPECT_EQ(hits[i].id, i);
        EXPECT_EQ(hits[i].score, 0.0);
    }
}

TEST_F(SimilarityIndexTest, QueryValidation) {
    EXPECT_THROW(index->query(vec({1, 0}), "A", 3), DimensionError);
    EXPECT_THROW(index->query(vec({1, 0, 0}), "B", 3), UnknownScaleError);
    EXPECT_THROW(index->query(vec({std::numeric_limits<double>::quiet_NaN(), 0, 0}), "A", 3), NumericError);
}

TEST_F(SimilarityIndexTest, ComponentSimilarity) {
    EXPECT_EQ(index->component_similarity("A", 0, 2), 1.0);
    EXPECT_EQ(index->component_similarity("A", 0, 4), -1.0);
    EXPECT_EQ(index->component_similarity("A", 0, 3), 0.0);
    EXPECT_THROW(index->component_similarity("A", 0, 5), IndexError);
}

TEST(SimilarityRankTest, ParallelScoringMatchesSerial) {
    // Large enough to take the OpenMP branch
    std::mt19937_64 rng(11);
    std::normal_distribution<double> normal(0.0, 1.0);
    RowMatrix table(1000, 8);
    for (Eigen::Index i = 0; i < table.size(); ++i) table(i) = normal(rng);
    Vector q(8);
    for (Eigen::Index i = 0; i < q.size(); ++i) q[i] = normal(rng);

    auto scores = SimilarityIndex::score_all(table, q);
    ASSERT_EQ(scores.size(), 1000u);
    for (Eigen::Index r = 0; r < table.rows(); ++r) {
        Vector row = table.row(r).transpose();
        EXPECT_EQ(scores[static_cast<size_t>(r)], cosine_similarity(row, q));
    }

    auto hits = SimilarityIndex::rank(scores, 10);
    ASSERT_EQ(hits.size(), 10u);
    for (size_t i = 1; i < hits.size(); ++i) {
        EXPECT_GE(hits[i - 1].score, hits[i].score);
    }
}
