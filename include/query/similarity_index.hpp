/**
 * @file similarity_index.hpp
 * @brief Cosine similarity and exact top-k ranking within one scale
 */

#pragma once

#include <storage/scale_registry.hpp>
#include <core/scale.hpp>
#include <export.hpp>
#include <string>
#include <vector>

namespace Strata {

/// Norms below this are treated as zero: similarity falls back to 0.0.
constexpr double kNormEpsilon = 1e-10;

/**
 * @brief dot(u, v) / (‖u‖ ‖v‖), clamped to [-1, 1].
 *
 * Returns 0.0 when either norm is below kNormEpsilon. Identical non-zero
 * vectors score exactly 1.0, whatever their magnitude.
 *
 * @throws DimensionError if the lengths differ
 * @throws NumericError if either vector contains NaN or Inf
 */
STRATA_API double cosine_similarity(const Eigen::Ref<const Vector>& u, const Eigen::Ref<const Vector>& v);

struct SimilarityHit {
    size_t id;
    double score;
};

class STRATA_API SimilarityIndex {
public:
    explicit SimilarityIndex(const ScaleRegistry& registry);

    /**
     * @brief Rank every component of a scale against a query vector.
     *
     * @return min(top_k, cardinality) hits, descending score, ties by ascending id
     * @throws UnknownScaleError, DimensionError, NumericError (non-finite query)
     */
    std::vector<SimilarityHit> query(const Vector& vector, const std::string& scale, size_t top_k) const;

    /**
     * @brief Cosine similarity between two components of the same scale.
     */
    double component_similarity(const std::string& scale, size_t a, size_t b) const;

    /**
     * @brief Similarity of the query against every row of a table.
     *
     * @throws DimensionError, NumericError (non-finite query)
     */
    static std::vector<double> score_all(const RowMatrix& table, const Vector& vector);

    /**
     * @brief Order scores descending (ties by ascending id) and keep top_k.
     */
    static std::vector<SimilarityHit> rank(const std::vector<double>& scores, size_t top_k);

private:
    const ScaleRegistry& registry_;
};

} // namespace Strata
