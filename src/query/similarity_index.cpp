/**
 * @file similarity_index.cpp
 * @brief Brute-force cosine ranking; scales are small enough for exact search
 */

#include <query/similarity_index.hpp>
#include <core/errors.hpp>
#include <core/numeric.hpp>
#include <algorithm>
#include <cmath>

namespace Strata {

double cosine_similarity(const Eigen::Ref<const Vector>& u, const Eigen::Ref<const Vector>& v) {
    if (u.size() != v.size()) {
        throw DimensionError("Cosine similarity of vectors with lengths " + std::to_string(u.size()) +
                             " and " + std::to_string(v.size()));
    }

    if (!all_finite(u) || !all_finite(v)) {
        throw NumericError("Cosine similarity of a vector containing NaN or Inf");
    }
    if (u.size() == 0) {
        return 0.0;
    }

    // Each vector is divided by its largest magnitude first, so the sums stay
    // within [0, D] for any finite input. For u == v the scaled copies and the
    // three sums are bitwise equal, and sqrt(uu * uu) == uu, so the quotient
    // is exactly 1.
    const double su = u.cwiseAbs().maxCoeff();
    const double sv = v.cwiseAbs().maxCoeff();
    if (su == 0.0 || sv == 0.0) {
        return 0.0;
    }

    double dot = 0.0, uu = 0.0, vv = 0.0;
    for (Eigen::Index i = 0; i < u.size(); ++i) {
        const double a = u[i] / su;
        const double b = v[i] / sv;
        dot += a * b;
        uu  += a * a;
        vv  += b * b;
    }

    if (su * std::sqrt(uu) < kNormEpsilon || sv * std::sqrt(vv) < kNormEpsilon) {
        return 0.0;
    }

    return std::clamp(dot / std::sqrt(uu * vv), -1.0, 1.0);
}

SimilarityIndex::SimilarityIndex(const ScaleRegistry& registry) : registry_(registry) {}

std::vector<double> SimilarityIndex::score_all(const RowMatrix& table, const Vector& vector) {
    if (table.cols() != vector.size()) {
        throw DimensionError("Query vector has length " + std::to_string(vector.size()) +
                             ", expected " + std::to_string(table.cols()));
    }
    // Checked here rather than per row: nothing may throw inside the parallel loop.
    if (!all_finite(vector)) {
        throw NumericError("Similarity target contains NaN or Inf");
    }

    const Eigen::Index n = table.rows();
    std::vector<double> scores(static_cast<size_t>(n), 0.0);

    #pragma omp parallel for schedule(static) if(n > 256)
    for (Eigen::Index i = 0; i < n; ++i) {
        scores[static_cast<size_t>(i)] = cosine_similarity(table.row(i).transpose(), vector);
    }

    return scores;
}

std::vector<SimilarityHit> SimilarityIndex::rank(const std::vector<double>& scores, size_t top_k) {
    std::vector<SimilarityHit> hits;
    hits.reserve(scores.size());
    for (size_t i = 0; i < scores.size(); ++i) {
        hits.push_back({i, scores[i]});
    }

    const size_t k = std::min(top_k, hits.size());
    auto by_score = [](const SimilarityHit& a, const SimilarityHit& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.id < b.id;
    };
    std::partial_sort(hits.begin(), hits.begin() + static_cast<std::ptrdiff_t>(k), hits.end(), by_score);
    hits.resize(k);

    return hits;
}

std::vector<SimilarityHit> SimilarityIndex::query(const Vector& vector, const std::string& scale, size_t top_k) const {
    const EmbeddingStore& store = registry_.store(scale);
    if (static_cast<size_t>(vector.size()) != store.dimension()) {
        throw DimensionError("Query vector has length " + std::to_string(vector.size()) +
                             ", expected " + std::to_string(store.dimension()));
    }
    if (!all_finite(vector)) {
        throw NumericError("Query vector contains NaN or Inf");
    }

    auto scores = store.read([&](const RowMatrix& table, const std::vector<Metadata>&) {
        return score_all(table, vector);
    });

    return rank(scores, top_k);
}

double SimilarityIndex::component_similarity(const std::string& scale, size_t a, size_t b) const {
    const EmbeddingStore& store = registry_.store(scale);
    store.check_id(a);
    store.check_id(b);

    return store.read([&](const RowMatrix& table, const std::vector<Metadata>&) {
        return cosine_similarity(table.row(a).transpose(), table.row(b).transpose());
    });
}

} // namespace Strata
