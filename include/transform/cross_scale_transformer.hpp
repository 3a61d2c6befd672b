/**
 * @file cross_scale_transformer.hpp
 * @brief Learnable linear maps between the vector spaces of two scales
 *
 * One D×D matrix per ordered (from, to) pair. The matrix for to → from is a
 * separate learnable parameter: it is never assumed to be the transpose or
 * inverse of from → to.
 */

#pragma once

#include <core/scale.hpp>
#include <export.hpp>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace Strata {

class STRATA_API CrossScaleTransformer {
public:
    using ScalePair = std::pair<std::string, std::string>;

    CrossScaleTransformer(ScaleSchema schema, size_t dimension);

    CrossScaleTransformer(const CrossScaleTransformer&) = delete;
    CrossScaleTransformer& operator=(const CrossScaleTransformer&) = delete;

    size_t dimension() const { return dimension_; }

    /**
     * @brief output = M(from→to) · vector; from == to returns the vector unchanged.
     *
     * @throws UnknownScaleError, DimensionError
     * @throws MissingTransformError if no matrix is registered for the pair;
     *         there is no fallback to identity, the reverse matrix, or a chain
     *         through intermediate scales
     */
    Vector transform(const Vector& vector, const std::string& from, const std::string& to) const;

    /**
     * @brief Register or replace the matrix of an ordered pair.
     *
     * @throws UnknownScaleError, ArgumentError (from == to),
     *         DimensionError (not D×D), NumericError (non-finite)
     */
    void set_matrix(const std::string& from, const std::string& to, const Matrix& matrix);

    /**
     * @throws MissingTransformError
     */
    Matrix matrix(const std::string& from, const std::string& to) const;

    bool contains(const std::string& from, const std::string& to) const;

    /**
     * @return true if a matrix was removed
     */
    bool remove(const std::string& from, const std::string& to);

    /**
     * @brief Registered pairs, ordered by (from ordinal, to ordinal).
     */
    std::vector<ScalePair> pairs() const;
    size_t size() const;

    /**
     * @brief One least-squares gradient step pulling M·source toward target.
     *
     * M ← M + rate · (target − M·source) · sourceᵀ
     *
     * @throws ArgumentError (rate outside [0, 1]), DimensionError,
     *         MissingTransformError, NumericError (non-finite result, matrix untouched)
     */
    void train_step(const std::string& from, const std::string& to,
                    const Vector& source, const Vector& target, double rate);

    /**
     * @brief Hold the shared lock across several reads (snapshotting).
     */
    std::shared_lock<std::shared_mutex> lock_shared() const {
        return std::shared_lock<std::shared_mutex>(mutex_);
    }

    /**
     * @brief Matrix access for a caller already holding lock_shared().
     */
    const Matrix& matrix_unlocked(const std::string& from, const std::string& to) const;
    const Matrix* find_unlocked(const std::string& from, const std::string& to) const;

private:
    using Key = std::pair<size_t, size_t>;

    Key key_for(const std::string& from, const std::string& to) const;
    void check_vector(const Vector& vector, const char* what) const;
    [[noreturn]] void throw_missing(const std::string& from, const std::string& to) const;

    ScaleSchema schema_;
    size_t dimension_;
    std::map<Key, Matrix> matrices_;
    mutable std::shared_mutex mutex_;
};

} // namespace Strata
