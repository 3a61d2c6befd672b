#include <transform/cross_scale_transformer.hpp>
#include <core/errors.hpp>
#include <core/numeric.hpp>
#include <utils/logger.hpp>
#include <cmath>

namespace Strata {

CrossScaleTransformer::CrossScaleTransformer(ScaleSchema schema, size_t dimension)
    : schema_(std::move(schema)), dimension_(dimension) {}

CrossScaleTransformer::Key CrossScaleTransformer::key_for(const std::string& from, const std::string& to) const {
    return {schema_.ordinal(from), schema_.ordinal(to)};
}

void CrossScaleTransformer::check_vector(const Vector& vector, const char* what) const {
    if (static_cast<size_t>(vector.size()) != dimension_) {
        throw DimensionError(std::string(what) + " has length " + std::to_string(vector.size()) +
                             ", expected " + std::to_string(dimension_));
    }
}

void CrossScaleTransformer::throw_missing(const std::string& from, const std::string& to) const {
    Logger::warn("No transform registered for " + transform_key(from, to));
    throw MissingTransformError("No transform registered for " + transform_key(from, to));
}

Vector CrossScaleTransformer::transform(const Vector& vector, const std::string& from, const std::string& to) const {
    Key key = key_for(from, to);
    check_vector(vector, "Transform input");

    if (key.first == key.second) {
        return vector;
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = matrices_.find(key);
    if (it == matrices_.end()) {
        throw_missing(from, to);
    }
    return it->second * vector;
}

void CrossScaleTransformer::set_matrix(const std::string& from, const std::string& to, const Matrix& matrix) {
    Key key = key_for(from, to);
    if (key.first == key.second) {
        throw ArgumentError("A transform needs two distinct scales, got " + transform_key(from, to));
    }
    if (static_cast<size_t>(matrix.rows()) != dimension_ || static_cast<size_t>(matrix.cols()) != dimension_) {
        throw DimensionError("Transform " + transform_key(from, to) + " must be " +
                             std::to_string(dimension_) + "x" + std::to_string(dimension_));
    }
    if (!all_finite(matrix)) {
        throw NumericError("Transform " + transform_key(from, to) + " contains NaN or Inf");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    matrices_[key] = matrix;
}

Matrix CrossScaleTransformer::matrix(const std::string& from, const std::string& to) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return matrix_unlocked(from, to);
}

const Matrix& CrossScaleTransformer::matrix_unlocked(const std::string& from, const std::string& to) const {
    auto it = matrices_.find(key_for(from, to));
    if (it == matrices_.end()) {
        throw_missing(from, to);
    }
    return it->second;
}

const Matrix* CrossScaleTransformer::find_unlocked(const std::string& from, const std::string& to) const {
    auto it = matrices_.find(key_for(from, to));
    return it == matrices_.end() ? nullptr : &it->second;
}

bool CrossScaleTransformer::contains(const std::string& from, const std::string& to) const {
    Key key = key_for(from, to);
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return matrices_.count(key) > 0;
}

bool CrossScaleTransformer::remove(const std::string& from, const std::string& to) {
    Key key = key_for(from, to);
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return matrices_.erase(key) > 0;
}

std::vector<CrossScaleTransformer::ScalePair> CrossScaleTransformer::pairs() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<ScalePair> result;
    result.reserve(matrices_.size());
    for (const auto& [key, _] : matrices_) {
        result.emplace_back(schema_[key.first].name, schema_[key.second].name);
    }
    return result;
}

size_t CrossScaleTransformer::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return matrices_.size();
}

void CrossScaleTransformer::train_step(const std::string& from, const std::string& to,
                                       const Vector& source, const Vector& target, double rate) {
    if (!std::isfinite(rate) || rate < 0.0 || rate > 1.0) {
        throw ArgumentError("Transform learning rate must lie in [0, 1]");
    }
    Key key = key_for(from, to);
    check_vector(source, "Training source");
    check_vector(target, "Training target");
    if (!all_finite(source) || !all_finite(target)) {
        throw NumericError("Training vectors contain NaN or Inf");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = matrices_.find(key);
    if (it == matrices_.end()) {
        throw_missing(from, to);
    }

    Matrix& m = it->second;
    Vector residual = target - m * source;
    Matrix next = m + rate * residual * source.transpose();
    if (!all_finite(next)) {
        throw NumericError("Training step on " + transform_key(from, to) + " diverged");
    }
    m = std::move(next);
}

} // namespace Strata
