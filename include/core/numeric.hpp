#pragma once

#include <core/scale.hpp>
#include <cmath>
#include <random>

namespace Strata {

template<typename Derived>
inline bool all_finite(const Eigen::DenseBase<Derived>& values) {
    for (Eigen::Index i = 0; i < values.size(); ++i) {
        if (!std::isfinite(values(i))) return false;
    }
    return true;
}

/**
 * @brief Fill with N(0, stddev²) in storage order.
 *
 * A zero stddev yields zeros without consuming the generator.
 */
template<typename Derived>
inline void fill_gaussian(Eigen::DenseBase<Derived>& values, double stddev, std::mt19937_64& rng) {
    if (stddev == 0.0) {
        values.setZero();
        return;
    }
    std::normal_distribution<double> normal(0.0, stddev);
    for (Eigen::Index i = 0; i < values.size(); ++i) {
        values(i) = normal(rng);
    }
}

} // namespace Strata
