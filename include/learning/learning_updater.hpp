/**
 * @file learning_updater.hpp
 * @brief Pull component embeddings toward observed vectors
 */

#pragma once

#include <storage/scale_registry.hpp>
#include <export.hpp>
#include <atomic>
#include <string>
#include <utility>
#include <vector>

namespace Strata {

struct Observation {
    size_t id;
    Vector values;
};

class STRATA_API LearningUpdater {
public:
    explicit LearningUpdater(ScaleRegistry& registry);

    /**
     * @brief embedding ← embedding + rate · (observation − embedding)
     *
     * Evaluated as (1 − rate)·e + rate·o so that rate 1 stores the observation
     * exactly and rate 0 leaves the embedding bit-identical. Any rate in
     * (0, 1) shrinks the distance to the observation by the factor (1 − rate).
     *
     * @throws UnknownScaleError, IndexError, DimensionError, NumericError,
     *         ArgumentError (rate outside [0, 1]); nothing is written on failure
     */
    void update_from_observation(const std::string& scale, size_t id,
                                 const Vector& observation, double rate);

    /**
     * @brief Apply observations in order, checking cancel before each one.
     *
     * Stops at the first invalid observation and rethrows; updates applied
     * before it are kept.
     *
     * @param cancel optional caller-owned flag; set it to stop between items
     * @return number of updates applied
     */
    size_t update_batch(const std::string& scale, const std::vector<Observation>& observations,
                        double rate, const std::atomic<bool>* cancel = nullptr);

    static void check_rate(double rate);

private:
    ScaleRegistry& registry_;
};

} // namespace Strata
