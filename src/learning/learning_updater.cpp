#include <learning/learning_updater.hpp>
#include <core/errors.hpp>
#include <core/numeric.hpp>
#include <utils/logger.hpp>
#include <cmath>

namespace Strata {

LearningUpdater::LearningUpdater(ScaleRegistry& registry) : registry_(registry) {}

void LearningUpdater::check_rate(double rate) {
    if (!std::isfinite(rate) || rate < 0.0 || rate > 1.0) {
        throw ArgumentError("Learning rate must lie in [0, 1], got " + std::to_string(rate));
    }
}

void LearningUpdater::update_from_observation(const std::string& scale, size_t id,
                                              const Vector& observation, double rate) {
    check_rate(rate);
    EmbeddingStore& store = registry_.store(scale);
    store.check_id(id);

    if (static_cast<size_t>(observation.size()) != store.dimension()) {
        throw DimensionError("Observation has length " + std::to_string(observation.size()) +
                             ", expected " + std::to_string(store.dimension()));
    }
    if (!all_finite(observation)) {
        throw NumericError("Observation contains NaN or Inf");
    }

    if (rate == 0.0) return;

    store.update(id, [&](const Vector& current) -> Vector {
        if (rate == 1.0) return observation;
        return (1.0 - rate) * current + rate * observation;
    });
}

size_t LearningUpdater::update_batch(const std::string& scale, const std::vector<Observation>& observations,
                                     double rate, const std::atomic<bool>* cancel) {
    check_rate(rate);
    registry_.ordinal(scale);

    size_t applied = 0;
    for (const auto& obs : observations) {
        if (cancel && cancel->load(std::memory_order_relaxed)) {
            Logger::info("Batch update on " + scale + " cancelled after " +
                         std::to_string(applied) + " of " + std::to_string(observations.size()));
            break;
        }
        update_from_observation(scale, obs.id, obs.values, rate);
        ++applied;
    }
    return applied;
}

} // namespace Strata
