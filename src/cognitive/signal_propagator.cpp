#include <cognitive/signal_propagator.hpp>
#include <query/similarity_index.hpp>
#include <core/errors.hpp>
#include <algorithm>
#include <cmath>

namespace Strata {

SignalPropagator::SignalPropagator(const ScaleRegistry& registry, const CrossScaleTransformer& transformer)
    : registry_(registry), transformer_(transformer) {}

ActivationMap SignalPropagator::propagate(const std::string& source_scale, size_t source_id,
                                          const std::string& target_scale, double strength) const {
    if (!std::isfinite(strength) || strength < 0.0) {
        throw ArgumentError("Signal strength must be finite and non-negative");
    }

    const EmbeddingStore& target = registry_.store(target_scale);

    // 1. Source embedding (copied; the source lock is released before the target is read)
    Vector source = registry_.store(source_scale).get(source_id);

    // 2. Into the target scale's space
    Vector carried = transformer_.transform(source, source_scale, target_scale);

    // 3. Similarity with every target component
    auto scores = target.read([&](const RowMatrix& table, const std::vector<Metadata>&) {
        return SimilarityIndex::score_all(table, carried);
    });

    // 4. Excitatory activation
    ActivationMap activations;
    for (size_t id = 0; id < scores.size(); ++id) {
        activations[id] = strength * std::max(0.0, scores[id]);
    }

    return activations;
}

} // namespace Strata
