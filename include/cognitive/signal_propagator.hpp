/**
 * @file signal_propagator.hpp
 * @brief Diffuse an activation from one component into a whole target scale
 *
 * The source embedding is carried into the target scale's space by the
 * cross-scale transform, then each target component is activated in
 * proportion to its (non-negative) cosine similarity with the result.
 * Propagation is excitatory only: anti-correlated components get 0.
 */

#pragma once

#include <storage/scale_registry.hpp>
#include <transform/cross_scale_transformer.hpp>
#include <export.hpp>
#include <map>
#include <string>

namespace Strata {

using ActivationMap = std::map<size_t, double>;

class STRATA_API SignalPropagator {
public:
    SignalPropagator(const ScaleRegistry& registry, const CrossScaleTransformer& transformer);

    /**
     * @brief activation[id] = strength × max(0, cos(M·source, target[id]))
     *
     * @return one entry per component of the target scale; values are
     *         independent, not normalized
     * @throws UnknownScaleError, IndexError, MissingTransformError,
     *         ArgumentError (strength negative or non-finite),
     *         NumericError (the transformed vector overflowed)
     */
    ActivationMap propagate(const std::string& source_scale, size_t source_id,
                            const std::string& target_scale, double strength = 1.0) const;

private:
    const ScaleRegistry& registry_;
    const CrossScaleTransformer& transformer_;
};

} // namespace Strata
