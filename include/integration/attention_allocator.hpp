/**
 * @file attention_allocator.hpp
 * @brief Attention client: spread a budget over components by activation
 */

#pragma once

#include <fabric.hpp>
#include <export.hpp>
#include <map>
#include <string>

namespace Strata {

/// scale → (component id → share of the budget)
using AttentionAllocation = std::map<std::string, std::map<size_t, double>>;

class STRATA_API AttentionAllocator {
public:
    explicit AttentionAllocator(Fabric& fabric);

    /**
     * @brief Allocate `budget` in proportion to |activation| across all scales.
     *
     * Each activation vector must have one entry per component of its scale.
     * Scales whose activations are all zero receive nothing. If the total
     * activation is zero, every component of every scale gets
     * budget / total_components.
     *
     * @throws ArgumentError (negative or non-finite budget), UnknownScaleError,
     *         DimensionError (length ≠ cardinality), NumericError
     */
    AttentionAllocation allocate(const std::map<std::string, Vector>& activations, double budget = 1.0) const;

    /**
     * @brief Dense activation vector for a scale from a propagation result.
     *
     * Ids missing from the map read as 0.
     */
    Vector to_activation_vector(const std::string& scale, const ActivationMap& activations) const;

    /**
     * @brief Pull a component toward a propagated signal (already in the
     *        component's scale space) at the given rate.
     */
    void reinforce(const std::string& scale, size_t id, const Vector& signal, double rate);

private:
    Fabric& fabric_;
};

} // namespace Strata
