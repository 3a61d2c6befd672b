#include <integration/attention_allocator.hpp>
#include <core/errors.hpp>
#include <core/numeric.hpp>
#include <cmath>

namespace Strata {

AttentionAllocator::AttentionAllocator(Fabric& fabric) : fabric_(fabric) {}

AttentionAllocation AttentionAllocator::allocate(const std::map<std::string, Vector>& activations,
                                                 double budget) const {
    if (!std::isfinite(budget) || budget < 0.0) {
        throw ArgumentError("Attention budget must be finite and >= 0");
    }

    const ScaleSchema& schema = fabric_.schema();
    double total = 0.0;
    for (const auto& [scale, values] : activations) {
        const size_t cardinality = schema[schema.ordinal(scale)].cardinality;
        if (static_cast<size_t>(values.size()) != cardinality) {
            throw DimensionError("Activations for " + scale + " have length " +
                                 std::to_string(values.size()) + ", expected " + std::to_string(cardinality));
        }
        if (!all_finite(values)) {
            throw NumericError("Activations for " + scale + " contain NaN or Inf");
        }
        total += values.cwiseAbs().sum();
    }

    AttentionAllocation allocation;

    if (total == 0.0) {
        const double share = budget / static_cast<double>(schema.total_components());
        for (const auto& spec : schema) {
            auto& slots = allocation[spec.name];
            for (size_t i = 0; i < spec.cardinality; ++i) slots[i] = share;
        }
        return allocation;
    }

    for (const auto& [scale, values] : activations) {
        if (values.cwiseAbs().sum() == 0.0) continue;
        auto& slots = allocation[scale];
        for (Eigen::Index i = 0; i < values.size(); ++i) {
            slots[static_cast<size_t>(i)] = budget * std::abs(values[i]) / total;
        }
    }
    return allocation;
}

Vector AttentionAllocator::to_activation_vector(const std::string& scale, const ActivationMap& activations) const {
    const size_t cardinality = fabric_.count(scale);
    Vector dense = Vector::Zero(static_cast<Eigen::Index>(cardinality));
    for (const auto& [id, value] : activations) {
        if (id >= cardinality) {
            throw IndexError("Activation id " + std::to_string(id) + " out of range for scale " + scale);
        }
        dense[static_cast<Eigen::Index>(id)] = value;
    }
    return dense;
}

void AttentionAllocator::reinforce(const std::string& scale, size_t id, const Vector& signal, double rate) {
    fabric_.update_from_observation(scale, id, signal, rate);
}

} // namespace Strata
