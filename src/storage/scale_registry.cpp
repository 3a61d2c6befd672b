#include <storage/scale_registry.hpp>
#include <core/errors.hpp>

namespace Strata {

ScaleRegistry::ScaleRegistry(ScaleSchema schema, size_t dimension,
                             std::vector<std::unique_ptr<EmbeddingStore>> stores)
    : schema_(std::move(schema)), dimension_(dimension), stores_(std::move(stores))
{
    if (stores_.size() != schema_.size()) {
        throw SchemaError("Registry expects " + std::to_string(schema_.size()) +
                          " scales, got " + std::to_string(stores_.size()));
    }

    for (size_t i = 0; i < stores_.size(); ++i) {
        const auto& spec = schema_[i];
        const auto* s = stores_[i].get();
        if (!s || s->name() != spec.name || s->cardinality() != spec.cardinality ||
            s->dimension() != dimension_) {
            throw SchemaError("Store " + std::to_string(i) + " does not match scale " + spec.name);
        }
    }
}

EmbeddingStore& ScaleRegistry::store(const std::string& scale) {
    return *stores_[schema_.ordinal(scale)];
}

const EmbeddingStore& ScaleRegistry::store(const std::string& scale) const {
    return *stores_[schema_.ordinal(scale)];
}

EmbeddingStore& ScaleRegistry::store(size_t ordinal) {
    if (ordinal >= stores_.size()) {
        throw UnknownScaleError("Unknown scale ordinal: " + std::to_string(ordinal));
    }
    return *stores_[ordinal];
}

const EmbeddingStore& ScaleRegistry::store(size_t ordinal) const {
    if (ordinal >= stores_.size()) {
        throw UnknownScaleError("Unknown scale ordinal: " + std::to_string(ordinal));
    }
    return *stores_[ordinal];
}

} // namespace Strata
