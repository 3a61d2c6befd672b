/**
 * @file scale_registry.hpp
 * @brief One EmbeddingStore per scale, addressed by name or ordinal
 */

#pragma once

#include <storage/embedding_store.hpp>
#include <core/scale.hpp>
#include <export.hpp>
#include <memory>
#include <string>
#include <vector>

namespace Strata {

class STRATA_API ScaleRegistry {
public:
    /**
     * @param stores one store per schema entry, in schema order
     *
     * @throws SchemaError if a store's name, cardinality or dimension
     *         disagrees with the schema
     */
    ScaleRegistry(ScaleSchema schema, size_t dimension, std::vector<std::unique_ptr<EmbeddingStore>> stores);

    const ScaleSchema& schema() const { return schema_; }
    size_t dimension() const { return dimension_; }
    size_t size() const { return stores_.size(); }

    bool contains(const std::string& scale) const { return schema_.contains(scale); }

    /**
     * @throws UnknownScaleError
     */
    size_t ordinal(const std::string& scale) const { return schema_.ordinal(scale); }

    EmbeddingStore& store(const std::string& scale);
    const EmbeddingStore& store(const std::string& scale) const;

    /**
     * @throws UnknownScaleError if ordinal >= size()
     */
    EmbeddingStore& store(size_t ordinal);
    const EmbeddingStore& store(size_t ordinal) const;

    size_t total_components() const { return schema_.total_components(); }

private:
    ScaleSchema schema_;
    size_t dimension_;
    std::vector<std::unique_ptr<EmbeddingStore>> stores_;
};

} // namespace Strata
