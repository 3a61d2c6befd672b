/**
 * @file concept_map.hpp
 * @brief Knowledge-mapping client: named concepts bound to fabric components
 *
 * Bindings live in the knowledge_mapping collaborator entry under
 * "concept_mapping" ({concept: {"scale": s, "id": n}}), so they travel with
 * every snapshot and survive save/load.
 */

#pragma once

#include <fabric.hpp>
#include <export.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Strata {

struct ConceptBinding {
    std::string scale;
    size_t id;
};

/**
 * @brief Parse one concept_mapping entry: {"scale": known scale, "id": n < cardinality}.
 * @throws SchemaError on any other shape
 */
STRATA_API ConceptBinding parse_concept_binding(const std::string& concept_name, const nlohmann::json& entry,
                                                const ScaleSchema& schema);

/**
 * @brief Check every binding of a knowledge_mapping config, and that no two
 *        concepts share a component. A missing concept_mapping is accepted.
 * @throws SchemaError
 */
STRATA_API void validate_concept_mapping(const nlohmann::json& knowledge_config, const ScaleSchema& schema);

struct RelatedComponent {
    size_t id;
    double score;
    Metadata metadata;
};

struct ConceptDescription {
    ConceptBinding binding;
    Vector embedding;
    Metadata metadata;
    std::vector<RelatedComponent> related;   ///< Excludes the concept's own component
};

class STRATA_API ConceptMap {
public:
    /**
     * @brief Registers the knowledge_mapping collaborator if it is missing.
     */
    explicit ConceptMap(Fabric& fabric);

    /**
     * @brief Scale used by bind() when none is given (the collaborator's
     *        "embedding_scale").
     */
    std::string default_scale() const;

    /**
     * @brief Bind a concept to the lowest unbound component of a scale.
     *
     * Writes metadata {name, source: "knowledge_mapping", type: "knowledge_concept"}
     * and, when given, the features as the component's embedding. A concept that
     * is already bound keeps its binding and id.
     *
     * The id is reserved atomically in the shared collaborator entry, so any
     * number of ConceptMaps over one fabric never hand out the same component.
     *
     * @throws ArgumentError (empty name), UnknownScaleError, DimensionError,
     *         NumericError (features), CapacityError (no unbound component),
     *         SchemaError (corrupt existing bindings)
     */
    size_t bind(const std::string& concept_name, const std::string& scale,
                const std::optional<Vector>& features = std::nullopt);
    size_t bind(const std::string& concept_name);

    /// @throws SchemaError if the stored binding is corrupt
    std::optional<ConceptBinding> lookup(const std::string& concept_name) const;

    /**
     * @brief Embedding, metadata and the top_k most similar other components.
     * @throws ArgumentError if the concept is not bound
     */
    ConceptDescription describe(const std::string& concept_name, size_t top_k = 5) const;

    std::vector<std::string> concepts() const;

private:
    nlohmann::json mapping() const;

    Fabric& fabric_;
};

} // namespace Strata
