/**
 * @file persistence_manager.hpp
 * @brief Versioned JSON snapshots of a whole fabric
 *
 * Snapshot layout (schema_version 1):
 *
 *   { "schema_version": 1,
 *     "dimension": D,
 *     "config": { "init_std", "learning_rate", "seed", "transform_init" },
 *     "scale_order": [name, ...],
 *     "scales": { name: { "cardinality": N,
 *                         "embeddings": [[D numbers] x N],
 *                         "metadata":   [object x N] } },
 *     "transforms": { "from->to": [[D numbers] x D] },
 *     "collaborators": { name: object } }
 *
 * Doubles are written with round-trip precision, so save → load reproduces
 * every embedding and matrix bit for bit.
 */

#pragma once

#include <fabric.hpp>
#include <export.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>

namespace Strata {

struct LoadOptions {
    /// Scales (names, order, cardinalities) the snapshot must carry; unset accepts any valid schema
    std::optional<ScaleSchema> expected_schema = ScaleSchema::skin_default();
    /// Dimension the snapshot must carry; unset accepts any
    std::optional<size_t> expected_dimension;
};

class STRATA_API PersistenceManager {
public:
    static constexpr int kSchemaVersion = 1;

    /**
     * @brief Snapshot taken under shared locks on every store, the transform
     *        table and the collaborator registry, so no write is torn.
     */
    static nlohmann::json to_json(const Fabric& fabric);

    /**
     * @throws SchemaError on any incompatibility; nothing is partially loaded
     */
    static std::unique_ptr<Fabric> from_json(const nlohmann::json& snapshot, const LoadOptions& options = {});

    static void save(const Fabric& fabric, std::ostream& out);

    /**
     * @brief Write to a sibling temp file, then rename over the target.
     * @throws IoError
     */
    static void save(const Fabric& fabric, const std::filesystem::path& path);

    /**
     * @throws SchemaError (malformed or incompatible snapshot)
     */
    static std::unique_ptr<Fabric> load(std::istream& in, const LoadOptions& options = {});

    /**
     * @throws IoError (unreadable file), SchemaError
     */
    static std::unique_ptr<Fabric> load(const std::filesystem::path& path, const LoadOptions& options = {});
};

} // namespace Strata
