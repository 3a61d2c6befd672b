/**
 * @file fabric.hpp
 * @brief The multi-scale embedding fabric
 *
 * The Fabric owns one EmbeddingStore per scale, every cross-scale transform
 * matrix, the global configuration and the collaborator registry. Nothing is
 * shared between two fabrics and there is no process-wide default instance:
 * collaborators hold a Fabric reference and component ids, and re-read the
 * fabric on every access.
 *
 *   caller ─(scale, id)─▶ ScaleRegistry ─▶ EmbeddingStore
 *                │
 *                ├─▶ CrossScaleTransformer ─▶ SignalPropagator ◀─ SimilarityIndex
 *                ├─▶ LearningUpdater
 *                └─▶ PersistenceManager (whole-fabric snapshot)
 */

#pragma once

#include <core/fabric_config.hpp>
#include <storage/scale_registry.hpp>
#include <transform/cross_scale_transformer.hpp>
#include <query/similarity_index.hpp>
#include <cognitive/signal_propagator.hpp>
#include <learning/learning_updater.hpp>
#include <export.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace Strata {

struct LoadOptions;

struct ScaleState {
    std::string name;
    size_t components;
    double norm_mean;
    double norm_std;
};

struct FabricState {
    size_t dimension;
    std::vector<ScaleState> scales;
    size_t transforms;
    std::vector<std::string> collaborators;
};

class STRATA_API Fabric {
public:
    /**
     * @brief Assemble a fabric from existing stores; no transforms are registered.
     *
     * Most callers want create_fabric(), which also initializes every transform.
     *
     * @throws ArgumentError (invalid config), SchemaError (stores disagree with config)
     */
    Fabric(FabricConfig config, std::vector<std::unique_ptr<EmbeddingStore>> stores);

    Fabric(const Fabric&) = delete;
    Fabric& operator=(const Fabric&) = delete;

    const FabricConfig& config() const { return config_; }
    size_t dimension() const { return config_.dimension; }
    const ScaleSchema& schema() const { return registry_.schema(); }

    ScaleRegistry& registry() { return registry_; }
    const ScaleRegistry& registry() const { return registry_; }
    CrossScaleTransformer& transformer() { return transformer_; }
    const CrossScaleTransformer& transformer() const { return transformer_; }

    // =========================================================================
    //  Components
    // =========================================================================

    Vector get_embedding(const std::string& scale, size_t id) const;
    void set_embedding(const std::string& scale, size_t id, const Vector& embedding);

    Metadata get_metadata(const std::string& scale, size_t id) const;
    void set_metadata(const std::string& scale, size_t id, const Metadata& metadata);

    size_t count(const std::string& scale) const;

    // =========================================================================
    //  Cross-scale operations
    // =========================================================================

    Vector transform_across_scales(const Vector& vector, const std::string& from, const std::string& to) const;
    void register_transform(const std::string& from, const std::string& to, const Matrix& matrix);

    ActivationMap propagate_signal(const std::string& from, size_t from_id,
                                   const std::string& to, double strength = 1.0) const;

    /**
     * @brief One gradient step on M(from→to) so that it maps component
     *        (from, from_id) toward component (to, to_id).
     */
    void train_transform(const std::string& from, size_t from_id,
                         const std::string& to, size_t to_id, double rate);

    // =========================================================================
    //  Similarity & learning
    // =========================================================================

    std::vector<SimilarityHit> query_similar(const Vector& vector, const std::string& scale, size_t top_k = 5) const;
    double component_similarity(const std::string& scale, size_t a, size_t b) const;

    /**
     * @param rate defaults to config().learning_rate
     */
    void update_from_observation(const std::string& scale, size_t id, const Vector& observation,
                                 std::optional<double> rate = std::nullopt);

    size_t update_batch(const std::string& scale, const std::vector<Observation>& observations,
                        std::optional<double> rate = std::nullopt, const std::atomic<bool>* cancel = nullptr);

    // =========================================================================
    //  Collaborators
    // =========================================================================

    /**
     * @brief Register or replace a collaborator's configuration object.
     * @throws ArgumentError on an empty name or a non-object config
     */
    void register_collaborator(const std::string& name, const nlohmann::json& config);
    std::optional<nlohmann::json> collaborator(const std::string& name) const;
    std::vector<std::string> collaborators() const;

    /**
     * @brief Read-modify-write one collaborator entry under the registry's unique lock.
     *
     * @p update receives a copy of the current config (null when the name
     * is not registered yet). The entry is replaced only if @p update
     * returns normally and leaves an object behind. @p update must not call
     * back into the collaborator registry.
     *
     * @throws ArgumentError on an empty name or a non-object result; anything
     *         @p update throws propagates with the entry unchanged
     */
    void update_collaborator(const std::string& name, const std::function<void(nlohmann::json&)>& update);

    /**
     * @brief Copy of every collaborator config, taken under the registry lock.
     */
    std::map<std::string, nlohmann::json> collaborator_configs() const;

    // =========================================================================
    //  State & persistence
    // =========================================================================

    FabricState state() const;

    void save(const std::filesystem::path& path) const;
    void save(std::ostream& out) const;

    static std::unique_ptr<Fabric> load(const std::filesystem::path& path);
    static std::unique_ptr<Fabric> load(const std::filesystem::path& path, const LoadOptions& options);
    static std::unique_ptr<Fabric> load(std::istream& in);
    static std::unique_ptr<Fabric> load(std::istream& in, const LoadOptions& options);

    /**
     * @brief Hold the collaborator registry's shared lock (snapshotting).
     */
    std::shared_lock<std::shared_mutex> lock_collaborators_shared() const {
        return std::shared_lock<std::shared_mutex>(collaborators_mutex_);
    }
    const std::map<std::string, nlohmann::json>& collaborators_unlocked() const { return collaborators_; }

private:
    FabricConfig config_;
    ScaleRegistry registry_;
    CrossScaleTransformer transformer_;
    SimilarityIndex similarity_;
    SignalPropagator propagator_;
    LearningUpdater learner_;

    std::map<std::string, nlohmann::json> collaborators_;
    mutable std::shared_mutex collaborators_mutex_;
};

/**
 * @brief Fabric with every scale of config.schema filled with N(0, init_std²)
 *        noise and a matrix for every ordered pair of distinct scales.
 *
 * If config.seed is unset a seed is drawn and recorded in the fabric's config,
 * so the snapshot reproduces the run. Same seed, same config → bit-identical fabric.
 *
 * @throws ArgumentError on an invalid config
 */
STRATA_API std::unique_ptr<Fabric> create_fabric(FabricConfig config);

/**
 * @brief Default skin schema with the given dimension and init std.
 */
STRATA_API std::unique_ptr<Fabric> create_fabric(size_t dimension = 128, double init_std = 0.01);

/**
 * @brief Name the first components of the default skin scales.
 *
 * Scales missing from the schema, and ids beyond a scale's cardinality,
 * are skipped.
 */
STRATA_API void seed_skin_metadata(Fabric& fabric);

} // namespace Strata
