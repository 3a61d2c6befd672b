/**
 * @file fabric.cpp
 * @brief Fabric facade, factory and statistics
 */

#include <fabric.hpp>
#include <persistence/persistence_manager.hpp>
#include <core/errors.hpp>
#include <core/numeric.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <cmath>
#include <random>
#include <sstream>

namespace Strata {

static ScaleRegistry make_registry(const FabricConfig& config, std::vector<std::unique_ptr<EmbeddingStore>> stores) {
    config.validate();
    return ScaleRegistry(config.schema, config.dimension, std::move(stores));
}

Fabric::Fabric(FabricConfig config, std::vector<std::unique_ptr<EmbeddingStore>> stores)
    : config_(std::move(config)),
      registry_(make_registry(config_, std::move(stores))),
      transformer_(config_.schema, config_.dimension),
      similarity_(registry_),
      propagator_(registry_, transformer_),
      learner_(registry_) {}

// =============================================================================
//  Components
// =============================================================================

Vector Fabric::get_embedding(const std::string& scale, size_t id) const {
    return registry_.store(scale).get(id);
}

void Fabric::set_embedding(const std::string& scale, size_t id, const Vector& embedding) {
    registry_.store(scale).set(id, embedding);
}

Metadata Fabric::get_metadata(const std::string& scale, size_t id) const {
    return registry_.store(scale).get_metadata(id);
}

void Fabric::set_metadata(const std::string& scale, size_t id, const Metadata& metadata) {
    registry_.store(scale).set_metadata(id, metadata);
}

size_t Fabric::count(const std::string& scale) const {
    return registry_.store(scale).count();
}

// =============================================================================
//  Cross-scale operations
// =============================================================================

Vector Fabric::transform_across_scales(const Vector& vector, const std::string& from, const std::string& to) const {
    return transformer_.transform(vector, from, to);
}

void Fabric::register_transform(const std::string& from, const std::string& to, const Matrix& matrix) {
    transformer_.set_matrix(from, to, matrix);
}

ActivationMap Fabric::propagate_signal(const std::string& from, size_t from_id,
                                       const std::string& to, double strength) const {
    return propagator_.propagate(from, from_id, to, strength);
}

void Fabric::train_transform(const std::string& from, size_t from_id,
                             const std::string& to, size_t to_id, double rate) {
    Vector source = registry_.store(from).get(from_id);
    Vector target = registry_.store(to).get(to_id);
    transformer_.train_step(from, to, source, target, rate);
}

// =============================================================================
//  Similarity & learning
// =============================================================================

std::vector<SimilarityHit> Fabric::query_similar(const Vector& vector, const std::string& scale, size_t top_k) const {
    return similarity_.query(vector, scale, top_k);
}

double Fabric::component_similarity(const std::string& scale, size_t a, size_t b) const {
    return similarity_.component_similarity(scale, a, b);
}

void Fabric::update_from_observation(const std::string& scale, size_t id, const Vector& observation,
                                     std::optional<double> rate) {
    learner_.update_from_observation(scale, id, observation, rate.value_or(config_.learning_rate));
}

size_t Fabric::update_batch(const std::string& scale, const std::vector<Observation>& observations,
                            std::optional<double> rate, const std::atomic<bool>* cancel) {
    return learner_.update_batch(scale, observations, rate.value_or(config_.learning_rate), cancel);
}

// =============================================================================
//  Collaborators
// =============================================================================

void Fabric::register_collaborator(const std::string& name, const nlohmann::json& config) {
    if (name.empty()) {
        throw ArgumentError("Collaborator name must not be empty");
    }
    if (!config.is_object()) {
        throw ArgumentError("Collaborator config for " + name + " must be a JSON object");
    }

    std::unique_lock<std::shared_mutex> lock(collaborators_mutex_);
    collaborators_[name] = config;
}

std::optional<nlohmann::json> Fabric::collaborator(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(collaborators_mutex_);
    auto it = collaborators_.find(name);
    if (it == collaborators_.end()) return std::nullopt;
    return it->second;
}

void Fabric::update_collaborator(const std::string& name,
                                 const std::function<void(nlohmann::json&)>& update) {
    if (name.empty()) {
        throw ArgumentError("Collaborator name must not be empty");
    }

    std::unique_lock<std::shared_mutex> lock(collaborators_mutex_);
    auto it = collaborators_.find(name);
    nlohmann::json config = it != collaborators_.end() ? it->second : nlohmann::json();
    update(config);
    if (!config.is_object()) {
        throw ArgumentError("Collaborator config for " + name + " must be a JSON object");
    }
    collaborators_[name] = std::move(config);
}

std::vector<std::string> Fabric::collaborators() const {
    std::shared_lock<std::shared_mutex> lock(collaborators_mutex_);
    std::vector<std::string> names;
    names.reserve(collaborators_.size());
    for (const auto& [name, _] : collaborators_) names.push_back(name);
    return names;
}

std::map<std::string, nlohmann::json> Fabric::collaborator_configs() const {
    std::shared_lock<std::shared_mutex> lock(collaborators_mutex_);
    return collaborators_;
}

// =============================================================================
//  State & persistence
// =============================================================================

FabricState Fabric::state() const {
    FabricState st;
    st.dimension = config_.dimension;
    st.transforms = transformer_.size();
    st.collaborators = collaborators();

    for (size_t i = 0; i < registry_.size(); ++i) {
        const EmbeddingStore& store = registry_.store(i);
        ScaleState scale = store.read([&](const RowMatrix& table, const std::vector<Metadata>&) {
            Vector norms = table.rowwise().norm();
            double mean = norms.mean();
            double var = (norms.array() - mean).square().mean();
            return ScaleState{store.name(), store.cardinality(), mean, std::sqrt(var)};
        });
        st.scales.push_back(scale);
    }

    return st;
}

void Fabric::save(const std::filesystem::path& path) const {
    PersistenceManager::save(*this, path);
}

void Fabric::save(std::ostream& out) const {
    PersistenceManager::save(*this, out);
}

std::unique_ptr<Fabric> Fabric::load(const std::filesystem::path& path) {
    return PersistenceManager::load(path, LoadOptions{});
}

std::unique_ptr<Fabric> Fabric::load(const std::filesystem::path& path, const LoadOptions& options) {
    return PersistenceManager::load(path, options);
}

std::unique_ptr<Fabric> Fabric::load(std::istream& in) {
    return PersistenceManager::load(in, LoadOptions{});
}

std::unique_ptr<Fabric> Fabric::load(std::istream& in, const LoadOptions& options) {
    return PersistenceManager::load(in, options);
}

// =============================================================================
//  Factory
// =============================================================================

std::unique_ptr<Fabric> create_fabric(FabricConfig config) {
    config.validate();

    if (!config.seed) {
        std::random_device rd;
        config.seed = (static_cast<uint64_t>(rd()) << 32) | rd();
    }
    std::mt19937_64 rng(*config.seed);

    // Embeddings first, scale by scale, then transforms in (from, to) ordinal
    // order: the draw sequence is what makes a seed reproducible.
    std::vector<std::unique_ptr<EmbeddingStore>> stores;
    stores.reserve(config.schema.size());
    for (const auto& spec : config.schema) {
        RowMatrix table(spec.cardinality, config.dimension);
        fill_gaussian(table, config.init_std, rng);
        stores.push_back(std::make_unique<EmbeddingStore>(spec.name, std::move(table)));
    }

    auto fabric = std::make_unique<Fabric>(config, std::move(stores));

    const auto& schema = fabric->schema();
    const Eigen::Index d = static_cast<Eigen::Index>(config.dimension);
    for (size_t from = 0; from < schema.size(); ++from) {
        for (size_t to = 0; to < schema.size(); ++to) {
            if (from == to) continue;

            Matrix m(d, d);
            fill_gaussian(m, config.init_std, rng);
            if (config.transform_init == TransformInit::IdentityNoise) {
                m += Matrix::Identity(d, d);
            }
            fabric->register_transform(schema[from].name, schema[to].name, m);
        }
    }

    if (config.seed_default_metadata) {
        seed_skin_metadata(*fabric);
    }

    std::ostringstream msg;
    msg << "Fabric created: D=" << config.dimension
        << ", scales=" << schema.size()
        << ", components=" << schema.total_components()
        << ", transforms=" << fabric->transformer().size()
        << ", seed=" << *config.seed;
    Logger::info(msg.str());

    return fabric;
}

std::unique_ptr<Fabric> create_fabric(size_t dimension, double init_std) {
    FabricConfig config;
    config.dimension = dimension;
    config.init_std = init_std;
    return create_fabric(std::move(config));
}

// =============================================================================
//  Default skin metadata
// =============================================================================

void seed_skin_metadata(Fabric& fabric) {
    struct Entry { const char* name; const char* category; };

    auto apply = [&](const char* scale, const std::vector<Entry>& entries) {
        if (!fabric.registry().contains(scale)) return;
        const char* key = category_key(scale);
        size_t n = std::min(entries.size(), fabric.count(scale));
        for (size_t i = 0; i < n; ++i) {
            Metadata m = Metadata::object();
            m[MetaKeys::NAME] = entries[i].name;
            m[key] = entries[i].category;
            fabric.set_metadata(scale, i, m);
        }
    };

    apply(Scales::CELLULAR, {
        {"keratinocyte", "cell"}, {"melanocyte", "cell"}, {"langerhans_cell", "cell"},
        {"merkel_cell", "cell"}, {"fibroblast", "structure"}, {"collagen", "structure"},
        {"elastin", "structure"}, {"sebaceous_gland", "structure"},
    });

    apply(Scales::TISSUE, {
        {"stratum_corneum", "epidermis"}, {"stratum_lucidum", "epidermis"},
        {"stratum_granulosum", "epidermis"}, {"stratum_spinosum", "epidermis"},
        {"stratum_basale", "epidermis"}, {"papillary_dermis", "dermis"},
        {"reticular_dermis", "dermis"}, {"hypodermis", "dermis"},
    });

    apply(Scales::REGION, {
        {"face", "face"}, {"scalp", "scalp"}, {"neck", "neck"}, {"chest", "chest"},
        {"back", "back"}, {"arms", "arms"}, {"hands", "hands"}, {"abdomen", "abdomen"},
        {"legs", "legs"}, {"feet", "feet"},
    });

    apply(Scales::SYSTEM, {
        {"barrier_function", "barrier_function"}, {"immune_response", "immune_response"},
        {"thermal_regulation", "thermal_regulation"}, {"sensory_perception", "sensory_perception"},
        {"vitamin_synthesis", "vitamin_synthesis"},
    });
}

} // namespace Strata
