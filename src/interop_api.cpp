#include <interop_api.h>
#include <fabric.hpp>
#include <persistence/persistence_manager.hpp>
#include <core/errors.hpp>
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>

// Thread-local error storage
thread_local std::string g_last_error;

const char* strata_get_last_error() {
    return g_last_error.c_str();
}

const char* strata_get_version() {
    return "0.1.0";
}

static void set_error(const std::exception& e) {
    g_last_error = e.what();
}

#define STRATA_TRY_CATCH(...) \
    try { \
        __VA_ARGS__ \
    } catch (const std::exception& e) { \
        set_error(e); \
        return false; \
    }

#define STRATA_TRY_CATCH_PTR(...) \
    try { \
        __VA_ARGS__ \
    } catch (const std::exception& e) { \
        set_error(e); \
        return nullptr; \
    }

// Helper for string duplication
static char* strdup_safe(const std::string& str) {
#ifdef _WIN32
    return _strdup(str.c_str());
#else
    return strdup(str.c_str());
#endif
}

void strata_free_string(char* str) {
    free(str);
}

static Strata::Fabric& fabric_from(h_fabric_t handle) {
    if (!handle) throw Strata::ArgumentError("Invalid fabric handle");
    return *static_cast<Strata::Fabric*>(handle);
}

static const char* require_str(const char* s, const char* what) {
    if (!s) throw Strata::ArgumentError(std::string(what) + " must not be null");
    return s;
}

static void require_ptr(const void* p, const char* what) {
    if (!p) throw Strata::ArgumentError(std::string(what) + " must not be null");
}

static Strata::Vector to_vector(const double* values, size_t len) {
    require_ptr(values, "Vector buffer");
    return Eigen::Map<const Strata::Vector>(values, static_cast<Eigen::Index>(len));
}

static void check_len(const Strata::Fabric& fabric, size_t len) {
    if (len != fabric.dimension()) {
        throw Strata::DimensionError("Buffer length " + std::to_string(len) +
                                     " does not match dimension " + std::to_string(fabric.dimension()));
    }
}

// =============================================================================
//  Fabric Lifecycle
// =============================================================================

h_fabric_t strata_fabric_create(const HFabricConfig* config) {
    STRATA_TRY_CATCH_PTR({
        require_ptr(config, "Fabric config");
        Strata::FabricConfig cfg;
        cfg.dimension = config->dimension;
        cfg.init_std = config->init_std;
        cfg.learning_rate = config->learning_rate;
        if (config->has_seed) cfg.seed = config->seed;
        cfg.transform_init = config->identity_noise ? Strata::TransformInit::IdentityNoise
                                                    : Strata::TransformInit::Gaussian;
        auto fabric = Strata::create_fabric(std::move(cfg));
        return static_cast<h_fabric_t>(fabric.release());
    })
}

void strata_fabric_destroy(h_fabric_t handle) {
    if (handle) {
        delete static_cast<Strata::Fabric*>(handle);
    }
}

bool strata_fabric_dimension(h_fabric_t handle, size_t* out_dimension) {
    STRATA_TRY_CATCH({
        require_ptr(out_dimension, "Output");
        *out_dimension = fabric_from(handle).dimension();
        return true;
    })
}

bool strata_fabric_scale_count(h_fabric_t handle, size_t* out_count) {
    STRATA_TRY_CATCH({
        require_ptr(out_count, "Output");
        *out_count = fabric_from(handle).schema().size();
        return true;
    })
}

char* strata_fabric_scale_name(h_fabric_t handle, size_t ordinal) {
    STRATA_TRY_CATCH_PTR({
        return strdup_safe(fabric_from(handle).registry().store(ordinal).name());
    })
}

bool strata_fabric_cardinality(h_fabric_t handle, const char* scale, size_t* out_cardinality) {
    STRATA_TRY_CATCH({
        require_ptr(out_cardinality, "Output");
        *out_cardinality = fabric_from(handle).count(require_str(scale, "Scale"));
        return true;
    })
}

// =============================================================================
//  Components
// =============================================================================

bool strata_get_embedding(h_fabric_t handle, const char* scale, size_t id, double* out, size_t len) {
    STRATA_TRY_CATCH({
        auto& fabric = fabric_from(handle);
        require_ptr(out, "Output buffer");
        check_len(fabric, len);
        Strata::Vector v = fabric.get_embedding(require_str(scale, "Scale"), id);
        std::copy(v.data(), v.data() + v.size(), out);
        return true;
    })
}

bool strata_set_embedding(h_fabric_t handle, const char* scale, size_t id, const double* values, size_t len) {
    STRATA_TRY_CATCH({
        fabric_from(handle).set_embedding(require_str(scale, "Scale"), id, to_vector(values, len));
        return true;
    })
}

char* strata_get_metadata(h_fabric_t handle, const char* scale, size_t id) {
    STRATA_TRY_CATCH_PTR({
        return strdup_safe(fabric_from(handle).get_metadata(require_str(scale, "Scale"), id).dump());
    })
}

bool strata_set_metadata(h_fabric_t handle, const char* scale, size_t id, const char* json) {
    STRATA_TRY_CATCH({
        auto& fabric = fabric_from(handle);
        Strata::Metadata metadata;
        try {
            metadata = Strata::Metadata::parse(require_str(json, "Metadata"));
        } catch (const nlohmann::json::parse_error& e) {
            throw Strata::ArgumentError(std::string("Metadata is not valid JSON: ") + e.what());
        }
        fabric.set_metadata(require_str(scale, "Scale"), id, metadata);
        return true;
    })
}

// =============================================================================
//  Cross-Scale Operations
// =============================================================================

bool strata_transform(h_fabric_t handle, const double* in, size_t len,
                      const char* from, const char* to, double* out) {
    STRATA_TRY_CATCH({
        auto& fabric = fabric_from(handle);
        require_ptr(out, "Output buffer");
        Strata::Vector result = fabric.transform_across_scales(
            to_vector(in, len), require_str(from, "Source scale"), require_str(to, "Target scale"));
        std::copy(result.data(), result.data() + result.size(), out);
        return true;
    })
}

bool strata_propagate(h_fabric_t handle, const char* from, size_t from_id, const char* to,
                      double strength, double* out_activations, size_t out_len) {
    STRATA_TRY_CATCH({
        auto& fabric = fabric_from(handle);
        require_ptr(out_activations, "Output buffer");
        const char* target = require_str(to, "Target scale");
        if (out_len != fabric.count(target)) {
            throw Strata::DimensionError("Activation buffer length " + std::to_string(out_len) +
                                         " does not match cardinality of " + target);
        }
        auto activations = fabric.propagate_signal(require_str(from, "Source scale"), from_id, target, strength);
        for (const auto& [id, value] : activations) out_activations[id] = value;
        return true;
    })
}

bool strata_train_transform(h_fabric_t handle, const char* from, size_t from_id,
                            const char* to, size_t to_id, double rate) {
    STRATA_TRY_CATCH({
        fabric_from(handle).train_transform(require_str(from, "Source scale"), from_id,
                                            require_str(to, "Target scale"), to_id, rate);
        return true;
    })
}

// =============================================================================
//  Similarity & Learning
// =============================================================================

bool strata_query(h_fabric_t handle, const double* vector, size_t len, const char* scale,
                  size_t top_k, HSimilarityHit* out, size_t* out_count) {
    STRATA_TRY_CATCH({
        auto& fabric = fabric_from(handle);
        require_ptr(out_count, "Output count");
        if (top_k > 0) require_ptr(out, "Output buffer");
        auto hits = fabric.query_similar(to_vector(vector, len), require_str(scale, "Scale"), top_k);
        for (size_t i = 0; i < hits.size(); ++i) {
            out[i].id = hits[i].id;
            out[i].score = hits[i].score;
        }
        *out_count = hits.size();
        return true;
    })
}

bool strata_update(h_fabric_t handle, const char* scale, size_t id,
                   const double* observation, size_t len, double rate) {
    STRATA_TRY_CATCH({
        fabric_from(handle).update_from_observation(require_str(scale, "Scale"), id,
                                                    to_vector(observation, len), rate);
        return true;
    })
}

// =============================================================================
//  Persistence
// =============================================================================

bool strata_save(h_fabric_t handle, const char* path) {
    STRATA_TRY_CATCH({
        fabric_from(handle).save(std::filesystem::path(require_str(path, "Path")));
        return true;
    })
}

h_fabric_t strata_load(const char* path, size_t expected_dimension) {
    STRATA_TRY_CATCH_PTR({
        Strata::LoadOptions options;
        options.expected_schema.reset();
        if (expected_dimension > 0) options.expected_dimension = expected_dimension;
        auto fabric = Strata::Fabric::load(std::filesystem::path(require_str(path, "Path")), options);
        return static_cast<h_fabric_t>(fabric.release());
    })
}
