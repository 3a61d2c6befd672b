#pragma once

#include <export.hpp>

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

// =============================================================================
//  Error Handling
// =============================================================================

// Thread-local error storage; valid until the next failing call on this thread
STRATA_API const char* strata_get_last_error();
STRATA_API const char* strata_get_version();

// Releases strings returned by strata_* functions
STRATA_API void strata_free_string(char* str);

// =============================================================================
//  Opaque Handles
// =============================================================================

typedef void* h_fabric_t;

// =============================================================================
//  Fabric Lifecycle
// =============================================================================

typedef struct HFabricConfig {
    size_t dimension;
    double init_std;
    double learning_rate;
    uint64_t seed;
    bool has_seed;          // false: seed drawn at random and recorded
    bool identity_noise;    // transform init I + noise instead of pure noise
} HFabricConfig;

// Default skin scales (cellular, tissue, region, system)
STRATA_API h_fabric_t strata_fabric_create(const HFabricConfig* config);
STRATA_API void strata_fabric_destroy(h_fabric_t handle);

STRATA_API bool strata_fabric_dimension(h_fabric_t handle, size_t* out_dimension);
STRATA_API bool strata_fabric_scale_count(h_fabric_t handle, size_t* out_count);
STRATA_API char* strata_fabric_scale_name(h_fabric_t handle, size_t ordinal);
STRATA_API bool strata_fabric_cardinality(h_fabric_t handle, const char* scale, size_t* out_cardinality);

// =============================================================================
//  Components
// =============================================================================

// `len` must equal the fabric dimension
STRATA_API bool strata_get_embedding(h_fabric_t handle, const char* scale, size_t id, double* out, size_t len);
STRATA_API bool strata_set_embedding(h_fabric_t handle, const char* scale, size_t id, const double* values, size_t len);

// Metadata as JSON object text
STRATA_API char* strata_get_metadata(h_fabric_t handle, const char* scale, size_t id);
STRATA_API bool strata_set_metadata(h_fabric_t handle, const char* scale, size_t id, const char* json);

// =============================================================================
//  Cross-Scale Operations
// =============================================================================

STRATA_API bool strata_transform(h_fabric_t handle, const double* in, size_t len,
                                 const char* from, const char* to, double* out);

// `out_len` must equal the target scale's cardinality; out[i] is the activation of component i
STRATA_API bool strata_propagate(h_fabric_t handle, const char* from, size_t from_id, const char* to,
                                 double strength, double* out_activations, size_t out_len);

STRATA_API bool strata_train_transform(h_fabric_t handle, const char* from, size_t from_id,
                                       const char* to, size_t to_id, double rate);

// =============================================================================
//  Similarity & Learning
// =============================================================================

typedef struct HSimilarityHit {
    size_t id;
    double score;
} HSimilarityHit;

// `out` must hold `top_k` entries; `out_count` receives min(top_k, cardinality)
STRATA_API bool strata_query(h_fabric_t handle, const double* vector, size_t len, const char* scale,
                             size_t top_k, HSimilarityHit* out, size_t* out_count);

STRATA_API bool strata_update(h_fabric_t handle, const char* scale, size_t id,
                              const double* observation, size_t len, double rate);

// =============================================================================
//  Persistence
// =============================================================================

STRATA_API bool strata_save(h_fabric_t handle, const char* path);

// Accepts any valid scale schema; expected_dimension 0 accepts any dimension
STRATA_API h_fabric_t strata_load(const char* path, size_t expected_dimension);

#ifdef __cplusplus
}
#endif
