/**
 * @file fabric_config.hpp
 * @brief Global fabric configuration with environment-based overrides
 */

#pragma once

#include <core/scale.hpp>
#include <export.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace Strata {

enum class TransformInit {
    Gaussian,       ///< N(0, init_std²), same as embeddings
    IdentityNoise   ///< I + N(0, init_std²), drawn independently per direction
};

STRATA_API std::string to_string(TransformInit init);

/**
 * @throws ArgumentError on an unrecognized name
 */
STRATA_API TransformInit parse_transform_init(const std::string& name);

struct STRATA_API FabricConfig {
    size_t dimension = 128;                 ///< D, shared by every scale
    double init_std = 0.01;                 ///< Std of the Gaussian initialization
    double learning_rate = 0.01;            ///< Default rate for observation updates
    std::optional<uint64_t> seed;           ///< Unset: drawn from std::random_device
    TransformInit transform_init = TransformInit::Gaussian;
    bool seed_default_metadata = true;      ///< Name the first skin components
    ScaleSchema schema = ScaleSchema::skin_default();

    /**
     * @brief Apply overrides from the environment
     *
     * Uses: STRATA_DIMENSION, STRATA_INIT_STD, STRATA_LEARNING_RATE,
     *       STRATA_SEED, STRATA_TRANSFORM_INIT
     *
     * @throws ArgumentError if a variable is set but unparsable
     */
    static FabricConfig from_env();

    /**
     * @throws ArgumentError on dimension 0, negative or non-finite init_std,
     *         learning_rate outside [0, 1], or an invalid schema
     */
    void validate() const;
};

} // namespace Strata
