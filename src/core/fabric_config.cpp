#include <core/fabric_config.hpp>
#include <core/errors.hpp>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace Strata {

std::string to_string(TransformInit init) {
    switch (init) {
        case TransformInit::Gaussian:      return "gaussian";
        case TransformInit::IdentityNoise: return "identity_noise";
    }
    return "gaussian";
}

TransformInit parse_transform_init(const std::string& name) {
    if (name == "gaussian") return TransformInit::Gaussian;
    if (name == "identity_noise") return TransformInit::IdentityNoise;
    throw ArgumentError("Unknown transform init mode: " + name);
}

namespace {

template<typename T, typename Parse>
void read_env(const char* var, T& out, Parse parse) {
    const char* value = std::getenv(var);
    if (!value || !*value) return;
    try {
        size_t consumed = 0;
        std::string text(value);
        auto parsed = parse(text, &consumed);
        if (consumed != text.size()) {
            throw std::invalid_argument("trailing characters");
        }
        out = static_cast<T>(parsed);
    } catch (const std::exception&) {
        throw ArgumentError(std::string("Invalid value for ") + var + ": " + value);
    }
}

} // namespace

FabricConfig FabricConfig::from_env() {
    FabricConfig config;

    read_env(
        "STRATA_DIMENSION", config.dimension,
        [](const std::string& s, size_t* n) {
            if (!s.empty() && s[0] == '-') throw std::invalid_argument("negative");
            return std::stoull(s, n);
        }
    );
    read_env(
        "STRATA_INIT_STD", config.init_std,
        [](const std::string& s, size_t* n) { return std::stod(s, n); }
    );
    read_env(
        "STRATA_LEARNING_RATE", config.learning_rate,
        [](const std::string& s, size_t* n) { return std::stod(s, n); }
    );

    uint64_t seed = 0;
    const char* seed_env = std::getenv("STRATA_SEED");
    if (seed_env && *seed_env) {
        read_env(
            "STRATA_SEED", seed,
            [](const std::string& s, size_t* n) {
                if (!s.empty() && s[0] == '-') throw std::invalid_argument("negative");
                return std::stoull(s, n);
            }
        );
        config.seed = seed;
    }

    const char* init = std::getenv("STRATA_TRANSFORM_INIT");
    if (init && *init) {
        config.transform_init = parse_transform_init(init);
    }

    config.validate();
    return config;
}

void FabricConfig::validate() const {
    if (dimension == 0) {
        throw ArgumentError("Embedding dimension must be positive");
    }
    if (!std::isfinite(init_std) || init_std < 0.0) {
        throw ArgumentError("init_std must be finite and non-negative");
    }
    if (!std::isfinite(learning_rate) || learning_rate < 0.0 || learning_rate > 1.0) {
        throw ArgumentError("learning_rate must lie in [0, 1]");
    }
    schema.validate();
}

} // namespace Strata
