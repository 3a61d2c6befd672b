#include <persistence/persistence_manager.hpp>
#include <integration/collaborators.hpp>
#include <integration/concept_map.hpp>
#include <core/errors.hpp>
#include <core/numeric.hpp>
#include <utils/logger.hpp>
#include <fstream>
#include <sstream>
#include <system_error>
#include <tuple>

namespace fs = std::filesystem;

namespace Strata {

using json = nlohmann::json;

namespace {

[[noreturn]] void schema_fail(const std::string& msg) {
    Logger::error("Snapshot rejected: " + msg);
    throw SchemaError(msg);
}

const json& require(const json& obj, const char* key, const std::string& where) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        schema_fail(where + " is missing '" + key + "'");
    }
    return *it;
}

size_t require_count(const json& obj, const char* key, const std::string& where) {
    const json& v = require(obj, key, where);
    if (!v.is_number_unsigned()) {
        schema_fail(where + "." + key + " must be a non-negative integer");
    }
    return v.get<size_t>();
}

double require_number(const json& obj, const char* key, const std::string& where) {
    const json& v = require(obj, key, where);
    if (!v.is_number()) {
        schema_fail(where + "." + key + " must be a number");
    }
    return v.get<double>();
}

template<typename Mat>
json rows_to_json(const Mat& m) {
    json rows = json::array();
    for (Eigen::Index r = 0; r < m.rows(); ++r) {
        json row = json::array();
        for (Eigen::Index c = 0; c < m.cols(); ++c) row.push_back(m(r, c));
        rows.push_back(std::move(row));
    }
    return rows;
}

/**
 * @brief Parse an array of `rows` arrays of `cols` finite numbers into `out`.
 */
template<typename Mat>
void parse_rows(const json& v, size_t rows, size_t cols, Mat& out, const std::string& where) {
    if (!v.is_array() || v.size() != rows) {
        schema_fail(where + " must be an array of " + std::to_string(rows) + " rows");
    }
    out.resize(static_cast<Eigen::Index>(rows), static_cast<Eigen::Index>(cols));
    for (size_t r = 0; r < rows; ++r) {
        const json& row = v[r];
        if (!row.is_array() || row.size() != cols) {
            schema_fail(where + "[" + std::to_string(r) + "] must hold " + std::to_string(cols) + " numbers");
        }
        for (size_t c = 0; c < cols; ++c) {
            if (!row[c].is_number()) {
                schema_fail(where + "[" + std::to_string(r) + "][" + std::to_string(c) + "] is not a number");
            }
            out(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) = row[c].get<double>();
        }
    }
    if (!all_finite(out)) {
        schema_fail(where + " contains NaN or Inf");
    }
}

FabricConfig parse_config(const json& snapshot, size_t dimension) {
    const json& cfg = require(snapshot, "config", "snapshot");
    if (!cfg.is_object()) {
        schema_fail("snapshot.config must be an object");
    }

    FabricConfig config;
    config.dimension = dimension;
    config.init_std = require_number(cfg, "init_std", "config");
    config.learning_rate = require_number(cfg, "learning_rate", "config");
    config.seed_default_metadata = false;

    const json& seed = require(cfg, "seed", "config");
    if (seed.is_number_unsigned()) {
        config.seed = seed.get<uint64_t>();
    } else if (!seed.is_null()) {
        schema_fail("config.seed must be a non-negative integer or null");
    }

    const json& init = require(cfg, "transform_init", "config");
    if (!init.is_string()) {
        schema_fail("config.transform_init must be a string");
    }
    try {
        config.transform_init = parse_transform_init(init.get<std::string>());
    } catch (const ArgumentError& e) {
        schema_fail(e.what());
    }
    return config;
}

ScaleSchema parse_schema(const json& snapshot) {
    const json& order = require(snapshot, "scale_order", "snapshot");
    const json& scales = require(snapshot, "scales", "snapshot");
    if (!order.is_array()) {
        schema_fail("snapshot.scale_order must be an array");
    }
    if (!scales.is_object()) {
        schema_fail("snapshot.scales must be an object");
    }
    if (scales.size() != order.size()) {
        schema_fail("snapshot.scales and scale_order list different scales");
    }

    std::vector<ScaleSpec> specs;
    for (const auto& name : order) {
        if (!name.is_string()) {
            schema_fail("snapshot.scale_order entries must be strings");
        }
        const std::string scale = name.get<std::string>();
        auto it = scales.find(scale);
        if (it == scales.end() || !it->is_object()) {
            schema_fail("snapshot.scales has no object for scale " + scale);
        }
        specs.push_back({scale, require_count(*it, "cardinality", "scales." + scale)});
    }

    ScaleSchema schema(std::move(specs));
    try {
        schema.validate();
    } catch (const ArgumentError& e) {
        schema_fail(e.what());
    }
    return schema;
}

std::pair<std::string, std::string> split_transform_key(const std::string& key) {
    auto pos = key.find("->");
    if (pos == std::string::npos) {
        schema_fail("Malformed transform key: " + key);
    }
    return {key.substr(0, pos), key.substr(pos + 2)};
}

} // anonymous namespace

// =============================================================================
//  Save
// =============================================================================

json PersistenceManager::to_json(const Fabric& fabric) {
    const ScaleRegistry& registry = fabric.registry();
    const FabricConfig& config = fabric.config();

    // Shared locks in schema order, then transforms, then collaborators.
    std::vector<std::shared_lock<std::shared_mutex>> locks;
    locks.reserve(registry.size() + 2);
    for (size_t i = 0; i < registry.size(); ++i) {
        locks.push_back(registry.store(i).lock_shared());
    }
    locks.push_back(fabric.transformer().lock_shared());
    locks.push_back(fabric.lock_collaborators_shared());

    json snapshot;
    snapshot["schema_version"] = kSchemaVersion;
    snapshot["dimension"] = config.dimension;
    snapshot["config"] = {
        {"init_std", config.init_std},
        {"learning_rate", config.learning_rate},
        {"seed", config.seed ? json(*config.seed) : json(nullptr)},
        {"transform_init", to_string(config.transform_init)},
    };

    json order = json::array();
    json scales = json::object();
    for (size_t i = 0; i < registry.size(); ++i) {
        const EmbeddingStore& store = registry.store(i);
        order.push_back(store.name());
        scales[store.name()] = {
            {"cardinality", store.cardinality()},
            {"embeddings", rows_to_json(store.embeddings_unlocked())},
            {"metadata", store.metadata_unlocked()},
        };
    }
    snapshot["scale_order"] = std::move(order);
    snapshot["scales"] = std::move(scales);

    const ScaleSchema& schema = registry.schema();
    json transforms = json::object();
    for (size_t from = 0; from < schema.size(); ++from) {
        for (size_t to = 0; to < schema.size(); ++to) {
            if (from == to) continue;
            const std::string& a = schema[from].name;
            const std::string& b = schema[to].name;
            if (const Matrix* m = fabric.transformer().find_unlocked(a, b)) {
                transforms[transform_key(a, b)] = rows_to_json(*m);
            }
        }
    }
    snapshot["transforms"] = std::move(transforms);

    json collaborators = json::object();
    for (const auto& [name, cfg] : fabric.collaborators_unlocked()) {
        collaborators[name] = cfg;
    }
    snapshot["collaborators"] = std::move(collaborators);

    return snapshot;
}

void PersistenceManager::save(const Fabric& fabric, std::ostream& out) {
    json snapshot = to_json(fabric);
    out << snapshot.dump();
    if (!out) {
        throw IoError("Failed writing fabric snapshot to stream");
    }
}

void PersistenceManager::save(const Fabric& fabric, const fs::path& path) {
    json snapshot = to_json(fabric);
    std::string text = snapshot.dump();

    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw IoError("Cannot open " + tmp.string() + " for writing");
        }
        file << text;
        file.flush();
        if (!file) {
            throw IoError("Failed writing " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw IoError("Cannot move snapshot into place at " + path.string() + ": " + ec.message());
    }

    Logger::success("Fabric saved to " + path.string() + " (" + std::to_string(text.size()) + " bytes)");
}

// =============================================================================
//  Load
// =============================================================================

std::unique_ptr<Fabric> PersistenceManager::from_json(const json& snapshot, const LoadOptions& options) {
    if (!snapshot.is_object()) {
        schema_fail("snapshot must be a JSON object");
    }

    const json& version = require(snapshot, "schema_version", "snapshot");
    if (!version.is_number_integer() || version.get<int64_t>() != kSchemaVersion) {
        schema_fail("Unsupported schema_version " + version.dump() +
                    " (expected " + std::to_string(kSchemaVersion) + ")");
    }

    const size_t dimension = require_count(snapshot, "dimension", "snapshot");
    if (dimension == 0) {
        schema_fail("snapshot.dimension must be positive");
    }
    if (options.expected_dimension && *options.expected_dimension != dimension) {
        schema_fail("Snapshot dimension " + std::to_string(dimension) +
                    " does not match expected " + std::to_string(*options.expected_dimension));
    }

    FabricConfig config = parse_config(snapshot, dimension);
    config.schema = parse_schema(snapshot);
    if (options.expected_schema && !(*options.expected_schema == config.schema)) {
        schema_fail("Snapshot scales do not match the expected scale schema");
    }
    try {
        config.validate();
    } catch (const ArgumentError& e) {
        schema_fail(e.what());
    }

    // Stores
    const json& scales = snapshot["scales"];
    std::vector<std::unique_ptr<EmbeddingStore>> stores;
    for (const auto& spec : config.schema) {
        const json& entry = scales[spec.name];
        const std::string where = "scales." + spec.name;

        RowMatrix table;
        parse_rows(require(entry, "embeddings", where), spec.cardinality, dimension, table, where + ".embeddings");

        const json& meta = require(entry, "metadata", where);
        if (!meta.is_array() || meta.size() != spec.cardinality) {
            schema_fail(where + ".metadata must be an array of " + std::to_string(spec.cardinality) + " objects");
        }
        std::vector<Metadata> metadata;
        metadata.reserve(spec.cardinality);
        for (const auto& m : meta) {
            try {
                validate_metadata(spec.name, m);
            } catch (const ArgumentError& e) {
                schema_fail(where + ".metadata: " + e.what());
            }
            metadata.push_back(m);
        }

        stores.push_back(std::make_unique<EmbeddingStore>(spec.name, std::move(table), std::move(metadata)));
    }

    // Transforms, parsed fully before the fabric exists
    const json& transforms = require(snapshot, "transforms", "snapshot");
    if (!transforms.is_object()) {
        schema_fail("snapshot.transforms must be an object");
    }
    std::vector<std::tuple<std::string, std::string, Matrix>> matrices;
    for (const auto& [key, value] : transforms.items()) {
        auto [from, to] = split_transform_key(key);
        if (!config.schema.contains(from) || !config.schema.contains(to) || from == to) {
            schema_fail("Transform " + key + " does not name two distinct known scales");
        }
        Matrix m;
        parse_rows(value, dimension, dimension, m, "transforms." + key);
        matrices.emplace_back(std::move(from), std::move(to), std::move(m));
    }

    const json& collaborators = require(snapshot, "collaborators", "snapshot");
    if (!collaborators.is_object()) {
        schema_fail("snapshot.collaborators must be an object");
    }
    for (const auto& [name, cfg] : collaborators.items()) {
        if (name.empty() || !cfg.is_object()) {
            schema_fail("Collaborator entries must be named objects");
        }
        if (name == Collaborators::KNOWLEDGE_MAPPING) {
            try {
                validate_concept_mapping(cfg, config.schema);
            } catch (const SchemaError& e) {
                schema_fail(std::string("collaborators.") + name + ": " + e.what());
            }
        }
    }

    auto fabric = std::make_unique<Fabric>(std::move(config), std::move(stores));
    for (const auto& [from, to, m] : matrices) {
        fabric->register_transform(from, to, m);
    }
    for (const auto& [name, cfg] : collaborators.items()) {
        fabric->register_collaborator(name, cfg);
    }
    return fabric;
}

std::unique_ptr<Fabric> PersistenceManager::load(std::istream& in, const LoadOptions& options) {
    json snapshot;
    try {
        snapshot = json::parse(in);
    } catch (const json::parse_error& e) {
        schema_fail(std::string("Snapshot is not valid JSON: ") + e.what());
    }
    return from_json(snapshot, options);
}

std::unique_ptr<Fabric> PersistenceManager::load(const fs::path& path, const LoadOptions& options) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IoError("Cannot open snapshot " + path.string());
    }

    auto fabric = load(file, options);
    Logger::success("Fabric loaded from " + path.string() + ": D=" + std::to_string(fabric->dimension()) +
                    ", scales=" + std::to_string(fabric->schema().size()) +
                    ", transforms=" + std::to_string(fabric->transformer().size()));
    return fabric;
}

} // namespace Strata
