#include <integration/collaborators.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>

namespace Strata {

using json = nlohmann::json;

std::string primary_scale(const Fabric& fabric, const std::string& preferred) {
    if (fabric.schema().contains(preferred)) return preferred;
    return fabric.schema()[0].name;
}

void register_default_collaborators(Fabric& fabric) {
    json all_scales = json::array();
    for (const auto& spec : fabric.schema()) all_scales.push_back(spec.name);

    json search_scales = json::array();
    for (const char* s : {Scales::CELLULAR, Scales::TISSUE}) {
        if (fabric.schema().contains(s)) search_scales.push_back(s);
    }
    if (search_scales.empty()) search_scales.push_back(fabric.schema()[0].name);

    const std::vector<std::pair<const char*, json>> defaults = {
        {Collaborators::KNOWLEDGE_MAPPING, {
            {"type", "knowledge_graph"},
            {"embedding_scale", primary_scale(fabric, Scales::TISSUE)},
            {"concept_mapping", json::object()},
            {"relation_encoding", "cross_scale"},
        }},
        {Collaborators::REASONING, {
            {"type", "reasoning_engine"},
            {"truth_value_encoding", "activation"},
            {"inference_scale", primary_scale(fabric, Scales::TISSUE)},
            {"confidence_threshold", 0.7},
        }},
        {Collaborators::PATTERN_SEARCH, {
            {"type", "pattern_discovery"},
            {"search_scales", search_scales},
            {"fitness_metric", "embedding_coherence"},
        }},
        {Collaborators::TEMPORAL_PREDICTION, {
            {"type", "temporal_prediction"},
            {"temporal_scale", primary_scale(fabric, Scales::SYSTEM)},
            {"reservoir_dimension", fabric.dimension()},
            {"readout_scales", all_scales},
        }},
        {Collaborators::ATTENTION_ALLOCATION, {
            {"type", "attention_allocation"},
            {"attention_currency", "activation"},
            {"allocation_scales", all_scales},
        }},
    };

    size_t added = 0;
    for (const auto& entry : defaults) {
        fabric.update_collaborator(entry.first, [&](json& config) {
            if (!config.is_null()) return;
            config = entry.second;
            ++added;
        });
    }
    Logger::step("Registered " + std::to_string(added) + " default collaborators");
}

std::unique_ptr<Fabric> create_integrated_fabric(FabricConfig config) {
    auto fabric = create_fabric(std::move(config));
    register_default_collaborators(*fabric);
    return fabric;
}

Vector feature_vector(const Fabric& fabric, const std::vector<std::string>& scales) {
    if (scales.empty()) {
        throw ArgumentError("feature_vector needs at least one scale");
    }

    const Eigen::Index d = static_cast<Eigen::Index>(fabric.dimension());
    Vector features(d * static_cast<Eigen::Index>(scales.size()));

    for (size_t i = 0; i < scales.size(); ++i) {
        const EmbeddingStore& store = fabric.registry().store(scales[i]);
        features.segment(static_cast<Eigen::Index>(i) * d, d) =
            store.read([](const RowMatrix& table, const std::vector<Metadata>&) -> Vector {
                return table.colwise().mean().transpose();
            });
    }
    return features;
}

} // namespace Strata
