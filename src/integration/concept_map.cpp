#include <integration/concept_map.hpp>
#include <integration/collaborators.hpp>
#include <core/errors.hpp>
#include <core/numeric.hpp>
#include <utils/logger.hpp>
#include <set>
#include <utility>

namespace Strata {

using json = nlohmann::json;

namespace {

constexpr const char* kMapping = "concept_mapping";

json knowledge_config(const Fabric& fabric) {
    auto config = fabric.collaborator(Collaborators::KNOWLEDGE_MAPPING);
    if (!config) {
        throw ArgumentError("knowledge_mapping collaborator is not registered");
    }
    return *config;
}

[[noreturn]] void binding_fail(const std::string& concept_name, const std::string& msg) {
    throw SchemaError("Concept binding " + concept_name + " " + msg);
}

} // anonymous namespace

ConceptBinding parse_concept_binding(const std::string& concept_name, const json& entry,
                                     const ScaleSchema& schema) {
    if (!entry.is_object()) {
        binding_fail(concept_name, "must be an object with scale and id");
    }
    auto scale = entry.find("scale");
    if (scale == entry.end() || !scale->is_string()) {
        binding_fail(concept_name, "has no scale name");
    }
    const std::string name = scale->get<std::string>();
    if (!schema.contains(name)) {
        binding_fail(concept_name, "names unknown scale " + name);
    }
    auto id = entry.find("id");
    if (id == entry.end() || !id->is_number_unsigned()) {
        binding_fail(concept_name, "has no non-negative integer id");
    }
    const size_t value = id->get<size_t>();
    if (value >= schema[schema.ordinal(name)].cardinality) {
        binding_fail(concept_name, "id " + std::to_string(value) + " is outside scale " + name);
    }
    return ConceptBinding{name, value};
}

void validate_concept_mapping(const json& knowledge_config, const ScaleSchema& schema) {
    auto it = knowledge_config.find(kMapping);
    if (it == knowledge_config.end() || it->is_null()) return;
    if (!it->is_object()) {
        throw SchemaError("knowledge_mapping.concept_mapping must be an object");
    }

    std::set<std::pair<std::string, size_t>> used;
    for (auto b = it->begin(); b != it->end(); ++b) {
        ConceptBinding binding = parse_concept_binding(b.key(), b.value(), schema);
        if (!used.emplace(binding.scale, binding.id).second) {
            binding_fail(b.key(), "shares " + binding.scale + "[" + std::to_string(binding.id) +
                         "] with another concept");
        }
    }
}

ConceptMap::ConceptMap(Fabric& fabric) : fabric_(fabric) {
    fabric_.update_collaborator(Collaborators::KNOWLEDGE_MAPPING, [&](json& config) {
        if (!config.is_null()) return;
        config = {
            {"type", "knowledge_graph"},
            {"embedding_scale", primary_scale(fabric_, Scales::TISSUE)},
            {kMapping, json::object()},
        };
    });
}

json ConceptMap::mapping() const {
    json config = knowledge_config(fabric_);
    auto it = config.find(kMapping);
    if (it == config.end() || it->is_null()) return json::object();
    if (!it->is_object()) {
        throw SchemaError("knowledge_mapping.concept_mapping must be an object");
    }
    return *it;
}

std::string ConceptMap::default_scale() const {
    json config = knowledge_config(fabric_);
    auto it = config.find("embedding_scale");
    if (it != config.end() && it->is_string() && fabric_.schema().contains(it->get<std::string>())) {
        return it->get<std::string>();
    }
    return primary_scale(fabric_, Scales::TISSUE);
}

size_t ConceptMap::bind(const std::string& concept_name) {
    return bind(concept_name, default_scale());
}

size_t ConceptMap::bind(const std::string& concept_name, const std::string& scale,
                        const std::optional<Vector>& features) {
    if (concept_name.empty()) {
        throw ArgumentError("Concept name must not be empty");
    }

    const size_t cardinality = fabric_.count(scale);
    if (features) {
        if (static_cast<size_t>(features->size()) != fabric_.dimension()) {
            throw DimensionError("Concept features for " + concept_name + " have length " +
                                 std::to_string(features->size()) + ", expected " +
                                 std::to_string(fabric_.dimension()));
        }
        if (!all_finite(*features)) {
            throw NumericError("Concept features for " + concept_name + " contain NaN or Inf");
        }
    }

    // Reserve the id in the shared entry; component writes follow outside the
    // registry lock so that no two unique locks are ever held together.
    const ScaleSchema& schema = fabric_.schema();
    size_t id = 0;
    bool fresh = false;
    fabric_.update_collaborator(Collaborators::KNOWLEDGE_MAPPING, [&](json& config) {
        if (config.is_null()) {
            throw ArgumentError("knowledge_mapping collaborator is not registered");
        }
        json& bindings = config[kMapping];
        if (bindings.is_null()) bindings = json::object();
        if (!bindings.is_object()) {
            throw SchemaError("knowledge_mapping.concept_mapping must be an object");
        }

        if (auto it = bindings.find(concept_name); it != bindings.end()) {
            id = parse_concept_binding(concept_name, *it, schema).id;
            return;
        }

        std::set<size_t> taken;
        for (auto it = bindings.begin(); it != bindings.end(); ++it) {
            ConceptBinding b = parse_concept_binding(it.key(), it.value(), schema);
            if (b.scale == scale) taken.insert(b.id);
        }
        while (taken.count(id)) ++id;
        if (id >= cardinality) {
            throw CapacityError("No unbound component left at scale " + scale +
                                " for concept " + concept_name);
        }

        bindings[concept_name] = {{"scale", scale}, {"id", id}};
        fresh = true;
    });

    if (!fresh) return id;

    if (features) {
        fabric_.set_embedding(scale, id, *features);
    }
    fabric_.set_metadata(scale, id, {
        {MetaKeys::NAME, concept_name},
        {MetaKeys::SOURCE, Collaborators::KNOWLEDGE_MAPPING},
        {MetaKeys::TYPE, "knowledge_concept"},
    });

    Logger::step("Bound concept " + concept_name + " to " + scale + "[" + std::to_string(id) + "]");
    return id;
}

std::optional<ConceptBinding> ConceptMap::lookup(const std::string& concept_name) const {
    json bindings = mapping();
    auto it = bindings.find(concept_name);
    if (it == bindings.end()) return std::nullopt;
    return parse_concept_binding(concept_name, *it, fabric_.schema());
}

ConceptDescription ConceptMap::describe(const std::string& concept_name, size_t top_k) const {
    auto binding = lookup(concept_name);
    if (!binding) {
        throw ArgumentError("Concept is not bound: " + concept_name);
    }

    ConceptDescription desc;
    desc.binding = *binding;
    desc.embedding = fabric_.get_embedding(binding->scale, binding->id);
    desc.metadata = fabric_.get_metadata(binding->scale, binding->id);

    // One extra hit so that dropping the concept itself still leaves top_k.
    for (const auto& hit : fabric_.query_similar(desc.embedding, binding->scale, top_k + 1)) {
        if (hit.id == binding->id) continue;
        if (desc.related.size() == top_k) break;
        desc.related.push_back({hit.id, hit.score, fabric_.get_metadata(binding->scale, hit.id)});
    }
    return desc;
}

std::vector<std::string> ConceptMap::concepts() const {
    json bindings = mapping();
    std::vector<std::string> names;
    for (auto it = bindings.begin(); it != bindings.end(); ++it) names.push_back(it.key());
    return names;
}

} // namespace Strata
