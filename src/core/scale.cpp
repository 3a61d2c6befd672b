#include <core/scale.hpp>
#include <core/errors.hpp>
#include <unordered_set>

namespace Strata {

ScaleSchema::ScaleSchema(std::vector<ScaleSpec> scales) : scales_(std::move(scales)) {}

ScaleSchema ScaleSchema::skin_default() {
    return ScaleSchema({
        {Scales::CELLULAR, 1000},
        {Scales::TISSUE,     50},
        {Scales::REGION,     20},
        {Scales::SYSTEM,      5},
    });
}

bool ScaleSchema::contains(const std::string& name) const {
    for (const auto& s : scales_) {
        if (s.name == name) return true;
    }
    return false;
}

size_t ScaleSchema::ordinal(const std::string& name) const {
    for (size_t i = 0; i < scales_.size(); ++i) {
        if (scales_[i].name == name) return i;
    }
    throw UnknownScaleError("Unknown scale: " + name);
}

size_t ScaleSchema::total_components() const {
    size_t total = 0;
    for (const auto& s : scales_) total += s.cardinality;
    return total;
}

void ScaleSchema::validate() const {
    if (scales_.empty()) {
        throw ArgumentError("Scale schema must contain at least one scale");
    }

    std::unordered_set<std::string> seen;
    for (const auto& s : scales_) {
        if (s.name.empty()) {
            throw ArgumentError("Scale name must not be empty");
        }
        // "->" separates the two scales of a transform key
        if (s.name.find("->") != std::string::npos) {
            throw ArgumentError("Scale name must not contain '->': " + s.name);
        }
        if (s.cardinality == 0) {
            throw ArgumentError("Scale " + s.name + " must have at least one component");
        }
        if (!seen.insert(s.name).second) {
            throw ArgumentError("Duplicate scale name: " + s.name);
        }
    }
}

std::string transform_key(const std::string& from, const std::string& to) {
    return from + "->" + to;
}

} // namespace Strata
