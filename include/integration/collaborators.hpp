/**
 * @file collaborators.hpp
 * @brief Default collaborator registrations and feature reads
 *
 * Collaborators are the cognitive subsystems that consume the fabric. The
 * fabric stores one JSON configuration entry per collaborator and persists it
 * with every snapshot:
 * - knowledge_mapping:    embedding scale and concept bindings (ConceptMap)
 * - reasoning:            inference scale and confidence threshold
 * - pattern_search:       scales to search and the fitness metric name
 * - temporal_prediction:  temporal scale and readout scales (feature_vector)
 * - attention_allocation: scales that share the budget (AttentionAllocator)
 */

#pragma once

#include <fabric.hpp>
#include <export.hpp>
#include <memory>
#include <string>
#include <vector>

namespace Strata {

namespace Collaborators {
    inline constexpr const char* KNOWLEDGE_MAPPING    = "knowledge_mapping";
    inline constexpr const char* REASONING            = "reasoning";
    inline constexpr const char* PATTERN_SEARCH       = "pattern_search";
    inline constexpr const char* TEMPORAL_PREDICTION  = "temporal_prediction";
    inline constexpr const char* ATTENTION_ALLOCATION = "attention_allocation";
}

/**
 * @brief The given scale if the fabric has it, otherwise the fabric's first scale.
 */
STRATA_API std::string primary_scale(const Fabric& fabric, const std::string& preferred);

/**
 * @brief Register the five default collaborators with their primary scales.
 *
 * Existing registrations (e.g. restored from a snapshot, with their concept
 * bindings) are left as they are.
 */
STRATA_API void register_default_collaborators(Fabric& fabric);

/**
 * @brief create_fabric() followed by register_default_collaborators().
 */
STRATA_API std::unique_ptr<Fabric> create_integrated_fabric(FabricConfig config);

/**
 * @brief Concatenated mean embedding of each listed scale, in list order.
 *
 * Each scale's mean is read under that store's shared lock.
 *
 * @return vector of length scales.size() · D
 * @throws ArgumentError on an empty list, UnknownScaleError
 */
STRATA_API Vector feature_vector(const Fabric& fabric, const std::vector<std::string>& scales);

} // namespace Strata
