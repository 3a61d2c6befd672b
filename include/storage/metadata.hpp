/**
 * @file metadata.hpp
 * @brief Component metadata: a JSON object with documented, type-checked keys
 */

#pragma once

#include <export.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace Strata {

using Metadata = nlohmann::json;

/**
 * @brief Documented metadata keys.
 *
 * NAME and DESCRIPTION apply to every scale. Each default skin scale also
 * documents one category key (see category_key()). Any other key is carried
 * through untouched for collaborators.
 */
namespace MetaKeys {
    inline constexpr const char* NAME        = "name";
    inline constexpr const char* DESCRIPTION = "description";
    inline constexpr const char* TYPE        = "type";       // cellular
    inline constexpr const char* LAYER       = "layer";      // tissue
    inline constexpr const char* BODY_PART   = "body_part";  // region
    inline constexpr const char* FUNCTION    = "function";   // system
    inline constexpr const char* SOURCE      = "source";
}

/**
 * @brief Category key documented for a scale, or nullptr for custom scales.
 */
STRATA_API const char* category_key(const std::string& scale);

/**
 * @brief Check a metadata value before it is stored.
 *
 * @throws ArgumentError if the value is not an object, or a documented key
 *         for this scale holds a non-string value
 */
STRATA_API void validate_metadata(const std::string& scale, const Metadata& metadata);

} // namespace Strata
