#include <storage/metadata.hpp>
#include <core/errors.hpp>
#include <core/scale.hpp>

namespace Strata {

const char* category_key(const std::string& scale) {
    if (scale == Scales::CELLULAR) return MetaKeys::TYPE;
    if (scale == Scales::TISSUE)   return MetaKeys::LAYER;
    if (scale == Scales::REGION)   return MetaKeys::BODY_PART;
    if (scale == Scales::SYSTEM)   return MetaKeys::FUNCTION;
    return nullptr;
}

static void require_string(const Metadata& metadata, const char* key) {
    auto it = metadata.find(key);
    if (it != metadata.end() && !it->is_string()) {
        throw ArgumentError(std::string("Metadata key '") + key + "' must be a string");
    }
}

void validate_metadata(const std::string& scale, const Metadata& metadata) {
    if (!metadata.is_object()) {
        throw ArgumentError("Metadata for scale " + scale + " must be a JSON object");
    }

    require_string(metadata, MetaKeys::NAME);
    require_string(metadata, MetaKeys::DESCRIPTION);

    if (const char* key = category_key(scale)) {
        require_string(metadata, key);
    }
}

} // namespace Strata
