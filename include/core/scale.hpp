/**
 * @file scale.hpp
 * @brief Hierarchical scales and the ordered schema they form
 */

#pragma once

#include <export.hpp>
#include <Eigen/Core>
#include <cstddef>
#include <string>
#include <vector>

namespace Strata {

using Vector = Eigen::VectorXd;
using Matrix = Eigen::MatrixXd;
/// One embedding per row, rows contiguous
using RowMatrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/**
 * @brief Names of the four default skin scales, fine to coarse.
 */
namespace Scales {
    inline constexpr const char* CELLULAR = "cellular";  ///< cells, proteins, molecular structures
    inline constexpr const char* TISSUE   = "tissue";    ///< epidermal and dermal layers
    inline constexpr const char* REGION   = "region";    ///< body regions
    inline constexpr const char* SYSTEM   = "system";    ///< whole-body skin functions
}

struct ScaleSpec {
    std::string name;
    size_t cardinality;

    bool operator==(const ScaleSpec& o) const {
        return name == o.name && cardinality == o.cardinality;
    }
    bool operator!=(const ScaleSpec& o) const { return !(*this == o); }
};

/**
 * @brief Ordered list of scales (fine → coarse) with fixed cardinalities.
 *
 * The ordinal of a scale is its position in the schema.
 */
class STRATA_API ScaleSchema {
public:
    ScaleSchema() = default;
    explicit ScaleSchema(std::vector<ScaleSpec> scales);

    /**
     * @brief cellular(1000), tissue(50), region(20), system(5)
     */
    static ScaleSchema skin_default();

    size_t size() const { return scales_.size(); }
    bool empty() const { return scales_.empty(); }
    const ScaleSpec& operator[](size_t ordinal) const { return scales_[ordinal]; }
    const std::vector<ScaleSpec>& scales() const { return scales_; }

    auto begin() const { return scales_.begin(); }
    auto end() const { return scales_.end(); }

    bool contains(const std::string& name) const;

    /**
     * @throws UnknownScaleError if the name is not in the schema
     */
    size_t ordinal(const std::string& name) const;

    size_t total_components() const;

    /**
     * @brief Reject empty schemas, empty or duplicate names and zero cardinalities.
     * @throws ArgumentError
     */
    void validate() const;

    bool operator==(const ScaleSchema& o) const { return scales_ == o.scales_; }
    bool operator!=(const ScaleSchema& o) const { return !(*this == o); }

private:
    std::vector<ScaleSpec> scales_;
};

/**
 * @brief "<from>-><to>", the snapshot key of a transform.
 */
STRATA_API std::string transform_key(const std::string& from, const std::string& to);

} // namespace Strata
