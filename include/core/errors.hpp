/**
 * @file errors.hpp
 * @brief Exception taxonomy for fabric operations
 *
 * Every error is raised synchronously at the offending call, before any state
 * is mutated. Nothing is retried internally.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace Strata {

class FabricError : public std::runtime_error {
public:
    explicit FabricError(const std::string& what) : std::runtime_error(what) {}
};

/// Component id outside [0, cardinality) for its scale.
class IndexError : public FabricError {
public:
    explicit IndexError(const std::string& what) : FabricError(what) {}
};

/// Scale name or ordinal not present in the schema.
class UnknownScaleError : public IndexError {
public:
    explicit UnknownScaleError(const std::string& what) : IndexError(what) {}
};

/// Vector or matrix shape does not match the fabric dimension.
class DimensionError : public FabricError {
public:
    explicit DimensionError(const std::string& what) : FabricError(what) {}
};

/// No matrix registered for an ordered scale pair.
class MissingTransformError : public FabricError {
public:
    explicit MissingTransformError(const std::string& what) : FabricError(what) {}
};

/// Snapshot incompatible with the expected version, dimension or scales.
class SchemaError : public FabricError {
public:
    explicit SchemaError(const std::string& what) : FabricError(what) {}
};

/// Input carries NaN or Inf, or an update would produce one.
class NumericError : public FabricError {
public:
    explicit NumericError(const std::string& what) : FabricError(what) {}
};

/// Parameter outside its accepted range (rates, strengths, metadata shape).
class ArgumentError : public FabricError {
public:
    explicit ArgumentError(const std::string& what) : FabricError(what) {}
};

/// No unbound component left at a scale.
class CapacityError : public FabricError {
public:
    explicit CapacityError(const std::string& what) : FabricError(what) {}
};

/// Snapshot file could not be opened, read or written.
class IoError : public FabricError {
public:
    explicit IoError(const std::string& what) : FabricError(what) {}
};

} // namespace Strata
