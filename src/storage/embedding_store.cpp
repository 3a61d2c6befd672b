#include <storage/embedding_store.hpp>
#include <core/errors.hpp>
#include <core/numeric.hpp>

namespace Strata {

EmbeddingStore::EmbeddingStore(std::string name, RowMatrix embeddings, std::vector<Metadata> metadata)
    : name_(std::move(name)),
      cardinality_(static_cast<size_t>(embeddings.rows())),
      dimension_(static_cast<size_t>(embeddings.cols())),
      embeddings_(std::move(embeddings)),
      metadata_(std::move(metadata))
{
    if (cardinality_ == 0 || dimension_ == 0) {
        throw ArgumentError("Scale " + name_ + " needs at least one component and one dimension");
    }
    if (!all_finite(embeddings_)) {
        throw NumericError("Scale " + name_ + " has non-finite initial embeddings");
    }

    if (metadata_.empty()) {
        metadata_.assign(cardinality_, Metadata::object());
    } else if (metadata_.size() != cardinality_) {
        throw ArgumentError("Scale " + name_ + ": expected " + std::to_string(cardinality_) +
                            " metadata entries, got " + std::to_string(metadata_.size()));
    }
    for (const auto& m : metadata_) {
        validate_metadata(name_, m);
    }
}

void EmbeddingStore::check_id(size_t id) const {
    if (id >= cardinality_) {
        throw IndexError("Component " + std::to_string(id) + " out of range for scale " +
                         name_ + " (cardinality " + std::to_string(cardinality_) + ")");
    }
}

void EmbeddingStore::check_vector(const Vector& embedding) const {
    if (static_cast<size_t>(embedding.size()) != dimension_) {
        throw DimensionError("Expected vector of length " + std::to_string(dimension_) +
                             " for scale " + name_ + ", got " + std::to_string(embedding.size()));
    }
    if (!all_finite(embedding)) {
        throw NumericError("Embedding for scale " + name_ + " contains NaN or Inf");
    }
}

Vector EmbeddingStore::get(size_t id) const {
    check_id(id);
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return embeddings_.row(id).transpose();
}

void EmbeddingStore::set(size_t id, const Vector& embedding) {
    check_id(id);
    check_vector(embedding);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    embeddings_.row(id) = embedding.transpose();
}

void EmbeddingStore::update(size_t id, const std::function<Vector(const Vector&)>& fn) {
    check_id(id);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    Vector current = embeddings_.row(id).transpose();
    Vector next = fn(current);
    check_vector(next);
    embeddings_.row(id) = next.transpose();
}

Metadata EmbeddingStore::get_metadata(size_t id) const {
    check_id(id);
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return metadata_[id];
}

void EmbeddingStore::set_metadata(size_t id, const Metadata& metadata) {
    check_id(id);
    validate_metadata(name_, metadata);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    metadata_[id] = metadata;
}

RowMatrix EmbeddingStore::matrix() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return embeddings_;
}

std::vector<Metadata> EmbeddingStore::all_metadata() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return metadata_;
}

} // namespace Strata
