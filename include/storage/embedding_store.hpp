/**
 * @file embedding_store.hpp
 * @brief Fixed-size embedding table and metadata for one scale
 */

#pragma once

#include <core/scale.hpp>
#include <storage/metadata.hpp>
#include <export.hpp>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace Strata {

/**
 * @brief Embeddings and metadata for every component of one scale.
 *
 * The table never grows or shrinks after construction. Reads take a shared
 * lock, writes a unique lock, so concurrent readers never block each other
 * and no update to a component is lost.
 */
class STRATA_API EmbeddingStore {
public:
    /**
     * @param embeddings cardinality × D, one component per row
     * @param metadata empty, or exactly one object per row
     *
     * @throws ArgumentError on an empty table, wrong metadata count or invalid metadata
     * @throws NumericError on non-finite embeddings
     */
    EmbeddingStore(std::string name, RowMatrix embeddings, std::vector<Metadata> metadata = {});

    EmbeddingStore(const EmbeddingStore&) = delete;
    EmbeddingStore& operator=(const EmbeddingStore&) = delete;

    const std::string& name() const { return name_; }
    size_t cardinality() const { return cardinality_; }
    size_t count() const { return cardinality_; }
    size_t dimension() const { return dimension_; }

    /**
     * @throws IndexError if id >= cardinality
     */
    Vector get(size_t id) const;

    /**
     * @throws IndexError, DimensionError, NumericError (checked before writing)
     */
    void set(size_t id, const Vector& embedding);

    /**
     * @brief Atomic read-modify-write of one embedding.
     *
     * @param fn maps the current embedding to its replacement; runs under the
     *           unique lock and must not touch this store
     * @throws IndexError, DimensionError, NumericError; the embedding is left
     *         unchanged if fn's result is rejected
     */
    void update(size_t id, const std::function<Vector(const Vector&)>& fn);

    Metadata get_metadata(size_t id) const;
    void set_metadata(size_t id, const Metadata& metadata);

    /**
     * @brief Copy of the whole table.
     */
    RowMatrix matrix() const;
    std::vector<Metadata> all_metadata() const;

    /**
     * @brief Run fn over the table under the shared lock.
     */
    template<typename Fn>
    auto read(Fn&& fn) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return fn(embeddings_, metadata_);
    }

    /**
     * @brief Hold the shared lock across several reads (snapshotting).
     */
    std::shared_lock<std::shared_mutex> lock_shared() const {
        return std::shared_lock<std::shared_mutex>(mutex_);
    }

    /**
     * @brief Table and metadata access for a caller already holding lock_shared().
     */
    const RowMatrix& embeddings_unlocked() const { return embeddings_; }
    const std::vector<Metadata>& metadata_unlocked() const { return metadata_; }

    void check_id(size_t id) const;

private:
    void check_vector(const Vector& embedding) const;

    std::string name_;
    size_t cardinality_;
    size_t dimension_;
    RowMatrix embeddings_;
    std::vector<Metadata> metadata_;
    mutable std::shared_mutex mutex_;
};

} // namespace Strata
