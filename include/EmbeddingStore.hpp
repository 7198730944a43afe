#pragma once

#include "FaceTypes.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace presence {

/**
 * @brief One enrolled identity
 */
struct EnrolledIdentity {
    std::string id;
    std::string name;
    Embedding embedding;
    bool active = true;
};

/**
 * @brief Immutable view of the enrolled identities at one point in time
 *
 * Instances are never modified after construction, so any number of
 * matcher calls may read the same snapshot without locking.
 */
class EmbeddingSnapshot {
public:
    EmbeddingSnapshot() = default;
    EmbeddingSnapshot(std::vector<EnrolledIdentity> entries, uint64_t version);

    const std::vector<EnrolledIdentity>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    size_t active_count() const { return active_count_; }
    bool empty() const { return active_count_ == 0; }
    uint64_t version() const { return version_; }

    /** @return entry with the given id, or nullptr */
    const EnrolledIdentity* find(const std::string& id) const;

private:
    std::vector<EnrolledIdentity> entries_;
    size_t active_count_ = 0;
    uint64_t version_ = 0;
};

using SnapshotPtr = std::shared_ptr<const EmbeddingSnapshot>;

/**
 * @brief Enrolled identity embeddings with copy-on-write publication
 *
 * Every mutation builds a complete new snapshot off to the side and then
 * swaps the published pointer under an exclusive lock. Readers only hold
 * the shared lock long enough to copy the pointer, so an in-flight match
 * sees either the old or the new store, never a partial one.
 */
class EmbeddingStore {
public:
    EmbeddingStore();

    /**
     * @brief Enroll (or re-enroll) an identity
     * @throws InvalidEmbedding if the embedding is not 128 finite values
     */
    void enroll(const std::string& identity_id, const std::string& name, const Embedding& embedding);

    /**
     * @brief Deactivate an identity so it no longer participates in matching
     * @return false if the id is unknown or already inactive
     */
    bool remove(const std::string& identity_id);

    /**
     * @brief Replace the whole store with the given identities
     *
     * All ids and embeddings are validated before anything is published.
     * @throws InvalidEmbedding on the first bad embedding; the store is left untouched
     * @throws std::invalid_argument on an empty or duplicate id
     */
    void bulk_reload(std::vector<EnrolledIdentity> identities);

    /** Current published snapshot (never null) */
    SnapshotPtr snapshot() const;

    uint64_t version() const { return version_.load(std::memory_order_acquire); }

    /**
     * @brief Validate embedding dimensionality and values
     * @throws InvalidEmbedding
     */
    static void validate_embedding(const Embedding& embedding);

private:
    void publish(std::vector<EnrolledIdentity> entries);

    mutable std::shared_mutex publish_mutex_;  // guards current_
    std::mutex writer_mutex_;                  // serializes rebuilds
    SnapshotPtr current_;
    std::atomic<uint64_t> version_{0};
};

} // namespace presence
