#pragma once

#include "EmbeddingStore.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace presence {

class SnapshotError : public std::runtime_error {
public:
    explicit SnapshotError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Write a snapshot as JSON with a SHA-256 checksum over the identity list
 *
 * File layout:
 *   { "format": "presence-embeddings", "version": N, "dimension": 128,
 *     "checksum": "<sha256 hex>", "identities": [ {id, name, active, embedding}, ... ] }
 *
 * @throws SnapshotError if the file cannot be written
 */
void save_snapshot(const EmbeddingSnapshot& snapshot, const std::string& path);

/**
 * @brief Read identities from a snapshot file (install with EmbeddingStore::bulk_reload)
 * @throws SnapshotError on I/O errors, malformed JSON, wrong dimension, checksum mismatch or duplicate ids
 */
std::vector<EnrolledIdentity> load_snapshot(const std::string& path);

/** In-memory variants used by the file functions */
std::string serialize_snapshot(const EmbeddingSnapshot& snapshot);
std::vector<EnrolledIdentity> parse_snapshot(const std::string& json_text);

} // namespace presence
