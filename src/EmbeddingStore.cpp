#include "EmbeddingStore.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <unordered_set>

namespace presence {

EmbeddingSnapshot::EmbeddingSnapshot(std::vector<EnrolledIdentity> entries, uint64_t version)
    : entries_(std::move(entries)), version_(version) {
    active_count_ = static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
        [](const EnrolledIdentity& e) { return e.active; }));
}

const EnrolledIdentity* EmbeddingSnapshot::find(const std::string& id) const {
    for (const auto& entry : entries_) {
        if (entry.id == id) return &entry;
    }
    return nullptr;
}

EmbeddingStore::EmbeddingStore()
    : current_(std::make_shared<EmbeddingSnapshot>()) {}

void EmbeddingStore::validate_embedding(const Embedding& embedding) {
    if (embedding.size() != EMBEDDING_DIM) {
        throw InvalidEmbedding("embedding must have " + std::to_string(EMBEDDING_DIM) +
                               " dimensions, got " + std::to_string(embedding.size()));
    }
    for (size_t i = 0; i < embedding.size(); ++i) {
        if (!std::isfinite(embedding[i])) {
            throw InvalidEmbedding("embedding value at index " + std::to_string(i) + " is not finite");
        }
    }
}

SnapshotPtr EmbeddingStore::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(publish_mutex_);
    return current_;
}

void EmbeddingStore::enroll(const std::string& identity_id, const std::string& name, const Embedding& embedding) {
    if (identity_id.empty()) {
        throw std::invalid_argument("identity id must not be empty");
    }
    validate_embedding(embedding);

    std::lock_guard<std::mutex> writer(writer_mutex_);

    // Rescan the current identities into a fresh list
    SnapshotPtr base = snapshot();
    std::vector<EnrolledIdentity> entries;
    entries.reserve(base->size() + 1);

    bool replaced = false;
    for (const auto& entry : base->entries()) {
        if (entry.id == identity_id) {
            entries.push_back({identity_id, name, embedding, true});
            replaced = true;
        } else {
            entries.push_back(entry);
        }
    }
    if (!replaced) {
        entries.push_back({identity_id, name, embedding, true});
    }

    publish(std::move(entries));
    std::cout << "[EmbeddingStore] " << (replaced ? "Re-enrolled " : "Enrolled ") << identity_id
              << " (" << name << "), version " << version() << std::endl;
}

bool EmbeddingStore::remove(const std::string& identity_id) {
    std::lock_guard<std::mutex> writer(writer_mutex_);

    SnapshotPtr base = snapshot();
    const EnrolledIdentity* existing = base->find(identity_id);
    if (!existing || !existing->active) {
        return false;
    }

    std::vector<EnrolledIdentity> entries = base->entries();
    for (auto& entry : entries) {
        if (entry.id == identity_id) entry.active = false;
    }

    publish(std::move(entries));
    std::cout << "[EmbeddingStore] Deactivated " << identity_id << ", version " << version() << std::endl;
    return true;
}

void EmbeddingStore::bulk_reload(std::vector<EnrolledIdentity> identities) {
    std::unordered_set<std::string> seen;
    for (const auto& entry : identities) {
        if (entry.id.empty()) {
            throw std::invalid_argument("identity id must not be empty");
        }
        if (!seen.insert(entry.id).second) {
            throw std::invalid_argument("duplicate identity id: " + entry.id);
        }
        try {
            validate_embedding(entry.embedding);
        } catch (const InvalidEmbedding& e) {
            throw InvalidEmbedding("identity " + entry.id + ": " + e.what());
        }
    }

    std::lock_guard<std::mutex> writer(writer_mutex_);
    size_t count = identities.size();
    publish(std::move(identities));
    std::cout << "[EmbeddingStore] Reloaded " << count << " identities, version " << version() << std::endl;
}

void EmbeddingStore::publish(std::vector<EnrolledIdentity> entries) {
    uint64_t next_version = version_.load(std::memory_order_acquire) + 1;
    auto next = std::make_shared<const EmbeddingSnapshot>(std::move(entries), next_version);

    {
        std::unique_lock<std::shared_mutex> lock(publish_mutex_);
        current_ = std::move(next);
    }
    version_.store(next_version, std::memory_order_release);
}

} // namespace presence
