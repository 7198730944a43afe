#include "FaceMatcher.hpp"
#include <cmath>
#include <limits>

namespace presence {

FaceMatcher::FaceMatcher(const EmbeddingStore& store) : store_(store) {}

double FaceMatcher::euclidean_distance(const Embedding& a, const Embedding& b) {
    double sum = 0.0;
    for (size_t i = 0; i < a.size() && i < b.size(); ++i) {
        double d = a[i] - b[i];
        sum += d * d;
    }
    return std::sqrt(sum);
}

MatchResult FaceMatcher::match(const Embedding& query) const {
    SnapshotPtr snapshot = store_.snapshot();
    return match(query, *snapshot);
}

MatchResult FaceMatcher::match(const Embedding& query, const EmbeddingSnapshot& snapshot) {
    EmbeddingStore::validate_embedding(query);

    MatchResult result;
    result.distance = std::numeric_limits<double>::infinity();

    const EnrolledIdentity* best = nullptr;
    for (const auto& entry : snapshot.entries()) {
        if (!entry.active) continue;
        double distance = euclidean_distance(query, entry.embedding);
        // Strict '<' keeps the first of equally close entries
        if (distance < result.distance) {
            result.distance = distance;
            best = &entry;
        }
    }

    if (best && result.distance < MATCH_DISTANCE_CUTOFF) {
        result.recognized = true;
        result.identity_id = best->id;
        result.display_name = best->name;
        result.confidence = 1.0 - result.distance;
    }
    return result;
}

} // namespace presence
