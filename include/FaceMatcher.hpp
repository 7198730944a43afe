#pragma once

#include "EmbeddingStore.hpp"
#include "FaceTypes.hpp"

namespace presence {

/**
 * @brief Nearest-neighbour identity matching over an EmbeddingStore
 *
 * Euclidean distance against every active entry; the closest wins and is
 * accepted when its distance is strictly below MATCH_DISTANCE_CUTOFF, with
 * confidence = 1 - distance. Confidence is a monotonic proxy for distance,
 * not a probability. Stateless; safe to call from any number of threads.
 */
class FaceMatcher {
public:
    static constexpr double MATCH_DISTANCE_CUTOFF = 0.6;

    explicit FaceMatcher(const EmbeddingStore& store);

    /**
     * @brief Match a query embedding against the current snapshot
     * @throws InvalidEmbedding if the query is not 128 finite values
     */
    MatchResult match(const Embedding& query) const;

    /** Match against an explicit snapshot (no store access) */
    static MatchResult match(const Embedding& query, const EmbeddingSnapshot& snapshot);

    static double euclidean_distance(const Embedding& a, const Embedding& b);

private:
    const EmbeddingStore& store_;
};

} // namespace presence
