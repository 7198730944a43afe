#pragma once

#include "BlinkTracker.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace presence {

/**
 * @brief Read-only copy of one session's blink state
 */
struct SessionInfo {
    std::string session_id;
    int counter = 0;
    int total_blinks = 0;
    std::vector<double> ear_history;
    uint64_t frames = 0;
};

/**
 * @brief Keyed liveness session state
 *
 * Owns one BlinkTracker per session id. Frames of one session are applied
 * under that session's mutex, so a session is never updated by two callers
 * at once, while different sessions proceed in parallel. Sessions are
 * created on their first frame and discarded by reset_session() or
 * evict_idle().
 */
class SessionRegistry {
public:
    using Clock = std::chrono::steady_clock;

    explicit SessionRegistry(const BlinkConfig& config = BlinkConfig(),
                             std::chrono::seconds idle_timeout = std::chrono::seconds(300));

    BlinkResult track_blink(const std::string& session_id, const LandmarkSet& landmarks,
                            Clock::time_point now = Clock::now());

    /** @return true if a session was discarded */
    bool reset_session(const std::string& session_id);

    /**
     * @brief Discard sessions that have not seen a frame within the idle timeout
     *
     * Sessions with a frame in progress are skipped rather than waited on.
     * @return number of sessions removed
     */
    size_t evict_idle(Clock::time_point now = Clock::now());

    std::optional<SessionInfo> inspect(const std::string& session_id) const;

    size_t session_count() const;

private:
    struct Session {
        explicit Session(const BlinkConfig& config) : tracker(config) {}

        std::mutex mutex;
        BlinkTracker tracker;
        Clock::time_point last_seen;
        uint64_t frames = 0;
    };

    std::shared_ptr<Session> acquire(const std::string& session_id, Clock::time_point now);

    BlinkConfig config_;
    std::chrono::seconds idle_timeout_;

    mutable std::mutex registry_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
};

} // namespace presence
