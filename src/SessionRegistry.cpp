#include "SessionRegistry.hpp"
#include <iostream>

namespace presence {

SessionRegistry::SessionRegistry(const BlinkConfig& config, std::chrono::seconds idle_timeout)
    : config_(config), idle_timeout_(idle_timeout) {}

std::shared_ptr<SessionRegistry::Session> SessionRegistry::acquire(const std::string& session_id,
                                                                   Clock::time_point now) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        auto session = std::make_shared<Session>(config_);
        session->last_seen = now;
        it = sessions_.emplace(session_id, std::move(session)).first;
    }
    return it->second;
}

BlinkResult SessionRegistry::track_blink(const std::string& session_id, const LandmarkSet& landmarks,
                                         Clock::time_point now) {
    std::shared_ptr<Session> session = acquire(session_id, now);

    // A session reset concurrently keeps updating its detached state; the next
    // frame for that id starts a fresh one.
    std::lock_guard<std::mutex> lock(session->mutex);
    session->last_seen = now;
    ++session->frames;
    return session->tracker.update(landmarks);
}

bool SessionRegistry::reset_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return sessions_.erase(session_id) > 0;
}

size_t SessionRegistry::evict_idle(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    size_t removed = 0;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        // A session whose frame is being applied right now is not idle; never wait on it
        bool idle = false;
        {
            std::unique_lock<std::mutex> session_lock(it->second->mutex, std::try_to_lock);
            idle = session_lock.owns_lock() && now - it->second->last_seen > idle_timeout_;
        }
        if (idle) {
            it = sessions_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        std::cout << "[Sessions] Evicted " << removed << " idle session(s), "
                  << sessions_.size() << " active" << std::endl;
    }
    return removed;
}

std::optional<SessionInfo> SessionRegistry::inspect(const std::string& session_id) const {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) return std::nullopt;
        session = it->second;
    }

    std::lock_guard<std::mutex> lock(session->mutex);
    SessionInfo info;
    info.session_id = session_id;
    info.counter = session->tracker.counter();
    info.total_blinks = session->tracker.total_blinks();
    info.ear_history.assign(session->tracker.ear_history().begin(), session->tracker.ear_history().end());
    info.frames = session->frames;
    return info;
}

size_t SessionRegistry::session_count() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return sessions_.size();
}

} // namespace presence
