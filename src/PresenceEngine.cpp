#include "PresenceEngine.hpp"
#include <chrono>
#include <iostream>

namespace presence {

namespace {

nlohmann::json match_to_json(const MatchResult& match) {
    nlohmann::json j = {
        {"recognized", match.recognized},
        {"confidence", match.confidence}
    };
    j["user_id"] = match.identity_id ? nlohmann::json(*match.identity_id) : nlohmann::json(nullptr);
    j["user_name"] = match.display_name ? nlohmann::json(*match.display_name) : nlohmann::json(nullptr);
    return j;
}

nlohmann::json liveness_to_json(const LivenessResult& liveness) {
    return {
        {"is_live", liveness.is_live},
        {"liveness_score", liveness.liveness_score},
        {"blink_result", {
            {"blink_detected", liveness.blink.blink_detected},
            {"ear", liveness.blink.ear},
            {"total_blinks", liveness.blink.total_blinks},
            {"confidence", liveness.blink.confidence},
            {"status", to_string(liveness.blink.reason)}
        }},
        {"pose_result", {
            {"yaw", liveness.pose.yaw},
            {"pitch", liveness.pose.pitch},
            {"roll", liveness.pose.roll},
            {"movement_detected", liveness.pose.movement_detected},
            {"confidence", liveness.pose.confidence},
            {"status", to_string(liveness.pose.reason)}
        }}
    };
}

// Frame-level anomaly only wins when strictly more severe than the face-level one
std::optional<Anomaly> more_severe(std::optional<Anomaly> frame_level, std::optional<Anomaly> face_level,
                                   size_t face_count) {
    if (!face_level) return frame_level;
    if (frame_level && frame_level->severity > face_level->severity) return frame_level;
    if (face_count > 1) {
        face_level->details["face_count"] = face_count;
    }
    return face_level;
}

LivenessResult degraded_liveness(DegradeReason reason) {
    LivenessResult result;
    result.blink = BlinkResult::degraded(reason);
    result.pose = PoseEstimate::degraded(reason);
    return result;
}

} // namespace

nlohmann::json FrameVerdict::to_json() const {
    nlohmann::json j = match_to_json(match);
    j["face_count"] = face_count;
    j["liveness"] = liveness_to_json(liveness);
    j["is_live"] = liveness.is_live;
    j["liveness_score"] = liveness.liveness_score;
    j["has_mask"] = mask ? mask->has_mask : false;
    j["face_locations"] = nlohmann::json::array();
    if (face_region) {
        j["face_locations"].push_back({face_region->top, face_region->right,
                                       face_region->bottom, face_region->left});
    }
    j["anomaly_detected"] = anomaly.has_value();
    j["anomaly"] = anomaly ? anomaly->to_json() : nlohmann::json(nullptr);
    j["attendance"] = {
        {"status", to_string(attendance.status)},
        {"anomaly_flag", attendance.anomaly_flag}
    };
    return j;
}

PresenceEngine::PresenceEngine(const EngineConfig& config)
    : config_(config),
      store_(),
      matcher_(store_),
      sessions_(config.blink, std::chrono::seconds(config.session_idle_timeout_s)),
      pose_estimator_(config.pose),
      classifier_(config.classifier),
      mask_detector_(config.mask) {
    config_.validate();
}

void PresenceEngine::enroll(const std::string& identity_id, const std::string& name, const Embedding& embedding) {
    store_.enroll(identity_id, name, embedding);
}

void PresenceEngine::bulk_reload(std::vector<EnrolledIdentity> identities) {
    store_.bulk_reload(std::move(identities));
}

bool PresenceEngine::remove(const std::string& identity_id) {
    return store_.remove(identity_id);
}

MatchResult PresenceEngine::match(const Embedding& query) const {
    return matcher_.match(query);
}

BlinkResult PresenceEngine::track_blink(const std::string& session_id, const LandmarkSet& landmarks) {
    return sessions_.track_blink(session_id, landmarks);
}

bool PresenceEngine::reset_session(const std::string& session_id) {
    return sessions_.reset_session(session_id);
}

PoseEstimate PresenceEngine::estimate_pose(const LandmarkSet& landmarks, cv::Size frame_size) const {
    return pose_estimator_.estimate(landmarks, frame_size);
}

LivenessResult PresenceEngine::check_liveness(const std::string& session_id, const LandmarkSet& landmarks,
                                              cv::Size frame_size, double threshold) {
    try {
        BlinkResult blink = sessions_.track_blink(session_id, landmarks);
        PoseEstimate pose = pose_estimator_.estimate(landmarks, frame_size);
        LivenessResult result = fuse(blink, pose, threshold);

        if (config_.verbose) {
            std::cout << "[Liveness] " << session_id
                      << " ear=" << blink.ear << " blinks=" << blink.total_blinks
                      << " yaw=" << pose.yaw << " pitch=" << pose.pitch << " roll=" << pose.roll
                      << " score=" << result.liveness_score
                      << (result.is_live ? " LIVE" : " not live") << std::endl;
        }
        if (result.degraded()) {
            std::cerr << "[Liveness] " << session_id << " degraded (blink: " << to_string(blink.reason)
                      << ", pose: " << to_string(pose.reason) << ")" << std::endl;
        }
        return result;
    } catch (const std::exception& e) {
        std::cerr << "[Liveness] " << session_id << " internal error: " << e.what() << std::endl;
        return degraded_liveness(DegradeReason::INTERNAL_ERROR);
    }
}

LivenessResult PresenceEngine::check_liveness(const std::string& session_id, const LandmarkSet& landmarks,
                                              cv::Size frame_size) {
    return check_liveness(session_id, landmarks, frame_size, config_.fusion.liveness_threshold);
}

std::optional<Anomaly> PresenceEngine::classify(const MatchResult& match, const LivenessResult& liveness,
                                                const ClassifyContext& context) const {
    return classifier_.classify(match, liveness, context);
}

FrameVerdict PresenceEngine::evaluate_frame(const std::string& session_id, const FrameObservation& frame) {
    auto start = std::chrono::steady_clock::now();

    FrameVerdict verdict;
    verdict.face_count = frame.faces.size();
    verdict.anomaly = classifier_.classify_frame(verdict.face_count);

    if (frames_since_sweep_.fetch_add(1, std::memory_order_relaxed) + 1 >= SESSION_SWEEP_INTERVAL) {
        frames_since_sweep_.store(0, std::memory_order_relaxed);
        sessions_.evict_idle();
    }

    if (!frame.faces.empty()) {
        const FaceObservation& face = frame.faces.front();
        verdict.face_region = face.region;

        if (face.embedding) {
            verdict.match = matcher_.match(*face.embedding);
        }

        if (frame.check_liveness) {
            verdict.liveness = check_liveness(session_id, face.landmarks, frame.frame_size);
        } else {
            verdict.liveness.is_live = true;
            verdict.liveness.liveness_score = 1.0;
        }

        if (frame.mask_flag) {
            MaskResult external;
            external.has_mask = *frame.mask_flag;
            external.confidence = 1.0;
            verdict.mask = external;
        } else if (frame.check_mask && !frame.image.empty()) {
            verdict.mask = mask_detector_.detect(frame.image, face.region);
        }

        ClassifyContext context;
        context.liveness_requested = frame.check_liveness;
        context.face_region = face.region;
        if (verdict.mask && verdict.mask->status == SignalStatus::OK) {
            context.has_mask = verdict.mask->has_mask;
        }

        verdict.anomaly = more_severe(std::move(verdict.anomaly),
                                      classifier_.classify(verdict.match, verdict.liveness, context),
                                      verdict.face_count);
        verdict.attendance = decide_attendance(verdict.match, verdict.liveness);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    stats_.record_frame(verdict.match.recognized, verdict.liveness.is_live,
                        frame.check_liveness && verdict.liveness.degraded(), elapsed);
    if (verdict.anomaly) {
        stats_.record_anomaly(verdict.anomaly->category);
    }
    return verdict;
}

size_t PresenceEngine::evict_idle_sessions() {
    return sessions_.evict_idle();
}

} // namespace presence
