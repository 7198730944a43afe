#pragma once

/**
 * @file PresenceEngine.hpp
 * @brief Face matching and liveness decision core used by the attendance layer
 */

#include "AnomalyClassifier.hpp"
#include "EmbeddingStore.hpp"
#include "EngineConfig.hpp"
#include "FaceMatcher.hpp"
#include "HeadPoseEstimator.hpp"
#include "LivenessFusion.hpp"
#include "MaskDetector.hpp"
#include "SessionRegistry.hpp"
#include "StatsService.hpp"

#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace presence {

/**
 * @brief One detected face as delivered by the upstream detector/encoder
 */
struct FaceObservation {
    FaceRegion region;
    LandmarkSet landmarks;                 // empty when landmark extraction failed
    std::optional<Embedding> embedding;    // empty when encoding failed
};

/**
 * @brief Everything known about one camera frame
 */
struct FrameObservation {
    cv::Size frame_size;
    std::vector<FaceObservation> faces;
    cv::Mat image;                         // BGR frame, only needed for mask detection
    bool check_liveness = true;
    bool check_mask = true;
    std::optional<bool> mask_flag;         // supplied by an external mask classifier
};

struct FrameVerdict {
    size_t face_count = 0;
    std::optional<FaceRegion> face_region;
    MatchResult match;
    LivenessResult liveness;
    std::optional<MaskResult> mask;
    std::optional<Anomaly> anomaly;
    AttendanceDecision attendance;

    nlohmann::json to_json() const;
};

/**
 * @brief Facade over matching, per-session liveness and anomaly classification
 *
 * Thread-safety: matching and pose estimation are stateless; blink state is
 * kept per session id, so concurrent callers must use distinct session ids
 * for independent checks (one per camera stream or attendance attempt).
 */
class PresenceEngine {
public:
    explicit PresenceEngine(const EngineConfig& config = EngineConfig());

    // === Enrollment ===
    void enroll(const std::string& identity_id, const std::string& name, const Embedding& embedding);
    void bulk_reload(std::vector<EnrolledIdentity> identities);
    bool remove(const std::string& identity_id);

    // === Matching ===

    /** @throws InvalidEmbedding on a malformed query */
    MatchResult match(const Embedding& query) const;

    // === Liveness ===
    BlinkResult track_blink(const std::string& session_id, const LandmarkSet& landmarks);
    bool reset_session(const std::string& session_id);
    PoseEstimate estimate_pose(const LandmarkSet& landmarks, cv::Size frame_size) const;

    /**
     * @brief Blink update + pose estimate + fusion for one frame of a session
     *
     * Never throws; internal failures yield a not-live result with both
     * sub-results marked degraded.
     */
    LivenessResult check_liveness(const std::string& session_id, const LandmarkSet& landmarks,
                                  cv::Size frame_size, double threshold);
    LivenessResult check_liveness(const std::string& session_id, const LandmarkSet& landmarks,
                                  cv::Size frame_size);

    // === Classification ===
    std::optional<Anomaly> classify(const MatchResult& match, const LivenessResult& liveness,
                                    const ClassifyContext& context = ClassifyContext()) const;

    // evaluate_frame() sweeps idle sessions once per this many frames
    static constexpr uint64_t SESSION_SWEEP_INTERVAL = 64;

    /**
     * @brief Full per-frame decision for the first detected face
     *
     * The first face is always classified. With no face or several faces the
     * frame-level anomaly is reported instead only when it is more severe, so
     * a spoof next to a bystander still surfaces as spoof_attempt (with the
     * face count in its details).
     *
     * @throws InvalidEmbedding if the face carries a malformed embedding
     */
    FrameVerdict evaluate_frame(const std::string& session_id, const FrameObservation& frame);

    /**
     * @brief Drop sessions idle longer than session_idle_timeout_s
     *
     * Also runs every SESSION_SWEEP_INTERVAL frames from evaluate_frame();
     * callers that only use check_liveness()/track_blink() own the cadence.
     */
    size_t evict_idle_sessions();

    EmbeddingStore& store() { return store_; }
    const SessionRegistry& sessions() const { return sessions_; }
    const StatsService& stats() const { return stats_; }
    const EngineConfig& config() const { return config_; }

private:
    EngineConfig config_;
    EmbeddingStore store_;
    FaceMatcher matcher_;
    SessionRegistry sessions_;
    HeadPoseEstimator pose_estimator_;
    AnomalyClassifier classifier_;
    MaskDetector mask_detector_;
    StatsService stats_;
    std::atomic<uint64_t> frames_since_sweep_{0};
};

} // namespace presence
