#pragma once

#include <opencv2/core.hpp>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace presence {

// Embedding dimensionality produced by the upstream encoder
constexpr size_t EMBEDDING_DIM = 128;

// iBUG 68-point landmark convention
constexpr size_t LANDMARK_COUNT = 68;

using Embedding = std::vector<double>;
using LandmarkSet = std::vector<cv::Point2f>;

/**
 * @brief Thrown when a query or enrolled embedding violates the data contract
 */
class InvalidEmbedding : public std::invalid_argument {
public:
    explicit InvalidEmbedding(const std::string& what)
        : std::invalid_argument(what) {}
};

/**
 * @brief Face bounding box as reported by the detector (top, right, bottom, left)
 */
struct FaceRegion {
    int top = 0;
    int right = 0;
    int bottom = 0;
    int left = 0;

    int width() const { return right - left; }
    int height() const { return bottom - top; }
    cv::Rect to_rect() const { return cv::Rect(left, top, width(), height()); }
};

/**
 * @brief Whether a per-frame signal was actually computed
 *
 * Degraded results carry zero confidence; the reason tells the caller
 * why, so "no blink yet" and "no landmarks" are not confused.
 */
enum class SignalStatus {
    OK,
    DEGRADED
};

enum class DegradeReason {
    NONE,
    MISSING_LANDMARKS,
    POSE_SOLVE_FAILURE,
    INTERNAL_ERROR
};

const char* to_string(DegradeReason reason);

struct MatchResult {
    bool recognized = false;
    std::optional<std::string> identity_id;
    std::optional<std::string> display_name;
    double confidence = 0.0;
    double distance = 0.0;   // to the nearest active entry, +inf when store is empty
};

struct BlinkResult {
    bool blink_detected = false;
    double ear = 0.0;
    int total_blinks = 0;
    double confidence = 0.0;
    SignalStatus status = SignalStatus::OK;
    DegradeReason reason = DegradeReason::NONE;

    static BlinkResult degraded(DegradeReason why) {
        BlinkResult r;
        r.status = SignalStatus::DEGRADED;
        r.reason = why;
        return r;
    }
};

/**
 * @brief Head pose in degrees. Angle naming follows the extraction order
 *        (x-axis angle reported as yaw, y-axis as pitch, z-axis as roll).
 */
struct PoseEstimate {
    double yaw = 0.0;
    double pitch = 0.0;
    double roll = 0.0;
    bool movement_detected = false;
    double confidence = 0.0;
    SignalStatus status = SignalStatus::OK;
    DegradeReason reason = DegradeReason::NONE;

    static PoseEstimate degraded(DegradeReason why) {
        PoseEstimate p;
        p.status = SignalStatus::DEGRADED;
        p.reason = why;
        return p;
    }
};

struct LivenessResult {
    bool is_live = false;
    double liveness_score = 0.0;
    BlinkResult blink;
    PoseEstimate pose;

    bool degraded() const {
        return blink.status == SignalStatus::DEGRADED || pose.status == SignalStatus::DEGRADED;
    }
};

struct MaskResult {
    bool has_mask = false;
    double confidence = 0.0;
    double skin_ratio = 0.0;
    SignalStatus status = SignalStatus::OK;
};

} // namespace presence
