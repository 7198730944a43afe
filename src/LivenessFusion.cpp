#include "LivenessFusion.hpp"

namespace presence {

LivenessResult fuse(const BlinkResult& blink, const PoseEstimate& pose, double threshold) {
    LivenessResult result;
    result.blink = blink;
    result.pose = pose;
    result.liveness_score = BLINK_WEIGHT * blink.confidence + POSE_WEIGHT * pose.confidence;
    result.is_live = blink.total_blinks > 0 ||
                     pose.movement_detected ||
                     result.liveness_score > threshold;
    return result;
}

} // namespace presence
