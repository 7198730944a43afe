#pragma once

#include "FaceTypes.hpp"

namespace presence {

constexpr double BLINK_WEIGHT = 0.6;
constexpr double POSE_WEIGHT = 0.4;

/**
 * @brief Combine blink and pose signals into a liveness verdict
 *
 * score   = 0.6 * blink.confidence + 0.4 * pose.confidence
 * is_live = total_blinks > 0 || movement_detected || score > threshold
 *
 * Any single positive signal accepts. This keeps false rejections of
 * genuine users low at the cost of letting incidental pose noise pass a
 * static photo.
 */
LivenessResult fuse(const BlinkResult& blink, const PoseEstimate& pose, double threshold);

} // namespace presence
