#pragma once

#include "EngineConfig.hpp"
#include "FaceTypes.hpp"
#include <opencv2/core.hpp>
#include <vector>

namespace presence {

/**
 * @brief Head pose from six 68-point landmarks via solvePnP
 *
 * Uses nose tip (30), chin (8), outer eye corners (36, 45) and mouth
 * corners (48, 54) against a generic millimetre-scale face model. Camera
 * intrinsics are approximated from the frame: focal length = width,
 * principal point at the centre, no distortion.
 *
 * Stateless; safe to call concurrently.
 */
class HeadPoseEstimator {
public:
    struct EulerAngles {
        double yaw, pitch, roll;   // degrees
    };

    explicit HeadPoseEstimator(const PoseConfig& config = PoseConfig());

    /**
     * @brief Estimate pose for one frame
     * @return Degraded zero pose on missing landmarks, invalid frame size or a failed solve
     */
    PoseEstimate estimate(const LandmarkSet& landmarks, cv::Size frame_size) const;

    /**
     * @brief Decompose a 3x3 rotation matrix (CV_64F) into degrees
     *
     * sy = sqrt(R00^2 + R10^2). Below 1e-6 the matrix is treated as gimbal
     * locked: roll is forced to 0 and the degenerate extraction is used.
     */
    static EulerAngles rotation_matrix_to_euler(const cv::Mat& R);

    /** min(1, mean(|yaw|, |pitch|, |roll|) / 45) */
    static double pose_confidence(double yaw, double pitch, double roll);

    static cv::Mat camera_matrix(cv::Size frame_size);

    /** Model points in the same order as landmark_indices() */
    static const std::vector<cv::Point3d>& model_points();

    /** Landmark indices used for the solve, in model point order */
    static const std::vector<int>& landmark_indices();

    const PoseConfig& config() const { return config_; }

private:
    PoseConfig config_;
};

} // namespace presence
