#include "HeadPoseEstimator.hpp"

#include <opencv2/calib3d.hpp> // For solvePnP and Rodrigues
#include <algorithm>
#include <cmath>
#include <iostream>

namespace presence {

namespace {

// Average deviation (degrees) at which pose confidence saturates
constexpr double FULL_CONFIDENCE_DEG = 45.0;

// Generic 3D face model (mm), order matches landmark_indices()
const std::vector<cv::Point3d> MODEL_POINTS_3D = {
        {0.0,    0.0,    0.0},     // Nose tip
        {0.0,    -330.0, -65.0},   // Chin
        {-225.0, 170.0,  -135.0},  // Left eye left corner
        {225.0,  170.0,  -135.0},  // Right eye right corner
        {-150.0, -150.0, -125.0},  // Left mouth corner
        {150.0,  -150.0, -125.0}   // Right mouth corner
};

const std::vector<int> LANDMARK_INDICES = {30, 8, 36, 45, 48, 54};

double to_degrees(double radians) {
    return radians * 180.0 / CV_PI;
}

} // namespace

HeadPoseEstimator::HeadPoseEstimator(const PoseConfig& config) : config_(config) {}

const std::vector<cv::Point3d>& HeadPoseEstimator::model_points() {
    return MODEL_POINTS_3D;
}

const std::vector<int>& HeadPoseEstimator::landmark_indices() {
    return LANDMARK_INDICES;
}

cv::Mat HeadPoseEstimator::camera_matrix(cv::Size frame_size) {
    double focal_length = frame_size.width;
    cv::Point2d center(frame_size.width / 2.0, frame_size.height / 2.0);

    return (cv::Mat_<double>(3, 3) << focal_length, 0, center.x,
            0, focal_length, center.y,
            0, 0, 1);
}

HeadPoseEstimator::EulerAngles HeadPoseEstimator::rotation_matrix_to_euler(const cv::Mat& R) {
    double sy = std::sqrt(R.at<double>(0, 0) * R.at<double>(0, 0) + R.at<double>(1, 0) * R.at<double>(1, 0));
    bool singular = sy < 1e-6;

    double x, y, z;
    if (!singular) {
        x = std::atan2(R.at<double>(2, 1), R.at<double>(2, 2));
        y = std::atan2(-R.at<double>(2, 0), sy);
        z = std::atan2(R.at<double>(1, 0), R.at<double>(0, 0));
    } else {
        x = std::atan2(-R.at<double>(1, 2), R.at<double>(1, 1));
        y = std::atan2(-R.at<double>(2, 0), sy);
        z = 0;
    }

    return {to_degrees(x), to_degrees(y), to_degrees(z)};
}

double HeadPoseEstimator::pose_confidence(double yaw, double pitch, double roll) {
    double pose_variation = (std::abs(yaw) + std::abs(pitch) + std::abs(roll)) / 3.0;
    return std::min(1.0, pose_variation / FULL_CONFIDENCE_DEG);
}

PoseEstimate HeadPoseEstimator::estimate(const LandmarkSet& landmarks, cv::Size frame_size) const {
    if (landmarks.size() < LANDMARK_COUNT) {
        return PoseEstimate::degraded(DegradeReason::MISSING_LANDMARKS);
    }
    if (frame_size.width <= 0 || frame_size.height <= 0) {
        std::cerr << "[HeadPose] Invalid frame size " << frame_size.width << "x" << frame_size.height << std::endl;
        return PoseEstimate::degraded(DegradeReason::POSE_SOLVE_FAILURE);
    }

    std::vector<cv::Point2d> image_points;
    image_points.reserve(LANDMARK_INDICES.size());
    for (int idx : LANDMARK_INDICES) {
        const cv::Point2f& p = landmarks[idx];
        if (!std::isfinite(p.x) || !std::isfinite(p.y)) {
            return PoseEstimate::degraded(DegradeReason::MISSING_LANDMARKS);
        }
        image_points.emplace_back(p.x, p.y);
    }

    cv::Mat camera = camera_matrix(frame_size);
    // Assume no lens distortion
    cv::Mat dist_coeffs = cv::Mat::zeros(4, 1, CV_64F);
    cv::Mat rvec, tvec, rot_mat;

    try {
        bool success = cv::solvePnP(MODEL_POINTS_3D, image_points, camera, dist_coeffs, rvec, tvec, false,
                                    cv::SOLVEPNP_EPNP);
        if (!success) {
            return PoseEstimate::degraded(DegradeReason::POSE_SOLVE_FAILURE);
        }

        // Refine with Levenberg-Marquardt
        cv::solvePnPRefineLM(MODEL_POINTS_3D, image_points, camera, dist_coeffs, rvec, tvec);
        cv::Rodrigues(rvec, rot_mat);
    } catch (const cv::Exception& e) {
        std::cerr << "[HeadPose] solvePnP failed: " << e.what() << std::endl;
        return PoseEstimate::degraded(DegradeReason::POSE_SOLVE_FAILURE);
    }

    EulerAngles angles = rotation_matrix_to_euler(rot_mat);
    if (!std::isfinite(angles.yaw) || !std::isfinite(angles.pitch) || !std::isfinite(angles.roll)) {
        return PoseEstimate::degraded(DegradeReason::POSE_SOLVE_FAILURE);
    }

    PoseEstimate pose;
    pose.yaw = angles.yaw;
    pose.pitch = angles.pitch;
    pose.roll = angles.roll;

    double theta = config_.movement_threshold_deg;
    pose.movement_detected = std::abs(pose.yaw) > theta ||
                             std::abs(pose.pitch) > theta ||
                             std::abs(pose.roll) > theta;
    pose.confidence = pose_confidence(pose.yaw, pose.pitch, pose.roll);
    return pose;
}

} // namespace presence
