#pragma once

#include "FaceTypes.hpp"
#include "HeadPoseEstimator.hpp"
#include <opencv2/calib3d.hpp>
#include <opencv2/core.hpp>
#include <vector>

namespace presence {
namespace testing {

// Eye width in pixels used for the synthetic eye contours
constexpr float EYE_WIDTH = 30.0f;

/**
 * @brief Six eye points p1..p6 starting at the outer corner, with EAR = 2h / w
 */
inline void place_eye(LandmarkSet& landmarks, size_t begin, cv::Point2f p1, float ear) {
    float w = EYE_WIDTH;
    float h = ear * w / 2.0f;
    landmarks[begin + 0] = p1;
    landmarks[begin + 1] = p1 + cv::Point2f(w / 3.0f, -h);
    landmarks[begin + 2] = p1 + cv::Point2f(2.0f * w / 3.0f, -h);
    landmarks[begin + 3] = p1 + cv::Point2f(w, 0.0f);
    landmarks[begin + 4] = p1 + cv::Point2f(2.0f * w / 3.0f, h);
    landmarks[begin + 5] = p1 + cv::Point2f(w / 3.0f, h);
}

/**
 * @brief 68-point landmark set of the generic face model seen by a camera
 *
 * The six pose points are exact projections of the model through the same
 * intrinsics HeadPoseEstimator assumes, so solving recovers `rvec`. Eyes are
 * built around the projected outer corners (36 and 45) with the given EAR.
 */
inline LandmarkSet synthetic_face(float ear, cv::Size frame = cv::Size(640, 480),
                                  cv::Vec3d rvec = cv::Vec3d(0, 0, 0)) {
    std::vector<cv::Point2d> projected;
    cv::Vec3d tvec(0, 0, 1000);
    cv::projectPoints(HeadPoseEstimator::model_points(), rvec, tvec,
                      HeadPoseEstimator::camera_matrix(frame), cv::Mat::zeros(4, 1, CV_64F), projected);

    const auto& indices = HeadPoseEstimator::landmark_indices();
    cv::Point2f nose(static_cast<float>(projected[0].x), static_cast<float>(projected[0].y));
    LandmarkSet landmarks(LANDMARK_COUNT, nose);
    for (size_t i = 0; i < indices.size(); ++i) {
        landmarks[indices[i]] = cv::Point2f(static_cast<float>(projected[i].x),
                                            static_cast<float>(projected[i].y));
    }

    place_eye(landmarks, 36, landmarks[36], ear);
    cv::Point2f right_outer = landmarks[45];
    place_eye(landmarks, 42, right_outer - cv::Point2f(EYE_WIDTH, 0.0f), ear);
    return landmarks;
}

inline Embedding constant_embedding(double value) {
    return Embedding(EMBEDDING_DIM, value);
}

/** Zero embedding with one coordinate shifted, at exactly `offset` from zero */
inline Embedding offset_embedding(size_t dim, double offset) {
    Embedding e(EMBEDDING_DIM, 0.0);
    e[dim] = offset;
    return e;
}

} // namespace testing
} // namespace presence
