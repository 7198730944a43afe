#include "MaskDetector.hpp"
#include <opencv2/imgproc.hpp>
#include <iostream>

namespace presence {

MaskDetector::MaskDetector(const MaskConfig& config) : config_(config) {}

double MaskDetector::lower_face_skin_ratio(const cv::Mat& face_bgr) {
    cv::Mat hsv;
    cv::cvtColor(face_bgr, hsv, cv::COLOR_BGR2HSV);

    cv::Mat skin_mask;
    cv::inRange(hsv, cv::Scalar(0, 20, 70), cv::Scalar(20, 255, 255), skin_mask);

    int half = skin_mask.rows / 2;
    cv::Mat lower_half = skin_mask.rowRange(half, skin_mask.rows);
    if (lower_half.empty()) return 0.0;

    return static_cast<double>(cv::countNonZero(lower_half)) / static_cast<double>(lower_half.total());
}

MaskResult MaskDetector::detect(const cv::Mat& image, const FaceRegion& region) const {
    MaskResult result;
    if (image.empty() || image.type() != CV_8UC3) {
        result.status = SignalStatus::DEGRADED;
        return result;
    }

    cv::Rect roi = region.to_rect() & cv::Rect(0, 0, image.cols, image.rows);
    if (roi.width < 1 || roi.height < 2) {
        result.status = SignalStatus::DEGRADED;
        return result;
    }

    try {
        result.skin_ratio = lower_face_skin_ratio(image(roi));
    } catch (const cv::Exception& e) {
        std::cerr << "[MaskDetector] " << e.what() << std::endl;
        result.status = SignalStatus::DEGRADED;
        return result;
    }

    result.has_mask = result.skin_ratio < config_.skin_ratio_threshold;
    result.confidence = result.has_mask ? 1.0 - result.skin_ratio : result.skin_ratio;
    return result;
}

} // namespace presence
