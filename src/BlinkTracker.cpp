#include "BlinkTracker.hpp"
#include <algorithm>
#include <cmath>

namespace presence {

namespace {

// Blinks needed for full confidence
constexpr double BLINKS_FOR_FULL_CONFIDENCE = 3.0;

double distance(const cv::Point2f& a, const cv::Point2f& b) {
    double dx = static_cast<double>(a.x) - b.x;
    double dy = static_cast<double>(a.y) - b.y;
    return std::sqrt(dx * dx + dy * dy);
}

} // namespace

std::optional<double> eye_aspect_ratio(const cv::Point2f* eye) {
    for (size_t i = 0; i < EYE_POINTS; ++i) {
        if (!std::isfinite(eye[i].x) || !std::isfinite(eye[i].y)) {
            return std::nullopt;
        }
    }

    double vertical1 = distance(eye[1], eye[5]);
    double vertical2 = distance(eye[2], eye[4]);
    double horizontal = distance(eye[0], eye[3]);

    if (horizontal <= 0.0) return std::nullopt;

    return (vertical1 + vertical2) / (2.0 * horizontal);
}

std::optional<double> average_eye_aspect_ratio(const LandmarkSet& landmarks) {
    if (landmarks.size() < RIGHT_EYE_BEGIN + EYE_POINTS) {
        return std::nullopt;
    }

    auto left = eye_aspect_ratio(&landmarks[LEFT_EYE_BEGIN]);
    auto right = eye_aspect_ratio(&landmarks[RIGHT_EYE_BEGIN]);
    if (!left || !right) return std::nullopt;

    return (*left + *right) / 2.0;
}

BlinkTracker::BlinkTracker(const BlinkConfig& config) : config_(config) {}

BlinkResult BlinkTracker::update(const LandmarkSet& landmarks) {
    auto ear = average_eye_aspect_ratio(landmarks);
    if (!ear) {
        return BlinkResult::degraded(DegradeReason::MISSING_LANDMARKS);
    }
    return update_ear(*ear);
}

BlinkResult BlinkTracker::update_ear(double ear) {
    ear_history_.push_back(ear);
    while (ear_history_.size() > static_cast<size_t>(config_.history_size)) {
        ear_history_.pop_front();
    }

    BlinkResult result;
    result.ear = ear;

    if (ear < config_.ear_threshold) {
        ++counter_;
    } else {
        if (counter_ >= config_.consecutive_frames) {
            ++total_blinks_;
            result.blink_detected = true;
        }
        counter_ = 0;
    }

    result.total_blinks = total_blinks_;
    result.confidence = confidence_for(total_blinks_);
    return result;
}

void BlinkTracker::reset() {
    ear_history_.clear();
    counter_ = 0;
    total_blinks_ = 0;
}

double BlinkTracker::confidence_for(int total_blinks) {
    return std::min(1.0, total_blinks / BLINKS_FOR_FULL_CONFIDENCE);
}

} // namespace presence
