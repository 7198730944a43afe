#pragma once

#include "EngineConfig.hpp"
#include "FaceTypes.hpp"
#include <deque>
#include <optional>

namespace presence {

// 68-point eye ranges: [36, 42) left eye, [42, 48) right eye
constexpr size_t LEFT_EYE_BEGIN = 36;
constexpr size_t RIGHT_EYE_BEGIN = 42;
constexpr size_t EYE_POINTS = 6;

/**
 * @brief Eye Aspect Ratio for one eye
 *
 * EAR = (|p2-p6| + |p3-p5|) / (2 * |p1-p4|), with p1..p6 the six eye
 * landmarks in contour order.
 *
 * @param eye Pointer to six consecutive points
 * @return EAR, or std::nullopt when the eye corners coincide
 */
std::optional<double> eye_aspect_ratio(const cv::Point2f* eye);

/**
 * @brief Average EAR of both eyes from a 68-point landmark set
 * @return std::nullopt when the eye ranges are missing or degenerate
 */
std::optional<double> average_eye_aspect_ratio(const LandmarkSet& landmarks);

/**
 * @brief Per-session blink state machine
 *
 * Each frame appends the current EAR to a bounded history. EAR below the
 * threshold increments the closed-frame counter; the first open frame after
 * at least `consecutive_frames` closed ones confirms a blink. The counter is
 * reset on every open frame.
 *
 * Not thread-safe: one instance per liveness session, updated in frame order.
 */
class BlinkTracker {
public:
    explicit BlinkTracker(const BlinkConfig& config = BlinkConfig());

    /**
     * @brief Feed one frame of landmarks
     *
     * Missing or malformed eye landmarks leave the state untouched and
     * return a degraded zero-confidence result.
     */
    BlinkResult update(const LandmarkSet& landmarks);

    /** Apply one transition for an already computed EAR value */
    BlinkResult update_ear(double ear);

    void reset();

    int total_blinks() const { return total_blinks_; }
    int counter() const { return counter_; }
    const std::deque<double>& ear_history() const { return ear_history_; }
    const BlinkConfig& config() const { return config_; }

    /** min(1, blinks / 3) */
    static double confidence_for(int total_blinks);

private:
    BlinkConfig config_;
    std::deque<double> ear_history_;
    int counter_ = 0;
    int total_blinks_ = 0;
};

} // namespace presence
