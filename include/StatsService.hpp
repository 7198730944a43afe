#pragma once

#include "AnomalyClassifier.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace presence {

/**
 * @brief Engine-wide verdict counters
 *
 * Thread-safe, lock-free counters updated once per evaluated frame.
 */
class StatsService {
public:
    static constexpr size_t CATEGORY_COUNT = 6;

    struct Summary {
        uint64_t frames_evaluated = 0;
        uint64_t recognized = 0;
        uint64_t live = 0;
        uint64_t degraded_liveness = 0;
        uint64_t anomalies = 0;
        std::array<uint64_t, CATEGORY_COUNT> by_category{};
        double avg_eval_ms = 0.0;
    };

    // === Hot path methods ===

    void record_frame(bool recognized, bool is_live, bool degraded, std::chrono::microseconds elapsed) {
        frames_evaluated_.fetch_add(1, std::memory_order_relaxed);
        if (recognized) recognized_.fetch_add(1, std::memory_order_relaxed);
        if (is_live) live_.fetch_add(1, std::memory_order_relaxed);
        if (degraded) degraded_liveness_.fetch_add(1, std::memory_order_relaxed);
        total_eval_us_.fetch_add(static_cast<uint64_t>(elapsed.count()), std::memory_order_relaxed);
    }

    void record_anomaly(AnomalyCategory category) {
        anomalies_.fetch_add(1, std::memory_order_relaxed);
        by_category_[static_cast<size_t>(category)].fetch_add(1, std::memory_order_relaxed);
    }

    // === Query methods ===

    Summary get_summary() const {
        Summary s;
        s.frames_evaluated = frames_evaluated_.load(std::memory_order_relaxed);
        s.recognized = recognized_.load(std::memory_order_relaxed);
        s.live = live_.load(std::memory_order_relaxed);
        s.degraded_liveness = degraded_liveness_.load(std::memory_order_relaxed);
        s.anomalies = anomalies_.load(std::memory_order_relaxed);
        for (size_t i = 0; i < CATEGORY_COUNT; ++i) {
            s.by_category[i] = by_category_[i].load(std::memory_order_relaxed);
        }
        uint64_t total_us = total_eval_us_.load(std::memory_order_relaxed);
        s.avg_eval_ms = s.frames_evaluated > 0 ? (total_us / static_cast<double>(s.frames_evaluated)) / 1000.0 : 0.0;
        return s;
    }

    std::string format_summary() const {
        auto summary = get_summary();
        std::ostringstream oss;
        oss << "[Stats] Frames: " << summary.frames_evaluated
            << " | Recognized: " << summary.recognized
            << " | Live: " << summary.live
            << " | Degraded: " << summary.degraded_liveness
            << " | Anomalies: " << summary.anomalies
            << " | Avg: " << std::fixed << std::setprecision(2) << summary.avg_eval_ms << "ms";
        for (size_t i = 0; i < CATEGORY_COUNT; ++i) {
            if (summary.by_category[i] > 0) {
                oss << " | " << to_string(static_cast<AnomalyCategory>(i)) << ": " << summary.by_category[i];
            }
        }
        return oss.str();
    }

    void log_summary() const {
        std::cout << format_summary() << std::endl;
    }

private:
    std::atomic<uint64_t> frames_evaluated_{0};
    std::atomic<uint64_t> recognized_{0};
    std::atomic<uint64_t> live_{0};
    std::atomic<uint64_t> degraded_liveness_{0};
    std::atomic<uint64_t> anomalies_{0};
    std::atomic<uint64_t> total_eval_us_{0};
    std::array<std::atomic<uint64_t>, CATEGORY_COUNT> by_category_{};
};

} // namespace presence
