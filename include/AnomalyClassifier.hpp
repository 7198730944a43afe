#pragma once

#include "EngineConfig.hpp"
#include "FaceTypes.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace presence {

enum class AnomalyCategory {
    SPOOF_ATTEMPT,
    MULTIPLE_FACES,
    NO_FACE,
    LOW_CONFIDENCE,
    MASK_VIOLATION,
    UNKNOWN_PERSON
};

enum class Severity {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

const char* to_string(AnomalyCategory category);
const char* to_string(Severity severity);

/**
 * @brief Typed anomaly handed to the alerting collaborator
 *
 * `details` carries confidence, liveness_score, has_mask, face_region and
 * identity_id where known.
 */
struct Anomaly {
    AnomalyCategory category = AnomalyCategory::UNKNOWN_PERSON;
    Severity severity = Severity::MEDIUM;
    std::optional<std::string> identity_id;
    std::string message;
    nlohmann::json details = nlohmann::json::object();

    nlohmann::json to_json() const;
};

/**
 * @brief Inputs to classification beyond the match and liveness results
 */
struct ClassifyContext {
    bool liveness_requested = true;
    std::optional<bool> has_mask;         // from the mask collaborator, if it ran
    std::optional<FaceRegion> face_region;
};

/**
 * @brief Maps match + liveness outcomes to at most one anomaly
 *
 * Evaluation order (first hit wins):
 *   1. not recognized                 -> unknown_person  (medium)
 *   2. confidence < low threshold     -> low_confidence  (medium)
 *   3. liveness requested, not live   -> spoof_attempt   (high)
 *   4. mask policy violated           -> mask_violation  (low)
 * An unrecognized face has no reliable identity to judge liveness against,
 * so it never reports spoof_attempt.
 */
class AnomalyClassifier {
public:
    explicit AnomalyClassifier(const ClassifierConfig& config = ClassifierConfig());

    std::optional<Anomaly> classify(const MatchResult& match,
                                    const LivenessResult& liveness,
                                    const ClassifyContext& context = ClassifyContext()) const;

    /** no_face for zero detections, multiple_faces for more than one */
    std::optional<Anomaly> classify_frame(size_t face_count) const;

    static Severity severity_for(AnomalyCategory category);

private:
    Anomaly make_anomaly(AnomalyCategory category) const;

    ClassifierConfig config_;
};

enum class AttendanceStatus {
    PRESENT,
    UNKNOWN
};

const char* to_string(AttendanceStatus status);

struct AttendanceDecision {
    AttendanceStatus status = AttendanceStatus::UNKNOWN;
    bool anomaly_flag = false;
};

/**
 * @brief Attendance row status for the attendance collaborator
 *
 * present when (live and confidence > 0.7) or confidence > 0.5;
 * anomaly_flag when not live or confidence < 0.7.
 */
AttendanceDecision decide_attendance(const MatchResult& match, const LivenessResult& liveness);

} // namespace presence
