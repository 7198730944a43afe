#include "AnomalyClassifier.hpp"

namespace presence {

namespace {

constexpr double PRESENT_CONFIDENCE = 0.7;
constexpr double PRESENT_FALLBACK_CONFIDENCE = 0.5;

nlohmann::json region_to_json(const FaceRegion& region) {
    return {region.top, region.right, region.bottom, region.left};
}

bool mask_policy_violated(MaskPolicy policy, const std::optional<bool>& has_mask) {
    if (!has_mask) return false;
    switch (policy) {
        case MaskPolicy::REQUIRED:  return !*has_mask;
        case MaskPolicy::FORBIDDEN: return *has_mask;
        case MaskPolicy::IGNORE:    return false;
    }
    return false;
}

} // namespace

const char* to_string(AnomalyCategory category) {
    switch (category) {
        case AnomalyCategory::SPOOF_ATTEMPT:  return "spoof_attempt";
        case AnomalyCategory::MULTIPLE_FACES: return "multiple_faces";
        case AnomalyCategory::NO_FACE:        return "no_face";
        case AnomalyCategory::LOW_CONFIDENCE: return "low_confidence";
        case AnomalyCategory::MASK_VIOLATION: return "mask_violation";
        case AnomalyCategory::UNKNOWN_PERSON: return "unknown_person";
    }
    return "unknown_person";
}

const char* to_string(Severity severity) {
    switch (severity) {
        case Severity::LOW:      return "low";
        case Severity::MEDIUM:   return "medium";
        case Severity::HIGH:     return "high";
        case Severity::CRITICAL: return "critical";
    }
    return "medium";
}

const char* to_string(AttendanceStatus status) {
    return status == AttendanceStatus::PRESENT ? "present" : "unknown";
}

nlohmann::json Anomaly::to_json() const {
    nlohmann::json j = {
        {"category", to_string(category)},
        {"severity", to_string(severity)},
        {"message", message},
        {"details", details}
    };
    j["identity_id"] = identity_id ? nlohmann::json(*identity_id) : nlohmann::json(nullptr);
    return j;
}

AnomalyClassifier::AnomalyClassifier(const ClassifierConfig& config) : config_(config) {}

Severity AnomalyClassifier::severity_for(AnomalyCategory category) {
    switch (category) {
        case AnomalyCategory::SPOOF_ATTEMPT:  return Severity::HIGH;
        case AnomalyCategory::UNKNOWN_PERSON: return Severity::MEDIUM;
        case AnomalyCategory::LOW_CONFIDENCE: return Severity::MEDIUM;
        case AnomalyCategory::MULTIPLE_FACES: return Severity::MEDIUM;
        case AnomalyCategory::MASK_VIOLATION: return Severity::LOW;
        case AnomalyCategory::NO_FACE:        return Severity::LOW;
    }
    return Severity::MEDIUM;
}

Anomaly AnomalyClassifier::make_anomaly(AnomalyCategory category) const {
    Anomaly anomaly;
    anomaly.category = category;
    anomaly.severity = severity_for(category);
    anomaly.message = std::string("Anomaly detected: ") + to_string(category);
    return anomaly;
}

std::optional<Anomaly> AnomalyClassifier::classify(const MatchResult& match,
                                                   const LivenessResult& liveness,
                                                   const ClassifyContext& context) const {
    std::optional<AnomalyCategory> category;

    if (!match.recognized) {
        category = AnomalyCategory::UNKNOWN_PERSON;
    } else if (match.confidence < config_.low_confidence_threshold) {
        category = AnomalyCategory::LOW_CONFIDENCE;
    } else if (context.liveness_requested && !liveness.is_live) {
        category = AnomalyCategory::SPOOF_ATTEMPT;
    } else if (mask_policy_violated(config_.mask_policy, context.has_mask)) {
        category = AnomalyCategory::MASK_VIOLATION;
    }

    if (!category) {
        return std::nullopt;
    }

    Anomaly anomaly = make_anomaly(*category);
    if (match.recognized) {
        anomaly.identity_id = match.identity_id;
    }

    anomaly.details["confidence"] = match.confidence;
    anomaly.details["liveness_score"] = liveness.liveness_score;
    anomaly.details["has_mask"] = context.has_mask.value_or(false);
    if (context.face_region) {
        anomaly.details["face_region"] = region_to_json(*context.face_region);
    }
    if (anomaly.identity_id) {
        anomaly.details["identity_id"] = *anomaly.identity_id;
    }
    if (liveness.degraded()) {
        anomaly.details["blink_status"] = to_string(liveness.blink.reason);
        anomaly.details["pose_status"] = to_string(liveness.pose.reason);
    }
    return anomaly;
}

std::optional<Anomaly> AnomalyClassifier::classify_frame(size_t face_count) const {
    if (face_count == 1) {
        return std::nullopt;
    }

    Anomaly anomaly = make_anomaly(face_count == 0 ? AnomalyCategory::NO_FACE
                                                   : AnomalyCategory::MULTIPLE_FACES);
    anomaly.details["face_count"] = face_count;
    return anomaly;
}

AttendanceDecision decide_attendance(const MatchResult& match, const LivenessResult& liveness) {
    AttendanceDecision decision;
    if ((liveness.is_live && match.confidence > PRESENT_CONFIDENCE) ||
        match.confidence > PRESENT_FALLBACK_CONFIDENCE) {
        decision.status = AttendanceStatus::PRESENT;
    }
    decision.anomaly_flag = !liveness.is_live || match.confidence < PRESENT_CONFIDENCE;
    return decision;
}

} // namespace presence
