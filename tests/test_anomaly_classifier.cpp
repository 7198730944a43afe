#include "AnomalyClassifier.hpp"
#include <iostream>

using namespace presence;

static int fails = 0;

static void assert_true(bool cond, const char* msg) {
    if (!cond) {
        std::cerr << "[FAIL] " << msg << std::endl;
        ++fails;
    } else {
        std::cout << "[PASS] " << msg << std::endl;
    }
}

static MatchResult recognized(const std::string& id, double confidence) {
    MatchResult m;
    m.recognized = true;
    m.identity_id = id;
    m.display_name = id;
    m.confidence = confidence;
    m.distance = 1.0 - confidence;
    return m;
}

static LivenessResult liveness(bool is_live, double score) {
    LivenessResult l;
    l.is_live = is_live;
    l.liveness_score = score;
    return l;
}

int main() {
    std::cout << "=== AnomalyClassifier Test ===" << std::endl;

    AnomalyClassifier classifier;

    // Test 1: Unknown person
    {
        auto a = classifier.classify(MatchResult(), liveness(false, 0.0));
        assert_true(a && a->category == AnomalyCategory::UNKNOWN_PERSON, "unrecognized face is unknown_person");
        assert_true(a && a->severity == Severity::MEDIUM, "unknown_person is medium");
        assert_true(a && !a->identity_id, "unknown_person has no identity");
        assert_true(a && a->message == "Anomaly detected: unknown_person", "message names the category");
    }

    // Test 2: Low confidence takes precedence over spoof
    {
        auto a = classifier.classify(recognized("A", 0.65), liveness(false, 0.1));
        assert_true(a && a->category == AnomalyCategory::LOW_CONFIDENCE, "0.65 confidence is low_confidence");
        assert_true(a && a->severity == Severity::MEDIUM, "low_confidence is medium");
        assert_true(a && a->identity_id && *a->identity_id == "A", "low_confidence carries identity");
    }

    // Test 3: Spoof attempt
    {
        ClassifyContext ctx;
        ctx.face_region = FaceRegion{10, 110, 130, 20};
        auto a = classifier.classify(recognized("A", 0.9), liveness(false, 0.2), ctx);
        assert_true(a && a->category == AnomalyCategory::SPOOF_ATTEMPT, "confident but not live is spoof");
        assert_true(a && a->severity == Severity::HIGH, "spoof is high severity");
        assert_true(a && a->details.at("identity_id") == "A", "details include identity");
        assert_true(a && a->details.at("liveness_score") == 0.2, "details include liveness score");
        assert_true(a && a->details.at("face_region") == nlohmann::json({10, 110, 130, 20}),
                    "details include face region");

        ctx.liveness_requested = false;
        auto skipped = classifier.classify(recognized("A", 0.9), liveness(false, 0.0), ctx);
        assert_true(!skipped, "no spoof when liveness was not requested");
    }

    // Test 4: Clean recognition
    {
        auto a = classifier.classify(recognized("A", 0.7), liveness(true, 0.6));
        assert_true(!a, "confidence at threshold and live is clean");
    }

    // Test 5: Degraded liveness reported in details
    {
        LivenessResult l;
        l.blink = BlinkResult::degraded(DegradeReason::MISSING_LANDMARKS);
        l.pose = PoseEstimate::degraded(DegradeReason::MISSING_LANDMARKS);
        auto a = classifier.classify(recognized("A", 0.9), l);
        assert_true(a && a->category == AnomalyCategory::SPOOF_ATTEMPT, "degraded liveness is not live");
        assert_true(a && a->details.at("blink_status") == "missing_landmarks", "blink status in details");
    }

    // Test 6: Mask policy
    {
        ClassifierConfig required;
        required.mask_policy = MaskPolicy::REQUIRED;
        AnomalyClassifier mask_required(required);

        ClassifyContext bare;
        bare.has_mask = false;
        auto a = mask_required.classify(recognized("A", 0.9), liveness(true, 0.6), bare);
        assert_true(a && a->category == AnomalyCategory::MASK_VIOLATION, "missing mask violates required policy");
        assert_true(a && a->severity == Severity::LOW, "mask_violation is low");

        ClassifyContext unknown;
        assert_true(!mask_required.classify(recognized("A", 0.9), liveness(true, 0.6), unknown),
                    "unknown mask state never violates");

        ClassifierConfig forbidden;
        forbidden.mask_policy = MaskPolicy::FORBIDDEN;
        ClassifyContext masked;
        masked.has_mask = true;
        auto f = AnomalyClassifier(forbidden).classify(recognized("A", 0.9), liveness(true, 0.6), masked);
        assert_true(f && f->category == AnomalyCategory::MASK_VIOLATION, "mask violates forbidden policy");

        assert_true(!classifier.classify(recognized("A", 0.9), liveness(true, 0.6), masked),
                    "ignore policy never violates");

        auto spoof_first = mask_required.classify(recognized("A", 0.9), liveness(false, 0.0), bare);
        assert_true(spoof_first && spoof_first->category == AnomalyCategory::SPOOF_ATTEMPT,
                    "spoof outranks mask violation");
    }

    // Test 7: Frame-level anomalies
    {
        assert_true(!classifier.classify_frame(1), "one face is normal");

        auto none = classifier.classify_frame(0);
        assert_true(none && none->category == AnomalyCategory::NO_FACE && none->severity == Severity::LOW,
                    "zero faces is low no_face");

        auto crowd = classifier.classify_frame(3);
        assert_true(crowd && crowd->category == AnomalyCategory::MULTIPLE_FACES, "three faces is multiple_faces");
        assert_true(crowd && crowd->severity == Severity::MEDIUM, "multiple_faces is medium");
        assert_true(crowd && crowd->details.at("face_count") == 3, "face count in details");
    }

    // Test 8: JSON form
    {
        auto a = classifier.classify(recognized("A", 0.9), liveness(false, 0.0));
        nlohmann::json j = a->to_json();
        assert_true(j.at("category") == "spoof_attempt" && j.at("severity") == "high", "category and severity strings");
        assert_true(j.at("identity_id") == "A", "identity in JSON");

        nlohmann::json u = classifier.classify(MatchResult(), liveness(true, 1.0))->to_json();
        assert_true(u.at("identity_id").is_null(), "unknown identity is null");
    }

    // Test 9: Attendance decisions
    {
        AttendanceDecision d = decide_attendance(recognized("A", 0.8), liveness(true, 0.6));
        assert_true(d.status == AttendanceStatus::PRESENT && !d.anomaly_flag, "live and confident: present, clean");

        d = decide_attendance(recognized("A", 0.6), liveness(false, 0.0));
        assert_true(d.status == AttendanceStatus::PRESENT && d.anomaly_flag, "not live at 0.6: present, flagged");

        d = decide_attendance(recognized("A", 0.4), liveness(false, 0.0));
        assert_true(d.status == AttendanceStatus::UNKNOWN && d.anomaly_flag, "0.4 and not live: unknown");

        d = decide_attendance(recognized("A", 0.7), liveness(true, 0.6));
        assert_true(d.status == AttendanceStatus::PRESENT && !d.anomaly_flag, "0.7 is not below the flag threshold");

        d = decide_attendance(MatchResult(), liveness(true, 1.0));
        assert_true(d.status == AttendanceStatus::UNKNOWN && d.anomaly_flag, "unrecognized: unknown, flagged");
        assert_true(std::string(to_string(d.status)) == "unknown", "status string");
    }

    std::cout << "\nFailures: " << fails << std::endl;
    return fails == 0 ? 0 : 1;
}
