#include "PresenceEngine.hpp"
#include "LandmarkFixtures.hpp"
#include <cmath>
#include <iostream>
#include <limits>
#include <thread>

using namespace presence;
using presence::testing::offset_embedding;
using presence::testing::synthetic_face;

static int fails = 0;

static void assert_true(bool cond, const char* msg) {
    if (!cond) {
        std::cerr << "[FAIL] " << msg << std::endl;
        ++fails;
    } else {
        std::cout << "[PASS] " << msg << std::endl;
    }
}

static FaceObservation face_with(const Embedding& embedding, float ear) {
    FaceObservation face;
    face.region = FaceRegion{100, 400, 400, 200};
    face.landmarks = synthetic_face(ear);
    face.embedding = embedding;
    return face;
}

static FrameObservation frame_of(std::vector<FaceObservation> faces) {
    FrameObservation frame;
    frame.frame_size = cv::Size(640, 480);
    frame.faces = std::move(faces);
    return frame;
}

int main() {
    std::cout << "=== PresenceEngine Test ===" << std::endl;

    const cv::Size frame_size(640, 480);
    const LandmarkSet open = synthetic_face(0.3f);
    const LandmarkSet closed = synthetic_face(0.2f);

    // Test 1: Recognized, live, no anomaly
    {
        PresenceEngine engine;
        engine.enroll("A", "Alice", offset_embedding(0, 0.0));

        MatchResult match = engine.match(offset_embedding(7, 0.1));
        assert_true(match.recognized && match.identity_id && *match.identity_id == "A", "query matches A");
        assert_true(std::abs(match.confidence - 0.9) < 1e-9, "confidence 0.9 at distance 0.1");

        LivenessResult first = engine.check_liveness("door-1", open, frame_size);
        assert_true(!first.is_live, "a still frontal face is not live yet");

        LivenessResult live;
        for (int b = 0; b < 3; ++b) {
            for (int i = 0; i < 3; ++i) engine.check_liveness("door-1", closed, frame_size);
            live = engine.check_liveness("door-1", open, frame_size);
        }
        assert_true(live.blink.total_blinks == 3, "three blinks counted");
        assert_true(!live.pose.movement_detected, "no head movement");
        assert_true(live.is_live, "three blinks are live");
        assert_true(live.liveness_score >= 0.6, "score at least the blink weight");

        auto anomaly = engine.classify(match, live);
        assert_true(!anomaly, "confident live match has no anomaly");
    }

    // Test 2: Missing landmarks are degraded, not an error
    {
        PresenceEngine engine;
        engine.enroll("A", "Alice", offset_embedding(0, 0.0));
        LivenessResult r = engine.check_liveness("s", LandmarkSet(), frame_size);
        assert_true(!r.is_live && r.liveness_score == 0.0, "no landmarks: not live");
        assert_true(r.blink.reason == DegradeReason::MISSING_LANDMARKS, "blink degraded");
        assert_true(r.pose.reason == DegradeReason::MISSING_LANDMARKS, "pose degraded");

        auto anomaly = engine.classify(engine.match(offset_embedding(0, 0.0)), r);
        assert_true(anomaly && anomaly->category == AnomalyCategory::SPOOF_ATTEMPT,
                    "recognized face without liveness evidence is a spoof");
    }

    // Test 3: Frame-level outcomes
    {
        PresenceEngine engine;
        engine.enroll("A", "Alice", offset_embedding(0, 0.0));

        FrameVerdict empty = engine.evaluate_frame("cam", frame_of({}));
        assert_true(empty.anomaly && empty.anomaly->category == AnomalyCategory::NO_FACE, "empty frame is no_face");
        assert_true(empty.attendance.status == AttendanceStatus::UNKNOWN, "empty frame is not attendance");

        FrameObservation crowd_frame = frame_of({
            face_with(offset_embedding(0, 0.0), 0.3f),
            face_with(offset_embedding(0, 0.0), 0.3f)
        });
        crowd_frame.check_liveness = false;
        FrameVerdict crowd = engine.evaluate_frame("cam", crowd_frame);
        assert_true(crowd.anomaly && crowd.anomaly->category == AnomalyCategory::MULTIPLE_FACES,
                    "two clean faces is multiple_faces");
        assert_true(crowd.match.recognized, "first face still matched");

        // A photo held up next to a bystander: the first face is recognized but still
        FrameVerdict photo = engine.evaluate_frame("cam-3", frame_of({
            face_with(offset_embedding(0, 0.0), 0.3f),
            face_with(offset_embedding(0, 5.0), 0.3f)
        }));
        assert_true(photo.anomaly && photo.anomaly->category == AnomalyCategory::SPOOF_ATTEMPT,
                    "spoof on the first face outranks multiple_faces");
        assert_true(photo.anomaly && photo.anomaly->severity == Severity::HIGH, "spoof stays high severity");
        assert_true(photo.anomaly && photo.anomaly->details.at("face_count") == 2, "face count kept in details");

        FrameVerdict strangers = engine.evaluate_frame("cam-4", frame_of({
            face_with(offset_embedding(0, 5.0), 0.3f),
            face_with(offset_embedding(0, 0.0), 0.3f)
        }));
        assert_true(strangers.anomaly && strangers.anomaly->category == AnomalyCategory::UNKNOWN_PERSON,
                    "equal severity keeps the face-level anomaly");

        FrameVerdict stranger = engine.evaluate_frame("cam-2", frame_of({face_with(offset_embedding(0, 5.0), 0.3f)}));
        assert_true(stranger.anomaly && stranger.anomaly->category == AnomalyCategory::UNKNOWN_PERSON,
                    "unmatched face is unknown_person");
    }

    // Test 4: Liveness disabled and external mask flag
    {
        EngineConfig config;
        config.classifier.mask_policy = MaskPolicy::REQUIRED;
        PresenceEngine engine(config);
        engine.enroll("A", "Alice", offset_embedding(0, 0.0));

        FrameObservation frame = frame_of({face_with(offset_embedding(0, 0.0), 0.3f)});
        frame.check_liveness = false;
        frame.mask_flag = false;
        FrameVerdict v = engine.evaluate_frame("gate", frame);
        assert_true(v.liveness.is_live && v.liveness.liveness_score == 1.0, "skipped liveness counts as live");
        assert_true(v.anomaly && v.anomaly->category == AnomalyCategory::MASK_VIOLATION,
                    "missing mask under required policy");
        assert_true(v.attendance.status == AttendanceStatus::PRESENT, "attendance still recorded");

        frame.mask_flag = true;
        v = engine.evaluate_frame("gate", frame);
        assert_true(!v.anomaly, "masked face passes required policy");
    }

    // Test 5: Verdict JSON
    {
        PresenceEngine engine;
        engine.enroll("A", "Alice", offset_embedding(0, 0.0));
        FrameVerdict v = engine.evaluate_frame("json", frame_of({face_with(offset_embedding(0, 0.0), 0.3f)}));
        nlohmann::json j = v.to_json();
        assert_true(j.at("recognized") == true && j.at("user_id") == "A" && j.at("user_name") == "Alice",
                    "identity fields");
        assert_true(j.at("face_count") == 1, "face count");
        assert_true(j.at("face_locations").size() == 1, "face location listed");
        assert_true(j.at("liveness").contains("blink_result") && j.at("liveness").contains("pose_result"),
                    "liveness sub-results included");
        assert_true(j.at("anomaly_detected") == true && j.at("anomaly").at("category") == "spoof_attempt",
                    "single still frame reported as spoof");
        assert_true(j.at("attendance").at("status") == "present", "attendance in JSON");
    }

    // Test 6: Store changes and bad queries
    {
        PresenceEngine engine;
        engine.enroll("A", "Alice", offset_embedding(0, 0.0));
        assert_true(engine.remove("A"), "remove enrolled identity");
        assert_true(!engine.match(offset_embedding(0, 0.0)).recognized, "removed identity no longer matches");

        bool threw = false;
        try {
            FaceObservation bad = face_with(Embedding(5, 0.0), 0.3f);
            engine.evaluate_frame("bad", frame_of({bad}));
        } catch (const InvalidEmbedding&) {
            threw = true;
        }
        assert_true(threw, "malformed embedding propagates InvalidEmbedding");
    }

    // Test 7: Sessions and stats
    {
        EngineConfig config;
        config.session_idle_timeout_s = 1;
        PresenceEngine engine(config);
        engine.enroll("A", "Alice", offset_embedding(0, 0.0));

        engine.evaluate_frame("s1", frame_of({face_with(offset_embedding(0, 0.0), 0.3f)}));
        engine.evaluate_frame("s1", frame_of({}));
        assert_true(engine.sessions().session_count() == 1, "session created by the first frame");
        assert_true(engine.reset_session("s1"), "session reset");

        auto summary = engine.stats().get_summary();
        assert_true(summary.frames_evaluated == 2, "two frames counted");
        assert_true(summary.recognized == 1, "one recognized frame");
        assert_true(summary.anomalies == 2, "spoof and no_face counted");
        assert_true(summary.by_category[static_cast<size_t>(AnomalyCategory::NO_FACE)] == 1, "no_face counted by category");
        assert_true(engine.stats().format_summary().rfind("[Stats] Frames: 2", 0) == 0, "summary line format");
    }

    // Test 8: Idle sessions are swept during frame evaluation
    {
        EngineConfig config;
        config.session_idle_timeout_s = 1;
        PresenceEngine engine(config);
        engine.enroll("A", "Alice", offset_embedding(0, 0.0));

        engine.evaluate_frame("kiosk", frame_of({face_with(offset_embedding(0, 0.0), 0.3f)}));
        assert_true(engine.sessions().session_count() == 1, "session open after a face frame");

        std::this_thread::sleep_for(std::chrono::milliseconds(1100));
        for (uint64_t i = 0; i < PresenceEngine::SESSION_SWEEP_INTERVAL; ++i) {
            engine.evaluate_frame("kiosk-empty", frame_of({}));
        }
        assert_true(engine.sessions().session_count() == 0, "idle session evicted without an explicit call");
    }

    // Test 9: Invalid configuration is refused
    {
        EngineConfig config;
        config.fusion.liveness_threshold = 2.0;
        bool threw = false;
        try {
            PresenceEngine engine(config);
        } catch (const ConfigError&) {
            threw = true;
        }
        assert_true(threw, "engine rejects invalid configuration");
    }

    std::cout << "\nFailures: " << fails << std::endl;
    return fails == 0 ? 0 : 1;
}
