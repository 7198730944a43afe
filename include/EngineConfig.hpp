#pragma once

#include <stdexcept>
#include <string>

namespace presence {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief EAR blink detection parameters
 */
struct BlinkConfig {
    double ear_threshold = 0.25;    // eyes considered closed below this EAR
    int consecutive_frames = 3;     // closed frames required before a blink counts
    int history_size = 10;          // rolling EAR history length
};

struct PoseConfig {
    double movement_threshold_deg = 15.0;
};

struct FusionConfig {
    double liveness_threshold = 0.5;
};

enum class MaskPolicy {
    IGNORE,
    REQUIRED,
    FORBIDDEN
};

struct ClassifierConfig {
    double low_confidence_threshold = 0.7;
    MaskPolicy mask_policy = MaskPolicy::IGNORE;
};

struct MaskConfig {
    double skin_ratio_threshold = 0.3;  // below this skin share the lower face is treated as covered
};

/**
 * @brief Aggregate engine configuration
 *
 * The match cutoff (0.6) is part of the matching contract and is
 * deliberately absent here.
 */
struct EngineConfig {
    BlinkConfig blink;
    PoseConfig pose;
    FusionConfig fusion;
    ClassifierConfig classifier;
    MaskConfig mask;
    int session_idle_timeout_s = 300;
    bool verbose = false;

    /**
     * @brief Check ranges of all values
     * @throws ConfigError describing the first offending field
     */
    void validate() const;
};

/**
 * @brief Load configuration from a JSON file, then apply environment overrides
 *
 * Missing keys keep their defaults. Recognized environment variables:
 * PRESENCE_LIVENESS_THRESHOLD, PRESENCE_HEAD_POSE_THRESHOLD,
 * PRESENCE_BLINK_THRESHOLD.
 *
 * @throws ConfigError if the file cannot be read or a value has the wrong type
 */
EngineConfig load_config(const std::string& path);

/** Parse configuration from an in-memory JSON document (no env overrides) */
EngineConfig parse_config(const std::string& json_text);

/** Apply PRESENCE_* environment overrides in place */
void apply_env_overrides(EngineConfig& config);

const char* to_string(MaskPolicy policy);
MaskPolicy mask_policy_from_string(const std::string& name);

} // namespace presence
