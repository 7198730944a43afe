#include "EngineConfig.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace presence {

namespace {

template <typename T>
void read_field(const nlohmann::json& section, const char* key, T& target) {
    if (section.contains(key)) {
        target = section.at(key).get<T>();
    }
}

bool env_double(const char* name, double& out) {
    const char* value = std::getenv(name);
    if (!value || *value == '\0') return false;

    char* end = nullptr;
    double parsed = std::strtod(value, &end);
    if (end == value || *end != '\0') {
        std::cerr << "[Config] Ignoring non-numeric " << name << "=" << value << std::endl;
        return false;
    }
    out = parsed;
    return true;
}

EngineConfig from_json(const nlohmann::json& doc) {
    EngineConfig config;
    if (!doc.is_object()) {
        throw ConfigError("configuration root must be a JSON object");
    }

    try {
        if (doc.contains("blink")) {
            const auto& s = doc.at("blink");
            read_field(s, "ear_threshold", config.blink.ear_threshold);
            read_field(s, "consecutive_frames", config.blink.consecutive_frames);
            read_field(s, "history_size", config.blink.history_size);
        }
        if (doc.contains("pose")) {
            read_field(doc.at("pose"), "movement_threshold_deg", config.pose.movement_threshold_deg);
        }
        if (doc.contains("fusion")) {
            read_field(doc.at("fusion"), "liveness_threshold", config.fusion.liveness_threshold);
        }
        if (doc.contains("classifier")) {
            const auto& s = doc.at("classifier");
            read_field(s, "low_confidence_threshold", config.classifier.low_confidence_threshold);
            if (s.contains("mask_policy")) {
                config.classifier.mask_policy = mask_policy_from_string(s.at("mask_policy").get<std::string>());
            }
        }
        if (doc.contains("mask")) {
            read_field(doc.at("mask"), "skin_ratio_threshold", config.mask.skin_ratio_threshold);
        }
        read_field(doc, "session_idle_timeout_s", config.session_idle_timeout_s);
        read_field(doc, "verbose", config.verbose);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid configuration value: ") + e.what());
    }

    return config;
}

} // namespace

void EngineConfig::validate() const {
    if (!(blink.ear_threshold > 0.0 && blink.ear_threshold < 1.0)) {
        throw ConfigError("blink.ear_threshold must be in (0, 1)");
    }
    if (blink.consecutive_frames < 1) {
        throw ConfigError("blink.consecutive_frames must be >= 1");
    }
    if (blink.history_size < 1) {
        throw ConfigError("blink.history_size must be >= 1");
    }
    if (!(pose.movement_threshold_deg > 0.0 && pose.movement_threshold_deg <= 180.0)) {
        throw ConfigError("pose.movement_threshold_deg must be in (0, 180]");
    }
    if (!(fusion.liveness_threshold >= 0.0 && fusion.liveness_threshold <= 1.0)) {
        throw ConfigError("fusion.liveness_threshold must be in [0, 1]");
    }
    if (!(classifier.low_confidence_threshold > 0.0 && classifier.low_confidence_threshold <= 1.0)) {
        throw ConfigError("classifier.low_confidence_threshold must be in (0, 1]");
    }
    if (!(mask.skin_ratio_threshold > 0.0 && mask.skin_ratio_threshold < 1.0)) {
        throw ConfigError("mask.skin_ratio_threshold must be in (0, 1)");
    }
    if (session_idle_timeout_s < 1) {
        throw ConfigError("session_idle_timeout_s must be >= 1");
    }
}

EngineConfig parse_config(const std::string& json_text) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("JSON parse error: ") + e.what());
    }
    EngineConfig config = from_json(doc);
    config.validate();
    return config;
}

EngineConfig load_config(const std::string& path) {
    std::ifstream config_file(path);
    if (!config_file.is_open()) {
        throw ConfigError("cannot open config file: " + path);
    }

    std::stringstream buffer;
    buffer << config_file.rdbuf();

    EngineConfig config = parse_config(buffer.str());
    apply_env_overrides(config);
    config.validate();

    std::cout << "[Config] Loaded " << path
              << " (liveness_threshold=" << config.fusion.liveness_threshold
              << ", head_pose_threshold=" << config.pose.movement_threshold_deg
              << ", ear_threshold=" << config.blink.ear_threshold << ")" << std::endl;
    return config;
}

void apply_env_overrides(EngineConfig& config) {
    double value = 0.0;
    if (env_double("PRESENCE_LIVENESS_THRESHOLD", value)) {
        config.fusion.liveness_threshold = value;
    }
    if (env_double("PRESENCE_HEAD_POSE_THRESHOLD", value)) {
        config.pose.movement_threshold_deg = value;
    }
    if (env_double("PRESENCE_BLINK_THRESHOLD", value)) {
        config.blink.ear_threshold = value;
    }
}

const char* to_string(MaskPolicy policy) {
    switch (policy) {
        case MaskPolicy::IGNORE:    return "ignore";
        case MaskPolicy::REQUIRED:  return "required";
        case MaskPolicy::FORBIDDEN: return "forbidden";
    }
    return "ignore";
}

MaskPolicy mask_policy_from_string(const std::string& name) {
    if (name == "ignore") return MaskPolicy::IGNORE;
    if (name == "required") return MaskPolicy::REQUIRED;
    if (name == "forbidden") return MaskPolicy::FORBIDDEN;
    throw ConfigError("unknown mask_policy: " + name);
}

} // namespace presence
