#include "PresenceEngine.hpp"
#include "SnapshotIO.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <string>

namespace {

const char* PRESENCE_VERSION = "1.0.0";

struct CliOptions {
    std::string config_path;
    std::string store_path;
    std::string script_path;
    std::string out_path;
    std::string save_store_path;
    bool verbose = false;
};

// Global terminate handler - last resort for anything that escapes main
void terminate_handler() {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception& e) {
            std::cerr << "[presence_cli] UNCAUGHT EXCEPTION: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "[presence_cli] UNCAUGHT EXCEPTION: Unknown type" << std::endl;
        }
    } else {
        std::cerr << "[presence_cli] std::terminate called (no active exception)" << std::endl;
    }
    std::cerr.flush();
    std::_Exit(2);
}

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " --script frames.json [options]\n"
              << "  --config PATH       engine configuration (JSON)\n"
              << "  --store PATH        embedding snapshot to load\n"
              << "  --save-store PATH   write the store after script enrollments\n"
              << "  --out PATH          write verdicts here instead of stdout\n"
              << "  --verbose           per-frame liveness logging\n";
}

bool parse_args(int argc, char* argv[], CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::string& target) {
            if (i + 1 >= argc) return false;
            target = argv[++i];
            return true;
        };

        if (arg == "--config") {
            if (!next(opts.config_path)) return false;
        } else if (arg == "--store") {
            if (!next(opts.store_path)) return false;
        } else if (arg == "--script") {
            if (!next(opts.script_path)) return false;
        } else if (arg == "--out") {
            if (!next(opts.out_path)) return false;
        } else if (arg == "--save-store") {
            if (!next(opts.save_store_path)) return false;
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            return false;
        }
    }
    return !opts.script_path.empty();
}

presence::FaceRegion region_from_json(const nlohmann::json& j) {
    presence::FaceRegion region;
    region.top = j.at(0).get<int>();
    region.right = j.at(1).get<int>();
    region.bottom = j.at(2).get<int>();
    region.left = j.at(3).get<int>();
    return region;
}

presence::LandmarkSet landmarks_from_json(const nlohmann::json& j) {
    presence::LandmarkSet landmarks;
    landmarks.reserve(j.size());
    for (const auto& p : j) {
        landmarks.emplace_back(p.at(0).get<float>(), p.at(1).get<float>());
    }
    return landmarks;
}

presence::FrameObservation frame_from_json(const nlohmann::json& j) {
    presence::FrameObservation frame;
    const auto& size = j.at("frame_size");
    frame.frame_size = cv::Size(size.at(0).get<int>(), size.at(1).get<int>());
    frame.check_liveness = j.value("check_liveness", true);
    frame.check_mask = j.value("check_mask", true);
    if (j.contains("mask")) {
        frame.mask_flag = j.at("mask").get<bool>();
    }

    for (const auto& f : j.value("faces", nlohmann::json::array())) {
        presence::FaceObservation face;
        face.region = region_from_json(f.at("region"));
        if (f.contains("landmarks")) {
            face.landmarks = landmarks_from_json(f.at("landmarks"));
        }
        if (f.contains("embedding")) {
            face.embedding = f.at("embedding").get<presence::Embedding>();
        }
        frame.faces.push_back(std::move(face));
    }
    return frame;
}

int run(const CliOptions& opts) {
    presence::EngineConfig config;
    if (!opts.config_path.empty()) {
        config = presence::load_config(opts.config_path);
    } else {
        presence::apply_env_overrides(config);
    }
    if (opts.verbose) config.verbose = true;

    presence::PresenceEngine engine(config);

    if (!opts.store_path.empty()) {
        engine.bulk_reload(presence::load_snapshot(opts.store_path));
    }

    std::ifstream script_file(opts.script_path);
    if (!script_file.is_open()) {
        std::cerr << "[presence_cli] Cannot open script: " << opts.script_path << std::endl;
        return 1;
    }
    nlohmann::json script;
    script_file >> script;

    for (const auto& e : script.value("enroll", nlohmann::json::array())) {
        engine.enroll(e.at("id").get<std::string>(), e.value("name", std::string()),
                      e.at("embedding").get<presence::Embedding>());
    }
    if (!opts.save_store_path.empty()) {
        presence::save_snapshot(*engine.store().snapshot(), opts.save_store_path);
    }

    std::ofstream out_file;
    if (!opts.out_path.empty()) {
        out_file.open(opts.out_path, std::ios::trunc);
        if (!out_file.is_open()) {
            std::cerr << "[presence_cli] Cannot write: " << opts.out_path << std::endl;
            return 1;
        }
    }
    std::ostream& out = opts.out_path.empty() ? std::cout : out_file;

    size_t index = 0;
    for (const auto& f : script.value("frames", nlohmann::json::array())) {
        std::string session = f.value("session", std::string("default"));
        presence::FrameVerdict verdict = engine.evaluate_frame(session, frame_from_json(f));

        nlohmann::json line = verdict.to_json();
        line["frame"] = index++;
        line["session"] = session;
        out << line.dump() << std::endl;

        if (f.value("end_session", false)) {
            engine.reset_session(session);
        }
    }

    engine.stats().log_summary();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::set_terminate(terminate_handler);

    CliOptions opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage(argv[0]);
        return 1;
    }

    std::cout << "[presence_cli] presence v" << PRESENCE_VERSION << std::endl;

    try {
        return run(opts);
    } catch (const presence::ConfigError& e) {
        std::cerr << "[presence_cli] Config error: " << e.what() << std::endl;
    } catch (const presence::SnapshotError& e) {
        std::cerr << "[presence_cli] Snapshot error: " << e.what() << std::endl;
    } catch (const presence::InvalidEmbedding& e) {
        std::cerr << "[presence_cli] Invalid embedding: " << e.what() << std::endl;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[presence_cli] Script error: " << e.what() << std::endl;
    }
    return 1;
}
