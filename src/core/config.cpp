#include "core/config.hpp"
#include "core/logging.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <mutex>

namespace fs = std::filesystem;
using nlohmann::json;

namespace core {

void to_json(json& j, const SpeakerVerificationConfig& c) {
    j = json{{"enabled", c.enabled},
             {"threshold", c.threshold},
             {"high_threshold", c.high_threshold},
             {"low_threshold", c.low_threshold},
             {"embedding_mode", c.embedding_mode},
             {"model_path", c.model_path},
             {"intra_op_threads", c.intra_op_threads}};
}

void from_json(const json& j, SpeakerVerificationConfig& c) {
    const SpeakerVerificationConfig d;
    c.enabled = j.value("enabled", d.enabled);
    c.threshold = j.value("threshold", d.threshold);
    c.high_threshold = j.value("high_threshold", d.high_threshold);
    c.low_threshold = j.value("low_threshold", d.low_threshold);
    c.embedding_mode = j.value("embedding_mode", d.embedding_mode);
    c.model_path = j.value("model_path", d.model_path);
    c.intra_op_threads = j.value("intra_op_threads", d.intra_op_threads);
}

void to_json(json& j, const EnrollmentConfig& c) {
    j = json{{"sample_count", c.sample_count},
             {"min_sample_seconds", c.min_sample_seconds},
             {"max_sample_seconds", c.max_sample_seconds}};
}

void from_json(const json& j, EnrollmentConfig& c) {
    const EnrollmentConfig d;
    c.sample_count = j.value("sample_count", d.sample_count);
    c.min_sample_seconds = j.value("min_sample_seconds", d.min_sample_seconds);
    c.max_sample_seconds = j.value("max_sample_seconds", d.max_sample_seconds);
}

void to_json(json& j, const AudioConfig& c) {
    j = json{{"sample_rate", c.sample_rate}, {"min_duration", c.min_duration}};
}

void from_json(const json& j, AudioConfig& c) {
    const AudioConfig d;
    c.sample_rate = j.value("sample_rate", d.sample_rate);
    c.min_duration = j.value("min_duration", d.min_duration);
}

void to_json(json& j, const LoggingConfig& c) {
    j = json{{"level", c.level}, {"file_enabled", c.file_enabled}};
}

void from_json(const json& j, LoggingConfig& c) {
    const LoggingConfig d;
    c.level = j.value("level", d.level);
    c.file_enabled = j.value("file_enabled", d.file_enabled);
}

namespace {

std::mutex g_config_mutex;
Config g_config;

template <typename T>
void merge_section(const json& root, const char* key, T& section) {
    auto it = root.find(key);
    if (it != root.end() && it->is_object()) {
        section = it->template get<T>();
    }
}

} // namespace

std::string settings_dir() {
    if (const char* env = std::getenv("SPEAKER_GATE_HOME")) {
        if (*env) return env;
    }
    const char* home = std::getenv("HOME");
#ifdef _WIN32
    if (!home) home = std::getenv("USERPROFILE");
#endif
    fs::path base = home ? fs::path(home) : fs::current_path();
    return (base / ".speaker_gate").string();
}

std::string settings_file(const std::string& home) {
    return (fs::path(home) / "settings.json").string();
}

std::string speaker_dir(const std::string& home) {
    return (fs::path(home) / "speaker").string();
}

std::string log_file(const std::string& home) {
    return (fs::path(home) / "speaker_gate.log").string();
}

Config load_config(const std::string& path) {
    Config cfg;
    if (!fs::exists(path)) {
        save_config(path, cfg);
        return cfg;
    }
    try {
        std::ifstream in(path);
        json root = json::parse(in);
        if (!root.is_object()) {
            throw std::runtime_error("top-level value is not an object");
        }
        merge_section(root, "speaker_verification", cfg.speaker_verification);
        merge_section(root, "enrollment", cfg.enrollment);
        merge_section(root, "audio", cfg.audio);
        merge_section(root, "logging", cfg.logging);
        log_info("[Config] Settings loaded from " + path);
    } catch (const std::exception& e) {
        log_error("[Config] Failed to load settings, using defaults: " + std::string(e.what()));
        cfg = Config{};
    }
    return cfg;
}

bool save_config(const std::string& path, const Config& cfg) {
    std::error_code ec;
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);

    json root = {{"speaker_verification", cfg.speaker_verification},
                 {"enrollment", cfg.enrollment},
                 {"audio", cfg.audio},
                 {"logging", cfg.logging}};

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        log_error("[Config] Failed to save settings to " + path);
        return false;
    }
    out << root.dump(2) << '\n';
    if (!out) {
        log_error("[Config] Failed to write settings to " + path);
        return false;
    }
    log_info("[Config] Settings saved to " + path);
    return true;
}

Config get_config() {
    std::lock_guard<std::mutex> lock(g_config_mutex);
    return g_config;
}

void set_config(const Config& cfg) {
    std::lock_guard<std::mutex> lock(g_config_mutex);
    g_config = cfg;
}

}
