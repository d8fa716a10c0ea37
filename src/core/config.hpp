#pragma once
#include <string>

namespace core {

struct SpeakerVerificationConfig {
    bool enabled = false;
    float threshold = 0.25f;        // per-window / pairwise acceptance
    float high_threshold = 0.40f;   // fast-path auto-accept
    float low_threshold = 0.10f;    // fast-path auto-reject
    std::string embedding_mode = "onnx";  // "onnx" or "logmel"
    std::string model_path = "models/speaker_embedding.onnx";
    int intra_op_threads = 4;
};

struct EnrollmentConfig {
    int sample_count = 3;
    float min_sample_seconds = 3.0f;
    float max_sample_seconds = 8.0f;
};

struct AudioConfig {
    int sample_rate = 16000;
    float min_duration = 0.3f;      // utterances shorter than this are dropped
};

struct LoggingConfig {
    std::string level = "info";
    bool file_enabled = true;
};

struct Config {
    SpeakerVerificationConfig speaker_verification;
    EnrollmentConfig enrollment;
    AudioConfig audio;
    LoggingConfig logging;
};

// ~/.speaker_gate, or $SPEAKER_GATE_HOME when set
std::string settings_dir();
std::string settings_file(const std::string& home);
std::string speaker_dir(const std::string& home);
std::string log_file(const std::string& home);

// Saved values are merged over the defaults; a missing file is created with
// the defaults and a malformed one falls back to them.
Config load_config(const std::string& path);
bool save_config(const std::string& path, const Config& cfg);

Config get_config();
void set_config(const Config& cfg);
}
