// Console front end: enroll a speaker from WAV files and run recordings
// through the same verification gate the dictation pipeline uses.

#include "app/verification_controller.hpp"
#include "audio/wav_file.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "spk/embedding_extractor.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFailed = 2;

struct Options {
    std::string home;
    std::string mode;        // overrides embedding_mode when set
    std::string model;       // overrides model_path when set
    bool verbose = false;
    std::string command;
    std::vector<std::string> args;
    std::string out_path;    // verify --out
};

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--home DIR] [--mode onnx|logmel] [--model PATH] [--verbose] <command>\n"
              << "\nCommands:\n"
              << "  enroll <a.wav> <b.wav> <c.wav>   Enroll the speaker from guided samples\n"
              << "  verify <x.wav> [--out out.wav]   Run one recording through the gate\n"
              << "  status                           Show enrollment and model state\n"
              << "  reset                            Delete the stored enrollment\n"
              << "  config [key value]               Show or change speaker_verification settings\n"
              << "                                   keys: enabled threshold high_threshold low_threshold\n";
}

bool parse_args(int argc, char** argv, Options& opt) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto next = [&](std::string& dst) {
            if (i + 1 >= argc) return false;
            dst = argv[++i];
            return true;
        };
        if (a == "--home") {
            if (!next(opt.home)) return false;
        } else if (a == "--mode") {
            if (!next(opt.mode)) return false;
        } else if (a == "--model") {
            if (!next(opt.model)) return false;
        } else if (a == "--out") {
            if (!next(opt.out_path)) return false;
        } else if (a == "--verbose" || a == "-v") {
            opt.verbose = true;
        } else if (a == "--help" || a == "-h") {
            return false;
        } else if (opt.command.empty()) {
            opt.command = a;
        } else {
            opt.args.push_back(a);
        }
    }
    return !opt.command.empty();
}

bool load_audio(const std::string& path, int sample_rate, audio::AudioBuffer& out) {
    audio::AudioBuffer raw;
    if (!audio::read_wav(path, raw)) {
        std::cerr << "Failed to read " << path << " (expected PCM16 or float32 WAV)\n";
        return false;
    }
    out = audio::resample_linear(raw, sample_rate);
    return true;
}

void print_status(const app::VerificationStatus& st) {
    std::cout << "Speaker verification: " << (st.enabled ? "enabled" : "disabled") << "\n";
    std::cout << "Embedder:             " << st.embedder << "\n";
    std::cout << "Model state:          " << spk::to_string(st.state) << "\n";
    std::cout << std::fixed << std::setprecision(2)
              << "Thresholds:           threshold=" << st.thresholds.threshold
              << " high=" << st.thresholds.high_threshold
              << " low=" << st.thresholds.low_threshold << "\n";
    if (st.enrolled_on_disk) {
        std::cout << "Enrollment:           yes";
        if (st.metadata) {
            std::cout << " (" << st.metadata->sample_count << " samples, created "
                      << st.metadata->created << ", threshold " << st.metadata->threshold << ")";
        }
        std::cout << "\n";
    } else {
        std::cout << "Enrollment:           none\n";
    }
}

int cmd_config(core::Config& cfg, const std::string& settings_path, const std::vector<std::string>& args) {
    auto& sv = cfg.speaker_verification;
    if (args.empty()) {
        std::cout << std::fixed << std::setprecision(2)
                  << "enabled=" << (sv.enabled ? "true" : "false")
                  << " threshold=" << sv.threshold
                  << " high_threshold=" << sv.high_threshold
                  << " low_threshold=" << sv.low_threshold
                  << " embedding_mode=" << sv.embedding_mode
                  << " model_path=" << sv.model_path << "\n";
        return kExitOk;
    }
    if (args.size() != 2) return kExitUsage;

    const std::string& key = args[0];
    const std::string& value = args[1];
    core::SpeakerVerificationConfig next = sv;
    try {
        if (key == "enabled") {
            next.enabled = (value == "true" || value == "1" || value == "on");
        } else if (key == "threshold") {
            next.threshold = std::stof(value);
        } else if (key == "high_threshold") {
            next.high_threshold = std::stof(value);
        } else if (key == "low_threshold") {
            next.low_threshold = std::stof(value);
        } else {
            std::cerr << "Unknown key: " << key << "\n";
            return kExitUsage;
        }
    } catch (const std::exception&) {
        std::cerr << "Invalid value for " << key << ": " << value << "\n";
        return kExitUsage;
    }

    std::string reason;
    spk::VerificationThresholds thr{next.threshold, next.high_threshold, next.low_threshold};
    if (!thr.is_valid(&reason)) {
        std::cerr << "Rejected: " << reason << "\n";
        return kExitFailed;
    }
    sv = next;
    return core::save_config(settings_path, cfg) ? kExitOk : kExitFailed;
}

} // namespace

int main(int argc, char** argv) {
    Options opt;
    if (!parse_args(argc, argv, opt)) {
        print_usage(argv[0]);
        return kExitUsage;
    }

    const std::string home = opt.home.empty() ? core::settings_dir() : opt.home;
    std::error_code ec;
    fs::create_directories(home, ec);
    if (ec) {
        std::cerr << "Cannot create " << home << ": " << ec.message() << "\n";
        return kExitFailed;
    }

    core::Config cfg = core::load_config(core::settings_file(home));
    core::set_log_level(opt.verbose ? core::LogLevel::Debug : core::parse_log_level(cfg.logging.level));
    if (cfg.logging.file_enabled) {
        core::set_log_file(core::log_file(home));
    }
    if (!opt.mode.empty()) cfg.speaker_verification.embedding_mode = opt.mode;
    if (!opt.model.empty()) cfg.speaker_verification.model_path = opt.model;
    core::set_config(cfg);

    if (opt.command == "config") {
        int rc = cmd_config(cfg, core::settings_file(home), opt.args);
        if (rc == kExitUsage) print_usage(argv[0]);
        return rc;
    }

    const int sample_rate = cfg.audio.sample_rate;
    app::VerificationController gate(spk::make_embedder, core::speaker_dir(home));
    gate.subscribe_to_state([](app::PipelineState state, const std::string& detail) {
        core::log_debug(std::string("[Console] state=") + app::to_string(state) +
                        (detail.empty() ? "" : " (" + detail + ")"));
    });

    if (opt.command == "status") {
        if (cfg.speaker_verification.enabled && !gate.apply_config(cfg)) {
            std::cerr << "Warning: speaker verification model could not be loaded\n";
        }
        print_status(gate.get_status());
        return kExitOk;
    }

    if (opt.command == "reset") {
        bool existed = gate.reset_enrollment();
        std::cout << (existed ? "✓ Enrollment removed\n" : "No enrollment to remove\n");
        return kExitOk;
    }

    if (opt.command == "enroll") {
        if (opt.args.empty()) {
            print_usage(argv[0]);
            return kExitUsage;
        }
        std::vector<std::vector<float>> samples;
        for (const auto& path : opt.args) {
            audio::AudioBuffer buf;
            if (!load_audio(path, sample_rate, buf)) return kExitFailed;
            std::cout << "Sample " << samples.size() + 1 << ": " << path << " ("
                      << std::fixed << std::setprecision(1) << buf.duration_seconds() << "s)\n";
            samples.push_back(std::move(buf.samples));
        }
        if (!gate.apply_config(cfg)) {
            std::cerr << "Warning: settings not fully applied, see log\n";
        }
        spk::EnrollmentResult r = gate.enroll(samples, sample_rate);
        if (!r.success) {
            std::cerr << "✗ " << r.message << "\n";
            return kExitFailed;
        }
        std::cout << "✓ " << r.message << "\n";
        return kExitOk;
    }

    if (opt.command == "verify") {
        if (opt.args.size() != 1) {
            print_usage(argv[0]);
            return kExitUsage;
        }
        audio::AudioBuffer buf;
        if (!load_audio(opt.args[0], sample_rate, buf)) return kExitFailed;

        // The console always verifies, regardless of the persisted toggle
        core::Config run_cfg = cfg;
        run_cfg.speaker_verification.enabled = true;
        if (!gate.apply_config(run_cfg)) {
            std::cerr << "Warning: verification not fully available; results may be bypassed\n";
        }

        app::GateDecision d = gate.process_utterance(buf.samples, sample_rate);
        std::cout << "Decision: " << app::to_string(d.action) << "\n";
        if (d.result) {
            std::cout << "Path:     " << spk::to_string(d.result->path) << "\n"
                      << "Score:    " << std::fixed << std::setprecision(4) << d.result->score << "\n"
                      << "Is user:  " << (d.result->is_user ? "yes" : "no") << "\n";
            if (d.result->windows_evaluated > 0) {
                std::cout << "Windows:  " << d.result->windows_evaluated << " evaluated\n";
            }
        }
        if (!d.error.empty()) {
            std::cout << "Error:    " << d.error << "\n";
        }
        if (d.should_transcribe()) {
            std::cout << "Kept:     " << std::fixed << std::setprecision(2)
                      << static_cast<double>(d.audio.size()) / sample_rate << "s of "
                      << buf.duration_seconds() << "s\n";
            if (!opt.out_path.empty()) {
                audio::AudioBuffer out{d.audio, sample_rate};
                if (!audio::write_wav(opt.out_path, out)) {
                    std::cerr << "Failed to write " << opt.out_path << "\n";
                    return kExitFailed;
                }
                std::cout << "✓ Wrote " << opt.out_path << "\n";
            }
        }
        return kExitOk;
    }

    std::cerr << "Unknown command: " << opt.command << "\n";
    print_usage(argv[0]);
    return kExitUsage;
}
