// Shared helpers for the test executables.
#pragma once

#include "spk/embedding_extractor.hpp"
#include "spk/errors.hpp"

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <initializer_list>
#include <memory>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace testing_support {

constexpr int kRate = 16000;

// Knobs shared between a test and the extractors a factory creates
struct FakeControls {
    int load_calls = 0;
    int compute_calls = 0;
    bool loaded = false;
    bool fail_load = false;
    bool fail_compute = false;
    std::vector<std::pair<size_t, float>> calls;  // (length, first sample)
};

// Deterministic stand-in for a speaker model: the embedding is the histogram
// of |sample| rounded to 0.01, as fractions of the buffer. Two signals built
// from different amplitudes are orthogonal; a mix scores in between.
class AmplitudeHistogramEmbedder : public spk::IEmbeddingExtractor {
public:
    explicit AmplitudeHistogramEmbedder(std::shared_ptr<FakeControls> controls =
                                            std::make_shared<FakeControls>(),
                                        int dim = spk::EMBEDDING_DIM)
        : m_controls(std::move(controls)), m_dim(dim) {}

    void load() override {
        ++m_controls->load_calls;
        if (m_controls->fail_load) throw spk::EmbeddingError("fake model missing");
        m_controls->loaded = true;
    }
    void unload() override { m_controls->loaded = false; }
    bool is_loaded() const override { return m_controls->loaded; }
    int embedding_dim() const override { return m_dim; }
    std::string name() const override { return "histogram"; }

    spk::Embedding compute_embedding(const float* samples, size_t n, int) override {
        if (!m_controls->loaded) throw spk::EmbeddingError("Model not loaded");
        if (m_controls->fail_compute) throw spk::EmbeddingError("fake inference failure");
        ++m_controls->compute_calls;
        m_controls->calls.emplace_back(n, n ? samples[0] : 0.0f);
        return histogram(samples, n, m_dim);
    }

    static spk::Embedding histogram(const float* samples, size_t n, int dim = spk::EMBEDDING_DIM) {
        spk::Embedding h(dim, 0.0f);
        if (n == 0) return h;
        for (size_t i = 0; i < n; ++i) {
            long bin = std::lround(std::fabs(samples[i]) * 100.0f);
            if (bin >= dim) bin = dim - 1;
            h[static_cast<size_t>(bin)] += 1.0f;
        }
        for (float& v : h) v /= static_cast<float>(n);
        return h;
    }

    static spk::Embedding histogram(const std::vector<float>& audio, int dim = spk::EMBEDDING_DIM) {
        return histogram(audio.data(), audio.size(), dim);
    }

private:
    std::shared_ptr<FakeControls> m_controls;
    int m_dim;
};

// +a, -a, +a, ... for `seconds`
inline std::vector<float> tone(double seconds, float amplitude) {
    std::vector<float> v(static_cast<size_t>(seconds * kRate));
    for (size_t i = 0; i < v.size(); ++i) v[i] = (i % 2 == 0) ? amplitude : -amplitude;
    return v;
}

// Enrolled speaker at 0.1 with a sprinkle of 0.11 samples; variant shifts the sprinkle
inline std::vector<float> user_voice(double seconds, int variant = 0) {
    std::vector<float> v = tone(seconds, 0.1f);
    const size_t step = static_cast<size_t>(50 + variant);
    for (size_t i = 0; i < v.size(); i += step) v[i] = (i % 2 == 0) ? 0.11f : -0.11f;
    return v;
}

inline std::vector<float> concat(std::initializer_list<std::vector<float>> parts) {
    std::vector<float> out;
    for (const auto& p : parts) out.insert(out.end(), p.begin(), p.end());
    return out;
}

inline bool near(double a, double b, double eps = 1e-4) { return std::fabs(a - b) <= eps; }

// Fresh empty directory under the system temp dir
inline std::string temp_dir(const std::string& tag) {
    std::random_device rd;
    std::filesystem::path p = std::filesystem::temp_directory_path() /
                              ("speaker_gate_" + tag + "_" + std::to_string(rd()));
    std::filesystem::remove_all(p);
    std::filesystem::create_directories(p);
    return p.string();
}

} // namespace testing_support
