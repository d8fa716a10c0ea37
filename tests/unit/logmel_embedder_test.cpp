#include <cassert>
#include <cmath>
#include <vector>
#include "spk/fbank.hpp"
#include "spk/logmel_embedder.hpp"
#include "spk/similarity.hpp"
#include "test_support.hpp"

using testing_support::kRate;
using testing_support::near;

static std::vector<float> voiced(double seconds, double f0) {
    std::vector<float> v(static_cast<size_t>(seconds * kRate));
    const double pi = std::acos(-1.0);
    for (size_t i = 0; i < v.size(); ++i) {
        const double t = static_cast<double>(i) / kRate;
        v[i] = static_cast<float>(0.3 * std::sin(2 * pi * f0 * t) + 0.1 * std::sin(2 * pi * 3 * f0 * t) +
                                  0.05 * std::sin(2 * pi * 7 * f0 * t));
    }
    return v;
}

int main() {
    // Fbank framing: 25ms frames every 10ms
    {
        spk::FbankExtractor fbank;
        assert(fbank.num_frames(399) == 0);
        assert(fbank.num_frames(400) == 1);
        assert(fbank.num_frames(16000) == 98);
        assert(fbank.compute(nullptr, 16000).empty());

        auto audio = voiced(1.0, 150.0);
        auto feats = fbank.compute(audio.data(), audio.size());
        assert(feats.size() == static_cast<size_t>(98 * fbank.n_mels()));
        for (float f : feats) assert(std::isfinite(f));

        // Mean normalization leaves every bin centred on zero
        for (int m = 0; m < fbank.n_mels(); ++m) {
            double sum = 0.0;
            for (int t = 0; t < 98; ++t) sum += feats[static_cast<size_t>(t) * fbank.n_mels() + m];
            assert(std::fabs(sum / 98.0) < 1e-3);
        }

        // Digital silence stays finite thanks to the energy floor
        std::vector<float> silence(8000, 0.0f);
        for (float f : fbank.compute(silence.data(), silence.size())) assert(std::isfinite(f));
    }

    // LogMel embedder
    {
        spk::LogMelEmbedder embedder;
        auto audio = voiced(2.0, 150.0);

        bool threw = false;
        try {
            embedder.compute_embedding(audio.data(), audio.size(), kRate);
        } catch (const spk::EmbeddingError&) {
            threw = true;
        }
        assert(threw);

        embedder.load();
        assert(embedder.is_loaded());
        assert(embedder.embedding_dim() == 40);

        auto e1 = embedder.compute_embedding(audio.data(), audio.size(), kRate);
        auto e2 = embedder.compute_embedding(audio.data(), audio.size(), kRate);
        assert(e1.size() == 40);
        assert(e1 == e2);
        for (float v : e1) assert(std::isfinite(v));

        // Gain changes shift every log energy equally and standardization removes it
        std::vector<float> louder(audio);
        for (float& s : louder) s *= 2.0f;
        auto e3 = embedder.compute_embedding(louder.data(), louder.size(), kRate);
        assert(spk::cosine_similarity(e1, e3) > 0.999f);

        // A different voice lands somewhere else
        auto other = voiced(2.0, 420.0);
        auto e4 = embedder.compute_embedding(other.data(), other.size(), kRate);
        assert(spk::cosine_similarity(e1, e4) < 0.99f);

        threw = false;
        try {
            embedder.compute_embedding(audio.data(), audio.size(), 8000);
        } catch (const spk::EmbeddingError&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            embedder.compute_embedding(audio.data(), 100, kRate);
        } catch (const spk::EmbeddingError&) {
            threw = true;
        }
        assert(threw);

        embedder.unload();
        assert(!embedder.is_loaded());
    }
    return 0;
}
