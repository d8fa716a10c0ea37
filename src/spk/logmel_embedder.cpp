#include "spk/logmel_embedder.hpp"
#include "spk/errors.hpp"
#include "core/logging.hpp"
#include <cmath>

namespace spk {

namespace {
FbankExtractor::Config logmel_config(int sample_rate, int n_mels) {
    FbankExtractor::Config c;
    c.sample_rate = sample_rate;
    c.frame_length = sample_rate / 40;
    c.frame_shift = sample_rate / 100;
    c.n_mels = n_mels;
    c.low_freq = 80.0f;
    c.subtract_mean = false;  // CMN would cancel the utterance average
    return c;
}
} // namespace

LogMelEmbedder::LogMelEmbedder(int sample_rate, int n_mels)
    : m_sample_rate(sample_rate), m_fbank(logmel_config(sample_rate, n_mels)) {}

Embedding LogMelEmbedder::compute_embedding(const float* samples, size_t n, int sample_rate) {
    if (!m_loaded) {
        throw EmbeddingError("Model not loaded. Call load() first.");
    }
    if (sample_rate != m_sample_rate) {
        throw EmbeddingError(core::format("[LogMelEmbedder] expected %d Hz audio, got %d Hz",
                                          m_sample_rate, sample_rate));
    }
    const int n_frames = m_fbank.num_frames(n);
    if (n_frames <= 0) {
        throw EmbeddingError(core::format("[LogMelEmbedder] audio too short (%zu samples)", n));
    }

    const int n_mels = m_fbank.n_mels();
    std::vector<float> feats = m_fbank.compute(samples, n);

    // Average over frames
    std::vector<double> avg(n_mels, 0.0);
    for (int t = 0; t < n_frames; ++t) {
        for (int m = 0; m < n_mels; ++m) avg[m] += feats[static_cast<size_t>(t) * n_mels + m];
    }
    for (double& v : avg) v /= n_frames;

    // Normalize
    double mean = 0.0;
    for (double v : avg) mean += v;
    mean /= n_mels;

    double var = 0.0;
    for (double v : avg) var += (v - mean) * (v - mean);
    var /= n_mels;
    double stdv = std::sqrt(var + 1e-8);

    Embedding emb(n_mels);
    for (int m = 0; m < n_mels; ++m) emb[m] = static_cast<float>((avg[m] - mean) / stdv);
    return emb;
}

} // namespace spk
