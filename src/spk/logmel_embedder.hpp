#pragma once

#include "spk/embedding_extractor.hpp"
#include "spk/fbank.hpp"

namespace spk {

// Hand-crafted embedding: utterance-averaged log-mel energies, standardized
// across bins. Far less discriminative than a neural model but needs no
// model files, so load() always succeeds.
class LogMelEmbedder : public IEmbeddingExtractor {
public:
    explicit LogMelEmbedder(int sample_rate = 16000, int n_mels = 40);

    void load() override { m_loaded = true; }
    void unload() override { m_loaded = false; }
    bool is_loaded() const override { return m_loaded; }
    int embedding_dim() const override { return m_fbank.n_mels(); }
    std::string name() const override { return "logmel"; }

    Embedding compute_embedding(const float* samples, size_t n, int sample_rate) override;

private:
    int m_sample_rate;
    FbankExtractor m_fbank;
    bool m_loaded = false;
};

} // namespace spk
