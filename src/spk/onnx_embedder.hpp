#pragma once

#include "spk/embedding_extractor.hpp"
#include "spk/fbank.hpp"
#include <vector>
#include <string>
#include <memory>

// Forward declarations to avoid including onnxruntime headers here
namespace Ort {
    struct Env;
    struct Session;
    struct SessionOptions;
    struct MemoryInfo;
}

namespace spk {

/**
 * ONNX-based neural speaker embedding extractor.
 * Uses pretrained models like ECAPA-TDNN for speaker embeddings.
 *
 * Accepts both export styles:
 * - rank-3 input [batch, frames, 80]: Fbank features (WeSpeaker, CAM++)
 * - rank-2 input [batch, samples]: raw waveform (SpeechBrain ECAPA)
 */
class OnnxSpeakerEmbedder : public IEmbeddingExtractor {
public:
    struct Config {
        std::string model_path = "models/speaker_embedding.onnx";
        int sample_rate = 16000;
        int intra_op_threads = 4;
        bool normalize_output = true;       // L2-normalize embeddings
        bool verbose = false;
    };

    explicit OnnxSpeakerEmbedder(const Config& config);
    ~OnnxSpeakerEmbedder() override;

    // Disable copy (ONNX session is non-copyable)
    OnnxSpeakerEmbedder(const OnnxSpeakerEmbedder&) = delete;
    OnnxSpeakerEmbedder& operator=(const OnnxSpeakerEmbedder&) = delete;

    void load() override;
    void unload() override;
    bool is_loaded() const override { return m_session != nullptr; }

    /**
     * Dimensionality of output embeddings; read from the model on load
     * (192 for ECAPA-TDNN until then).
     */
    int embedding_dim() const override { return m_embedding_dim; }
    std::string name() const override { return "onnx"; }

    /**
     * Extract speaker embedding from the whole buffer.
     * @throws EmbeddingError if not loaded, sample rate differs, or inference fails
     */
    Embedding compute_embedding(const float* samples, size_t n, int sample_rate) override;

private:
    Config m_config;
    FbankExtractor m_fbank;

    std::unique_ptr<Ort::Env> m_env;
    std::unique_ptr<Ort::SessionOptions> m_session_options;
    std::unique_ptr<Ort::Session> m_session;
    std::unique_ptr<Ort::MemoryInfo> m_memory_info;

    std::vector<std::string> m_input_name_strings;
    std::vector<std::string> m_output_name_strings;
    std::vector<const char*> m_input_names;
    std::vector<const char*> m_output_names;
    int m_embedding_dim = EMBEDDING_DIM;
    bool m_waveform_input = false;

    static void normalize_embedding(std::vector<float>& emb);
};

} // namespace spk
