#pragma once

#include <vector>
#include <string>
#include <memory>
#include <cstddef>

namespace core { struct Config; }

namespace spk {

using Embedding = std::vector<float>;

constexpr int EMBEDDING_DIM = 192;  // ECAPA-TDNN output size

/**
 * @brief Maps a mono waveform to a fixed-length speaker embedding.
 *
 * Implementations hold model state that is expensive to create, so load()
 * and unload() are explicit lifecycle transitions. compute_embedding() is
 * not reentrant; callers serialize access.
 *
 * Implementations:
 * - OnnxSpeakerEmbedder (ECAPA-TDNN / WeSpeaker model via ONNX Runtime)
 * - LogMelEmbedder (model-free log-mel statistics)
 */
class IEmbeddingExtractor {
public:
    virtual ~IEmbeddingExtractor() = default;

    /**
     * @brief Load model state. Idempotent.
     * @throws EmbeddingError if the model cannot be loaded
     */
    virtual void load() = 0;

    /**
     * @brief Release model state. Idempotent.
     */
    virtual void unload() = 0;

    virtual bool is_loaded() const = 0;

    /**
     * @brief Dimensionality of the vectors returned by compute_embedding()
     */
    virtual int embedding_dim() const = 0;

    virtual std::string name() const = 0;

    /**
     * @brief Extract an embedding from float samples in [-1, 1]
     * @throws EmbeddingError when not loaded or when inference fails
     */
    virtual Embedding compute_embedding(const float* samples, size_t n, int sample_rate) = 0;
};

/**
 * @brief Create the extractor selected by speaker_verification.embedding_mode
 * @throws std::invalid_argument on an unknown mode
 */
std::unique_ptr<IEmbeddingExtractor> make_embedder(const core::Config& config);

} // namespace spk
