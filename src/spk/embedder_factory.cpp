#include "spk/embedding_extractor.hpp"
#include "spk/onnx_embedder.hpp"
#include "spk/logmel_embedder.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include <stdexcept>

namespace spk {

std::unique_ptr<IEmbeddingExtractor> make_embedder(const core::Config& config) {
    const auto& sv = config.speaker_verification;
    if (sv.embedding_mode == "onnx") {
        OnnxSpeakerEmbedder::Config oc;
        oc.model_path = sv.model_path;
        oc.sample_rate = config.audio.sample_rate;
        oc.intra_op_threads = sv.intra_op_threads;
        oc.verbose = core::log_level() == core::LogLevel::Debug;
        return std::make_unique<OnnxSpeakerEmbedder>(oc);
    }
    if (sv.embedding_mode == "logmel") {
        return std::make_unique<LogMelEmbedder>(config.audio.sample_rate);
    }
    throw std::invalid_argument("Unknown embedding_mode: " + sv.embedding_mode);
}

} // namespace spk
