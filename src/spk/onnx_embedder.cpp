#include "spk/onnx_embedder.hpp"
#include "spk/errors.hpp"
#include "core/logging.hpp"
#include <onnxruntime_cxx_api.h>
#include <cmath>
#include <filesystem>

#ifdef _WIN32
#define NOMINMAX  // Prevent Windows.h from defining min/max macros
#include <windows.h>
#endif

namespace spk {

namespace {
FbankExtractor::Config fbank_config(int sample_rate) {
    FbankExtractor::Config c;
    c.sample_rate = sample_rate;
    c.frame_length = sample_rate / 40;   // 25ms
    c.frame_shift = sample_rate / 100;   // 10ms
    c.n_mels = 80;
    return c;
}
} // namespace

OnnxSpeakerEmbedder::OnnxSpeakerEmbedder(const Config& config)
    : m_config(config), m_fbank(fbank_config(config.sample_rate)) {}

OnnxSpeakerEmbedder::~OnnxSpeakerEmbedder() = default;

void OnnxSpeakerEmbedder::load() {
    if (m_session) return;

    if (!std::filesystem::exists(m_config.model_path)) {
        throw EmbeddingError("Speaker model not found: " + m_config.model_path);
    }
    core::log_info("[OnnxEmbedder] Loading model: " + m_config.model_path);

    try {
        m_env = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "SpeakerEmbedding");

        m_session_options = std::make_unique<Ort::SessionOptions>();
        m_session_options->SetIntraOpNumThreads(m_config.intra_op_threads);
        m_session_options->SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

#ifdef _WIN32
        // Windows: convert UTF-8 to wide string
        std::wstring wide_path;
        wide_path.resize(m_config.model_path.size() + 1);
        int len = MultiByteToWideChar(CP_UTF8, 0, m_config.model_path.c_str(),
                                      static_cast<int>(m_config.model_path.size()),
                                      &wide_path[0], static_cast<int>(wide_path.size()));
        wide_path.resize(len);
        m_session = std::make_unique<Ort::Session>(*m_env, wide_path.c_str(), *m_session_options);
#else
        m_session = std::make_unique<Ort::Session>(*m_env, m_config.model_path.c_str(), *m_session_options);
#endif

        Ort::AllocatorWithDefaultOptions allocator;
        if (m_session->GetInputCount() == 0 || m_session->GetOutputCount() == 0) {
            throw EmbeddingError("Speaker model has no inputs or outputs");
        }

        m_input_name_strings.clear();
        m_output_name_strings.clear();
        m_input_name_strings.emplace_back(m_session->GetInputNameAllocated(0, allocator).get());
        m_output_name_strings.emplace_back(m_session->GetOutputNameAllocated(0, allocator).get());
        m_input_names = {m_input_name_strings[0].c_str()};
        m_output_names = {m_output_name_strings[0].c_str()};

        auto in_shape = m_session->GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
        m_waveform_input = (in_shape.size() == 2);

        auto out_shape = m_session->GetOutputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
        if (!out_shape.empty() && out_shape.back() > 0) {
            m_embedding_dim = static_cast<int>(out_shape.back());  // (batch, [1,] embedding_dim)
        }

        m_memory_info = std::make_unique<Ort::MemoryInfo>(
            Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault));

        core::log_info(core::format("[OnnxEmbedder] Model loaded: input=%s (%s), output=%s, embedding_dim=%d",
                                    m_input_name_strings[0].c_str(),
                                    m_waveform_input ? "waveform" : "fbank",
                                    m_output_name_strings[0].c_str(), m_embedding_dim));
    } catch (const Ort::Exception& e) {
        unload();
        throw EmbeddingError(std::string("Failed to initialize ONNX embedder: ") + e.what());
    } catch (...) {
        unload();
        throw;
    }
}

void OnnxSpeakerEmbedder::unload() {
    const bool was_loaded = (m_session != nullptr);
    m_session.reset();
    m_session_options.reset();
    m_memory_info.reset();
    m_env.reset();
    m_input_names.clear();
    m_output_names.clear();
    if (was_loaded) {
        core::log_info("[OnnxEmbedder] Model unloaded");
    }
}

void OnnxSpeakerEmbedder::normalize_embedding(std::vector<float>& emb) {
    double norm = 0.0;
    for (float val : emb) {
        norm += static_cast<double>(val) * val;
    }
    norm = std::sqrt(norm);

    if (norm > 1e-8) {
        for (float& val : emb) {
            val /= static_cast<float>(norm);
        }
    }
}

Embedding OnnxSpeakerEmbedder::compute_embedding(const float* samples, size_t n, int sample_rate) {
    if (!m_session) {
        throw EmbeddingError("Model not loaded. Call load() first.");
    }
    if (sample_rate != m_config.sample_rate) {
        throw EmbeddingError(core::format("[OnnxEmbedder] expected %d Hz audio, got %d Hz",
                                          m_config.sample_rate, sample_rate));
    }
    if (!samples || n == 0) {
        throw EmbeddingError("[OnnxEmbedder] empty audio");
    }

    std::vector<float> input;
    std::vector<int64_t> input_shape;
    if (m_waveform_input) {
        input.assign(samples, samples + n);
        input_shape = {1, static_cast<int64_t>(n)};
    } else {
        input = m_fbank.compute(samples, n);
        const int n_frames = m_fbank.num_frames(n);
        if (n_frames <= 0) {
            throw EmbeddingError(core::format("[OnnxEmbedder] audio too short for features (%zu samples)", n));
        }
        input_shape = {1, static_cast<int64_t>(n_frames), static_cast<int64_t>(m_fbank.n_mels())};
    }

    try {
        Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
            *m_memory_info, input.data(), input.size(), input_shape.data(), input_shape.size());

        auto output_tensors = m_session->Run(Ort::RunOptions{nullptr},
                                             m_input_names.data(), &input_tensor, 1,
                                             m_output_names.data(), 1);

        const float* output_data = output_tensors[0].GetTensorData<float>();
        const size_t output_count = output_tensors[0].GetTensorTypeAndShapeInfo().GetElementCount();
        Embedding embedding(output_data, output_data + output_count);

        if (m_config.normalize_output) {
            normalize_embedding(embedding);
        }
        if (m_config.verbose) {
            core::log_debug(core::format("[OnnxEmbedder] %zu samples -> %zu-dim embedding", n, embedding.size()));
        }
        return embedding;
    } catch (const Ort::Exception& e) {
        throw EmbeddingError(std::string("[OnnxEmbedder] Inference error: ") + e.what());
    }
}

} // namespace spk
