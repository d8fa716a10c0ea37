#include "spk/enrollment_manager.hpp"
#include "spk/similarity.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <stdexcept>

namespace spk {

EnrollmentResult EnrollmentManager::enroll(IEmbeddingExtractor& extractor,
                                           const std::vector<std::vector<float>>& samples,
                                           int sample_rate,
                                           float threshold,
                                           EnrollmentStore& store) const {
    if (sample_rate <= 0) {
        throw std::invalid_argument(core::format("enroll: invalid sample rate %d", sample_rate));
    }

    EnrollmentResult result;

    if (!extractor.is_loaded()) {
        result.message = "Model not loaded";
        return result;
    }

    if (static_cast<int>(samples.size()) != m_config.sample_count) {
        result.message = core::format("Expected %d enrollment samples, got %zu",
                                      m_config.sample_count, samples.size());
        return result;
    }

    const size_t min_len = static_cast<size_t>(m_config.min_sample_seconds * sample_rate);
    const size_t max_len = static_cast<size_t>(m_config.max_sample_seconds * sample_rate);
    for (size_t i = 0; i < samples.size(); ++i) {
        if (samples[i].size() < min_len) {
            result.message = core::format("Sample %zu is too short (%.1fs, need at least %.0fs). Please re-record",
                                          i + 1, static_cast<double>(samples[i].size()) / sample_rate,
                                          static_cast<double>(m_config.min_sample_seconds));
            return result;
        }
    }

    std::vector<Embedding> embeddings;
    embeddings.reserve(samples.size());
    for (size_t i = 0; i < samples.size(); ++i) {
        // Recording auto-stops at max_sample_seconds; longer input is trimmed
        const size_t n = max_len > 0 ? std::min(samples[i].size(), max_len) : samples[i].size();
        embeddings.push_back(extractor.compute_embedding(samples[i].data(), n, sample_rate));
        core::log_info(core::format("[Enrollment] Sample %zu: embedding extracted", i + 1));
    }

    // Every pair, not just neighbours: one odd sample among consistent ones must fail
    for (size_t i = 0; i < embeddings.size(); ++i) {
        for (size_t j = i + 1; j < embeddings.size(); ++j) {
            const float sim = cosine_similarity(embeddings[i], embeddings[j]);
            core::log_info(core::format("[Enrollment] Pairwise similarity [%zu,%zu]: %.4f", i, j, sim));
            if (sim < threshold) {
                result.failed_pair = std::make_pair(static_cast<int>(i + 1), static_cast<int>(j + 1));
                result.failed_score = sim;
                result.message = core::format(
                    "Samples %zu and %zu are too different (similarity: %.2f). "
                    "Please re-record in a quiet environment",
                    i + 1, j + 1, static_cast<double>(sim));
                return result;
            }
        }
    }

    EnrollmentRecord record;
    record.centroid = mean_embedding(embeddings);
    record.embeddings = std::move(embeddings);
    record.metadata.sample_count = static_cast<int>(samples.size());
    record.metadata.created = EnrollmentStore::now_timestamp();
    record.metadata.threshold = threshold;
    record.metadata.embedding_dim = static_cast<int>(record.centroid.size());

    store.save(record);

    core::log_info(core::format("[Enrollment] Speaker enrolled with %zu samples", samples.size()));
    result.success = true;
    result.message = "Voice enrollment successful";
    result.centroid = record.centroid;
    return result;
}

} // namespace spk
