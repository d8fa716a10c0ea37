#pragma once

#include "spk/embedding_extractor.hpp"
#include "spk/enrollment_store.hpp"
#include "core/config.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace spk {

struct EnrollmentResult {
    bool success = false;
    std::string message;                         // user-facing
    std::optional<Embedding> centroid;           // set on success
    std::optional<std::pair<int, int>> failed_pair;  // 1-based sample indices
    float failed_score = 0.0f;
};

/**
 * Guided multi-sample enrollment: validates that every pair of samples
 * sounds like the same speaker, then persists the mean embedding.
 *
 * Validation failures come back as EnrollmentResult{success=false}; the store
 * is not touched in that case. Extraction and storage failures throw.
 */
class EnrollmentManager {
public:
    explicit EnrollmentManager(const core::EnrollmentConfig& config = core::EnrollmentConfig{})
        : m_config(config) {}

    const core::EnrollmentConfig& config() const { return m_config; }

    /**
     * @param extractor must be loaded, otherwise "Model not loaded" is returned
     * @param threshold minimum pairwise cosine similarity
     * @throws EmbeddingError, StorageError, std::invalid_argument for sample_rate <= 0
     */
    EnrollmentResult enroll(IEmbeddingExtractor& extractor,
                            const std::vector<std::vector<float>>& samples,
                            int sample_rate,
                            float threshold,
                            EnrollmentStore& store) const;

private:
    core::EnrollmentConfig m_config;
};

} // namespace spk
