#include "spk/similarity.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace spk {

float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("cosine_similarity: dimension mismatch (" +
                                    std::to_string(a.size()) + " vs " +
                                    std::to_string(b.size()) + ")");
    }
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        na += static_cast<double>(a[i]) * a[i];
        nb += static_cast<double>(b[i]) * b[i];
    }
    na = std::sqrt(na);
    nb = std::sqrt(nb);
    if (na < kNormEpsilon || nb < kNormEpsilon) return 0.0f;
    return static_cast<float>(dot / (na * nb));
}

double rms(const float* samples, size_t n) {
    if (!samples || n == 0) return 0.0;
    double acc = 0.0;
    for (size_t i = 0; i < n; ++i) {
        acc += static_cast<double>(samples[i]) * samples[i];
    }
    return std::sqrt(acc / static_cast<double>(n));
}

std::vector<float> mean_embedding(const std::vector<std::vector<float>>& embeddings) {
    if (embeddings.empty()) {
        throw std::invalid_argument("mean_embedding: no embeddings");
    }
    const size_t dim = embeddings[0].size();
    std::vector<double> sum(dim, 0.0);
    for (const auto& emb : embeddings) {
        if (emb.size() != dim) {
            throw std::invalid_argument("mean_embedding: ragged embeddings");
        }
        for (size_t i = 0; i < dim; ++i) sum[i] += emb[i];
    }
    std::vector<float> mean(dim);
    for (size_t i = 0; i < dim; ++i) {
        mean[i] = static_cast<float>(sum[i] / static_cast<double>(embeddings.size()));
    }
    return mean;
}

}
