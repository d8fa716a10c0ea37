#pragma once
#include <vector>
#include <cstddef>

namespace spk {

constexpr double kNormEpsilon = 1e-9;

// dot(a,b) / (|a| |b|). Returns 0 when either norm is below kNormEpsilon.
// Throws std::invalid_argument if the lengths differ.
float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

// Root mean square of n samples (0 for an empty range)
double rms(const float* samples, size_t n);

// Element-wise mean. Throws std::invalid_argument on empty or ragged input.
std::vector<float> mean_embedding(const std::vector<std::vector<float>>& embeddings);

}
