#include <cassert>
#include <cmath>
#include <stdexcept>
#include <vector>
#include "spk/similarity.hpp"
#include "test_support.hpp"

using testing_support::near;

int main() {
    std::vector<float> a{0.3f, -1.2f, 0.7f, 2.0f};
    std::vector<float> b{1.1f, 0.4f, -0.2f, 0.9f};

    // Symmetry and self-similarity
    assert(spk::cosine_similarity(a, b) == spk::cosine_similarity(b, a));
    assert(near(spk::cosine_similarity(a, a), 1.0));
    assert(near(spk::cosine_similarity(b, b), 1.0));

    // Orthogonal and opposite
    assert(near(spk::cosine_similarity({1.0f, 0.0f}, {0.0f, 1.0f}), 0.0));
    assert(near(spk::cosine_similarity({1.0f, 2.0f}, {-1.0f, -2.0f}), -1.0));

    // Degenerate inputs give exactly 0, never NaN/Inf
    std::vector<float> zero(4, 0.0f);
    float s = spk::cosine_similarity(a, zero);
    assert(s == 0.0f);
    assert(spk::cosine_similarity(zero, zero) == 0.0f);
    std::vector<float> tiny(4, 1e-12f);
    assert(spk::cosine_similarity(tiny, a) == 0.0f);
    assert(std::isfinite(spk::cosine_similarity(tiny, tiny)));

    bool threw = false;
    try {
        spk::cosine_similarity(a, {1.0f, 2.0f});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    // RMS
    std::vector<float> c(100, 0.25f);
    assert(near(spk::rms(c.data(), c.size()), 0.25, 1e-7));
    std::vector<float> alt{0.5f, -0.5f, 0.5f, -0.5f};
    assert(near(spk::rms(alt.data(), alt.size()), 0.5, 1e-7));
    assert(spk::rms(nullptr, 0) == 0.0);

    // Mean embedding
    auto m = spk::mean_embedding({{1.0f, 2.0f}, {3.0f, 4.0f}, {5.0f, 9.0f}});
    assert(m.size() == 2);
    assert(near(m[0], 3.0) && near(m[1], 5.0));

    threw = false;
    try {
        spk::mean_embedding({});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        spk::mean_embedding({{1.0f, 2.0f}, {1.0f}});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    return 0;
}
