#include "spk/fbank.hpp"
#include <cmath>
#include <complex>
#include <algorithm>
#include <limits>

namespace spk {

namespace {

constexpr double kPi = 3.14159265358979323846;

// In-place iterative radix-2 Cooley-Tukey FFT; size must be a power of two
void fft_inplace(std::vector<std::complex<double>>& x) {
    const size_t N = x.size();
    if (N <= 1) return;

    for (size_t i = 1, j = 0; i < N; ++i) {
        size_t bit = N >> 1;
        for (; j & bit; bit >>= 1) j ^= bit;
        j ^= bit;
        if (i < j) std::swap(x[i], x[j]);
    }

    for (size_t len = 2; len <= N; len <<= 1) {
        const double ang = -2.0 * kPi / static_cast<double>(len);
        const std::complex<double> wlen(std::cos(ang), std::sin(ang));
        for (size_t i = 0; i < N; i += len) {
            std::complex<double> w(1.0, 0.0);
            for (size_t k = 0; k < len / 2; ++k) {
                std::complex<double> u = x[i + k];
                std::complex<double> v = x[i + k + len / 2] * w;
                x[i + k] = u + v;
                x[i + k + len / 2] = u - v;
                w *= wlen;
            }
        }
    }
}

inline double mel_scale(double hz) { return 1127.0 * std::log(1.0 + hz / 700.0); }

int next_pow2(int n) {
    int p = 1;
    while (p < n) p <<= 1;
    return p;
}

} // namespace

FbankExtractor::FbankExtractor() : FbankExtractor(Config{}) {}

FbankExtractor::FbankExtractor(const Config& config)
    : m_config(config), m_fft_size(next_pow2(config.frame_length)) {
    init_window();
    init_banks();
}

void FbankExtractor::init_window() {
    const int N = m_config.frame_length;
    m_window.resize(N);
    for (int i = 0; i < N; ++i) {
        double hann = 0.5 - 0.5 * std::cos(2.0 * kPi * i / (N - 1));
        m_window[i] = static_cast<float>(std::pow(hann, 0.85));
    }
}

void FbankExtractor::init_banks() {
    const int n_bins = m_fft_size / 2 + 1;
    const double nyquist = 0.5 * m_config.sample_rate;
    double high = m_config.high_freq > 0.0f ? m_config.high_freq : nyquist + m_config.high_freq;
    const double mel_low = mel_scale(m_config.low_freq);
    const double mel_high = mel_scale(high);
    const double mel_delta = (mel_high - mel_low) / (m_config.n_mels + 1);
    const double bin_hz = static_cast<double>(m_config.sample_rate) / m_fft_size;

    m_banks.assign(m_config.n_mels, std::vector<float>(n_bins, 0.0f));
    for (int m = 0; m < m_config.n_mels; ++m) {
        const double left = mel_low + m * mel_delta;
        const double center = left + mel_delta;
        const double right = center + mel_delta;
        for (int k = 0; k < n_bins; ++k) {
            const double mel = mel_scale(bin_hz * k);
            if (mel > left && mel < right) {
                m_banks[m][k] = static_cast<float>(
                    mel <= center ? (mel - left) / (center - left)
                                  : (right - mel) / (right - center));
            }
        }
    }
}

int FbankExtractor::num_frames(size_t n) const {
    if (n < static_cast<size_t>(m_config.frame_length)) return 0;
    return 1 + static_cast<int>((n - m_config.frame_length) / m_config.frame_shift);
}

std::vector<float> FbankExtractor::compute(const float* samples, size_t n) const {
    const int n_frames = num_frames(n);
    if (!samples || n_frames <= 0) return {};

    const int L = m_config.frame_length;
    const int n_mels = m_config.n_mels;
    const int n_bins = m_fft_size / 2 + 1;
    const double floor_energy = std::numeric_limits<float>::epsilon();

    std::vector<float> feats(static_cast<size_t>(n_frames) * n_mels);
    std::vector<double> frame(L);
    std::vector<std::complex<double>> spec(m_fft_size);
    std::vector<double> power(n_bins);

    for (int t = 0; t < n_frames; ++t) {
        const float* src = samples + static_cast<size_t>(t) * m_config.frame_shift;

        double dc = 0.0;
        for (int i = 0; i < L; ++i) {
            frame[i] = src[i] * m_config.input_scale;
            dc += frame[i];
        }
        dc /= L;
        for (int i = 0; i < L; ++i) frame[i] -= dc;

        for (int i = L - 1; i > 0; --i) frame[i] -= m_config.preemphasis * frame[i - 1];
        frame[0] -= m_config.preemphasis * frame[0];

        std::fill(spec.begin(), spec.end(), std::complex<double>(0.0, 0.0));
        for (int i = 0; i < L; ++i) spec[i] = frame[i] * m_window[i];
        fft_inplace(spec);
        for (int k = 0; k < n_bins; ++k) power[k] = std::norm(spec[k]);

        float* row = &feats[static_cast<size_t>(t) * n_mels];
        for (int m = 0; m < n_mels; ++m) {
            double e = 0.0;
            const auto& bank = m_banks[m];
            for (int k = 0; k < n_bins; ++k) e += bank[k] * power[k];
            row[m] = static_cast<float>(std::log(std::max(e, floor_energy)));
        }
    }

    if (m_config.subtract_mean) {
        for (int m = 0; m < n_mels; ++m) {
            double mean = 0.0;
            for (int t = 0; t < n_frames; ++t) mean += feats[static_cast<size_t>(t) * n_mels + m];
            mean /= n_frames;
            for (int t = 0; t < n_frames; ++t) {
                feats[static_cast<size_t>(t) * n_mels + m] -= static_cast<float>(mean);
            }
        }
    }
    return feats;
}

} // namespace spk
