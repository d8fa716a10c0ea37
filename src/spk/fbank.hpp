#pragma once

#include <vector>
#include <cstddef>

namespace spk {

/**
 * Kaldi-style log mel filterbank (Fbank) features.
 *
 * Matches the front end that WeSpeaker / SpeechBrain ECAPA-TDNN exports are
 * trained with: 25ms frames, 10ms shift, DC removal, pre-emphasis, Povey
 * window, natural-log mel energies and optional per-utterance mean
 * normalization (CMN).
 */
class FbankExtractor {
public:
    struct Config {
        int sample_rate = 16000;
        int frame_length = 400;      // 25ms at 16kHz
        int frame_shift = 160;       // 10ms at 16kHz
        int n_mels = 80;
        float low_freq = 20.0f;
        float high_freq = 0.0f;      // <= 0 means Nyquist + high_freq
        float preemphasis = 0.97f;
        float input_scale = 32768.0f; // models expect int16-range samples
        bool subtract_mean = true;
    };

    FbankExtractor();
    explicit FbankExtractor(const Config& config);

    /**
     * @return Row-major [n_frames x n_mels]; empty when shorter than one frame
     */
    std::vector<float> compute(const float* samples, size_t n) const;

    int num_frames(size_t n) const;
    int n_mels() const { return m_config.n_mels; }

private:
    Config m_config;
    int m_fft_size;
    std::vector<float> m_window;
    std::vector<std::vector<float>> m_banks;  // [n_mels][fft_size/2 + 1]

    void init_window();
    void init_banks();
};

} // namespace spk
