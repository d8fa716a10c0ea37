#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace audio {

// Mono float samples in [-1, 1]
struct AudioBuffer {
    std::vector<float> samples;
    int sample_rate = 0;

    double duration_seconds() const {
        return sample_rate > 0 ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
};

// Read a PCM16 or float32 RIFF/WAVE file, downmixing to mono.
// Returns false if the file is missing, malformed or in an unsupported format.
bool read_wav(const std::string& path, AudioBuffer& out);

// Write mono PCM16. Returns false on I/O failure.
bool write_wav(const std::string& path, const AudioBuffer& in);

// Linear-interpolation resampling; returns the input unchanged if already at target_rate
AudioBuffer resample_linear(const AudioBuffer& in, int target_rate);

} // namespace audio
