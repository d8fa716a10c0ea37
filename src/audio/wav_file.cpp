#include "audio/wav_file.hpp"
#include <fstream>
#include <cstring>
#include <algorithm>
#include <cmath>

namespace audio {

namespace {
struct WavHeader {
    char riff[4];
    uint32_t chunkSize;
    char wave[4];
    char fmt[4];
    uint32_t subchunk1Size;
    uint16_t audioFormat; // 1=PCM, 3=float
    uint16_t numChannels;
    uint32_t sampleRate;
    uint32_t byteRate;
    uint16_t blockAlign;
    uint16_t bitsPerSample;
};

template <typename T>
void put(std::ofstream& f, T v) {
    f.write(reinterpret_cast<const char*>(&v), sizeof(T));
}
} // namespace

bool read_wav(const std::string& path, AudioBuffer& out) {
    out.samples.clear();
    out.sample_rate = 0;

    std::ifstream f(path, std::ios::binary);
    if (!f) return false;
    WavHeader hdr{};
    if (!f.read(reinterpret_cast<char*>(&hdr), sizeof(hdr))) return false;
    if (std::strncmp(hdr.riff, "RIFF", 4) != 0 || std::strncmp(hdr.wave, "WAVE", 4) != 0) return false;
    if (std::strncmp(hdr.fmt, "fmt ", 4) != 0 || hdr.numChannels == 0) return false;

    // Skip the optional fmt extension, then walk chunks until "data"
    uint32_t fmtExtra = hdr.subchunk1Size > 16 ? hdr.subchunk1Size - 16 : 0;
    if (fmtExtra) f.seekg(fmtExtra, std::ios::cur);

    char chunkId[4];
    uint32_t chunkSize = 0;
    bool found = false;
    while (f.read(chunkId, 4)) {
        if (!f.read(reinterpret_cast<char*>(&chunkSize), 4)) return false;
        if (std::strncmp(chunkId, "data", 4) == 0) {
            found = true;
            break;
        }
        f.seekg(chunkSize + (chunkSize & 1u), std::ios::cur);
    }
    if (!found) return false;

    const size_t channels = hdr.numChannels;
    const size_t bytesPerSample = hdr.bitsPerSample / 8;
    if (bytesPerSample == 0) return false;
    const size_t frameCount = chunkSize / (bytesPerSample * channels);
    out.samples.resize(frameCount);

    if (hdr.audioFormat == 1 && hdr.bitsPerSample == 16) {
        std::vector<int16_t> buf(frameCount * channels);
        if (!f.read(reinterpret_cast<char*>(buf.data()), buf.size() * sizeof(int16_t))) return false;
        for (size_t i = 0; i < frameCount; ++i) {
            int32_t sum = 0;
            for (size_t c = 0; c < channels; ++c) sum += buf[i * channels + c];
            out.samples[i] = static_cast<float>(sum) / static_cast<float>(channels) / 32768.0f;
        }
    } else if (hdr.audioFormat == 3 && hdr.bitsPerSample == 32) {
        std::vector<float> buf(frameCount * channels);
        if (!f.read(reinterpret_cast<char*>(buf.data()), buf.size() * sizeof(float))) return false;
        for (size_t i = 0; i < frameCount; ++i) {
            float sum = 0.0f;
            for (size_t c = 0; c < channels; ++c) sum += buf[i * channels + c];
            out.samples[i] = std::clamp(sum / static_cast<float>(channels), -1.0f, 1.0f);
        }
    } else {
        out.samples.clear();
        return false; // unsupported
    }

    out.sample_rate = static_cast<int>(hdr.sampleRate);
    return true;
}

bool write_wav(const std::string& path, const AudioBuffer& in) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) return false;

    const uint32_t dataBytes = static_cast<uint32_t>(in.samples.size() * sizeof(int16_t));
    f.write("RIFF", 4);
    put<uint32_t>(f, 36 + dataBytes);
    f.write("WAVE", 4);
    f.write("fmt ", 4);
    put<uint32_t>(f, 16);
    put<uint16_t>(f, 1);                                     // PCM
    put<uint16_t>(f, 1);                                     // mono
    put<uint32_t>(f, static_cast<uint32_t>(in.sample_rate));
    put<uint32_t>(f, static_cast<uint32_t>(in.sample_rate) * 2);
    put<uint16_t>(f, 2);
    put<uint16_t>(f, 16);
    f.write("data", 4);
    put<uint32_t>(f, dataBytes);

    for (float v : in.samples) {
        v = std::clamp(v, -1.0f, 1.0f);
        put<int16_t>(f, static_cast<int16_t>(std::lrint(v * 32767.0f)));
    }
    return static_cast<bool>(f);
}

AudioBuffer resample_linear(const AudioBuffer& in, int target_rate) {
    if (in.sample_rate == target_rate || in.sample_rate <= 0 || in.samples.empty()) return in;

    AudioBuffer out;
    out.sample_rate = target_rate;
    const double ratio = static_cast<double>(target_rate) / static_cast<double>(in.sample_rate);
    const size_t out_len = static_cast<size_t>(std::llround(in.samples.size() * ratio));
    out.samples.resize(out_len);
    // Linear interpolation on sample positions
    for (size_t i = 0; i < out_len; ++i) {
        double src_pos = i / ratio;
        size_t i0 = std::min(static_cast<size_t>(src_pos), in.samples.size() - 1);
        size_t i1 = std::min(i0 + 1, in.samples.size() - 1);
        double frac = src_pos - static_cast<double>(i0);
        out.samples[i] = static_cast<float>((1.0 - frac) * in.samples[i0] + frac * in.samples[i1]);
    }
    return out;
}

} // namespace audio
