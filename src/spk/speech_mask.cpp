#include "spk/speech_mask.hpp"
#include <algorithm>
#include <stdexcept>

namespace spk {

size_t SpeechIntervals::covered_samples() const {
    size_t n = 0;
    for (const auto& s : m_spans) n += s.length();
    return n;
}

std::vector<float> SpeechIntervals::gather(const std::vector<float>& audio) const {
    std::vector<float> out;
    out.reserve(covered_samples());
    for (const auto& s : m_spans) {
        size_t end = std::min(s.end, audio.size());
        if (s.begin >= end) continue;
        out.insert(out.end(), audio.begin() + s.begin, audio.begin() + end);
    }
    return out;
}

void SpeechMask::mark(size_t begin, size_t end) {
    if (m_finalized) {
        throw std::logic_error("SpeechMask::mark called after finalize");
    }
    end = std::min(end, m_total);
    if (begin >= end) return;
    m_pending.push_back({begin, end});
}

SpeechIntervals SpeechMask::finalize() {
    m_finalized = true;
    std::vector<SampleSpan> spans = m_pending;
    std::sort(spans.begin(), spans.end(),
              [](const SampleSpan& a, const SampleSpan& b) { return a.begin < b.begin; });

    std::vector<SampleSpan> merged;
    for (const auto& s : spans) {
        if (!merged.empty() && s.begin <= merged.back().end) {
            merged.back().end = std::max(merged.back().end, s.end);
        } else {
            merged.push_back(s);
        }
    }
    return SpeechIntervals(std::move(merged));
}

} // namespace spk
