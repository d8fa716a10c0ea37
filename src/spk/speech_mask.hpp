#pragma once
#include <vector>
#include <cstddef>

namespace spk {

// Half-open sample range [begin, end)
struct SampleSpan {
    size_t begin;
    size_t end;
    size_t length() const { return end - begin; }
};

/**
 * Finalized set of accepted sample ranges: sorted, non-overlapping,
 * non-adjacent. Read-only.
 */
class SpeechIntervals {
public:
    SpeechIntervals() = default;

    bool empty() const { return m_spans.empty(); }
    const std::vector<SampleSpan>& spans() const { return m_spans; }
    size_t covered_samples() const;

    // Concatenate the covered samples of `audio` in time order
    std::vector<float> gather(const std::vector<float>& audio) const;

private:
    friend class SpeechMask;
    explicit SpeechIntervals(std::vector<SampleSpan> spans) : m_spans(std::move(spans)) {}
    std::vector<SampleSpan> m_spans;
};

/**
 * Accumulates "user speech" ranges over a buffer of total_samples.
 * Coverage only grows: there is no way to unmark, so a later rejected window
 * can never erase what an earlier accepted window marked.
 */
class SpeechMask {
public:
    explicit SpeechMask(size_t total_samples) : m_total(total_samples) {}

    // Clamped to [0, total_samples). Throws std::logic_error after finalize().
    void mark(size_t begin, size_t end);

    bool any() const { return !m_pending.empty(); }
    size_t total_samples() const { return m_total; }

    // Sort and merge; the mask is sealed afterwards.
    SpeechIntervals finalize();

private:
    size_t m_total;
    bool m_finalized = false;
    std::vector<SampleSpan> m_pending;
};

} // namespace spk
