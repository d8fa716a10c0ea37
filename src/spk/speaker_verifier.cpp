#include "spk/speaker_verifier.hpp"
#include "spk/similarity.hpp"
#include "spk/speech_mask.hpp"
#include "spk/errors.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>

namespace spk {

const char* to_string(VerifyPath path) {
    switch (path) {
        case VerifyPath::Bypass:     return "bypass";
        case VerifyPath::FastAccept: return "fast_accept";
        case VerifyPath::FastReject: return "fast_reject";
        case VerifyPath::SlowAccept: return "slow_accept";
        case VerifyPath::SlowReject: return "slow_reject";
    }
    return "unknown";
}

const char* to_string(VerifierState state) {
    switch (state) {
        case VerifierState::Unloaded:          return "unloaded";
        case VerifierState::LoadedNotEnrolled: return "loaded_not_enrolled";
        case VerifierState::LoadedEnrolled:    return "loaded_enrolled";
    }
    return "unknown";
}

bool VerificationThresholds::is_valid(std::string* reason) const {
    auto fail = [reason](const std::string& why) {
        if (reason) *reason = why;
        return false;
    };
    for (float v : {threshold, high_threshold, low_threshold}) {
        if (!std::isfinite(v) || v < -1.0f || v > 1.0f) {
            return fail(core::format("threshold %.3f outside [-1, 1]", static_cast<double>(v)));
        }
    }
    if (low_threshold > threshold || threshold > high_threshold) {
        return fail(core::format("expected low <= threshold <= high, got low=%.3f threshold=%.3f high=%.3f",
                                 static_cast<double>(low_threshold), static_cast<double>(threshold),
                                 static_cast<double>(high_threshold)));
    }
    return true;
}

SpeakerVerifier::SpeakerVerifier(std::unique_ptr<IEmbeddingExtractor> extractor,
                                 const core::EnrollmentConfig& enrollment)
    : m_extractor(std::move(extractor)), m_enrollment(enrollment) {
    if (!m_extractor) {
        throw std::invalid_argument("SpeakerVerifier requires an embedding extractor");
    }
    m_loaded = m_extractor->is_loaded();
}

//==============================================================================
// Lifecycle
//==============================================================================

void SpeakerVerifier::load_model() {
    std::lock_guard<std::mutex> lock(m_model_mutex);
    if (m_extractor->is_loaded()) {
        m_loaded = true;
        return;
    }
    core::log_info("[SpeakerVerifier] Loading speaker verification model (" + m_extractor->name() + ")");
    const auto t0 = std::chrono::steady_clock::now();
    m_extractor->load();
    m_loaded = true;
    const double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
    core::log_info(core::format("[SpeakerVerifier] Speaker verification model loaded in %.1fs", secs));
}

void SpeakerVerifier::unload_model() {
    std::lock_guard<std::mutex> lock(m_model_mutex);
    if (!m_extractor->is_loaded()) return;
    m_extractor->unload();
    m_loaded = false;
    core::log_info("[SpeakerVerifier] Speaker verification model unloaded");
}

bool SpeakerVerifier::is_enrolled() const {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    return m_centroid != nullptr;
}

VerifierState SpeakerVerifier::state() const {
    if (!is_ready()) return VerifierState::Unloaded;
    return is_enrolled() ? VerifierState::LoadedEnrolled : VerifierState::LoadedNotEnrolled;
}

//==============================================================================
// Configuration
//==============================================================================

bool SpeakerVerifier::update_thresholds(float threshold, float high, float low) {
    VerificationThresholds next{threshold, high, low};
    std::string reason;
    if (!next.is_valid(&reason)) {
        core::log_error("[SpeakerVerifier] Rejected thresholds: " + reason);
        return false;
    }
    std::lock_guard<std::mutex> lock(m_state_mutex);
    m_thresholds = next;
    return true;
}

VerificationThresholds SpeakerVerifier::thresholds() const {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    return m_thresholds;
}

//==============================================================================
// Enrollment
//==============================================================================

bool SpeakerVerifier::load_enrollment(const EnrollmentStore& store) {
    auto centroid = store.load_centroid();
    std::lock_guard<std::mutex> lock(m_state_mutex);
    if (centroid) {
        m_centroid = std::make_shared<const Embedding>(std::move(*centroid));
        core::log_info("[SpeakerVerifier] Loaded enrolled speaker centroid from " + store.directory());
        return true;
    }
    m_centroid.reset();
    return false;
}

void SpeakerVerifier::set_centroid(Embedding centroid) {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    m_centroid = std::make_shared<const Embedding>(std::move(centroid));
}

void SpeakerVerifier::clear_enrollment() {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    m_centroid.reset();
}

std::optional<Embedding> SpeakerVerifier::centroid() const {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    if (!m_centroid) return std::nullopt;
    return *m_centroid;
}

EnrollmentResult SpeakerVerifier::enroll(const std::vector<std::vector<float>>& samples,
                                         int sample_rate,
                                         EnrollmentStore& store) {
    const float threshold = thresholds().threshold;

    EnrollmentResult result;
    {
        std::lock_guard<std::mutex> lock(m_model_mutex);
        result = m_enrollment.enroll(*m_extractor, samples, sample_rate, threshold, store);
    }
    if (result.success && result.centroid) {
        set_centroid(*result.centroid);
    }
    return result;
}

//==============================================================================
// Verification
//==============================================================================

float SpeakerVerifier::score_segment(const float* samples, size_t n, int sample_rate,
                                     const Embedding& centroid) {
    Embedding emb = m_extractor->compute_embedding(samples, n, sample_rate);
    if (emb.size() != centroid.size()) {
        throw EmbeddingError(core::format(
            "Enrolled centroid has %zu dims but the model produces %zu; re-enrollment required",
            centroid.size(), emb.size()));
    }
    return cosine_similarity(emb, centroid);
}

VerifyResult SpeakerVerifier::verify(const std::vector<float>& audio, int sample_rate) {
    if (sample_rate <= 0) {
        throw std::invalid_argument(core::format("verify: invalid sample rate %d", sample_rate));
    }

    std::shared_ptr<const Embedding> centroid;
    VerificationThresholds thr;
    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        centroid = m_centroid;
        thr = m_thresholds;
    }

    auto bypass = [&audio]() {
        VerifyResult r;
        r.audio = audio;
        r.is_user = true;
        r.score = 1.0f;
        r.path = VerifyPath::Bypass;
        return r;
    };

    if (!is_ready() || !centroid) {
        return bypass();
    }

    std::lock_guard<std::mutex> lock(m_model_mutex);
    // unload_model() may have won the race for the lock
    if (!m_extractor->is_loaded()) {
        return bypass();
    }

    VerifyResult result;

    // Fast path: whole-audio embedding
    const float score = score_segment(audio.data(), audio.size(), sample_rate, *centroid);
    core::log_info(core::format("[SpeakerVerifier] Fast path: score=%.4f (high=%.2f, low=%.2f)",
                                static_cast<double>(score), static_cast<double>(thr.high_threshold),
                                static_cast<double>(thr.low_threshold)));

    if (score >= thr.high_threshold) {
        result.audio = audio;
        result.is_user = true;
        result.score = score;
        result.path = VerifyPath::FastAccept;
        return result;
    }
    if (score <= thr.low_threshold) {
        result.audio.reset();
        result.is_user = false;
        result.score = score;
        result.path = VerifyPath::FastReject;
        return result;
    }

    core::log_info(core::format("[SpeakerVerifier] Entering slow path (score=%.4f in ambiguous zone)",
                                static_cast<double>(score)));
    return slow_path(audio, sample_rate, *centroid, thr, score);
}

VerifyResult SpeakerVerifier::slow_path(const std::vector<float>& audio, int sample_rate,
                                        const Embedding& centroid, const VerificationThresholds& thr,
                                        float whole_buffer_score) {
    using P = SegmentationParams;
    const size_t window = static_cast<size_t>(P::kWindowSeconds * sample_rate);
    const size_t hop = static_cast<size_t>(P::kHopSeconds * sample_rate);
    const size_t min_tail = static_cast<size_t>(P::kMinTailSeconds * sample_rate);
    const size_t total = audio.size();

    VerifyResult result;

    if (total < window) {
        // Too short to segment: judge the whole buffer against the per-window
        // threshold. The extractor is deterministic, so the fast-path score is
        // exactly what a second extraction would produce.
        result.is_user = whole_buffer_score >= thr.threshold;
        result.score = whole_buffer_score;
        result.path = result.is_user ? VerifyPath::SlowAccept : VerifyPath::SlowReject;
        result.windows_evaluated = 1;
        if (result.is_user) result.audio = audio;
        return result;
    }

    SpeechMask mask(total);
    float max_score = kNoScore;
    int evaluated = 0;

    auto evaluate = [&](size_t begin, size_t end) {
        const float* seg = audio.data() + begin;
        const size_t n = end - begin;
        const double level = rms(seg, n);
        if (level < P::kSilenceRms) {
            core::log_debug(core::format("[SpeakerVerifier] Segment [%zu:%zu] skipped (rms=%.6f)",
                                         begin, end, level));
            return;
        }
        const float s = score_segment(seg, n, sample_rate, centroid);
        ++evaluated;
        core::log_debug(core::format("[SpeakerVerifier] Segment [%zu:%zu] score=%.4f rms=%.6f",
                                     begin, end, static_cast<double>(s), level));
        if (s >= thr.threshold) {
            mask.mark(begin, end);
        }
        max_score = std::max(max_score, s);
    };

    size_t pos = 0;
    while (pos + window <= total) {
        evaluate(pos, pos + window);
        pos += hop;
    }

    // Trailing samples past the last full window
    if (pos < total && total - pos >= min_tail) {
        evaluate(pos, total);
    }

    SpeechIntervals kept = mask.finalize();
    result.score = max_score;
    result.windows_evaluated = evaluated;

    if (!kept.empty()) {
        result.audio = kept.gather(audio);
        result.is_user = true;
        result.path = VerifyPath::SlowAccept;
        core::log_info(core::format("[SpeakerVerifier] Slow path: kept %zu/%zu samples (%.1f%%)",
                                    result.audio->size(), total,
                                    100.0 * static_cast<double>(result.audio->size()) / total));
    } else {
        result.audio.reset();
        result.is_user = false;
        result.path = VerifyPath::SlowReject;
        if (evaluated == 0) {
            core::log_info("[SpeakerVerifier] Slow path: every segment was silent");
        } else {
            core::log_info(core::format("[SpeakerVerifier] Slow path: no user segments found (max_score=%.4f)",
                                        static_cast<double>(max_score)));
        }
    }
    return result;
}

} // namespace spk
