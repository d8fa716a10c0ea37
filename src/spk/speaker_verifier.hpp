#pragma once

#include "spk/embedding_extractor.hpp"
#include "spk/enrollment_manager.hpp"
#include "spk/enrollment_store.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace spk {

/// Which decision branch produced a VerifyResult
enum class VerifyPath {
    Bypass,      ///< model not loaded or nobody enrolled: accept unfiltered
    FastAccept,  ///< whole-buffer score >= high_threshold
    FastReject,  ///< whole-buffer score <= low_threshold
    SlowAccept,  ///< windowed scan found user speech
    SlowReject   ///< windowed scan found none
};

const char* to_string(VerifyPath path);

enum class VerifierState {
    Unloaded,           ///< extractor not loaded (verify() bypasses)
    LoadedNotEnrolled,  ///< extractor ready, no centroid (verify() bypasses)
    LoadedEnrolled      ///< full two-tier verification
};

const char* to_string(VerifierState state);

struct VerificationThresholds {
    float threshold = 0.25f;       ///< per-window / pairwise acceptance
    float high_threshold = 0.40f;  ///< fast-path auto-accept
    float low_threshold = 0.10f;   ///< fast-path auto-reject

    /// Each value within [-1, 1] and low <= threshold <= high
    bool is_valid(std::string* reason = nullptr) const;
};

/// Score reported by a slow-path reject in which every window was silent.
/// Strictly below any cosine similarity; windows_evaluated is 0 alongside it.
constexpr float kNoScore = -2.0f;

struct VerifyResult {
    std::optional<std::vector<float>> audio;  ///< audio to transcribe; nullopt when rejected
    bool is_user = true;
    float score = 0.0f;         ///< fast-path score, or max window score on the slow path
    VerifyPath path = VerifyPath::Bypass;
    int windows_evaluated = 0;  ///< slow path only: windows that were embedded and scored
};

/// Slow-path segmentation parameters (seconds, converted with the call's sample rate)
struct SegmentationParams {
    static constexpr double kWindowSeconds = 2.0;
    static constexpr double kHopSeconds = 1.0;
    static constexpr double kMinTailSeconds = 0.5;
    static constexpr double kSilenceRms = 0.005;
};

/// Two-tier speaker verification against an enrolled centroid.
///
/// Fast path: one embedding of the whole buffer compared with the centroid.
/// Scores at or above high_threshold accept the full buffer, scores at or below
/// low_threshold reject it. Anything in between goes to the slow path: 2s
/// windows with a 1s hop (plus a trailing segment of at least 0.5s), silent
/// windows skipped, and the samples of every window scoring >= threshold kept.
///
/// Errors from the extractor propagate; the caller decides how to fail open.
///
/// Thread Safety:
/// - Thresholds and centroid may be replaced from any thread; verify() works
///   on a snapshot taken at entry.
/// - Extractor calls (verify, enroll, load, unload) are serialized.
class SpeakerVerifier {
public:
    explicit SpeakerVerifier(std::unique_ptr<IEmbeddingExtractor> extractor,
                             const core::EnrollmentConfig& enrollment = core::EnrollmentConfig{});

    SpeakerVerifier(const SpeakerVerifier&) = delete;
    SpeakerVerifier& operator=(const SpeakerVerifier&) = delete;

    //==========================================================================
    // Lifecycle
    //==========================================================================

    /// Load the extractor once; later calls are no-ops. Throws EmbeddingError.
    void load_model();
    void unload_model();

    bool is_ready() const { return m_loaded.load(); }
    bool is_enrolled() const;
    VerifierState state() const;

    //==========================================================================
    // Configuration
    //==========================================================================

    /// Takes effect on the next verify(). Invalid orderings are rejected and
    /// the previous thresholds stay in force.
    /// @return false if rejected
    bool update_thresholds(float threshold, float high, float low);
    VerificationThresholds thresholds() const;

    //==========================================================================
    // Enrollment
    //==========================================================================

    /// Load the centroid from the store (clears it when none is stored).
    /// @return true if a centroid is now active. Throws StorageError.
    bool load_enrollment(const EnrollmentStore& store);
    void set_centroid(Embedding centroid);
    void clear_enrollment();
    std::optional<Embedding> centroid() const;

    /// Validate and persist a new enrollment; on success the centroid is
    /// active immediately. Throws EmbeddingError / StorageError.
    EnrollmentResult enroll(const std::vector<std::vector<float>>& samples,
                            int sample_rate,
                            EnrollmentStore& store);

    //==========================================================================
    // Verification
    //==========================================================================

    /// Throws std::invalid_argument for sample_rate <= 0, whatever the state
    VerifyResult verify(const std::vector<float>& audio, int sample_rate);

    const IEmbeddingExtractor& extractor() const { return *m_extractor; }

private:
    std::unique_ptr<IEmbeddingExtractor> m_extractor;
    EnrollmentManager m_enrollment;

    mutable std::mutex m_state_mutex;    // guards m_centroid, m_thresholds
    std::shared_ptr<const Embedding> m_centroid;
    VerificationThresholds m_thresholds;

    std::mutex m_model_mutex;            // serializes extractor access
    std::atomic<bool> m_loaded{false};

    // Caller holds m_model_mutex
    float score_segment(const float* samples, size_t n, int sample_rate, const Embedding& centroid);

    VerifyResult slow_path(const std::vector<float>& audio, int sample_rate,
                           const Embedding& centroid, const VerificationThresholds& thr,
                           float whole_buffer_score);
};

} // namespace spk
