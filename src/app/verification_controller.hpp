// Application API - Verification Controller Interface
//
// Single integration point between the recording/transcription pipeline and
// speaker verification. Owns the verifier lifecycle and applies the
// fail-open policy: any verification failure lets the utterance through.

#pragma once

#include "core/config.hpp"
#include "spk/embedding_extractor.hpp"
#include "spk/enrollment_manager.hpp"
#include "spk/enrollment_store.hpp"
#include "spk/speaker_verifier.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace app {

// Forward declarations
class VerificationControllerImpl;

//==============================================================================
// Event Structures
//==============================================================================

/// Pipeline state reported to the UI layer
enum class PipelineState {
    VERIFYING,      ///< Speaker verification in progress
    FILTERED,       ///< Utterance discarded: not the enrolled speaker
    RECOGNIZING,    ///< Audio handed to transcription
    ERROR           ///< Enrollment or configuration failure
};

const char* to_string(PipelineState state);

/// What the pipeline should do with one captured utterance
struct GateDecision {
    enum class Action {
        TOO_SHORT,      ///< Below audio.min_duration; drop without verifying
        PASS_THROUGH,   ///< Verification disabled or bypassed; original audio
        TRANSCRIBE,     ///< Enrolled speaker detected; audio may be filtered
        FILTERED,       ///< Rejected; nothing to transcribe
        FAIL_OPEN       ///< Verification failed; original audio
    };

    Action action = Action::PASS_THROUGH;
    std::vector<float> audio;                   ///< Audio to transcribe (empty unless should_transcribe())
    std::optional<spk::VerifyResult> result;    ///< Set whenever verify() returned
    std::string error;                          ///< Set for FAIL_OPEN

    bool should_transcribe() const {
        return action == Action::PASS_THROUGH || action == Action::TRANSCRIBE ||
               action == Action::FAIL_OPEN;
    }
};

const char* to_string(GateDecision::Action action);

/// Snapshot for status displays
struct VerificationStatus {
    bool enabled = false;
    spk::VerifierState state = spk::VerifierState::Unloaded;
    bool enrolled_on_disk = false;
    std::optional<spk::EnrollmentMetadata> metadata;
    spk::VerificationThresholds thresholds;
    std::string embedder;                       ///< Active embedding_mode
};

//==============================================================================
// Callback Types
//==============================================================================

using StateCallback = std::function<void(PipelineState, const std::string& detail)>;
using ExtractorFactory = std::function<std::unique_ptr<spk::IEmbeddingExtractor>(const core::Config&)>;

//==============================================================================
// Main Controller Class
//==============================================================================

/// Example:
/// @code
/// VerificationController gate(spk::make_embedder, core::speaker_dir(home));
/// gate.apply_config(cfg);
/// auto decision = gate.process_utterance(samples, 16000);
/// if (decision.should_transcribe()) transcribe(decision.audio);
/// @endcode
class VerificationController {
public:
    VerificationController(ExtractorFactory factory, std::string speaker_dir);
    ~VerificationController();

    // Non-copyable, non-movable
    VerificationController(const VerificationController&) = delete;
    VerificationController& operator=(const VerificationController&) = delete;
    VerificationController(VerificationController&&) = delete;
    VerificationController& operator=(VerificationController&&) = delete;

    //==========================================================================
    // Configuration
    //==========================================================================

    /// Apply settings: load the model and enrollment when verification becomes
    /// enabled, unload when disabled, hot-reload thresholds otherwise.
    /// @return false if the model failed to load or thresholds were rejected
    bool apply_config(const core::Config& config);

    //==========================================================================
    // Pipeline
    //==========================================================================

    /// Decide what to transcribe for one utterance. Never throws on
    /// verification failure; that case yields FAIL_OPEN with the original audio.
    GateDecision process_utterance(const std::vector<float>& audio, int sample_rate);

    //==========================================================================
    // Enrollment
    //==========================================================================

    /// Enroll from guided samples. When verification is disabled a temporary
    /// model is loaded for the duration of the call.
    /// Failures, including I/O errors, come back as success=false with a message.
    spk::EnrollmentResult enroll(const std::vector<std::vector<float>>& samples, int sample_rate);

    /// Delete the stored enrollment and deactivate the centroid
    bool reset_enrollment();

    VerificationStatus get_status() const;

    //==========================================================================
    // Event Subscription
    //==========================================================================

    void subscribe_to_state(StateCallback callback);
    void clear_subscriptions();

private:
    std::unique_ptr<VerificationControllerImpl> m_impl;
};

} // namespace app
