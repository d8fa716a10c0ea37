// Application API - Verification Controller Implementation

#include "app/verification_controller.hpp"
#include "core/logging.hpp"
#include "spk/errors.hpp"

#include <mutex>

namespace app {

const char* to_string(PipelineState state) {
    switch (state) {
        case PipelineState::VERIFYING:   return "verifying";
        case PipelineState::FILTERED:    return "filtered";
        case PipelineState::RECOGNIZING: return "recognizing";
        case PipelineState::ERROR:       return "error";
    }
    return "unknown";
}

const char* to_string(GateDecision::Action action) {
    switch (action) {
        case GateDecision::Action::TOO_SHORT:    return "too_short";
        case GateDecision::Action::PASS_THROUGH: return "pass_through";
        case GateDecision::Action::TRANSCRIBE:   return "transcribe";
        case GateDecision::Action::FILTERED:     return "filtered";
        case GateDecision::Action::FAIL_OPEN:    return "fail_open";
    }
    return "unknown";
}

//==============================================================================
// Implementation Class (PIMPL Pattern)
//==============================================================================

class VerificationControllerImpl {
public:
    VerificationControllerImpl(ExtractorFactory factory, std::string speaker_dir)
        : factory_(std::move(factory)), store_(std::move(speaker_dir)) {}

    ~VerificationControllerImpl() {
        std::shared_ptr<spk::SpeakerVerifier> verifier;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            verifier.swap(verifier_);
        }
        if (verifier) verifier->unload_model();
    }

    bool apply_config(const core::Config& config);
    GateDecision process_utterance(const std::vector<float>& audio, int sample_rate);
    spk::EnrollmentResult enroll(const std::vector<std::vector<float>>& samples, int sample_rate);
    bool reset_enrollment();
    VerificationStatus get_status() const;

    void subscribe_to_state(StateCallback callback);
    void clear_subscriptions();

private:
    ExtractorFactory factory_;
    spk::EnrollmentStore store_;

    // Internal state
    mutable std::mutex state_mutex_;
    core::Config config_;
    std::shared_ptr<spk::SpeakerVerifier> verifier_;   // non-null only while enabled

    // Callbacks
    mutable std::mutex callbacks_mutex_;
    std::vector<StateCallback> state_callbacks_;

    std::shared_ptr<spk::SpeakerVerifier> create_verifier(const core::Config& config) const;
    void emit_state(PipelineState state, const std::string& detail = "");
};

std::shared_ptr<spk::SpeakerVerifier>
VerificationControllerImpl::create_verifier(const core::Config& config) const {
    auto verifier = std::make_shared<spk::SpeakerVerifier>(factory_(config), config.enrollment);
    const auto& sv = config.speaker_verification;
    verifier->update_thresholds(sv.threshold, sv.high_threshold, sv.low_threshold);
    return verifier;
}

//==============================================================================
// Configuration Implementation
//==============================================================================

bool VerificationControllerImpl::apply_config(const core::Config& config) {
    std::shared_ptr<spk::SpeakerVerifier> to_unload;
    std::shared_ptr<spk::SpeakerVerifier> verifier;
    bool ok = true;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        const auto& prev = config_.speaker_verification;
        const auto& next = config.speaker_verification;
        const bool model_changed = prev.embedding_mode != next.embedding_mode ||
                                   prev.model_path != next.model_path ||
                                   config_.audio.sample_rate != config.audio.sample_rate;
        config_ = config;

        if (verifier_ && (!next.enabled || model_changed)) {
            to_unload.swap(verifier_);
        }
        if (next.enabled && !verifier_) {
            try {
                verifier_ = create_verifier(config);
            } catch (const std::exception& e) {
                core::log_error(std::string("[VerificationController] Cannot create embedder: ") + e.what());
                ok = false;
            }
        }
        verifier = verifier_;
    }

    if (to_unload) {
        to_unload->unload_model();
        core::log_info("[VerificationController] Speaker verifier unloaded");
    }
    if (!verifier) {
        return ok;
    }

    const auto& sv = config.speaker_verification;
    if (!verifier->update_thresholds(sv.threshold, sv.high_threshold, sv.low_threshold)) {
        ok = false;
    }

    try {
        verifier->load_model();
        verifier->load_enrollment(store_);
    } catch (const std::exception& e) {
        // verify() bypasses until the model loads, so dictation is never blocked
        core::log_error(std::string("[VerificationController] Speaker verification unavailable: ") + e.what());
        return false;
    }
    core::log_info(core::format("[VerificationController] Speaker verification active (%s, %s)",
                                sv.embedding_mode.c_str(), spk::to_string(verifier->state())));
    return ok;
}

//==============================================================================
// Pipeline Implementation
//==============================================================================

GateDecision VerificationControllerImpl::process_utterance(const std::vector<float>& audio, int sample_rate) {
    GateDecision decision;

    std::shared_ptr<spk::SpeakerVerifier> verifier;
    float min_duration = 0.0f;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        verifier = verifier_;
        min_duration = config_.audio.min_duration;
    }

    if (sample_rate <= 0 || audio.empty() ||
        static_cast<double>(audio.size()) / sample_rate < min_duration) {
        decision.action = GateDecision::Action::TOO_SHORT;
        return decision;
    }

    if (!verifier) {
        decision.action = GateDecision::Action::PASS_THROUGH;
        decision.audio = audio;
        emit_state(PipelineState::RECOGNIZING);
        return decision;
    }

    emit_state(PipelineState::VERIFYING);
    try {
        spk::VerifyResult result = verifier->verify(audio, sample_rate);
        if (!result.is_user) {
            core::log_info(core::format("[VerificationController] Speaker filtered: path=%s, score=%.4f",
                                        spk::to_string(result.path), static_cast<double>(result.score)));
            decision.action = GateDecision::Action::FILTERED;
            decision.result = std::move(result);
            emit_state(PipelineState::FILTERED);
            return decision;
        }
        decision.action = result.path == spk::VerifyPath::Bypass ? GateDecision::Action::PASS_THROUGH
                                                                 : GateDecision::Action::TRANSCRIBE;
        decision.audio = result.audio ? *result.audio : audio;
        decision.result = std::move(result);
    } catch (const std::exception& e) {
        core::log_error(std::string("[VerificationController] Speaker verification failed, proceeding with ASR: ") +
                        e.what());
        decision = GateDecision{};
        decision.action = GateDecision::Action::FAIL_OPEN;
        decision.audio = audio;
        decision.error = e.what();
    }

    emit_state(PipelineState::RECOGNIZING);
    return decision;
}

//==============================================================================
// Enrollment Implementation
//==============================================================================

spk::EnrollmentResult VerificationControllerImpl::enroll(const std::vector<std::vector<float>>& samples,
                                                         int sample_rate) {
    std::shared_ptr<spk::SpeakerVerifier> verifier;
    core::Config config;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        verifier = verifier_;
        config = config_;
    }

    spk::EnrollmentResult result;
    const bool temporary = !verifier;
    try {
        if (temporary) {
            verifier = create_verifier(config);
        }
        verifier->load_model();
        result = verifier->enroll(samples, sample_rate, store_);
    } catch (const std::exception& e) {
        core::log_error(std::string("[VerificationController] Enrollment failed: ") + e.what());
        result = spk::EnrollmentResult{};
        result.message = std::string("Enrollment failed: ") + e.what();
    }

    if (temporary && verifier) {
        verifier->unload_model();
    }

    if (!result.success) {
        emit_state(PipelineState::ERROR, result.message);
    }
    return result;
}

bool VerificationControllerImpl::reset_enrollment() {
    std::shared_ptr<spk::SpeakerVerifier> verifier;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        verifier = verifier_;
    }
    if (verifier) verifier->clear_enrollment();
    return store_.clear();
}

VerificationStatus VerificationControllerImpl::get_status() const {
    VerificationStatus status;
    std::shared_ptr<spk::SpeakerVerifier> verifier;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        verifier = verifier_;
        const auto& sv = config_.speaker_verification;
        status.enabled = sv.enabled;
        status.embedder = sv.embedding_mode;
        status.thresholds = spk::VerificationThresholds{sv.threshold, sv.high_threshold, sv.low_threshold};
    }
    if (verifier) {
        status.state = verifier->state();
        status.thresholds = verifier->thresholds();
    }
    status.enrolled_on_disk = store_.has_enrollment();
    try {
        status.metadata = store_.load_metadata();
    } catch (const spk::StorageError& e) {
        core::log_warn(std::string("[VerificationController] ") + e.what());
    }
    return status;
}

//==============================================================================
// Event Subscription Implementation
//==============================================================================

void VerificationControllerImpl::subscribe_to_state(StateCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    state_callbacks_.push_back(std::move(callback));
}

void VerificationControllerImpl::clear_subscriptions() {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    state_callbacks_.clear();
}

void VerificationControllerImpl::emit_state(PipelineState state, const std::string& detail) {
    std::vector<StateCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks = state_callbacks_;
    }
    for (const auto& cb : callbacks) {
        cb(state, detail);
    }
}

//==============================================================================
// Public API Forwarding
//==============================================================================

VerificationController::VerificationController(ExtractorFactory factory, std::string speaker_dir)
    : m_impl(std::make_unique<VerificationControllerImpl>(std::move(factory), std::move(speaker_dir))) {}

VerificationController::~VerificationController() = default;

bool VerificationController::apply_config(const core::Config& config) {
    return m_impl->apply_config(config);
}

GateDecision VerificationController::process_utterance(const std::vector<float>& audio, int sample_rate) {
    return m_impl->process_utterance(audio, sample_rate);
}

spk::EnrollmentResult VerificationController::enroll(const std::vector<std::vector<float>>& samples,
                                                     int sample_rate) {
    return m_impl->enroll(samples, sample_rate);
}

bool VerificationController::reset_enrollment() {
    return m_impl->reset_enrollment();
}

VerificationStatus VerificationController::get_status() const {
    return m_impl->get_status();
}

void VerificationController::subscribe_to_state(StateCallback callback) {
    m_impl->subscribe_to_state(std::move(callback));
}

void VerificationController::clear_subscriptions() {
    m_impl->clear_subscriptions();
}

} // namespace app
