#include "inference-backend.h"

RoutingSynthesizer::RoutingSynthesizer(std::unique_ptr<SpeechSynthesizer> builtin_backend,
                                       std::unique_ptr<SpeechSynthesizer> clone_backend)
    : builtin_backend_(std::move(builtin_backend)), clone_backend_(std::move(clone_backend)) {}

SpeechSynthesizer* RoutingSynthesizer::route(const VoiceIdentity& voice) const {
    SpeechSynthesizer* backend = voice.sample_path.empty() ? builtin_backend_.get() : clone_backend_.get();
    if (backend && backend->supports(voice)) return backend;
    return nullptr;
}

bool RoutingSynthesizer::synthesize(const SynthesisRequest& request, const std::string& output_path,
                                    std::string& error) {
    SpeechSynthesizer* backend = route(request.voice);
    if (!backend) {
        error = request.voice.sample_path.empty()
            ? "no synthesizer configured for built-in voice '" + request.voice.id + "'"
            : "voice cloning is not configured (no clone command)";
        return false;
    }
    return backend->synthesize(request, output_path, error);
}

bool RoutingSynthesizer::is_ready() const {
    // Ready when at least one configured backend can serve requests
    return (builtin_backend_ && builtin_backend_->is_ready()) ||
           (clone_backend_ && clone_backend_->is_ready());
}

bool RoutingSynthesizer::supports(const VoiceIdentity& voice) const {
    return route(voice) != nullptr;
}
