#include "synthesis-service.h"
#include "model-coordinator.h"
#include "synthesis-cache.h"
#include "voice-registry.h"
#include "foreground-tracker.h"
#include "chunk-transcriber.h"
#include "transient-file.h"
#include <iostream>

// Emotion settings are not part of the cache key, so only default-styled
// requests are served from or stored into the cache.
static bool cacheable(const SynthesisRequest& request) {
    return request.emo_alpha == 1.0f && !request.use_emo_text;
}

SynthesisService::SynthesisService(ModelCoordinator& coordinator, SynthesisCache& cache,
                                   VoiceRegistry& registry, ForegroundTracker& foreground,
                                   const std::string& scratch_dir, bool verbose)
    : coordinator_(coordinator), cache_(cache), registry_(registry), foreground_(foreground),
      scratch_dir_(scratch_dir), verbose_(verbose) {}

std::string SynthesisService::cache_voice_key(const VoiceIdentity& voice) {
    return voice.builtin ? "builtin:" + voice.id : voice.id;
}

bool SynthesisService::run_cached(const SynthesisRequest& request, const std::string& voice_key,
                                  SynthesisOutcome& outcome, std::string& error, const std::string& who) {
    const bool use_cache = cacheable(request);

    if (use_cache && cache_.lookup(request.text, voice_key, outcome.audio)) {
        outcome.cached = true;
        outcome.format = coordinator_.output_format();
        cache_hits_++;
        if (verbose_) {
            std::cout << "⚡ [" << who << "] Cache hit for voice " << request.voice.id
                      << " (" << outcome.audio.size() << " bytes)" << std::endl;
        }
        return true;
    }

    outcome.cached = false;
    if (!coordinator_.supports_voice(request.voice)) {
        error = "no synthesizer available for voice '" + request.voice.id + "'";
        return false;
    }

    // Read before the sample is: a re-registration during synthesis makes the result uncacheable
    const uint64_t generation = cache_.generation(voice_key);
    if (!coordinator_.synthesize(request, outcome.audio, outcome.format, error, who)) {
        return false;
    }
    synthesized_++;

    if (use_cache && !cache_.store(request.text, voice_key, outcome.audio, generation) && cache_.enabled()) {
        std::cout << "🗑️ [" << who << "] Voice " << request.voice.id
                  << " was re-registered during synthesis, result not cached" << std::endl;
    }
    return true;
}

bool SynthesisService::synthesize(const std::string& text, const std::string& voice_id,
                                  float emo_alpha, bool use_emo_text,
                                  SynthesisOutcome& outcome, std::string& error, const std::string& who) {
    ForegroundScope foreground(foreground_);

    SynthesisRequest request;
    request.text = trim_whitespace(text);
    if (request.text.empty()) {
        error = "text is required";
        return false;
    }

    if (!registry_.find(voice_id, request.voice)) {
        error = "unknown voice: " + voice_id;
        return false;
    }
    request.emo_alpha = emo_alpha;
    request.use_emo_text = use_emo_text;

    outcome.voice_id = request.voice.id;
    return run_cached(request, cache_voice_key(request.voice), outcome, error, who);
}

bool SynthesisService::clone_and_speak(const std::string& text, const std::vector<uint8_t>& sample,
                                       const std::string& voice_label, float emo_alpha, bool use_emo_text,
                                       SynthesisOutcome& outcome, std::string& error, const std::string& who) {
    ForegroundScope foreground(foreground_);

    SynthesisRequest request;
    request.text = trim_whitespace(text);
    if (request.text.empty()) {
        error = "text is required";
        return false;
    }
    if (sample.empty()) {
        error = "voice_sample is required";
        return false;
    }

    // Reference sample lives only as long as this call
    TransientFile sample_file(scratch_dir_, ".wav");
    if (!sample_file.valid() || !sample_file.write_all(sample)) {
        error = "cannot store voice sample";
        return false;
    }

    request.voice.id = voice_label.empty() ? "clone" : voice_label;
    request.voice.display_name = request.voice.id;
    request.voice.sample_path = sample_file.path();
    request.voice.builtin = false;
    request.emo_alpha = emo_alpha;
    request.use_emo_text = use_emo_text;

    outcome.voice_id = request.voice.id;
    return run_cached(request, "sample:" + sha256_hex(sample), outcome, error, who);
}

bool SynthesisService::register_voice(const std::string& voice_id, const std::string& display_name,
                                      const std::vector<uint8_t>& sample, std::string& error,
                                      const std::string& who) {
    ForegroundScope foreground(foreground_);

    VoiceIdentity voice;
    if (!registry_.register_voice(voice_id, display_name, sample, voice, error)) {
        std::cout << "❌ [" << who << "] Voice registration failed: " << error << std::endl;
        return false;
    }

    size_t dropped = cache_.invalidate_voice(cache_voice_key(voice));
    if (dropped > 0) {
        std::cout << "🗑️ [" << who << "] Dropped " << dropped << " cached clips for voice " << voice_id << std::endl;
    }
    return true;
}

std::vector<VoiceIdentity> SynthesisService::list_voices() const {
    return registry_.list();
}

bool SynthesisService::prewarm(const std::string& text, const VoiceIdentity& voice, bool& already_cached,
                               std::string& error) {
    SynthesisRequest request;
    request.text = trim_whitespace(text);
    request.voice = voice;

    const std::string voice_key = cache_voice_key(voice);
    already_cached = cache_.contains(request.text, voice_key);
    if (already_cached) return true;

    SynthesisOutcome outcome;
    return run_cached(request, voice_key, outcome, error, "preload");
}
