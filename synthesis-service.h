#pragma once

#include "inference-backend.h"
#include <string>
#include <vector>
#include <atomic>
#include <cstdint>

class ModelCoordinator;
class SynthesisCache;
class VoiceRegistry;
class ForegroundTracker;

struct SynthesisOutcome {
    std::vector<uint8_t> audio;
    std::string format;
    std::string voice_id;
    bool cached = false;
};

// Cache-first synthesis shared by every connection and by the preload task.
// Foreground calls are counted in the ForegroundTracker for their whole
// duration, cache lookup included; prewarm() is not.
class SynthesisService {
public:
    SynthesisService(ModelCoordinator& coordinator, SynthesisCache& cache,
                     VoiceRegistry& registry, ForegroundTracker& foreground,
                     const std::string& scratch_dir = "", bool verbose = false);

    bool synthesize(const std::string& text, const std::string& voice_id,
                    float emo_alpha, bool use_emo_text,
                    SynthesisOutcome& outcome, std::string& error, const std::string& who);

    // Synthesizes with an ad hoc reference sample that is not registered
    bool clone_and_speak(const std::string& text, const std::vector<uint8_t>& sample,
                         const std::string& voice_label, float emo_alpha, bool use_emo_text,
                         SynthesisOutcome& outcome, std::string& error, const std::string& who);

    // Registers (or replaces) a cloned voice and drops its cached audio
    bool register_voice(const std::string& voice_id, const std::string& display_name,
                        const std::vector<uint8_t>& sample, std::string& error, const std::string& who);

    std::vector<VoiceIdentity> list_voices() const;

    // Background cache fill. already_cached is set when nothing had to be synthesized.
    bool prewarm(const std::string& text, const VoiceIdentity& voice, bool& already_cached, std::string& error);

    static std::string cache_voice_key(const VoiceIdentity& voice);

    uint64_t cache_hits() const { return cache_hits_.load(); }
    uint64_t synthesized() const { return synthesized_.load(); }

private:
    ModelCoordinator& coordinator_;
    SynthesisCache& cache_;
    VoiceRegistry& registry_;
    ForegroundTracker& foreground_;
    std::string scratch_dir_;
    bool verbose_;

    std::atomic<uint64_t> cache_hits_{0};
    std::atomic<uint64_t> synthesized_{0};

    bool run_cached(const SynthesisRequest& request, const std::string& voice_key,
                    SynthesisOutcome& outcome, std::string& error, const std::string& who);
};
