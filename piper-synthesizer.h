#pragma once

#include "inference-backend.h"
#include <string>
#include <map>

// Forward declarations for Piper C API
struct piper_synthesizer;

struct PiperSynthesizerConfig {
    std::string model_path = "models/voice.onnx";
    std::string config_path = "";  // Auto-generated from model_path + .json
    std::string espeak_data_path = "espeak-ng-data";
    float length_scale = 0.90f;
    float noise_scale = 0.667f;
    float noise_w_scale = 0.8f;
    bool verbose = false;
};

// Built-in voices through libpiper. Each built-in voice id maps to a speaker
// of the loaded model; output is a PCM16 mono WAV file.
class PiperSynthesizer : public SpeechSynthesizer {
public:
    explicit PiperSynthesizer(const PiperSynthesizerConfig& config);
    ~PiperSynthesizer() override;

    PiperSynthesizer(const PiperSynthesizer&) = delete;
    PiperSynthesizer& operator=(const PiperSynthesizer&) = delete;

    bool load();

    bool synthesize(const SynthesisRequest& request, const std::string& output_path,
                    std::string& error) override;
    bool is_ready() const override { return synthesizer_ != nullptr; }
    bool supports(const VoiceIdentity& voice) const override { return voice.builtin; }

private:
    PiperSynthesizerConfig config_;
    piper_synthesizer* synthesizer_;
};
