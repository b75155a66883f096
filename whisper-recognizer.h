#pragma once

#include "inference-backend.h"
#include <string>
#include <cstdint>

struct whisper_context;

struct WhisperRecognizerConfig {
    std::string model_path = "models/ggml-base.bin";
    std::string language = "auto";
    int n_threads = 4;
    bool use_gpu = true;
    bool verbose = false;
};

// whisper.cpp recognition over one preloaded context. The context is loaded
// eagerly by load() and warmed with one second of silence.
class WhisperRecognizer : public SpeechRecognizer {
public:
    explicit WhisperRecognizer(const WhisperRecognizerConfig& config);
    ~WhisperRecognizer() override;

    WhisperRecognizer(const WhisperRecognizer&) = delete;
    WhisperRecognizer& operator=(const WhisperRecognizer&) = delete;

    bool load();

    bool recognize(const uint8_t* pcm, size_t length, const AudioFormat& format,
                   std::string& text, std::string& error) override;
    bool is_ready() const override { return ctx_ != nullptr; }

private:
    WhisperRecognizerConfig config_;
    whisper_context* ctx_;

    void warm_up();
};
