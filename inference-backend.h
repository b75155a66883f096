#pragma once

#include <string>
#include <vector>
#include <memory>
#include <cstddef>
#include <cstdint>

// Opaque model capabilities used by the speech service.
// Implementations are NOT required to be reentrant or thread-safe: the
// ModelCoordinator is the only caller and never overlaps two calls.

struct AudioFormat {
    int sample_rate = 16000;
    int bits_per_sample = 16;
    int channels = 1;

    size_t bytes_per_frame() const { return static_cast<size_t>(bits_per_sample / 8) * channels; }
    size_t bytes_per_second() const { return bytes_per_frame() * sample_rate; }

    // Byte count for a duration, rounded down to whole sample frames
    size_t bytes_for_ms(int ms) const {
        if (ms <= 0) return 0;
        size_t frames = static_cast<size_t>(sample_rate) * static_cast<size_t>(ms) / 1000;
        return frames * bytes_per_frame();
    }

    double seconds_for_bytes(size_t n) const {
        size_t bps = bytes_per_second();
        return bps ? static_cast<double>(n) / static_cast<double>(bps) : 0.0;
    }
};

// A built-in voice (piper speaker) or a registered cloned voice backed by a sample.
struct VoiceIdentity {
    std::string id;
    std::string display_name;
    std::string sample_path;   // empty for built-in voices
    int speaker_id = 0;        // built-in voices only
    bool builtin = false;
};

struct SynthesisRequest {
    std::string text;
    VoiceIdentity voice;
    float emo_alpha = 1.0f;
    bool use_emo_text = false;
};

class SpeechRecognizer {
public:
    virtual ~SpeechRecognizer() = default;

    // Recognize PCM audio. Returns false and fills error on failure.
    virtual bool recognize(const uint8_t* pcm, size_t length, const AudioFormat& format,
                           std::string& text, std::string& error) = 0;
    virtual bool is_ready() const = 0;
};

class SpeechSynthesizer {
public:
    virtual ~SpeechSynthesizer() = default;

    // Synthesize request.text into a complete audio file at output_path.
    virtual bool synthesize(const SynthesisRequest& request, const std::string& output_path,
                            std::string& error) = 0;
    virtual bool is_ready() const = 0;
    virtual bool supports(const VoiceIdentity& voice) const = 0;
    virtual std::string output_format() const { return "wav"; }
};

// Sends sample-backed (cloned) voices to one backend and built-in voices to another.
// Either side may be null when that backend is not configured.
class RoutingSynthesizer : public SpeechSynthesizer {
public:
    RoutingSynthesizer(std::unique_ptr<SpeechSynthesizer> builtin_backend,
                       std::unique_ptr<SpeechSynthesizer> clone_backend);

    bool synthesize(const SynthesisRequest& request, const std::string& output_path,
                    std::string& error) override;
    bool is_ready() const override;
    bool supports(const VoiceIdentity& voice) const override;

private:
    std::unique_ptr<SpeechSynthesizer> builtin_backend_;
    std::unique_ptr<SpeechSynthesizer> clone_backend_;

    SpeechSynthesizer* route(const VoiceIdentity& voice) const;
};
