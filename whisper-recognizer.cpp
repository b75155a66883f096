#include "whisper-recognizer.h"
#include <iostream>
#include <vector>
#include <chrono>
#include <sys/stat.h>

#include <whisper.h>

WhisperRecognizer::WhisperRecognizer(const WhisperRecognizerConfig& config)
    : config_(config), ctx_(nullptr) {}

WhisperRecognizer::~WhisperRecognizer() {
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

bool WhisperRecognizer::load() {
    if (ctx_) return true;

    // Validate model file exists
    struct stat file_stat;
    if (stat(config_.model_path.c_str(), &file_stat) != 0) {
        std::cout << "❌ Model file not found: " << config_.model_path << std::endl;
        return false;
    }

    std::cout << "⏳ Preloading Whisper model: " << config_.model_path << std::endl;
    auto t0 = std::chrono::steady_clock::now();
    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = config_.use_gpu;
    cparams.gpu_device = 0;
    cparams.dtw_token_timestamps = false;
    ctx_ = whisper_init_from_file_with_params(config_.model_path.c_str(), cparams);
    if (!ctx_) {
        std::cout << "❌ Whisper preload failed for model: " << config_.model_path << std::endl;
        return false;
    }
    auto t1 = std::chrono::steady_clock::now();
    std::cout << "✅ Whisper model preloaded in "
              << std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count()
              << " ms" << std::endl;

    warm_up();
    return true;
}

// Warm-up inference to allocate compute graphs before the first session
void WhisperRecognizer::warm_up() {
    std::vector<float> silence(16000, 0.0f); // ~1s @16kHz
    whisper_full_params wp = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wp.no_timestamps = true;
    wp.print_progress = false;
    wp.print_realtime = false;
    int wres = whisper_full(ctx_, wp, silence.data(), silence.size());
    if (wres == 0) {
        std::cout << "✅ Whisper warm-up inference completed" << std::endl;
    } else {
        std::cout << "⚠️ Whisper warm-up failed (non-fatal)" << std::endl;
    }
}

bool WhisperRecognizer::recognize(const uint8_t* pcm, size_t length, const AudioFormat& format,
                                  std::string& text, std::string& error) {
    text.clear();
    if (!ctx_) {
        error = "whisper model not loaded";
        return false;
    }
    if (format.bits_per_sample != 16 || format.channels != 1 || format.sample_rate != WHISPER_SAMPLE_RATE) {
        error = "unsupported audio format (expected 16 kHz mono PCM16)";
        return false;
    }

    // PCM16 little-endian -> float [-1, 1)
    const size_t n_samples = length / 2;
    std::vector<float> samples(n_samples);
    for (size_t i = 0; i < n_samples; ++i) {
        int16_t s = static_cast<int16_t>(pcm[2 * i] | (pcm[2 * i + 1] << 8));
        samples[i] = static_cast<float>(s) / 32768.0f;
    }

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.language = config_.language.c_str();
    wparams.n_threads = config_.n_threads;
    wparams.temperature = 0.0f;
    wparams.no_timestamps = true;
    wparams.translate = false;
    wparams.print_progress = false;
    wparams.print_realtime = false;

    int result = whisper_full(ctx_, wparams, samples.data(), static_cast<int>(samples.size()));
    if (result != 0) {
        error = "whisper_full failed with code " + std::to_string(result);
        return false;
    }

    const int n_segments = whisper_full_n_segments(ctx_);
    for (int i = 0; i < n_segments; ++i) {
        const char* segment = whisper_full_get_segment_text(ctx_, i);
        if (segment) {
            text += segment;
        }
    }

    if (config_.verbose) {
        std::cout << "🎤 Whisper: " << n_segments << " segments for "
                  << format.seconds_for_bytes(length) << "s audio" << std::endl;
    }
    return true;
}
