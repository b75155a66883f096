#include "piper-synthesizer.h"
#include <iostream>
#include <fstream>
#include <vector>
#include <chrono>
#include <algorithm>
#include <exception>
#include <cstdint>
#include <sys/stat.h>

// Include Piper C API
extern "C" {
#include "piper.h"
}

static void put_u32(std::ofstream& f, uint32_t v) {
    uint8_t b[4] = {(uint8_t)(v & 0xFF), (uint8_t)((v >> 8) & 0xFF), (uint8_t)((v >> 16) & 0xFF), (uint8_t)((v >> 24) & 0xFF)};
    f.write(reinterpret_cast<const char*>(b), 4);
}

static void put_u16(std::ofstream& f, uint16_t v) {
    uint8_t b[2] = {(uint8_t)(v & 0xFF), (uint8_t)((v >> 8) & 0xFF)};
    f.write(reinterpret_cast<const char*>(b), 2);
}

// Canonical 44-byte header, PCM16 mono, little-endian
static bool write_pcm16_wav(const std::string& path, const std::vector<int16_t>& samples, int sample_rate) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) return false;

    const uint32_t data_size = static_cast<uint32_t>(samples.size() * 2);
    f.write("RIFF", 4);
    put_u32(f, 36 + data_size);
    f.write("WAVE", 4);
    f.write("fmt ", 4);
    put_u32(f, 16);
    put_u16(f, 1);                  // PCM
    put_u16(f, 1);                  // mono
    put_u32(f, static_cast<uint32_t>(sample_rate));
    put_u32(f, static_cast<uint32_t>(sample_rate) * 2);
    put_u16(f, 2);                  // block align
    put_u16(f, 16);
    f.write("data", 4);
    put_u32(f, data_size);
    for (int16_t s : samples) {
        put_u16(f, static_cast<uint16_t>(s));
    }
    return bool(f);
}

PiperSynthesizer::PiperSynthesizer(const PiperSynthesizerConfig& config)
    : config_(config), synthesizer_(nullptr) {}

PiperSynthesizer::~PiperSynthesizer() {
    if (synthesizer_) {
        piper_free(synthesizer_);
        synthesizer_ = nullptr;
    }
}

bool PiperSynthesizer::load() {
    if (synthesizer_) return true;

    std::string cfg = config_.config_path.empty() ? (config_.model_path + ".json") : config_.config_path;

    // Validate config file exists and is non-empty to avoid JSON parse errors inside libpiper
    struct stat st{};
    if (stat(cfg.c_str(), &st) != 0 || st.st_size == 0) {
        std::cout << "❌ Piper config JSON missing or empty: " << cfg << std::endl;
        return false;
    }

    std::cout << "⏳ Preloading Piper synthesizer: " << config_.model_path << std::endl;
    auto t0 = std::chrono::steady_clock::now();
    try {
        synthesizer_ = piper_create(
            config_.model_path.c_str(),
            cfg.c_str(),
            config_.espeak_data_path.c_str()
        );
    } catch (const std::exception& e) {
        std::cout << "❌ Exception during Piper synthesizer preload: " << e.what() << std::endl;
        synthesizer_ = nullptr;
        return false;
    }
    if (!synthesizer_) {
        std::cout << "❌ Failed to preload Piper synthesizer" << std::endl;
        return false;
    }
    auto t1 = std::chrono::steady_clock::now();
    std::cout << "✅ Piper synthesizer preloaded in "
              << std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count()
              << " ms" << std::endl;
    return true;
}

bool PiperSynthesizer::synthesize(const SynthesisRequest& request, const std::string& output_path,
                                  std::string& error) {
    if (!synthesizer_) {
        error = "piper synthesizer not loaded";
        return false;
    }
    if (!request.voice.builtin) {
        error = "piper only serves built-in voices";
        return false;
    }

    piper_synthesize_options options = piper_default_synthesize_options(synthesizer_);
    options.speaker_id = request.voice.speaker_id;
    options.length_scale = config_.length_scale;
    options.noise_scale = config_.noise_scale;
    options.noise_w_scale = config_.noise_w_scale;

    if (piper_synthesize_start(synthesizer_, request.text.c_str(), &options) != PIPER_OK) {
        error = "failed to start piper synthesis";
        return false;
    }

    std::vector<int16_t> pcm;
    int sample_rate = 22050;
    while (true) {
        piper_audio_chunk chunk;
        int result = piper_synthesize_next(synthesizer_, &chunk);
        if (result != PIPER_OK && result != PIPER_DONE) {
            error = "piper synthesis failed with code " + std::to_string(result);
            return false;
        }
        if (chunk.num_samples > 0) {
            sample_rate = chunk.sample_rate;
            pcm.reserve(pcm.size() + chunk.num_samples);
            for (size_t i = 0; i < chunk.num_samples; ++i) {
                float v = std::max(-1.0f, std::min(1.0f, chunk.samples[i]));
                pcm.push_back(static_cast<int16_t>(v * 32767.0f));
            }
        }
        if (result == PIPER_DONE || chunk.is_last) break;
    }

    if (pcm.empty()) {
        error = "piper produced no audio";
        return false;
    }

    if (!write_pcm16_wav(output_path, pcm, sample_rate)) {
        error = "failed to write synthesized audio to " + output_path;
        return false;
    }

    if (config_.verbose) {
        std::cout << "🔊 Piper: " << pcm.size() << " samples @" << sample_rate
                  << "Hz for voice " << request.voice.id << std::endl;
    }
    return true;
}
