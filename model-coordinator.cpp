#include "model-coordinator.h"
#include "transient-file.h"
#include <iostream>
#include <chrono>
#include <exception>

ModelAccess::ModelAccess(ModelAccess&& other) noexcept : owner_(other.owner_) {
    other.owner_ = nullptr;
}

ModelAccess::~ModelAccess() {
    release();
}

void ModelAccess::release() {
    if (owner_) {
        owner_->release_access();
        owner_ = nullptr;
    }
}

ModelCoordinator::ModelCoordinator(std::unique_ptr<SpeechRecognizer> recognizer,
                                   std::unique_ptr<SpeechSynthesizer> synthesizer,
                                   const std::string& scratch_dir)
    : recognizer_(std::move(recognizer)), synthesizer_(std::move(synthesizer)), scratch_dir_(scratch_dir) {}

ModelCoordinator::~ModelCoordinator() = default;

ModelAccess ModelCoordinator::acquire(const std::string& who) {
    auto t_start = std::chrono::steady_clock::now();
    {
        std::unique_lock<std::mutex> lk(gate_mutex_);
        const uint64_t ticket = next_ticket_++;
        gate_cv_.wait(lk, [&]{ return now_serving_ == ticket; });
    }
    auto wait_ms = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t_start).count());

    metrics_.total_acquisitions++;
    metrics_.total_wait_ms += wait_ms;
    uint64_t prev_max = metrics_.max_wait_ms.load();
    while (wait_ms > prev_max && !metrics_.max_wait_ms.compare_exchange_weak(prev_max, wait_ms)) {}

    if (wait_ms > 10) {
        std::cout << "⏳ [" << who << "] Model gate wait: " << wait_ms << "ms" << std::endl;
    }
    return ModelAccess(this);
}

void ModelCoordinator::release_access() {
    {
        std::lock_guard<std::mutex> lk(gate_mutex_);
        ++now_serving_;
    }
    gate_cv_.notify_all();
}

size_t ModelCoordinator::queued() const {
    std::lock_guard<std::mutex> lk(gate_mutex_);
    return static_cast<size_t>(next_ticket_ - now_serving_);
}

bool ModelCoordinator::supports_voice(const VoiceIdentity& voice) const {
    return synthesizer_ && synthesizer_->supports(voice);
}

bool ModelCoordinator::recognize(const uint8_t* pcm, size_t length, const AudioFormat& format,
                                 std::string& text, std::string& error, const std::string& who) {
    if (!recognizer_) {
        error = "no recognizer loaded";
        return false;
    }

    ModelAccess access = acquire(who);
    auto t0 = std::chrono::steady_clock::now();
    bool ok = false;
    try {
        ok = recognizer_->recognize(pcm, length, format, text, error);
    } catch (const std::exception& e) {
        error = e.what();
        ok = false;
    }
    auto inference_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();
    metrics_.total_inference_ms += static_cast<uint64_t>(inference_ms);

    std::cout << "⚡ [" << who << "] Recognition: " << inference_ms << "ms ("
              << format.seconds_for_bytes(length) << "s audio)" << std::endl;

    if (!ok) {
        metrics_.failed_calls++;
        if (error.empty()) error = "recognition failed";
    }
    return ok;
}

bool ModelCoordinator::synthesize(const SynthesisRequest& request, std::vector<uint8_t>& audio,
                                  std::string& format, std::string& error, const std::string& who) {
    if (!synthesizer_) {
        error = "no synthesizer loaded";
        return false;
    }

    ModelAccess access = acquire(who);
    TransientFile output(scratch_dir_, "." + synthesizer_->output_format());
    if (!output.valid()) {
        error = "cannot create synthesis output file";
        metrics_.failed_calls++;
        return false;
    }

    auto t0 = std::chrono::steady_clock::now();
    bool ok = false;
    try {
        ok = synthesizer_->synthesize(request, output.path(), error);
    } catch (const std::exception& e) {
        error = e.what();
        ok = false;
    }
    auto inference_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();
    metrics_.total_inference_ms += static_cast<uint64_t>(inference_ms);

    if (ok && !output.read_all(audio)) {
        error = "cannot read synthesis output";
        ok = false;
    }
    if (ok && audio.empty()) {
        error = "synthesizer produced no audio";
        ok = false;
    }

    if (!ok) {
        metrics_.failed_calls++;
        audio.clear();
        if (error.empty()) error = "synthesis failed";
        std::cout << "❌ [" << who << "] Synthesis failed after " << inference_ms << "ms: " << error << std::endl;
        return false;
    }

    format = synthesizer_->output_format();
    std::cout << "🔊 [" << who << "] Synthesis: " << inference_ms << "ms (" << audio.size()
              << " bytes, voice " << request.voice.id << ")" << std::endl;
    return true;
}

void ModelCoordinator::log_metrics() const {
    uint64_t n = metrics_.total_acquisitions.load();
    std::cout << "📊 Model gate: " << n << " calls, avg wait "
              << (n ? metrics_.total_wait_ms.load() / n : 0) << "ms, max wait "
              << metrics_.max_wait_ms.load() << "ms, inference "
              << metrics_.total_inference_ms.load() << "ms total, "
              << metrics_.failed_calls.load() << " failed" << std::endl;
}
