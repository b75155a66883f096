#pragma once

#include "inference-backend.h"
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <cstdint>

class ModelCoordinator;

// Exclusive permit to run one inference call. Released on destruction.
class ModelAccess {
public:
    ModelAccess(ModelAccess&& other) noexcept;
    ~ModelAccess();

    ModelAccess(const ModelAccess&) = delete;
    ModelAccess& operator=(const ModelAccess&) = delete;
    ModelAccess& operator=(ModelAccess&&) = delete;

    void release();

private:
    friend class ModelCoordinator;
    explicit ModelAccess(ModelCoordinator* owner) : owner_(owner) {}

    ModelCoordinator* owner_;
};

// Single gate in front of the non-reentrant model. Owns the recognizer and the
// synthesizer; nothing else in the process calls them. Waiters are served in
// the order they asked (ticket lock), so no session can be starved.
class ModelCoordinator {
public:
    ModelCoordinator(std::unique_ptr<SpeechRecognizer> recognizer,
                     std::unique_ptr<SpeechSynthesizer> synthesizer,
                     const std::string& scratch_dir = "");
    ~ModelCoordinator();

    ModelCoordinator(const ModelCoordinator&) = delete;
    ModelCoordinator& operator=(const ModelCoordinator&) = delete;

    // Blocks until the caller is at the head of the queue
    ModelAccess acquire(const std::string& who);

    // One recognition call under the gate
    bool recognize(const uint8_t* pcm, size_t length, const AudioFormat& format,
                   std::string& text, std::string& error, const std::string& who);

    // One synthesis call under the gate. Output goes through a transient file that is
    // removed before returning, whatever the outcome.
    bool synthesize(const SynthesisRequest& request, std::vector<uint8_t>& audio,
                    std::string& format, std::string& error, const std::string& who);

    bool has_recognizer() const { return recognizer_ != nullptr; }
    bool has_synthesizer() const { return synthesizer_ != nullptr; }
    bool recognizer_ready() const { return recognizer_ && recognizer_->is_ready(); }
    bool synthesizer_ready() const { return synthesizer_ && synthesizer_->is_ready(); }
    bool supports_voice(const VoiceIdentity& voice) const;
    std::string output_format() const { return synthesizer_ ? synthesizer_->output_format() : "wav"; }

    // Callers holding or waiting for the gate
    size_t queued() const;
    uint64_t acquisitions() const { return metrics_.total_acquisitions.load(); }

    void log_metrics() const;

private:
    friend class ModelAccess;
    void release_access();

    std::unique_ptr<SpeechRecognizer> recognizer_;
    std::unique_ptr<SpeechSynthesizer> synthesizer_;
    std::string scratch_dir_;

    mutable std::mutex gate_mutex_;
    std::condition_variable gate_cv_;
    uint64_t next_ticket_ = 0;
    uint64_t now_serving_ = 0;

    struct PerformanceMetrics {
        std::atomic<uint64_t> total_wait_ms{0};
        std::atomic<uint64_t> max_wait_ms{0};
        std::atomic<uint64_t> total_inference_ms{0};
        std::atomic<uint64_t> total_acquisitions{0};
        std::atomic<uint64_t> failed_calls{0};
    };
    PerformanceMetrics metrics_;
};
