#pragma once

#include "inference-backend.h"
#include <string>
#include <vector>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <chrono>
#include <cstdint>

class SynthesisService;
class VoiceRegistry;
class ForegroundTracker;

struct PreloadConfig {
    std::chrono::milliseconds initial_delay{3000};
    std::chrono::milliseconds busy_wait{2000};   // max wait for foreground to clear before skipping
    std::chrono::milliseconds pause{300};        // between phrases
    std::vector<std::string> phrases;            // empty = common_phrases()
    bool verbose = false;
};

// One-shot background cache fill: every cloned voice (newest first) times every
// common phrase, each attempted once. Yields to foreground requests.
class PreloadScheduler {
public:
    PreloadScheduler(SynthesisService& synthesis, VoiceRegistry& registry,
                     ForegroundTracker& foreground, const PreloadConfig& config);
    ~PreloadScheduler();

    PreloadScheduler(const PreloadScheduler&) = delete;
    PreloadScheduler& operator=(const PreloadScheduler&) = delete;

    // Returns false if a run is already in progress
    bool start();
    void stop();
    bool is_running() const { return running_.load(); }

    // Blocks until the current run finishes or the timeout passes
    bool wait_until_finished(std::chrono::milliseconds timeout);

    struct Stats {
        uint64_t attempted = 0;
        uint64_t succeeded = 0;
        uint64_t skipped = 0;         // foreground demand persisted
        uint64_t already_cached = 0;
    };
    Stats stats() const;
    void log_stats() const;

    static const std::vector<std::string>& common_phrases();

private:
    SynthesisService& synthesis_;
    VoiceRegistry& registry_;
    ForegroundTracker& foreground_;
    PreloadConfig config_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};

    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    Stats stats_;

    void run();
    bool sleep_interruptible(std::chrono::milliseconds duration);
    void preload_voice(const VoiceIdentity& voice, const std::vector<std::string>& phrases);
};
