#include "preload-scheduler.h"
#include "synthesis-service.h"
#include "voice-registry.h"
#include "foreground-tracker.h"
#include <iostream>

PreloadScheduler::PreloadScheduler(SynthesisService& synthesis, VoiceRegistry& registry,
                                   ForegroundTracker& foreground, const PreloadConfig& config)
    : synthesis_(synthesis), registry_(registry), foreground_(foreground), config_(config) {}

PreloadScheduler::~PreloadScheduler() {
    stop();
}

const std::vector<std::string>& PreloadScheduler::common_phrases() {
    static const std::vector<std::string> phrases = {
        "Hello, I am your voice assistant.",
        "Sure, let me take care of that.",
        "One moment please.",
        "Sorry, I didn't catch that. Could you say it again?",
        "You're welcome, glad I could help!",
        "Let me check that for you.",
        "Goodbye, have a nice day!"
    };
    return phrases;
}

bool PreloadScheduler::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        std::cout << "⚠️ Preload already running" << std::endl;
        return false;
    }

    // Reap the previous (finished) run
    if (thread_.joinable()) {
        thread_.join();
    }

    stop_requested_.store(false);
    thread_ = std::thread(&PreloadScheduler::run, this);
    return true;
}

void PreloadScheduler::stop() {
    {
        // Under the lock so a sleeper between its predicate check and its wait sees the flag
        std::lock_guard<std::mutex> lk(state_mutex_);
        stop_requested_.store(true);
    }
    state_cv_.notify_all();
    foreground_.interrupt();
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool PreloadScheduler::wait_until_finished(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(state_mutex_);
    return state_cv_.wait_for(lk, timeout, [&]{ return !running_.load(); });
}

bool PreloadScheduler::sleep_interruptible(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lk(state_mutex_);
    state_cv_.wait_for(lk, duration, [&]{ return stop_requested_.load(); });
    return !stop_requested_.load();
}

PreloadScheduler::Stats PreloadScheduler::stats() const {
    std::lock_guard<std::mutex> lk(state_mutex_);
    return stats_;
}

void PreloadScheduler::log_stats() const {
    Stats s = stats();
    std::cout << "📊 Preload: " << s.attempted << " attempted, " << s.succeeded << " synthesized, "
              << s.already_cached << " already cached, " << s.skipped << " skipped" << std::endl;
}

void PreloadScheduler::run() {
    if (sleep_interruptible(config_.initial_delay)) {
        const std::vector<std::string>& phrases = config_.phrases.empty() ? common_phrases() : config_.phrases;
        std::vector<VoiceIdentity> voices = registry_.cloned_by_recency();

        if (voices.empty()) {
            std::cout << "ℹ️ Preload: no cloned voices registered" << std::endl;
        } else {
            std::cout << "🔥 Preloading " << phrases.size() << " phrases for "
                      << voices.size() << " voices" << std::endl;
        }

        for (const auto& voice : voices) {
            if (stop_requested_.load()) break;
            preload_voice(voice, phrases);
        }

        if (!stop_requested_.load()) {
            log_stats();
        }
    }

    {
        std::lock_guard<std::mutex> lk(state_mutex_);
        running_.store(false);
    }
    state_cv_.notify_all();
}

void PreloadScheduler::preload_voice(const VoiceIdentity& voice, const std::vector<std::string>& phrases) {
    for (size_t i = 0; i < phrases.size(); ++i) {
        if (stop_requested_.load()) return;

        if (foreground_.active() > 0 && !foreground_.wait_until_idle(config_.busy_wait)) {
            if (stop_requested_.load()) return;
            {
                std::lock_guard<std::mutex> lk(state_mutex_);
                stats_.skipped++;
            }
            if (config_.verbose) {
                std::cout << "⏭️ Preload skipped phrase " << i << " for voice " << voice.id
                          << " (foreground busy)" << std::endl;
            }
            continue;
        }

        bool already_cached = false;
        std::string error;
        bool ok = synthesis_.prewarm(phrases[i], voice, already_cached, error);
        {
            std::lock_guard<std::mutex> lk(state_mutex_);
            stats_.attempted++;
            if (ok && already_cached) stats_.already_cached++;
            else if (ok) stats_.succeeded++;
        }
        if (!ok) {
            std::cout << "⚠️ Preload failed for voice " << voice.id << ": " << error << std::endl;
        }

        if (!already_cached && !sleep_interruptible(config_.pause)) return;
    }
}
