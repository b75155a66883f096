#pragma once

#include <mutex>
#include <condition_variable>
#include <chrono>
#include <cstddef>
#include <cstdint>

// Count of user-initiated requests currently in progress. Background work
// blocks on it instead of polling.
class ForegroundTracker {
public:
    void begin();
    void end();
    size_t active() const;

    // Waits until no foreground request is active, the timeout passes, or
    // interrupt() is called. Returns true when idle.
    bool wait_until_idle(std::chrono::milliseconds timeout);

    // Wakes every waiter (used on shutdown)
    void interrupt();

private:
    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    size_t active_ = 0;
    uint64_t interrupt_epoch_ = 0;
};

// Marks one foreground request for the lifetime of the scope
class ForegroundScope {
public:
    explicit ForegroundScope(ForegroundTracker& tracker) : tracker_(tracker) { tracker_.begin(); }
    ~ForegroundScope() { tracker_.end(); }

    ForegroundScope(const ForegroundScope&) = delete;
    ForegroundScope& operator=(const ForegroundScope&) = delete;

private:
    ForegroundTracker& tracker_;
};
