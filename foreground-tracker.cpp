#include "foreground-tracker.h"

void ForegroundTracker::begin() {
    std::lock_guard<std::mutex> lk(mutex_);
    ++active_;
}

void ForegroundTracker::end() {
    bool now_idle = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (active_ > 0) --active_;
        now_idle = active_ == 0;
    }
    if (now_idle) idle_cv_.notify_all();
}

size_t ForegroundTracker::active() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return active_;
}

bool ForegroundTracker::wait_until_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mutex_);
    const uint64_t epoch = interrupt_epoch_;
    idle_cv_.wait_for(lk, timeout, [&]{ return active_ == 0 || interrupt_epoch_ != epoch; });
    return active_ == 0;
}

void ForegroundTracker::interrupt() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        ++interrupt_epoch_;
    }
    idle_cv_.notify_all();
}
