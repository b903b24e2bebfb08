#include "PlaybackSignals.hpp"
#include <algorithm>

namespace hotmacro::automation {

void PlaybackSignals::reset() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = false;
        gateOpen_ = true;
    }
    cv_.notify_all();
}

void PlaybackSignals::requestCancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool PlaybackSignals::isCancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

void PlaybackSignals::openGate() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        gateOpen_ = true;
    }
    cv_.notify_all();
}

void PlaybackSignals::closeGate() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        gateOpen_ = false;
    }
    cv_.notify_all();
}

bool PlaybackSignals::isGateOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return gateOpen_;
}

bool PlaybackSignals::waitWhilePaused() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return cancelled_ || gateOpen_; });
    return !cancelled_;
}

bool PlaybackSignals::waitRunning(Duration duration) {
    using Clock = std::chrono::steady_clock;
    Duration remaining = std::min(duration, kMaxWait);

    std::unique_lock<std::mutex> lock(mutex_);
    while (remaining > Duration::zero()) {
        if (cancelled_) {
            return false;
        }
        if (!gateOpen_) {
            // Paused: nothing is consumed until the gate opens again
            cv_.wait(lock, [this] { return cancelled_ || gateOpen_; });
            continue;
        }

        auto started = Clock::now();
        cv_.wait_for(lock, remaining, [this] { return cancelled_ || !gateOpen_; });
        remaining -= Clock::now() - started;
    }
    return !cancelled_;
}

} // namespace hotmacro::automation
