#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace hotmacro::automation {

/**
 * Cancellation flag and pause gate shared between the controller and the
 * playback worker. Every change wakes all waiters.
 */
class PlaybackSignals {
public:
    using Duration = std::chrono::steady_clock::duration;

    // Longest single wait; longer requests are clamped to it
    static constexpr Duration kMaxWait = std::chrono::hours(24 * 365 * 100);

    // Clear cancellation and open the gate, ready for a new run
    void reset();

    void requestCancel();
    [[nodiscard]] bool isCancelled() const;

    void openGate();
    void closeGate();
    [[nodiscard]] bool isGateOpen() const;

    // Block while the gate is closed. Returns false if cancelled.
    bool waitWhilePaused();

    /**
     * Wait for `duration` of running time. Time spent with the gate closed
     * does not count. Returns false if cancelled before the time elapsed.
     */
    bool waitRunning(Duration duration);

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_ = false;
    bool gateOpen_ = true;
};

} // namespace hotmacro::automation
