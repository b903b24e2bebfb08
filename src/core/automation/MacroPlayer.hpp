#pragma once

#include "HeldKeys.hpp"
#include "MacroStep.hpp"
#include "PlaybackSignals.hpp"
#include "StepInterpreter.hpp"
#include "Task.hpp"
#include "core/io/OutputSink.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace hotmacro::automation {

/**
 * Plays a macro on a single background worker.
 *
 * Idle -> start() -> Running -> pause() -> Paused -> resume() -> Running.
 * stop() cancels from Running or Paused. The run ends by itself when a
 * non-looping macro has executed every step.
 *
 * All control operations are serialized by one mutex and only flip
 * PlaybackSignals and the held-key stash. pause() additionally waits for an
 * output step that is mid-write; it never waits out a "wait" step. Anything the
 * macro holds down is released on pause (and pressed again on resume), on
 * stop, and when the worker exits for any reason.
 */
class MacroPlayer : public PausableTask {
public:
    enum class State { Idle, Running, Paused };

    // Called on the worker thread after a run has finished. Must not call
    // back into the player.
    using CompletionCallback = std::function<void(const std::string&)>;

    MacroPlayer(std::string name, Macro steps, bool loop, OutputSinkPtr sink);
    ~MacroPlayer() override;

    MacroPlayer(const MacroPlayer&) = delete;
    MacroPlayer& operator=(const MacroPlayer&) = delete;

    // Task interface
    void start() override;
    void stop() override;
    // Start when idle, otherwise stop
    void toggle() override;
    [[nodiscard]] bool isRunning() const override;
    [[nodiscard]] std::string getName() const override;

    // PausableTask interface
    void pause() override;
    void resume() override;
    void trigger() override;
    [[nodiscard]] bool isPaused() const override;

    [[nodiscard]] State state() const;

    // Block until no worker is running. Returns false on timeout.
    bool waitForIdle(std::chrono::milliseconds timeout);

    void setCompletionCallback(CompletionCallback callback);

    const HeldKeys& heldKeys() const { return held_; }

private:
    void startLocked();
    void stopLocked();
    void pauseLocked();
    void resumeLocked();

    void workerThread();
    bool runOnce();
    bool executeUnpaused(const MacroStep& step);

    const std::string name_;
    const Macro steps_;
    const bool loop_;
    OutputSinkPtr sink_;

    HeldKeys held_;
    PlaybackSignals signals_;
    StepInterpreter interpreter_;

    mutable std::mutex controlMutex_;
    std::thread worker_;
    std::vector<int> pausedRestore_;

    // Held by the worker for each non-wait step and by pause()
    std::mutex stepMutex_;

    std::atomic<bool> active_{false};
    std::mutex idleMutex_;
    std::condition_variable idleCv_;
    CompletionCallback onCompletion_; // guarded by idleMutex_
};

const char* toString(MacroPlayer::State state);

} // namespace hotmacro::automation
