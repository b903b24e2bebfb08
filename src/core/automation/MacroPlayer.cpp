#include "MacroPlayer.hpp"
#include "core/Errors.hpp"
#include "core/io/KeyMap.hpp"
#include "utils/Logger.hpp"
#include <linux/input-event-codes.h>
#include <stdexcept>
#include <utility>

namespace hotmacro::automation {

namespace {
OutputSinkPtr requireSink(OutputSinkPtr sink) {
    if (!sink) {
        throw std::invalid_argument("Output sink cannot be null");
    }
    return sink;
}
}

MacroPlayer::MacroPlayer(std::string name, Macro steps, bool loop, OutputSinkPtr sink)
    : name_(std::move(name))
    , steps_(std::move(steps))
    , loop_(loop)
    , sink_(requireSink(std::move(sink)))
    , interpreter_(*sink_, held_) {}

MacroPlayer::~MacroPlayer() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(controlMutex_);
        stopLocked();
        worker = std::move(worker_);
    }
    if (worker.joinable()) {
        worker.join();
    }
}

void MacroPlayer::start() {
    std::lock_guard<std::mutex> lock(controlMutex_);
    startLocked();
}

void MacroPlayer::stop() {
    std::lock_guard<std::mutex> lock(controlMutex_);
    stopLocked();
}

void MacroPlayer::pause() {
    std::lock_guard<std::mutex> lock(controlMutex_);
    pauseLocked();
}

void MacroPlayer::resume() {
    std::lock_guard<std::mutex> lock(controlMutex_);
    resumeLocked();
}

void MacroPlayer::trigger() {
    std::lock_guard<std::mutex> lock(controlMutex_);
    if (!active_) {
        startLocked();
    } else if (!signals_.isGateOpen()) {
        resumeLocked();
    } else {
        pauseLocked();
    }
}

void MacroPlayer::toggle() {
    std::lock_guard<std::mutex> lock(controlMutex_);
    if (active_) {
        stopLocked();
    } else {
        startLocked();
    }
}

bool MacroPlayer::isRunning() const {
    return active_;
}

bool MacroPlayer::isPaused() const {
    return active_ && !signals_.isGateOpen();
}

MacroPlayer::State MacroPlayer::state() const {
    if (!active_) {
        return State::Idle;
    }
    return signals_.isGateOpen() ? State::Running : State::Paused;
}

std::string MacroPlayer::getName() const {
    return name_;
}

void MacroPlayer::setCompletionCallback(CompletionCallback callback) {
    std::lock_guard<std::mutex> lock(idleMutex_);
    onCompletion_ = std::move(callback);
}

bool MacroPlayer::waitForIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(idleMutex_);
    return idleCv_.wait_for(lock, timeout, [this] { return !active_; });
}

void MacroPlayer::startLocked() {
    if (active_) {
        return;
    }
    // The previous worker has already finished its run
    if (worker_.joinable()) {
        worker_.join();
    }

    signals_.reset();
    pausedRestore_.clear();
    active_ = true;
    worker_ = std::thread(&MacroPlayer::workerThread, this);
    info("[macro] started");
}

void MacroPlayer::stopLocked() {
    signals_.requestCancel();
    // A worker blocked on the closed gate has to see the cancellation
    signals_.openGate();
    held_.releaseAll(*sink_);
    pausedRestore_.clear();
    if (active_) {
        info("[macro] stopping...");
    }
}

void MacroPlayer::pauseLocked() {
    if (!active_ || !signals_.isGateOpen()) {
        return;
    }
    // Waits for an in-flight step so its presses land in the ledger first
    std::lock_guard<std::mutex> step(stepMutex_);
    signals_.closeGate();
    pausedRestore_ = held_.releaseAll(*sink_);
    info("[macro] paused ({} held code(s) released)", pausedRestore_.size());
}

void MacroPlayer::resumeLocked() {
    if (!active_ || signals_.isGateOpen()) {
        return;
    }

    for (int code : pausedRestore_) {
        try {
            sink_->Emit(EV_KEY, static_cast<uint16_t>(code), 1);
            held_.markDown(code);
        } catch (const DeviceWriteError& e) {
            warning("Failed to re-press {}: {}", KeyMap::Describe(code), e.what());
        }
    }
    try {
        sink_->Sync();
    } catch (const DeviceWriteError& e) {
        warning("Failed to sync after resume: {}", e.what());
    }
    pausedRestore_.clear();
    signals_.openGate();
    info("[macro] resumed");
}

void MacroPlayer::workerThread() {
    try {
        if (steps_.empty()) {
            warning("[macro] '{}' has no steps", name_);
        } else {
            do {
                if (!runOnce()) {
                    break;
                }
            } while (loop_ && !signals_.isCancelled());
        }
    } catch (const std::exception& e) {
        error("[macro] run aborted: {}", e.what());
    }

    held_.releaseAll(*sink_);

    CompletionCallback callback;
    {
        std::lock_guard<std::mutex> lock(idleMutex_);
        active_ = false;
        callback = onCompletion_;
    }
    idleCv_.notify_all();
    info("[macro] stopped");

    if (callback) {
        callback(name_);
    }
}

// One pass over the steps. Returns false once cancelled.
bool MacroPlayer::runOnce() {
    for (const auto& step : steps_) {
        if (std::holds_alternative<WaitStep>(step)) {
            if (!signals_.waitWhilePaused()) {
                return false;
            }
            interpreter_.execute(step, signals_);
            continue;
        }
        if (!executeUnpaused(step)) {
            return false;
        }
    }
    return !signals_.isCancelled();
}

// Runs an output step while no pause can interleave. Returns false if
// cancelled while waiting for the gate.
bool MacroPlayer::executeUnpaused(const MacroStep& step) {
    while (signals_.waitWhilePaused()) {
        std::lock_guard<std::mutex> lock(stepMutex_);
        // A pause may have closed the gate before the lock was taken
        if (signals_.isGateOpen()) {
            interpreter_.execute(step, signals_);
            return true;
        }
    }
    return false;
}

const char* toString(MacroPlayer::State state) {
    switch (state) {
        case MacroPlayer::State::Idle: return "idle";
        case MacroPlayer::State::Running: return "running";
        case MacroPlayer::State::Paused: return "paused";
    }
    return "unknown";
}

} // namespace hotmacro::automation
