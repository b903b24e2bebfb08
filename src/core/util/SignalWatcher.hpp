#pragma once

#include <atomic>
#include <csignal>
#include <functional>
#include <initializer_list>
#include <thread>
#include <utility>

namespace hotmacro::util {

/**
 * Dedicated sigwait() thread for SIGINT/SIGTERM/SIGHUP/SIGQUIT.
 *
 * The watched signals must be blocked in every thread (call
 * blockShutdownSignals() from main before any thread is created), otherwise
 * the kernel may deliver them elsewhere.
 */
class SignalWatcher {
public:
    using ShutdownCallback = std::function<void(int)>;

    SignalWatcher() = default;
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;
    SignalWatcher(SignalWatcher&&) = delete;
    SignalWatcher& operator=(SignalWatcher&&) = delete;

    // Runs on the watcher thread for SIGINT or SIGTERM
    void setShutdownCallback(ShutdownCallback callback) {
        shutdownCallback = std::move(callback);
    }

    void start();
    void stop();

    bool shutdownRequested() const {
        return receivedSignal.load(std::memory_order_relaxed) != 0;
    }
    int lastSignal() const { return receivedSignal.load(std::memory_order_relaxed); }

private:
    static const char* signalName(int sig);

    std::atomic<bool> stopping{false};
    std::atomic<int> receivedSignal{0};
    std::thread watcherThread;
    ShutdownCallback shutdownCallback;
};

// Block SIGINT, SIGTERM, SIGHUP and SIGQUIT in the calling thread
void blockShutdownSignals();

// Block specific signals in the calling thread
void blockSignals(const std::initializer_list<int>& signalsToBlock);

} // namespace hotmacro::util
