#include "SignalWatcher.hpp"
#include "utils/Logger.hpp"
#include <cerrno>
#include <cstring>
#include <pthread.h>
#include <stdexcept>
#include <system_error>

namespace hotmacro::util {

const char* SignalWatcher::signalName(int sig) {
    switch (sig) {
        case SIGINT:  return "SIGINT";
        case SIGTERM: return "SIGTERM";
        case SIGHUP:  return "SIGHUP";
        case SIGQUIT: return "SIGQUIT";
    }
    return "Unknown";
}

SignalWatcher::~SignalWatcher() {
    stop();
}

void SignalWatcher::start() {
    if (watcherThread.joinable()) {
        throw std::runtime_error("SignalWatcher already running");
    }
    stopping = false;

    watcherThread = std::thread([this]() {
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGINT);
        sigaddset(&set, SIGTERM);
        sigaddset(&set, SIGHUP);
        sigaddset(&set, SIGQUIT);

        while (true) {
            int sig = 0;
            int result = sigwait(&set, &sig);
            if (result != 0) {
                // sigwait returns the error number instead of setting errno
                if (result == EINTR) {
                    continue;
                }
                error("[SignalWatcher] sigwait failed: {}", std::strerror(result));
                return;
            }
            if (stopping.load(std::memory_order_relaxed)) {
                return;
            }

            info("[SignalWatcher] Received signal: {} ({})", signalName(sig), sig);
            if (sig == SIGINT || sig == SIGTERM) {
                receivedSignal.store(sig, std::memory_order_relaxed);
                if (shutdownCallback) {
                    shutdownCallback(sig);
                }
                return;
            }
        }
    });
}

void SignalWatcher::stop() {
    if (!watcherThread.joinable()) {
        return;
    }
    if (!shutdownRequested()) {
        // Wake sigwait; the stopping flag keeps it from being treated as a
        // real shutdown request
        stopping.store(true, std::memory_order_relaxed);
        pthread_kill(watcherThread.native_handle(), SIGTERM);
    }
    watcherThread.join();
}

void blockShutdownSignals() {
    blockSignals({SIGINT, SIGTERM, SIGHUP, SIGQUIT});
}

void blockSignals(const std::initializer_list<int>& signalsToBlock) {
    sigset_t set;
    sigemptyset(&set);
    for (int sig : signalsToBlock) {
        sigaddset(&set, sig);
    }
    int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (rc != 0) {
        throw std::system_error(rc, std::system_category(), "Failed to block signals");
    }
}

} // namespace hotmacro::util
