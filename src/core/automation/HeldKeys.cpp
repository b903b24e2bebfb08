#include "HeldKeys.hpp"
#include "core/Errors.hpp"
#include "core/io/KeyMap.hpp"
#include "utils/Logger.hpp"
#include <linux/input-event-codes.h>

namespace hotmacro::automation {

void HeldKeys::markDown(int code) {
    std::lock_guard<std::mutex> lock(mutex_);
    held_.insert(code);
}

void HeldKeys::markUp(int code) {
    std::lock_guard<std::mutex> lock(mutex_);
    held_.erase(code);
}

std::vector<int> HeldKeys::releaseAll(OutputSink& sink) {
    std::vector<int> codes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        codes.assign(held_.begin(), held_.end());
        held_.clear();
    }

    if (codes.empty()) {
        return codes;
    }

    for (int code : codes) {
        try {
            sink.Emit(EV_KEY, static_cast<uint16_t>(code), 0);
        } catch (const DeviceWriteError& e) {
            warning("Failed to release {}: {}", KeyMap::Describe(code), e.what());
        }
    }
    try {
        sink.Sync();
    } catch (const DeviceWriteError& e) {
        warning("Failed to sync after release: {}", e.what());
    }

    debug("Released {} held code(s)", codes.size());
    return codes;
}

std::vector<int> HeldKeys::held() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {held_.begin(), held_.end()};
}

bool HeldKeys::contains(int code) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_.count(code) > 0;
}

bool HeldKeys::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_.empty();
}

} // namespace hotmacro::automation
