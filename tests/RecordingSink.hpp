#pragma once
#include "core/Errors.hpp"
#include "core/io/OutputSink.hpp"
#include <linux/input-event-codes.h>
#include <mutex>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace hotmacro::test {

struct RecordedEvent {
    uint16_t type;
    uint16_t code;
    int32_t value;

    bool operator==(const RecordedEvent& other) const {
        return type == other.type && code == other.code && value == other.value;
    }
};

inline std::ostream& operator<<(std::ostream& os, const RecordedEvent& ev) {
    return os << "{" << ev.type << ", " << ev.code << ", " << ev.value << "}";
}

inline RecordedEvent KeyDown(int code) { return {EV_KEY, static_cast<uint16_t>(code), 1}; }
inline RecordedEvent KeyUp(int code) { return {EV_KEY, static_cast<uint16_t>(code), 0}; }
inline RecordedEvent SyncEvent() { return {EV_SYN, SYN_REPORT, 0}; }

// Thread-safe OutputSink that records everything it is asked to emit
class RecordingSink : public OutputSink {
public:
    void Emit(uint16_t type, uint16_t code, int32_t value) override {
        std::lock_guard<std::mutex> lock(mutex);
        if (failing.count(code)) {
            throw DeviceWriteError("write failed for code " + std::to_string(code));
        }
        events.push_back({type, code, value});
    }

    void Sync() override {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(SyncEvent());
    }

    // Writes for this code throw DeviceWriteError
    void FailCode(int code) {
        std::lock_guard<std::mutex> lock(mutex);
        failing.insert(code);
    }

    std::vector<RecordedEvent> Events() const {
        std::lock_guard<std::mutex> lock(mutex);
        return events;
    }

    size_t Count(const RecordedEvent& ev) const {
        std::lock_guard<std::mutex> lock(mutex);
        size_t n = 0;
        for (const auto& e : events) {
            if (e == ev) ++n;
        }
        return n;
    }

    void Clear() {
        std::lock_guard<std::mutex> lock(mutex);
        events.clear();
    }

private:
    mutable std::mutex mutex;
    std::vector<RecordedEvent> events;
    std::set<int> failing;
};

} // namespace hotmacro::test
