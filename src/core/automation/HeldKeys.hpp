#pragma once

#include "core/io/OutputSink.hpp"
#include <mutex>
#include <set>
#include <vector>

namespace hotmacro::automation {

/**
 * Output codes (keys or mouse buttons) currently held down by "press" steps.
 *
 * Mutated by the playback worker and drained by pause/stop from the listener
 * thread. The ledger lock is never held while writing to the device.
 */
class HeldKeys {
public:
    void markDown(int code);
    void markUp(int code);

    // Snapshot and clear, then release every snapshot code (best-effort) and
    // sync once. Returns the codes that were held.
    std::vector<int> releaseAll(OutputSink& sink);

    [[nodiscard]] std::vector<int> held() const;
    [[nodiscard]] bool contains(int code) const;
    [[nodiscard]] bool empty() const;

private:
    mutable std::mutex mutex_;
    std::set<int> held_;
};

} // namespace hotmacro::automation
