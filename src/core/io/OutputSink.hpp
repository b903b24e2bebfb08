#pragma once
#include <cstdint>
#include <memory>

namespace hotmacro {

// Destination for synthetic input events (a virtual input device)
class OutputSink {
public:
    virtual ~OutputSink() = default;

    // Throws DeviceWriteError when the device rejects the write
    virtual void Emit(uint16_t type, uint16_t code, int32_t value) = 0;

    // EV_SYN / SYN_REPORT
    virtual void Sync() = 0;
};

using OutputSinkPtr = std::shared_ptr<OutputSink>;

} // namespace hotmacro
