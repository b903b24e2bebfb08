#pragma once
#include "OutputSink.hpp"
#include <mutex>
#include <string>

namespace hotmacro {

// Virtual keyboard + relative mouse created through /dev/uinput
class UinputSink : public OutputSink {
public:
    static constexpr const char* kDefaultName = "hotmacro-uinput";

    // Throws DeviceError when the device cannot be created
    explicit UinputSink(const std::string& deviceName = kDefaultName);
    ~UinputSink() override;

    UinputSink(const UinputSink&) = delete;
    UinputSink& operator=(const UinputSink&) = delete;

    void Emit(uint16_t type, uint16_t code, int32_t value) override;
    void Sync() override;

    const std::string& Name() const { return name; }

private:
    void Write(uint16_t type, uint16_t code, int32_t value);

    std::string name;
    int uinputFd = -1;
    std::mutex writeMutex;
};

} // namespace hotmacro
