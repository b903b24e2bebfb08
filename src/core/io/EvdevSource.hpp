#pragma once
#include "InputSource.hpp"
#include <atomic>
#include <string>

namespace hotmacro {

// Reads EV_KEY events from one /dev/input/eventN node
class EvdevSource : public InputSource {
public:
    // Throws DeviceError if the node cannot be opened
    explicit EvdevSource(const std::string& devicePath);
    ~EvdevSource() override;

    EvdevSource(const EvdevSource&) = delete;
    EvdevSource& operator=(const EvdevSource&) = delete;

    std::optional<KeyEvent> ReadEvent() override;
    void Interrupt() override;

    const std::string& Name() const { return name; }

private:
    std::string path;
    std::string name = "Unknown";
    int fd = -1;
    int shutdownFd = -1; // eventfd for clean shutdown
    std::atomic<bool> interrupted{false};
};

} // namespace hotmacro
