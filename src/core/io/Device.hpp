#pragma once
#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace hotmacro {

enum class DeviceType {
    Unknown,
    Keyboard,
    Mouse,
    Other
};

struct DeviceCapabilities {
    int totalKeys = 0;
    int letterKeys = 0;
    int modifierKeys = 0;
    int mouseButtons = 0;
    bool hasRelativeAxes = false;
};

// One entry of /proc/bus/input/devices
class Device {
public:
    int busType = 0;
    int vendor = 0;
    int product = 0;
    int version = 0;
    std::string name;
    std::string phys;
    std::string handlers;
    std::string eventPath;
    DeviceType type = DeviceType::Unknown;
    DeviceCapabilities caps;

    // Parse a device block from /proc/bus/input/devices
    static Device parseDeviceBlock(const std::vector<std::string>& lines);

    // Parse a whole devices listing (blank-line separated blocks)
    static std::vector<Device> parseDevices(std::istream& in);

    // Get all input devices from /proc/bus/input/devices
    static std::vector<Device> getAllDevices();

    // First device that has both KEY_A and KEY_LEFTCTRL. Throws DeviceError.
    static Device findKeyboard();
    static Device findKeyboard(const std::vector<Device>& devices);

    bool hasKey(int keycode) const;
    bool hasEventType(int eventType) const;
    bool hasRelativeAxis(int axis) const;

    // Letter key and ctrl key present
    bool looksLikeKeyboard() const;

    std::string toString() const;

private:
    std::vector<uint64_t> keyCapabilities;
    std::vector<uint64_t> eventCapabilities;
    std::vector<uint64_t> relCapabilities;

    void parseInfoLine(const std::string& line);
    void parseCapabilities(const std::string& capLine);
    std::string extractEventPath() const;
    std::vector<uint64_t> parseHexBitmask(const std::string& hex) const;
    int countKeysInRange(int start, int end) const;
    DeviceCapabilities analyzeCapabilities() const;
    DeviceType detectType() const;
};

} // namespace hotmacro
