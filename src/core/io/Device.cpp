#include "Device.hpp"
#include "core/Errors.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <fstream>
#include <linux/input-event-codes.h>
#include <regex>
#include <sstream>

namespace hotmacro {

Device Device::parseDeviceBlock(const std::vector<std::string>& lines) {
    Device device;

    for (const std::string& line : lines) {
        if (line.length() < 3 || line[1] != ':' || line[2] != ' ') continue;

        char prefix = line[0];
        std::string content = line.substr(3);

        switch (prefix) {
            case 'I':
                device.parseInfoLine(content);
                break;
            case 'N':
                if (content.starts_with("Name=")) {
                    device.name = content.substr(5);
                    if (device.name.length() >= 2 && device.name[0] == '"' && device.name.back() == '"') {
                        device.name = device.name.substr(1, device.name.length() - 2);
                    }
                }
                break;
            case 'P':
                if (content.starts_with("Phys=")) {
                    device.phys = content.substr(5);
                }
                break;
            case 'H':
                if (content.starts_with("Handlers=")) {
                    device.handlers = content.substr(9);
                    device.eventPath = device.extractEventPath();
                }
                break;
            case 'B':
                device.parseCapabilities(content);
                break;
        }
    }

    device.caps = device.analyzeCapabilities();
    device.type = device.detectType();
    return device;
}

void Device::parseInfoLine(const std::string& content) {
    std::regex infoRegex(R"(Bus=([0-9a-f]+)\s+Vendor=([0-9a-f]+)\s+Product=([0-9a-f]+)\s+Version=([0-9a-f]+))");
    std::smatch matches;

    if (std::regex_search(content, matches, infoRegex)) {
        busType = std::stoi(matches[1].str(), nullptr, 16);
        vendor = std::stoi(matches[2].str(), nullptr, 16);
        product = std::stoi(matches[3].str(), nullptr, 16);
        version = std::stoi(matches[4].str(), nullptr, 16);
    }
}

std::string Device::extractEventPath() const {
    std::regex eventRegex(R"(event(\d+))");
    std::smatch matches;

    if (std::regex_search(handlers, matches, eventRegex)) {
        return "/dev/input/event" + matches[1].str();
    }
    return "";
}

void Device::parseCapabilities(const std::string& capLine) {
    if (capLine.starts_with("EV=")) {
        eventCapabilities = parseHexBitmask(capLine.substr(3));
    } else if (capLine.starts_with("KEY=")) {
        keyCapabilities = parseHexBitmask(capLine.substr(4));
    } else if (capLine.starts_with("REL=")) {
        relCapabilities = parseHexBitmask(capLine.substr(4));
    }
}

// The kernel prints the most significant word first; store word 0 first.
std::vector<uint64_t> Device::parseHexBitmask(const std::string& hex) const {
    std::vector<uint64_t> result;
    std::istringstream iss(hex);
    std::string chunk;

    while (iss >> chunk) {
        try {
            result.push_back(std::stoull(chunk, nullptr, 16));
        } catch (const std::exception&) {
            warning("Ignoring malformed capability word '{}'", chunk);
            result.push_back(0);
        }
    }
    std::reverse(result.begin(), result.end());
    return result;
}

bool Device::hasKey(int keycode) const {
    if (keyCapabilities.empty() || keycode < 0) return false;

    size_t wordIndex = keycode / 64;
    int bitIndex = keycode % 64;

    if (wordIndex >= keyCapabilities.size()) return false;

    return (keyCapabilities[wordIndex] & (1ULL << bitIndex)) != 0;
}

bool Device::hasEventType(int eventType) const {
    if (eventCapabilities.empty()) return false;
    return (eventCapabilities[0] & (1ULL << eventType)) != 0;
}

bool Device::hasRelativeAxis(int axis) const {
    if (relCapabilities.empty()) return false;
    return (relCapabilities[0] & (1ULL << axis)) != 0;
}

int Device::countKeysInRange(int start, int end) const {
    int count = 0;
    for (int i = start; i <= end; i++) {
        if (hasKey(i)) count++;
    }
    return count;
}

DeviceCapabilities Device::analyzeCapabilities() const {
    DeviceCapabilities result;

    result.letterKeys = countKeysInRange(KEY_Q, KEY_P) + countKeysInRange(KEY_A, KEY_L) +
                        countKeysInRange(KEY_Z, KEY_M);
    result.totalKeys = countKeysInRange(0, 255);

    for (int code : {KEY_LEFTSHIFT, KEY_RIGHTSHIFT, KEY_LEFTCTRL, KEY_RIGHTCTRL, KEY_LEFTALT, KEY_RIGHTALT}) {
        if (hasKey(code)) result.modifierKeys++;
    }

    for (int code : {BTN_LEFT, BTN_RIGHT, BTN_MIDDLE, BTN_SIDE, BTN_EXTRA}) {
        if (hasKey(code)) result.mouseButtons++;
    }

    result.hasRelativeAxes = hasRelativeAxis(REL_X) || hasRelativeAxis(REL_Y);
    return result;
}

DeviceType Device::detectType() const {
    if (caps.letterKeys >= 20 && caps.modifierKeys >= 2 && caps.mouseButtons == 0) {
        return DeviceType::Keyboard;
    }
    if (caps.mouseButtons >= 2 && caps.hasRelativeAxes) {
        return DeviceType::Mouse;
    }
    if (caps.totalKeys > 0 || caps.hasRelativeAxes) {
        return DeviceType::Other;
    }
    return DeviceType::Unknown;
}

bool Device::looksLikeKeyboard() const {
    return hasKey(KEY_A) && hasKey(KEY_LEFTCTRL);
}

std::vector<Device> Device::parseDevices(std::istream& in) {
    std::vector<Device> devices;
    std::vector<std::string> currentBlock;
    std::string line;

    auto flush = [&]() {
        if (currentBlock.empty()) return;
        Device device = parseDeviceBlock(currentBlock);
        if (!device.name.empty() && !device.eventPath.empty()) {
            devices.push_back(device);
        }
        currentBlock.clear();
    };

    while (std::getline(in, line)) {
        if (line.empty()) {
            flush();
        } else {
            currentBlock.push_back(line);
        }
    }
    flush();

    return devices;
}

std::vector<Device> Device::getAllDevices() {
    std::ifstream proc("/proc/bus/input/devices");
    if (!proc.is_open()) {
        error("Cannot open /proc/bus/input/devices");
        return {};
    }
    return parseDevices(proc);
}

Device Device::findKeyboard() {
    return findKeyboard(getAllDevices());
}

Device Device::findKeyboard(const std::vector<Device>& devices) {
    auto it = std::find_if(devices.begin(), devices.end(),
                           [](const Device& d) { return d.looksLikeKeyboard(); });
    if (it == devices.end()) {
        throw DeviceError("Keyboard device not found. Set \"input_device\" in the config "
                          "to /dev/input/by-id/...-event-kbd");
    }
    return *it;
}

std::string Device::toString() const {
    std::ostringstream oss;
    oss << "Device: '" << name << "'\n";
    oss << "  Type: ";

    switch (type) {
        case DeviceType::Keyboard: oss << "Keyboard"; break;
        case DeviceType::Mouse: oss << "Mouse"; break;
        case DeviceType::Other: oss << "Other"; break;
        default: oss << "Unknown"; break;
    }

    oss << "\n  Event: " << eventPath << "\n";
    oss << "  Bus: 0x" << std::hex << busType << ", Vendor: 0x" << vendor
        << ", Product: 0x" << product << std::dec << "\n";
    oss << "  Capabilities: " << caps.totalKeys << " keys, "
        << caps.letterKeys << " letters, "
        << caps.mouseButtons << " mouse buttons\n";
    oss << "  Usable as trigger keyboard: " << (looksLikeKeyboard() ? "yes" : "no") << "\n";

    return oss.str();
}

} // namespace hotmacro
