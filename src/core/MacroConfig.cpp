#include "MacroConfig.hpp"
#include "core/Errors.hpp"
#include "core/io/KeyMap.hpp"
#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

namespace hotmacro {

using json = nlohmann::json;
using namespace automation;

namespace {

std::string stepPrefix(size_t index) {
    return "macro[" + std::to_string(index) + "]: ";
}

std::string requireString(const json& obj, const char* field, const std::string& where) {
    if (!obj.contains(field)) {
        throw ConfigError(where + "missing \"" + field + "\"");
    }
    const auto& value = obj.at(field);
    if (!value.is_string()) {
        throw ConfigError(where + "\"" + field + "\" must be a string");
    }
    return value.get<std::string>();
}

std::string optionalString(const json& obj, const char* field,
                           const std::string& fallback, const std::string& where) {
    if (!obj.contains(field) || obj.at(field).is_null()) {
        return fallback;
    }
    return requireString(obj, field, where);
}

int optionalInt(const json& obj, const char* field, int fallback, const std::string& where) {
    if (!obj.contains(field) || obj.at(field).is_null()) {
        return fallback;
    }
    const auto& value = obj.at(field);
    if (!value.is_number_integer()) {
        throw ConfigError(where + "\"" + field + "\" must be an integer");
    }
    // get<int>() would truncate a 64-bit value
    bool inRange;
    if (value.is_number_unsigned()) {
        inRange = value.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max());
    } else {
        auto wide = value.get<std::int64_t>();
        inRange = wide >= std::numeric_limits<int>::min() && wide <= std::numeric_limits<int>::max();
    }
    if (!inRange) {
        throw ConfigError(where + "\"" + field + "\" is out of range");
    }
    return static_cast<int>(value.get<std::int64_t>());
}

KeyAction parseAction(const std::string& name, const std::string& where) {
    if (name == "tap") return KeyAction::Tap;
    if (name == "press") return KeyAction::Press;
    if (name == "release") return KeyAction::Release;
    throw ConfigError(where + "unknown action '" + name + "' (expected tap, press or release)");
}

int parseButton(const std::string& name, const std::string& where) {
    int code = KeyMap::MouseButton(name);
    if (code == 0) {
        throw UnsupportedKey(where + "unknown mouse button '" + name + "'");
    }
    return code;
}

int parseKey(const std::string& raw, const std::string& where) {
    try {
        return ParseMacroKey(raw);
    } catch (const UnsupportedKey& e) {
        throw UnsupportedKey(where + e.what());
    }
}

HotkeyRequirement parseHotkeyField(const json& root, const char* field) {
    std::string spec = requireString(root, field, "");
    try {
        return ParseHotkey(spec);
    } catch (const InvalidHotkeySpec& e) {
        throw InvalidHotkeySpec(std::string(field) + ": " + e.what());
    }
}

} // namespace

const char* toString(TriggerMode mode) {
    switch (mode) {
        case TriggerMode::Cycle: return "cycle";
        case TriggerMode::Toggle: return "toggle";
    }
    return "unknown";
}

MacroStep ParseStep(const json& step, size_t index) {
    const std::string where = stepPrefix(index);
    if (!step.is_object()) {
        throw ConfigError(where + "step must be an object");
    }

    const std::string type = requireString(step, "type", where);

    if (type == "wait") {
        double seconds = 0.0;
        if (step.contains("seconds") && !step.at("seconds").is_null()) {
            if (!step.at("seconds").is_number()) {
                throw ConfigError(where + "\"seconds\" must be a number");
            }
            seconds = step.at("seconds").get<double>();
            if (!std::isfinite(seconds)) {
                throw ConfigError(where + "\"seconds\" must be finite");
            }
        }
        return WaitStep{seconds};
    }

    if (type == "key") {
        int code = parseKey(requireString(step, "key", where), where);
        KeyAction action = parseAction(optionalString(step, "action", "tap", where), where);
        return KeyStep{code, action};
    }

    if (type == "combo") {
        if (!step.contains("keys") || !step.at("keys").is_array()) {
            throw ConfigError(where + "\"keys\" must be an array");
        }
        ComboStep combo;
        for (const auto& key : step.at("keys")) {
            if (!key.is_string()) {
                throw ConfigError(where + "combo keys must be strings");
            }
            combo.codes.push_back(parseKey(key.get<std::string>(), where));
        }
        if (combo.codes.empty()) {
            throw ConfigError(where + "combo needs at least one key");
        }
        return combo;
    }

    if (type == "mouse_click") {
        int button = parseButton(optionalString(step, "button", "left", where), where);
        int count = optionalInt(step, "count", 1, where);
        return MouseClickStep{button, count};
    }

    if (type == "mouse_button") {
        int button = parseButton(optionalString(step, "button", "left", where), where);
        KeyAction action = parseAction(optionalString(step, "action", "tap", where), where);
        return MouseButtonStep{button, action};
    }

    if (type == "mouse_move") {
        MouseMoveStep move;
        move.dx = optionalInt(step, "x", 0, where);
        move.dy = optionalInt(step, "y", 0, where);
        std::string mode = optionalString(step, "mode", "relative", where);
        if (mode == "relative") {
            move.mode = MoveMode::Relative;
        } else if (mode == "absolute") {
            move.mode = MoveMode::Absolute;
        } else {
            throw ConfigError(where + "unknown mouse_move mode '" + mode + "'");
        }
        return move;
    }

    if (type == "mouse_scroll") {
        return MouseScrollStep{optionalInt(step, "dy", 0, where)};
    }

    throw UnknownStepType(where + "unknown step type '" + type + "'");
}

MacroConfig ParseConfig(const json& root) {
    if (!root.is_object()) {
        throw ConfigError("configuration must be a JSON object");
    }

    MacroConfig config;
    config.trigger = parseHotkeyField(root, "trigger_hotkey");
    // A blank quit_hotkey means there is none
    std::string quit = optionalString(root, "quit_hotkey", "", "");
    if (quit.find_first_not_of(" \t\r\n") != std::string::npos) {
        config.quit = parseHotkeyField(root, "quit_hotkey");
    }

    std::string mode = optionalString(root, "trigger_mode", "cycle", "");
    if (mode == "cycle") {
        config.triggerMode = TriggerMode::Cycle;
    } else if (mode == "toggle") {
        config.triggerMode = TriggerMode::Toggle;
    } else {
        throw ConfigError("unknown trigger_mode '" + mode + "' (expected cycle or toggle)");
    }

    if (root.contains("loop") && !root.at("loop").is_null()) {
        if (!root.at("loop").is_boolean()) {
            throw ConfigError("\"loop\" must be true or false");
        }
        config.loop = root.at("loop").get<bool>();
    }

    config.inputDevice = optionalString(root, "input_device", "", "");
    config.outputName = optionalString(root, "output_name", "", "");
    config.logFile = optionalString(root, "log_file", "", "");
    config.logLevel = optionalString(root, "log_level", "", "");

    if (root.contains("macro") && !root.at("macro").is_null()) {
        const auto& steps = root.at("macro");
        if (!steps.is_array()) {
            throw ConfigError("\"macro\" must be an array of steps");
        }
        config.macro.reserve(steps.size());
        for (size_t i = 0; i < steps.size(); ++i) {
            config.macro.push_back(ParseStep(steps.at(i), i));
        }
    }

    return config;
}

MacroConfig ParseConfigString(const std::string& text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("invalid JSON: ") + e.what());
    }
    try {
        return ParseConfig(root);
    } catch (const json::exception& e) {
        throw ConfigError(e.what());
    }
}

MacroConfig LoadConfigFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    try {
        return ParseConfigString(buffer.str());
    } catch (const InvalidHotkeySpec& e) {
        throw InvalidHotkeySpec(path + ": " + e.what());
    } catch (const UnsupportedKey& e) {
        throw UnsupportedKey(path + ": " + e.what());
    } catch (const UnknownStepType& e) {
        throw UnknownStepType(path + ": " + e.what());
    } catch (const ConfigError& e) {
        throw ConfigError(path + ": " + e.what());
    }
}

} // namespace hotmacro
