#pragma once

#include <string>
#include <variant>
#include <vector>

namespace hotmacro::automation {

enum class KeyAction { Tap, Press, Release };
enum class MoveMode { Relative, Absolute };

struct WaitStep {
    double seconds = 0.0;
};

struct KeyStep {
    int code = 0;
    KeyAction action = KeyAction::Tap;
};

// Pressed in order, released in reverse
struct ComboStep {
    std::vector<int> codes;
};

struct MouseClickStep {
    int button = 0;
    int count = 1;
};

struct MouseButtonStep {
    int button = 0;
    KeyAction action = KeyAction::Tap;
};

struct MouseMoveStep {
    int dx = 0;
    int dy = 0;
    MoveMode mode = MoveMode::Relative;
};

struct MouseScrollStep {
    int dy = 0;
};

using MacroStep = std::variant<WaitStep, KeyStep, ComboStep, MouseClickStep,
                               MouseButtonStep, MouseMoveStep, MouseScrollStep>;

using Macro = std::vector<MacroStep>;

const char* toString(KeyAction action);

// "wait", "key", ... matching the configuration "type" tags
std::string describe(const MacroStep& step);

} // namespace hotmacro::automation
