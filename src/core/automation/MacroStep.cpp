#include "MacroStep.hpp"
#include "core/io/KeyMap.hpp"
#include "utils/Overloaded.hpp"
#include <fmt/format.h>

namespace hotmacro::automation {

const char* toString(KeyAction action) {
    switch (action) {
        case KeyAction::Tap: return "tap";
        case KeyAction::Press: return "press";
        case KeyAction::Release: return "release";
    }
    return "unknown";
}

std::string describe(const MacroStep& step) {
    return std::visit(overloaded{
        [](const WaitStep& s) { return fmt::format("wait {:.3f}s", s.seconds); },
        [](const KeyStep& s) {
            return fmt::format("key {} {}", KeyMap::Describe(s.code), toString(s.action));
        },
        [](const ComboStep& s) {
            std::string keys;
            for (int code : s.codes) {
                if (!keys.empty()) keys += "+";
                keys += KeyMap::Describe(code);
            }
            return "combo " + keys;
        },
        [](const MouseClickStep& s) {
            return fmt::format("mouse_click {} x{}", KeyMap::Describe(s.button), s.count);
        },
        [](const MouseButtonStep& s) {
            return fmt::format("mouse_button {} {}", KeyMap::Describe(s.button), toString(s.action));
        },
        [](const MouseMoveStep& s) {
            return fmt::format("mouse_move {},{}{}", s.dx, s.dy,
                               s.mode == MoveMode::Absolute ? " (absolute)" : "");
        },
        [](const MouseScrollStep& s) { return fmt::format("mouse_scroll {}", s.dy); },
    }, step);
}

} // namespace hotmacro::automation
