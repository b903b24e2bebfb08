#pragma once
#include "HotkeyChord.hpp"
#include "InputSource.hpp"
#include "core/MacroConfig.hpp"
#include "core/automation/Task.hpp"
#include <optional>

namespace hotmacro {

enum class ListenAction { None, Quit };
enum class ListenResult { Quit, EndOfStream };

/**
 * Tracks the physical pressed set and turns hotkey edges into task calls.
 *
 * The quit hotkey is checked before the trigger hotkey. Auto-repeat events
 * leave the pressed set untouched, so a held chord fires only once.
 */
class MacroListener {
public:
    MacroListener(const MacroConfig& config, automation::PausableTask& task);

    ListenAction OnKeyEvent(const KeyEvent& event);

    // Pump events until the quit hotkey fires or the source ends
    ListenResult Run(InputSource& source);

    const PressedSet& Pressed() const { return pressed; }

private:
    automation::PausableTask& task;
    TriggerMode mode;
    HotkeyTrigger trigger;
    std::optional<HotkeyTrigger> quit;
    PressedSet pressed;
};

} // namespace hotmacro
