#include "StepInterpreter.hpp"
#include "core/Errors.hpp"
#include "utils/Logger.hpp"
#include "utils/Overloaded.hpp"
#include <algorithm>
#include <chrono>
#include <linux/input-event-codes.h>

namespace hotmacro::automation {

StepInterpreter::StepInterpreter(OutputSink& sink, HeldKeys& held)
    : sink_(sink)
    , held_(held) {}

void StepInterpreter::execute(const MacroStep& step, PlaybackSignals& signals) {
    if (const auto* w = std::get_if<WaitStep>(&step)) {
        wait(*w, signals);
        return;
    }

    if (signals.isCancelled()) {
        return;
    }

    debug("step: {}", describe(step));
    std::visit(overloaded{
        [](const WaitStep&) {},
        [this](const KeyStep& s) { keyAction(s.code, s.action); },
        [this](const ComboStep& s) { combo(s); },
        [this](const MouseClickStep& s) { mouseClick(s); },
        [this](const MouseButtonStep& s) { keyAction(s.button, s.action); },
        [this](const MouseMoveStep& s) { mouseMove(s); },
        [this](const MouseScrollStep& s) { mouseScroll(s); },
    }, step);
}

void StepInterpreter::wait(const WaitStep& step, PlaybackSignals& signals) {
    if (!(step.seconds > 0.0)) {
        return;
    }
    // Casting an oversized double to integral ticks is undefined
    using Seconds = std::chrono::duration<double>;
    const Seconds limit = PlaybackSignals::kMaxWait;
    auto duration = Seconds(step.seconds) < limit
        ? std::chrono::duration_cast<PlaybackSignals::Duration>(Seconds(step.seconds))
        : PlaybackSignals::kMaxWait;
    signals.waitRunning(duration);
}

// Shared by keyboard keys and mouse buttons
void StepInterpreter::keyAction(int code, KeyAction action) {
    auto c = static_cast<uint16_t>(code);
    switch (action) {
        case KeyAction::Tap:
            sink_.Emit(EV_KEY, c, 1);
            sink_.Emit(EV_KEY, c, 0);
            sink_.Sync();
            break;
        case KeyAction::Press:
            sink_.Emit(EV_KEY, c, 1);
            sink_.Sync();
            held_.markDown(code);
            break;
        case KeyAction::Release:
            sink_.Emit(EV_KEY, c, 0);
            sink_.Sync();
            held_.markUp(code);
            break;
    }
}

void StepInterpreter::combo(const ComboStep& step) {
    for (int code : step.codes) {
        sink_.Emit(EV_KEY, static_cast<uint16_t>(code), 1);
    }
    for (auto it = step.codes.rbegin(); it != step.codes.rend(); ++it) {
        sink_.Emit(EV_KEY, static_cast<uint16_t>(*it), 0);
    }
    sink_.Sync();
}

void StepInterpreter::mouseClick(const MouseClickStep& step) {
    int count = std::max(1, step.count);
    for (int i = 0; i < count; ++i) {
        keyAction(step.button, KeyAction::Tap);
    }
}

void StepInterpreter::mouseMove(const MouseMoveStep& step) {
    if (step.mode != MoveMode::Relative) {
        throw UnsupportedMode("mouse_move.mode must be \"relative\"; absolute positioning is not supported");
    }
    if (step.dx != 0) {
        sink_.Emit(EV_REL, REL_X, step.dx);
    }
    if (step.dy != 0) {
        sink_.Emit(EV_REL, REL_Y, step.dy);
    }
    sink_.Sync();
}

void StepInterpreter::mouseScroll(const MouseScrollStep& step) {
    if (step.dy == 0) {
        return;
    }
    sink_.Emit(EV_REL, REL_WHEEL, step.dy);
    sink_.Sync();
}

} // namespace hotmacro::automation
