#pragma once

#include "HeldKeys.hpp"
#include "MacroStep.hpp"
#include "PlaybackSignals.hpp"
#include "core/io/OutputSink.hpp"

namespace hotmacro::automation {

/**
 * Executes macro steps against one output device and one held-key ledger.
 *
 * Waits honour the pause gate and cancellation. Every other step is skipped
 * when cancellation was already requested, and otherwise runs to completion.
 * Device write failures propagate as DeviceWriteError.
 */
class StepInterpreter {
public:
    StepInterpreter(OutputSink& sink, HeldKeys& held);

    void execute(const MacroStep& step, PlaybackSignals& signals);

private:
    void keyAction(int code, KeyAction action);
    void wait(const WaitStep& step, PlaybackSignals& signals);
    void combo(const ComboStep& step);
    void mouseClick(const MouseClickStep& step);
    void mouseMove(const MouseMoveStep& step);
    void mouseScroll(const MouseScrollStep& step);

    OutputSink& sink_;
    HeldKeys& held_;
};

} // namespace hotmacro::automation
