#include "MacroListener.hpp"
#include "utils/Logger.hpp"

namespace hotmacro {

MacroListener::MacroListener(const MacroConfig& config, automation::PausableTask& task)
    : task(task)
    , mode(config.triggerMode)
    , trigger(config.trigger) {
    if (config.quit) {
        quit.emplace(*config.quit);
    }
}

ListenAction MacroListener::OnKeyEvent(const KeyEvent& event) {
    switch (event.value) {
        case KeyEvent::Down:
            pressed.insert(event.code);
            break;
        case KeyEvent::Up:
            pressed.erase(event.code);
            break;
        default:
            // Repeat: pressed set unchanged
            break;
    }

    if (quit && quit->Update(pressed)) {
        info("Quit hotkey {} pressed", quit->Requirement().spec);
        task.stop();
        return ListenAction::Quit;
    }

    if (trigger.Update(pressed)) {
        debug("Trigger hotkey {} pressed ({} is {})", trigger.Requirement().spec, task.getName(),
              !task.isRunning() ? "idle" : task.isPaused() ? "paused" : "running");
        if (mode == TriggerMode::Toggle) {
            task.toggle();
        } else {
            task.trigger();
        }
    }
    return ListenAction::None;
}

ListenResult MacroListener::Run(InputSource& source) {
    while (auto event = source.ReadEvent()) {
        if (OnKeyEvent(*event) == ListenAction::Quit) {
            return ListenResult::Quit;
        }
    }
    return ListenResult::EndOfStream;
}

} // namespace hotmacro
