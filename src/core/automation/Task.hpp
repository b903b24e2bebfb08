#pragma once

#include <string>

namespace hotmacro::automation {

class Task {
public:
    virtual ~Task() = default;

    virtual void start() = 0;
    virtual void stop() = 0;
    virtual void toggle() = 0;
    [[nodiscard]] virtual bool isRunning() const = 0;
    [[nodiscard]] virtual std::string getName() const = 0;
};

// A task whose run can be suspended and continued from the same step.
// This is what the hotkey listener drives.
class PausableTask : public Task {
public:
    virtual void pause() = 0;
    virtual void resume() = 0;
    // Start when idle, resume when paused, otherwise pause
    virtual void trigger() = 0;
    [[nodiscard]] virtual bool isPaused() const = 0;
};

} // namespace hotmacro::automation
