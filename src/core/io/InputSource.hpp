#pragma once
#include <optional>

namespace hotmacro {

struct KeyEvent {
    enum Value { Up = 0, Down = 1, Repeat = 2 };

    int code = 0;
    int value = Up;
};

// Blocking stream of key events from a physical keyboard
class InputSource {
public:
    virtual ~InputSource() = default;

    // Blocks until the next key event; std::nullopt once the stream has
    // ended or Interrupt() was called
    virtual std::optional<KeyEvent> ReadEvent() = 0;

    // Wake a blocked ReadEvent() from another thread
    virtual void Interrupt() {}
};

} // namespace hotmacro
