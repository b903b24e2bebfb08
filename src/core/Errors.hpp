#pragma once
#include <stdexcept>
#include <string>

namespace hotmacro {

class MacroError : public std::runtime_error {
public:
    explicit MacroError(const std::string& message) : std::runtime_error(message) {}
};

// Invalid or missing configuration. Fatal at startup.
class ConfigError : public MacroError {
public:
    explicit ConfigError(const std::string& message) : MacroError(message) {}
};

class InvalidHotkeySpec : public ConfigError {
public:
    explicit InvalidHotkeySpec(const std::string& message) : ConfigError(message) {}
};

class UnsupportedKey : public ConfigError {
public:
    explicit UnsupportedKey(const std::string& message) : ConfigError(message) {}
};

class UnknownStepType : public ConfigError {
public:
    explicit UnknownStepType(const std::string& message) : ConfigError(message) {}
};

// Raised while a step is executing; ends the current run only.
class PlaybackError : public MacroError {
public:
    explicit PlaybackError(const std::string& message) : MacroError(message) {}
};

class UnsupportedMode : public PlaybackError {
public:
    explicit UnsupportedMode(const std::string& message) : PlaybackError(message) {}
};

class DeviceError : public MacroError {
public:
    explicit DeviceError(const std::string& message) : MacroError(message) {}
};

class DeviceWriteError : public DeviceError {
public:
    explicit DeviceWriteError(const std::string& message) : DeviceError(message) {}
};

} // namespace hotmacro
