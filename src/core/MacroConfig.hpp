#pragma once

#include "core/automation/MacroStep.hpp"
#include "core/io/HotkeyChord.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace hotmacro {

enum class TriggerMode {
    Cycle,  // start -> pause -> resume -> pause ...
    Toggle  // start -> stop
};

const char* toString(TriggerMode mode);

// Everything loaded from macros.json, fully validated
struct MacroConfig {
    HotkeyRequirement trigger;
    std::optional<HotkeyRequirement> quit;
    TriggerMode triggerMode = TriggerMode::Cycle;
    bool loop = false;

    std::string inputDevice;  // empty: auto-detect a keyboard
    std::string outputName;   // empty: UinputSink::kDefaultName
    std::string logLevel;     // empty: keep current level
    std::string logFile;

    automation::Macro macro;
};

// All of these throw ConfigError (or a subclass) on any problem
MacroConfig ParseConfig(const nlohmann::json& root);
MacroConfig ParseConfigString(const std::string& text);
MacroConfig LoadConfigFile(const std::string& path);

// Exposed for tests; `index` only appears in error messages
automation::MacroStep ParseStep(const nlohmann::json& step, size_t index);

} // namespace hotmacro
