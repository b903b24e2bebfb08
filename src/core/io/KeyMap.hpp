#pragma once
#include <string>
#include <unordered_map>
#include <linux/input-event-codes.h>

namespace hotmacro {

// Converts between key names, characters and evdev codes
class KeyMap {
public:
    // Populate the tables. Safe to call repeatedly and from several threads.
    static void Initialize();

    // Lowercase name ("enter", "ctrl_l", "f5", "a") to evdev code, 0 if unknown
    static int FromName(const std::string& name);

    // Single printable character to evdev code (US layout), 0 if unsupported
    static int FromChar(char ch);

    // KEY_F1..KEY_F24, 0 outside that range
    static int FunctionKey(int n);

    // "left", "right", "middle" to BTN_*, 0 if unknown
    static int MouseButton(const std::string& name);

    // Evdev code to primary name, empty if unknown
    static std::string ToName(int code);

    // Name for log output, falls back to "evdev_<code>"
    static std::string Describe(int code);

private:
    struct KeyEntry {
        std::string primaryName;
        int evdevCode;
    };

    static void AddKey(const std::string& name, int evdev);
    static void AddAlias(const std::string& alias, const std::string& primaryName);

    static std::unordered_map<std::string, KeyEntry> nameToKey;
    static std::unordered_map<int, std::string> evdevToName;
};

// Resolve a macro key reference: "Key.<name>" or a single character.
// Throws UnsupportedKey.
int ParseMacroKey(const std::string& raw);

} // namespace hotmacro
