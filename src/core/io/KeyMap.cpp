#include "KeyMap.hpp"
#include "core/Errors.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <mutex>

namespace hotmacro {

std::unordered_map<std::string, KeyMap::KeyEntry> KeyMap::nameToKey;
std::unordered_map<int, std::string> KeyMap::evdevToName;

namespace {
constexpr std::array<int, 24> kFunctionKeys = {
    KEY_F1,  KEY_F2,  KEY_F3,  KEY_F4,  KEY_F5,  KEY_F6,
    KEY_F7,  KEY_F8,  KEY_F9,  KEY_F10, KEY_F11, KEY_F12,
    KEY_F13, KEY_F14, KEY_F15, KEY_F16, KEY_F17, KEY_F18,
    KEY_F19, KEY_F20, KEY_F21, KEY_F22, KEY_F23, KEY_F24,
};

std::once_flag initFlag;
}

void KeyMap::AddKey(const std::string& name, int evdev) {
    KeyEntry entry = {name, evdev};
    nameToKey[name] = entry;
    // First registration wins so ToName() stays stable
    evdevToName.emplace(evdev, name);
}

void KeyMap::AddAlias(const std::string& alias, const std::string& primaryName) {
    auto it = nameToKey.find(primaryName);
    if (it != nameToKey.end()) {
        nameToKey[alias] = it->second;
    } else {
        warning("Primary key name '{}' not found for alias '{}'", primaryName, alias);
    }
}

void KeyMap::Initialize() {
    std::call_once(initFlag, [] {
        // Letters
        const std::array<std::pair<const char*, int>, 26> letters = {{
            {"a", KEY_A}, {"b", KEY_B}, {"c", KEY_C}, {"d", KEY_D}, {"e", KEY_E},
            {"f", KEY_F}, {"g", KEY_G}, {"h", KEY_H}, {"i", KEY_I}, {"j", KEY_J},
            {"k", KEY_K}, {"l", KEY_L}, {"m", KEY_M}, {"n", KEY_N}, {"o", KEY_O},
            {"p", KEY_P}, {"q", KEY_Q}, {"r", KEY_R}, {"s", KEY_S}, {"t", KEY_T},
            {"u", KEY_U}, {"v", KEY_V}, {"w", KEY_W}, {"x", KEY_X}, {"y", KEY_Y},
            {"z", KEY_Z},
        }};
        for (const auto& [name, code] : letters) {
            AddKey(name, code);
        }

        // Top-row digits
        AddKey("1", KEY_1);
        AddKey("2", KEY_2);
        AddKey("3", KEY_3);
        AddKey("4", KEY_4);
        AddKey("5", KEY_5);
        AddKey("6", KEY_6);
        AddKey("7", KEY_7);
        AddKey("8", KEY_8);
        AddKey("9", KEY_9);
        AddKey("0", KEY_0);

        // Punctuation (US layout)
        AddKey("`", KEY_GRAVE);
        AddKey("-", KEY_MINUS);
        AddKey("=", KEY_EQUAL);
        AddKey("[", KEY_LEFTBRACE);
        AddKey("]", KEY_RIGHTBRACE);
        AddKey("\\", KEY_BACKSLASH);
        AddKey(";", KEY_SEMICOLON);
        AddKey("'", KEY_APOSTROPHE);
        AddKey(",", KEY_COMMA);
        AddKey(".", KEY_DOT);
        AddKey("/", KEY_SLASH);
        AddAlias("grave", "`");
        AddAlias("minus", "-");
        AddAlias("equal", "=");
        AddAlias("comma", ",");
        AddAlias("dot", ".");
        AddAlias("slash", "/");

        // Editing and navigation
        AddKey("enter", KEY_ENTER);
        AddKey("esc", KEY_ESC);
        AddKey("tab", KEY_TAB);
        AddKey("space", KEY_SPACE);
        AddKey("backspace", KEY_BACKSPACE);
        AddKey("delete", KEY_DELETE);
        AddKey("insert", KEY_INSERT);
        AddKey("home", KEY_HOME);
        AddKey("end", KEY_END);
        AddKey("page_up", KEY_PAGEUP);
        AddKey("page_down", KEY_PAGEDOWN);
        AddKey("up", KEY_UP);
        AddKey("down", KEY_DOWN);
        AddKey("left", KEY_LEFT);
        AddKey("right", KEY_RIGHT);
        AddKey("caps_lock", KEY_CAPSLOCK);
        AddKey("print_screen", KEY_SYSRQ);
        AddKey("menu", KEY_COMPOSE);
        AddAlias("return", "enter");
        AddAlias("escape", "esc");
        AddAlias("del", "delete");
        AddAlias("pgup", "page_up");
        AddAlias("pgdn", "page_down");

        // Modifiers, left side first so the bare name maps to the left key
        AddKey("shift_l", KEY_LEFTSHIFT);
        AddKey("shift_r", KEY_RIGHTSHIFT);
        AddKey("ctrl_l", KEY_LEFTCTRL);
        AddKey("ctrl_r", KEY_RIGHTCTRL);
        AddKey("alt_l", KEY_LEFTALT);
        AddKey("alt_r", KEY_RIGHTALT);
        AddKey("meta_l", KEY_LEFTMETA);
        AddKey("meta_r", KEY_RIGHTMETA);
        AddAlias("shift", "shift_l");
        AddAlias("ctrl", "ctrl_l");
        AddAlias("control", "ctrl_l");
        AddAlias("alt", "alt_l");
        AddAlias("alt_gr", "alt_r");
        AddAlias("meta", "meta_l");
        AddAlias("cmd", "meta_l");
        AddAlias("cmd_l", "meta_l");
        AddAlias("cmd_r", "meta_r");
        AddAlias("super", "meta_l");
        AddAlias("win", "meta_l");

        // Function keys
        for (size_t i = 0; i < kFunctionKeys.size(); ++i) {
            AddKey("f" + std::to_string(i + 1), kFunctionKeys[i]);
        }

        // Mouse buttons, only reachable through MouseButton()/ToName()
        evdevToName.emplace(BTN_LEFT, "mouse_left");
        evdevToName.emplace(BTN_RIGHT, "mouse_right");
        evdevToName.emplace(BTN_MIDDLE, "mouse_middle");
    });
}

int KeyMap::FromName(const std::string& name) {
    Initialize();
    auto it = nameToKey.find(name);
    if (it != nameToKey.end()) {
        return it->second.evdevCode;
    }
    return 0;
}

int KeyMap::FromChar(char ch) {
    if (ch == ' ') {
        return KEY_SPACE;
    }
    if (!std::isprint(static_cast<unsigned char>(ch))) {
        return 0;
    }
    // Only single-character names live in the table, so longer names never match
    char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return FromName(std::string(1, lower));
}

int KeyMap::FunctionKey(int n) {
    if (n < 1 || n > static_cast<int>(kFunctionKeys.size())) {
        return 0;
    }
    return kFunctionKeys[n - 1];
}

int KeyMap::MouseButton(const std::string& name) {
    if (name == "left") return BTN_LEFT;
    if (name == "right") return BTN_RIGHT;
    if (name == "middle") return BTN_MIDDLE;
    return 0;
}

std::string KeyMap::ToName(int code) {
    Initialize();
    auto it = evdevToName.find(code);
    if (it != evdevToName.end()) {
        return it->second;
    }
    return "";
}

std::string KeyMap::Describe(int code) {
    std::string name = ToName(code);
    if (name.empty()) {
        return "evdev_" + std::to_string(code);
    }
    return name;
}

int ParseMacroKey(const std::string& raw) {
    if (raw == " ") {
        return KEY_SPACE;
    }

    std::string key = raw;
    key.erase(0, key.find_first_not_of(" \t"));
    auto last = key.find_last_not_of(" \t");
    key.erase(last == std::string::npos ? 0 : last + 1);

    if (key.starts_with("Key.")) {
        std::string name = key.substr(4);
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        int code = 0;
        // Restrict Key.* to named keys; "Key.a" is not a valid reference
        if (name.size() > 1) {
            code = KeyMap::FromName(name);
        }
        if (code == 0) {
            throw UnsupportedKey("Unsupported Key.*: " + raw);
        }
        return code;
    }

    if (key.size() == 1) {
        int code = KeyMap::FromChar(key[0]);
        if (code == 0) {
            throw UnsupportedKey("Unsupported char key: '" + key + "'");
        }
        return code;
    }

    throw UnsupportedKey("Unsupported key format: '" + raw + "'");
}

} // namespace hotmacro
