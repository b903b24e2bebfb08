#include "HotkeyChord.hpp"
#include "KeyMap.hpp"
#include "core/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace hotmacro {

namespace {

std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::set<int> parseToken(const std::string& token, const std::string& spec) {
    if (token == "<ctrl>" || token == "<control>") {
        return {KEY_LEFTCTRL, KEY_RIGHTCTRL};
    }
    if (token == "<shift>") {
        return {KEY_LEFTSHIFT, KEY_RIGHTSHIFT};
    }
    if (token == "<alt>") {
        return {KEY_LEFTALT, KEY_RIGHTALT};
    }
    if (token == "<meta>" || token == "<super>" || token == "<win>") {
        return {KEY_LEFTMETA, KEY_RIGHTMETA};
    }

    // <f1> .. <f24>
    if (token.size() > 3 && token.starts_with("<f") && token.ends_with(">")) {
        std::string digits = token.substr(2, token.size() - 3);
        bool numeric = !digits.empty() && digits.size() <= 2 &&
                       std::all_of(digits.begin(), digits.end(),
                                   [](unsigned char c) { return std::isdigit(c) != 0; });
        int code = numeric ? KeyMap::FunctionKey(std::stoi(digits)) : 0;
        if (code == 0) {
            throw InvalidHotkeySpec("Unsupported function key '" + token + "' in hotkey '" + spec + "'");
        }
        return {code};
    }

    if (token.size() == 1) {
        int code = KeyMap::FromChar(token[0]);
        if (code == 0) {
            throw InvalidHotkeySpec("Unsupported char key '" + token + "' in hotkey '" + spec + "'");
        }
        return {code};
    }

    throw InvalidHotkeySpec("Unsupported hotkey token '" + token + "' in hotkey '" + spec + "'");
}

} // namespace

HotkeyRequirement ParseHotkey(const std::string& spec) {
    HotkeyRequirement req;
    req.spec = trim(spec);

    std::istringstream iss(spec);
    std::string part;
    while (std::getline(iss, part, '+')) {
        // " " on its own is the space key, anything else is trimmed
        std::string token = (part == " ") ? part : trim(part);
        if (token.empty()) continue;
        std::transform(token.begin(), token.end(), token.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        req.alternatives.push_back(parseToken(token, spec));
    }

    if (req.alternatives.empty()) {
        throw InvalidHotkeySpec("Empty hotkey specification: '" + spec + "'");
    }
    return req;
}

bool IsSatisfied(const PressedSet& pressed, const HotkeyRequirement& req) {
    if (req.alternatives.empty()) {
        return false;
    }
    return std::all_of(req.alternatives.begin(), req.alternatives.end(),
                       [&pressed](const std::set<int>& alt) {
                           return std::any_of(alt.begin(), alt.end(),
                                              [&pressed](int code) { return pressed.count(code) > 0; });
                       });
}

} // namespace hotmacro
