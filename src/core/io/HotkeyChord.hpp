#pragma once
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace hotmacro {

using PressedSet = std::set<int>;

/**
 * Parsed hotkey chord such as "<ctrl>+<shift>+e".
 *
 * Each element of `alternatives` is the set of evdev codes that satisfy one
 * token, e.g. "<ctrl>" -> {KEY_LEFTCTRL, KEY_RIGHTCTRL}. The chord holds when
 * every element has at least one of its codes pressed.
 */
struct HotkeyRequirement {
    std::string spec;
    std::vector<std::set<int>> alternatives;

    bool empty() const { return alternatives.empty(); }
};

// Throws InvalidHotkeySpec for empty input or an unrecognized token
HotkeyRequirement ParseHotkey(const std::string& spec);

bool IsSatisfied(const PressedSet& pressed, const HotkeyRequirement& req);

/**
 * Edge detector for one hotkey. Fires once when the chord goes from
 * unsatisfied to satisfied and re-arms only after it is released.
 */
class HotkeyTrigger {
public:
    explicit HotkeyTrigger(HotkeyRequirement requirement)
        : requirement_(std::move(requirement)) {}

    // Returns true when this evaluation should fire an action
    bool Update(const PressedSet& pressed) {
        bool satisfied = IsSatisfied(pressed, requirement_);
        bool fire = satisfied && armed_;
        armed_ = !satisfied;
        return fire;
    }

    bool IsArmed() const { return armed_; }
    const HotkeyRequirement& Requirement() const { return requirement_; }

private:
    HotkeyRequirement requirement_;
    bool armed_ = true;
};

} // namespace hotmacro
