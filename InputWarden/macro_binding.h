#pragma once
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include "raw_input_event.h"

// ============================================================
// MACRO BINDINGS
// Trigger condition -> macro name (resolved when the trigger fires).
//
// File format ("macro_bindings.dat"):
//   INPUTWARDEN_BINDINGS_V1
//   <enabled>
//   <count>
//   per binding:
//     <id>
//     <macroName>              escaped (text_util.h)
//     <device> <vk> <ctrl> <alt> <shift> <onKeyDown> <button> <onButtonDown> <enabled>
// ============================================================

struct MacroTrigger
{
    InputDevice device = InputDevice::Keyboard;

    // Keyboard
    uint16_t keyCode = 0;
    bool     ctrl = false;
    bool     alt = false;
    bool     shift = false;
    bool     onKeyDown = true;

    // Mouse (Left / Right / Middle)
    MouseButton button = MouseButton::None;
    bool        onButtonDown = true;

    static MacroTrigger Key(uint16_t vk, bool ctrl = false, bool alt = false, bool shift = false, bool onDown = true);
    static MacroTrigger Mouse(MouseButton button, bool onDown = true);

    // Device, code/button, exact modifiers and edge
    bool Matches(const RawInputEvent& e) const;

    // "Keyboard: Ctrl+Alt+VK(65) Down" / "Mouse: Left Down"
    std::string ToString() const;
};

bool operator==(const MacroTrigger& a, const MacroTrigger& b);
bool operator!=(const MacroTrigger& a, const MacroTrigger& b);

struct MacroBinding
{
    std::string  id;
    std::wstring macroName;
    MacroTrigger trigger;
    bool         enabled = true;
};

struct MacroBindingSet
{
    bool enabled = true;
    std::vector<MacroBinding> bindings;
};

void MacroBindings_Write(std::ostream& out, const MacroBindingSet& set);
bool MacroBindings_Read(std::istream& in, MacroBindingSet& out);
