#include "macro_binding.h"
#include "text_util.h"

#include <sstream>

static const char* kBindingsHeader = "INPUTWARDEN_BINDINGS_V1";
static const size_t kMaxBindings = 100000;

MacroTrigger MacroTrigger::Key(uint16_t vk, bool ctrl, bool alt, bool shift, bool onDown)
{
    MacroTrigger t;
    t.device = InputDevice::Keyboard;
    t.keyCode = vk;
    t.ctrl = ctrl;
    t.alt = alt;
    t.shift = shift;
    t.onKeyDown = onDown;
    return t;
}

MacroTrigger MacroTrigger::Mouse(MouseButton button, bool onDown)
{
    MacroTrigger t;
    t.device = InputDevice::Mouse;
    t.button = button;
    t.onButtonDown = onDown;
    return t;
}

bool MacroTrigger::Matches(const RawInputEvent& e) const
{
    if (e.device != device) return false;

    if (device == InputDevice::Keyboard)
    {
        if (keyCode == 0 || e.keyCode != keyCode) return false;
        if (e.ctrl != ctrl || e.alt != alt || e.shift != shift) return false;
        return onKeyDown ? e.IsDown() : e.IsUp();
    }

    if (e.edge != InputEdge::Down && e.edge != InputEdge::Up) return false;
    if (button == MouseButton::None || e.button != button) return false;
    return onButtonDown ? e.IsDown() : e.IsUp();
}

std::string MacroTrigger::ToString() const
{
    if (device == InputDevice::Keyboard)
    {
        std::string s = "Keyboard: ";
        if (ctrl) s += "Ctrl+";
        if (alt) s += "Alt+";
        if (shift) s += "Shift+";
        s += "VK(" + std::to_string(keyCode) + ")";
        s += onKeyDown ? " Down" : " Up";
        return s;
    }

    std::string s = "Mouse: ";
    switch (button)
    {
    case MouseButton::Left:   s += "Left"; break;
    case MouseButton::Right:  s += "Right"; break;
    case MouseButton::Middle: s += "Middle"; break;
    default:                  s += "Button " + std::to_string((int)button); break;
    }
    s += onButtonDown ? " Down" : " Up";
    return s;
}

bool operator==(const MacroTrigger& a, const MacroTrigger& b)
{
    if (a.device != b.device) return false;
    if (a.device == InputDevice::Keyboard)
    {
        return a.keyCode == b.keyCode && a.ctrl == b.ctrl && a.alt == b.alt &&
               a.shift == b.shift && a.onKeyDown == b.onKeyDown;
    }
    return a.button == b.button && a.onButtonDown == b.onButtonDown;
}

bool operator!=(const MacroTrigger& a, const MacroTrigger& b)
{
    return !(a == b);
}

// ============================================================
// Codec
// ============================================================

void MacroBindings_Write(std::ostream& out, const MacroBindingSet& set)
{
    out << kBindingsHeader << "\n";
    out << (set.enabled ? 1 : 0) << "\n";
    out << set.bindings.size() << "\n";
    for (const auto& b : set.bindings)
    {
        const MacroTrigger& t = b.trigger;
        out << (b.id.empty() ? std::string("~") : b.id) << "\n";
        out << TextUtil_EscapeLine(b.macroName) << "\n";
        out << (int)t.device << " " << t.keyCode << " "
            << (t.ctrl ? 1 : 0) << " " << (t.alt ? 1 : 0) << " " << (t.shift ? 1 : 0) << " "
            << (t.onKeyDown ? 1 : 0) << " " << (int)t.button << " " << (t.onButtonDown ? 1 : 0) << " "
            << (b.enabled ? 1 : 0) << "\n";
    }
}

bool MacroBindings_Read(std::istream& in, MacroBindingSet& out)
{
    std::string line;
    if (!TextUtil_ReadLine(in, line) || line != kBindingsHeader) return false;

    MacroBindingSet set;
    if (!TextUtil_ReadLine(in, line)) return false;
    set.enabled = (line != "0");

    size_t count = 0;
    {
        if (!TextUtil_ReadLine(in, line)) return false;
        std::istringstream ss(line);
        if (!(ss >> count) || count > kMaxBindings) return false;
    }

    for (size_t i = 0; i < count; ++i)
    {
        MacroBinding b;
        if (!TextUtil_ReadLine(in, line)) return false;
        b.id = (line == "~") ? std::string() : line;

        if (!TextUtil_ReadLine(in, line)) return false;
        if (!TextUtil_UnescapeLine(line, b.macroName)) return false;

        if (!TextUtil_ReadLine(in, line)) return false;
        std::istringstream ss(line);
        int device = 0, ctrl = 0, alt = 0, shift = 0, onKeyDown = 1, button = 0, onButtonDown = 1, enabled = 1;
        if (!(ss >> device >> b.trigger.keyCode >> ctrl >> alt >> shift >> onKeyDown >> button >> onButtonDown >> enabled))
            return false;
        if (device != (int)InputDevice::Keyboard && device != (int)InputDevice::Mouse) return false;
        if (button < (int)MouseButton::None || button > (int)MouseButton::X2) return false;

        b.trigger.device = (InputDevice)device;
        b.trigger.ctrl = (ctrl != 0);
        b.trigger.alt = (alt != 0);
        b.trigger.shift = (shift != 0);
        b.trigger.onKeyDown = (onKeyDown != 0);
        b.trigger.button = (MouseButton)button;
        b.trigger.onButtonDown = (onButtonDown != 0);
        b.enabled = (enabled != 0);
        set.bindings.push_back(std::move(b));
    }

    out = std::move(set);
    return true;
}
