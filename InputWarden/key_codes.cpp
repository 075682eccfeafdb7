#include "key_codes.h"

bool KeyCodes_IsCtrl(uint16_t vk)
{
    return vk == Vk::Control || vk == Vk::LControl || vk == Vk::RControl;
}

bool KeyCodes_IsAlt(uint16_t vk)
{
    return vk == Vk::Menu || vk == Vk::LMenu || vk == Vk::RMenu;
}

bool KeyCodes_IsShift(uint16_t vk)
{
    return vk == Vk::Shift || vk == Vk::LShift || vk == Vk::RShift;
}

bool KeyCodes_IsModifier(uint16_t vk)
{
    return KeyCodes_IsCtrl(vk) || KeyCodes_IsAlt(vk) || KeyCodes_IsShift(vk) ||
           vk == Vk::LWin || vk == Vk::RWin;
}

bool KeyCodes_IsFunction(uint16_t vk)
{
    return vk >= Vk::F1 && vk <= Vk::F24;
}

bool KeyCodes_IsNumber(uint16_t vk)
{
    return (vk >= Vk::Digit0 && vk <= Vk::Digit9) || (vk >= Vk::NumPad0 && vk <= Vk::NumPad9);
}

bool KeyCodes_IsLetter(uint16_t vk)
{
    return vk >= Vk::A && vk <= Vk::Z;
}

bool KeyCodes_IsArrow(uint16_t vk)
{
    return vk == Vk::Left || vk == Vk::Up || vk == Vk::Right || vk == Vk::Down;
}

bool KeyCodes_IsSpecial(uint16_t vk)
{
    switch (vk)
    {
    case Vk::Space: case Vk::Return: case Vk::Tab: case Vk::Back:
    case Vk::Delete: case Vk::Insert: case Vk::Home: case Vk::End:
    case Vk::Prior: case Vk::Next: case Vk::Escape: case Vk::Snapshot:
    case Vk::Pause: case Vk::Capital: case Vk::NumLock: case Vk::Scroll:
        return true;
    default:
        return false;
    }
}

std::string KeyCodes_Name(uint16_t vk)
{
    if (KeyCodes_IsLetter(vk) || (vk >= Vk::Digit0 && vk <= Vk::Digit9))
        return std::string(1, (char)vk);
    if (vk >= Vk::NumPad0 && vk <= Vk::NumPad9)
        return "NumPad" + std::to_string(vk - Vk::NumPad0);
    if (KeyCodes_IsFunction(vk))
        return "F" + std::to_string(vk - Vk::F1 + 1);
    if (KeyCodes_IsCtrl(vk)) return "Ctrl";
    if (KeyCodes_IsAlt(vk)) return "Alt";
    if (KeyCodes_IsShift(vk)) return "Shift";

    switch (vk)
    {
    case Vk::LWin: case Vk::RWin: return "Win";
    case Vk::Space:    return "Space";
    case Vk::Return:   return "Enter";
    case Vk::Tab:      return "Tab";
    case Vk::Back:     return "Backspace";
    case Vk::Delete:   return "Delete";
    case Vk::Insert:   return "Insert";
    case Vk::Home:     return "Home";
    case Vk::End:      return "End";
    case Vk::Prior:    return "PageUp";
    case Vk::Next:     return "PageDown";
    case Vk::Escape:   return "Esc";
    case Vk::Snapshot: return "PrintScreen";
    case Vk::Pause:    return "Pause";
    case Vk::Capital:  return "CapsLock";
    case Vk::NumLock:  return "NumLock";
    case Vk::Scroll:   return "ScrollLock";
    case Vk::Left:     return "Left";
    case Vk::Up:       return "Up";
    case Vk::Right:    return "Right";
    case Vk::Down:     return "Down";
    default:           return "VK(" + std::to_string(vk) + ")";
    }
}
