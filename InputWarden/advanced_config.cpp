#include "advanced_config.h"
#include "key_codes.h"

#include <vector>

static std::string JoinNames(const std::vector<std::string>& names)
{
    std::string out;
    for (size_t i = 0; i < names.size(); ++i)
    {
        if (i) out += ", ";
        out += names[i];
    }
    return out;
}

// ---------------- Keyboard ----------------

bool KeyboardAdvancedConfig::IsKeyBlocked(uint16_t vk) const
{
    if (blockedKeys.count(vk)) return true;

    if (blockModifierKeys && KeyCodes_IsModifier(vk)) return true;
    if (blockFunctionKeys && KeyCodes_IsFunction(vk)) return true;
    if (blockNumberKeys   && KeyCodes_IsNumber(vk))   return true;
    if (blockLetterKeys   && KeyCodes_IsLetter(vk))   return true;
    if (blockArrowKeys    && KeyCodes_IsArrow(vk))    return true;
    if (blockSpecialKeys  && KeyCodes_IsSpecial(vk))  return true;

    return false;
}

bool KeyboardAdvancedConfig::IsBlocked(const RawInputEvent& e) const
{
    if (!e.IsKeyboard()) return false;
    return IsKeyBlocked(e.keyCode);
}

void KeyboardAdvancedConfig::SetCategory(KeyCategory category, bool block)
{
    switch (category)
    {
    case KeyCategory::Modifier: blockModifierKeys = block; break;
    case KeyCategory::Function: blockFunctionKeys = block; break;
    case KeyCategory::Number:   blockNumberKeys   = block; break;
    case KeyCategory::Letter:   blockLetterKeys   = block; break;
    case KeyCategory::Arrow:    blockArrowKeys    = block; break;
    case KeyCategory::Special:  blockSpecialKeys  = block; break;
    }
}

bool KeyboardAdvancedConfig::GetCategory(KeyCategory category) const
{
    switch (category)
    {
    case KeyCategory::Modifier: return blockModifierKeys;
    case KeyCategory::Function: return blockFunctionKeys;
    case KeyCategory::Number:   return blockNumberKeys;
    case KeyCategory::Letter:   return blockLetterKeys;
    case KeyCategory::Arrow:    return blockArrowKeys;
    case KeyCategory::Special:  return blockSpecialKeys;
    }
    return false;
}

void KeyboardAdvancedConfig::BlockAllCategories()
{
    blockModifierKeys = true;
    blockFunctionKeys = true;
    blockNumberKeys = true;
    blockLetterKeys = true;
    blockArrowKeys = true;
    blockSpecialKeys = true;
}

bool KeyboardAdvancedConfig::HasAnyCategory() const
{
    return blockModifierKeys || blockFunctionKeys || blockNumberKeys ||
           blockLetterKeys || blockArrowKeys || blockSpecialKeys;
}

void KeyboardAdvancedConfig::ToggleKeySelection(uint16_t vk)
{
    if (selectedKeys.count(vk)) selectedKeys.erase(vk);
    else selectedKeys.insert(vk);
}

bool KeyboardAdvancedConfig::IsKeySelected(uint16_t vk) const
{
    return selectedKeys.count(vk) != 0;
}

void KeyboardAdvancedConfig::ApplySelection()
{
    blockedKeys.insert(selectedKeys.begin(), selectedKeys.end());
    selectedKeys.clear();
}

void KeyboardAdvancedConfig::ClearAll()
{
    blockedKeys.clear();
    selectedKeys.clear();
    blockModifierKeys = false;
    blockFunctionKeys = false;
    blockNumberKeys = false;
    blockLetterKeys = false;
    blockArrowKeys = false;
    blockSpecialKeys = false;
}

std::string KeyboardAdvancedConfig::Summary() const
{
    std::vector<std::string> categories;
    if (blockModifierKeys) categories.push_back("Modifiers");
    if (blockFunctionKeys) categories.push_back("Function");
    if (blockNumberKeys)   categories.push_back("Numbers");
    if (blockLetterKeys)   categories.push_back("Letters");
    if (blockArrowKeys)    categories.push_back("Arrows");
    if (blockSpecialKeys)  categories.push_back("Special");

    std::string summary = std::to_string(blockedKeys.size()) + " individual keys";
    if (!categories.empty())
        summary += " + " + JoinNames(categories);
    return summary;
}

// ---------------- Mouse ----------------

const char* MouseActionToString(MouseAction action)
{
    switch (action)
    {
    case MouseAction::LeftButton:   return "Left Button";
    case MouseAction::RightButton:  return "Right Button";
    case MouseAction::MiddleButton: return "Middle Button";
    case MouseAction::X1Button:     return "X1 Button";
    case MouseAction::X2Button:     return "X2 Button";
    case MouseAction::Wheel:        return "Mouse Wheel";
    case MouseAction::Movement:     return "Mouse Movement";
    case MouseAction::DoubleClick:  return "Double Click";
    }
    return "Unknown";
}

static bool ButtonToAction(MouseButton button, MouseAction& out)
{
    switch (button)
    {
    case MouseButton::Left:   out = MouseAction::LeftButton;   return true;
    case MouseButton::Right:  out = MouseAction::RightButton;  return true;
    case MouseButton::Middle: out = MouseAction::MiddleButton; return true;
    case MouseButton::X1:     out = MouseAction::X1Button;     return true;
    case MouseButton::X2:     out = MouseAction::X2Button;     return true;
    default: return false;
    }
}

bool MouseAdvancedConfig::IsActionBlocked(MouseAction action) const
{
    return blockedActions.count(action) != 0;
}

bool MouseAdvancedConfig::IsBlocked(const RawInputEvent& e) const
{
    if (!e.IsMouse()) return false;

    switch (e.edge)
    {
    case InputEdge::Move:
        return IsActionBlocked(MouseAction::Movement);
    case InputEdge::Wheel:
        return IsActionBlocked(MouseAction::Wheel);
    case InputEdge::Down:
    case InputEdge::Up:
    {
        if (e.doubleClick && e.IsDown() && IsActionBlocked(MouseAction::DoubleClick))
            return true;
        MouseAction action;
        if (!ButtonToAction(e.button, action)) return false;
        return IsActionBlocked(action);
    }
    }
    return false;
}

void MouseAdvancedConfig::SetActionBlocked(MouseAction action, bool block)
{
    if (block) blockedActions.insert(action);
    else blockedActions.erase(action);
}

void MouseAdvancedConfig::ToggleActionSelection(MouseAction action)
{
    if (selectedActions.count(action)) selectedActions.erase(action);
    else selectedActions.insert(action);
}

bool MouseAdvancedConfig::IsActionSelected(MouseAction action) const
{
    return selectedActions.count(action) != 0;
}

void MouseAdvancedConfig::ApplySelection()
{
    blockedActions.insert(selectedActions.begin(), selectedActions.end());
    selectedActions.clear();
}

void MouseAdvancedConfig::BlockAll()
{
    for (int a = (int)MouseAction::LeftButton; a <= (int)MouseAction::DoubleClick; ++a)
        blockedActions.insert((MouseAction)a);
}

void MouseAdvancedConfig::ClearAll()
{
    blockedActions.clear();
    selectedActions.clear();
}

std::string MouseAdvancedConfig::Summary() const
{
    std::vector<std::string> names;
    for (MouseAction a : blockedActions)
        names.push_back(MouseActionToString(a));
    return names.empty() ? "None" : JoinNames(names);
}
