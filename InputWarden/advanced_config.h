#pragma once
#include <cstdint>
#include <set>
#include <string>

#include "raw_input_event.h"

// ============================================================
// ADVANCED BLOCKING CONFIGURATIONS
// Keyboard: explicit key set + category flags
// Mouse:    explicit action set
// The "selected" sets are only used while a device is in Select mode
// and never decide suppression by themselves.
// ============================================================

enum class KeyCategory
{
    Modifier,
    Function,
    Number,
    Letter,
    Arrow,
    Special,
};

struct KeyboardAdvancedConfig
{
    std::set<uint16_t> blockedKeys;
    std::set<uint16_t> selectedKeys;

    bool blockModifierKeys = false;
    bool blockFunctionKeys = false;
    bool blockNumberKeys   = false;
    bool blockLetterKeys   = false;
    bool blockArrowKeys    = false;
    bool blockSpecialKeys  = false;

    bool IsKeyBlocked(uint16_t vk) const;
    bool IsBlocked(const RawInputEvent& e) const; // keyboard events only

    void SetCategory(KeyCategory category, bool block);
    bool GetCategory(KeyCategory category) const;
    void BlockAllCategories();
    bool HasAnyCategory() const;

    void ToggleKeySelection(uint16_t vk);
    bool IsKeySelected(uint16_t vk) const;
    bool HasSelectedKeys() const { return !selectedKeys.empty(); }
    void ClearSelection() { selectedKeys.clear(); }

    // Moves every selected key into blockedKeys, then clears the selection
    void ApplySelection();

    void ClearAll();

    // "3 individual keys + Modifiers, Letters"
    std::string Summary() const;
};

enum class MouseAction : uint8_t
{
    LeftButton,
    RightButton,
    MiddleButton,
    X1Button,
    X2Button,
    Wheel,
    Movement,
    DoubleClick,
};

struct MouseAdvancedConfig
{
    std::set<MouseAction> blockedActions;
    std::set<MouseAction> selectedActions;

    bool IsActionBlocked(MouseAction action) const;
    bool IsBlocked(const RawInputEvent& e) const; // mouse events only

    void SetActionBlocked(MouseAction action, bool block);

    void ToggleActionSelection(MouseAction action);
    bool IsActionSelected(MouseAction action) const;
    bool HasSelectedActions() const { return !selectedActions.empty(); }
    void ClearSelection() { selectedActions.clear(); }
    void ApplySelection();

    bool HasAnyBlocking() const { return !blockedActions.empty(); }
    void BlockAll();
    void ClearAll();

    // "Left Button, Mouse Wheel" or "None"
    std::string Summary() const;
};

const char* MouseActionToString(MouseAction action);
