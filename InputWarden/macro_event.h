#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "raw_input_event.h"

// ============================================================
// MACRO MODEL
// MacroEvent: one recorded action, offset from recording start
// Macro:      ordered events + execution parameters + statistics
// ============================================================

enum class MacroEventType : uint8_t
{
    KeyDown = 0,
    KeyUp = 1,
    MouseDown = 2,
    MouseUp = 3,
    MouseMove = 4,
    MouseWheel = 5,
    Delay = 6,
    TextInput = 7,
    // Reserved: stored and listed, not executed by the player
    Script = 8,
    VariableSet = 9,
    Condition = 10,
    LoopStart = 11,
    LoopEnd = 12,
};

enum class MacroExecutionMode : uint8_t
{
    Once = 0,
    Repeat = 1,
    Loop = 2,
    UntilCondition = 3,  // reserved, runs like Once
    Interval = 4,
    RandomInterval = 5,
};

const char* MacroEventTypeToString(MacroEventType type);
const char* MacroExecutionModeToString(MacroExecutionMode mode);

struct MacroEvent
{
    std::string     id;
    MacroEventType  type = MacroEventType::KeyDown;
    uint32_t        timestampMs = 0;       // offset from recording start

    // Type-specific payload
    uint16_t        keyCode = 0;           // KeyDown / KeyUp
    MouseButton     mouseButton = MouseButton::None; // MouseDown / MouseUp
    int             x = 0;                 // mouse events, screen coordinates
    int             y = 0;
    int             wheelDelta = 0;        // MouseWheel
    uint32_t        delayMs = 0;           // Delay
    std::wstring    text;                  // TextInput (and reserved types)

    bool            enabled = true;
    std::wstring    description;

    bool IsKeyboard() const { return type == MacroEventType::KeyDown || type == MacroEventType::KeyUp; }
    bool IsMouse() const;
    std::string ToString() const; // "KeyDown A @120ms"
};

// Factories: give the event a fresh id
MacroEvent MacroEvent_Key(uint16_t vk, bool down, uint32_t timestampMs);
MacroEvent MacroEvent_MouseButton(MouseButton button, bool down, int x, int y, uint32_t timestampMs);
MacroEvent MacroEvent_MouseMove(int x, int y, uint32_t timestampMs);
MacroEvent MacroEvent_MouseWheel(int delta, int x, int y, uint32_t timestampMs);
MacroEvent MacroEvent_Delay(uint32_t delayMs, uint32_t timestampMs);
MacroEvent MacroEvent_Text(const std::wstring& text, uint32_t timestampMs);

// Field-wise equality of type, offset and payload (ids and descriptions ignored)
bool MacroEvent_SamePayload(const MacroEvent& a, const MacroEvent& b);

struct Macro
{
    std::string             id;
    std::wstring            name;
    std::wstring            description;
    std::vector<MacroEvent> events;

    MacroExecutionMode      mode = MacroExecutionMode::Once;
    int                     repeatCount = 1;
    uint32_t                intervalMs = 1000;
    uint32_t                randomMinMs = 500;
    uint32_t                randomMaxMs = 2000;
    bool                    enabled = true;

    int64_t                 createdAt = 0;       // unix ms
    int64_t                 modifiedAt = 0;      // unix ms

    // Usage statistics
    uint32_t                executionCount = 0;
    int64_t                 lastExecutedAt = 0;  // unix ms, 0 = never

    Macro() = default;
    explicit Macro(const std::wstring& macroName);

    // Offset of the last event
    uint32_t DurationMs() const;

    // Stable sort by timestampMs
    void SortEvents();

    // Enabled events only, ordered by offset
    std::vector<MacroEvent> PlayableEvents() const;

    // Empty when valid
    std::vector<std::string> Validate() const;

    // Copy with fresh ids (macro and events), statistics reset
    Macro CloneAs(const std::wstring& newName) const;
};

int64_t Macro_NowUnixMs();
