#pragma once
#include <cstdint>

// ============================================================
// RAW INPUT EVENT
// Normalized payload of one low-level hook callback.
// Produced and consumed inside the callback, never persisted.
// ============================================================

// Marker put in dwExtraInfo of every event we inject ourselves ('IWMC')
constexpr uint64_t kSyntheticExtraInfo = 0x49574D43ULL;

enum class InputDevice : uint8_t
{
    Keyboard = 0,
    Mouse    = 1,
};

enum class InputEdge : uint8_t
{
    Down  = 0,
    Up    = 1,
    Move  = 2,
    Wheel = 3,
};

enum class MouseButton : uint8_t
{
    None   = 0,
    Left   = 1,
    Right  = 2,
    Middle = 3,
    X1     = 4,
    X2     = 5,
};

struct RawInputEvent
{
    InputDevice device   = InputDevice::Keyboard;
    InputEdge   edge     = InputEdge::Down;

    uint16_t    keyCode  = 0;                  // virtual-key code (keyboard)
    MouseButton button   = MouseButton::None;  // mouse button for Down/Up

    // Modifier state at the time of the event
    bool ctrl  = false;
    bool alt   = false;
    bool shift = false;

    int  x = 0;                  // screen coordinates (mouse)
    int  y = 0;
    int  wheelDelta = 0;         // signed, multiples of 120
    bool horizontalWheel = false;
    bool doubleClick = false;    // second button down within the system double-click time

    bool injected  = false;      // LLKHF_INJECTED / LLMHF_INJECTED
    bool synthetic = false;      // injected by us (kSyntheticExtraInfo)

    uint64_t timestampMs = 0;    // monotonic

    bool IsKeyboard() const { return device == InputDevice::Keyboard; }
    bool IsMouse() const    { return device == InputDevice::Mouse; }
    bool IsDown() const     { return edge == InputEdge::Down; }
    bool IsUp() const       { return edge == InputEdge::Up; }
};

// Monotonic milliseconds (steady clock)
uint64_t RawInput_NowMs();

RawInputEvent RawInput_MakeKey(uint16_t vk, bool down, uint64_t timestampMs,
                               bool ctrl = false, bool alt = false, bool shift = false);
RawInputEvent RawInput_MakeMouseButton(MouseButton button, bool down, int x, int y, uint64_t timestampMs);
RawInputEvent RawInput_MakeMouseMove(int x, int y, uint64_t timestampMs);
RawInputEvent RawInput_MakeMouseWheel(int delta, int x, int y, uint64_t timestampMs);
