#include "raw_input_event.h"

#include <chrono>

uint64_t RawInput_NowMs()
{
    using namespace std::chrono;
    return (uint64_t)duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

RawInputEvent RawInput_MakeKey(uint16_t vk, bool down, uint64_t timestampMs, bool ctrl, bool alt, bool shift)
{
    RawInputEvent e;
    e.device = InputDevice::Keyboard;
    e.edge = down ? InputEdge::Down : InputEdge::Up;
    e.keyCode = vk;
    e.ctrl = ctrl;
    e.alt = alt;
    e.shift = shift;
    e.timestampMs = timestampMs;
    return e;
}

RawInputEvent RawInput_MakeMouseButton(MouseButton button, bool down, int x, int y, uint64_t timestampMs)
{
    RawInputEvent e;
    e.device = InputDevice::Mouse;
    e.edge = down ? InputEdge::Down : InputEdge::Up;
    e.button = button;
    e.x = x;
    e.y = y;
    e.timestampMs = timestampMs;
    return e;
}

RawInputEvent RawInput_MakeMouseMove(int x, int y, uint64_t timestampMs)
{
    RawInputEvent e;
    e.device = InputDevice::Mouse;
    e.edge = InputEdge::Move;
    e.x = x;
    e.y = y;
    e.timestampMs = timestampMs;
    return e;
}

RawInputEvent RawInput_MakeMouseWheel(int delta, int x, int y, uint64_t timestampMs)
{
    RawInputEvent e;
    e.device = InputDevice::Mouse;
    e.edge = InputEdge::Wheel;
    e.wheelDelta = delta;
    e.x = x;
    e.y = y;
    e.timestampMs = timestampMs;
    return e;
}
