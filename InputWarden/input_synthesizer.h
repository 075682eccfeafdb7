#pragma once
#include <cstdint>

#include "raw_input_event.h"

// Injection seam used by the player. Every method returns false when the
// OS refused the input. Implementations tag what they send with
// kSyntheticExtraInfo so the hook lets it through.
class IInputSynthesizer
{
public:
    virtual ~IInputSynthesizer() = default;

    virtual bool SendKey(uint16_t vk, bool down) = 0;
    virtual bool SendMouseButton(MouseButton button, bool down, int x, int y) = 0;
    virtual bool SendMouseMove(int x, int y) = 0;          // absolute screen position
    virtual bool SendMouseWheel(int delta, int x, int y) = 0;
    virtual bool SendChar(wchar_t ch) = 0;                 // down + up of one character
};
