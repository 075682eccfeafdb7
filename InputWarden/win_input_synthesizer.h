#pragma once
#include "input_synthesizer.h"

// SendInput-based injection. Keys go out as scan codes, mouse
// positions as absolute virtual-desktop coordinates.
class WinInputSynthesizer : public IInputSynthesizer
{
public:
    bool SendKey(uint16_t vk, bool down) override;
    bool SendMouseButton(MouseButton button, bool down, int x, int y) override;
    bool SendMouseMove(int x, int y) override;
    bool SendMouseWheel(int delta, int x, int y) override;
    bool SendChar(wchar_t ch) override;
};
