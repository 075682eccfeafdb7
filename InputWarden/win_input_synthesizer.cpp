#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <windows.h>

#include "win_input_synthesizer.h"
#include "logger.h"
#include "win_util.h"

static bool IsExtendedVk(uint16_t vk)
{
    switch (vk)
    {
    case VK_RCONTROL: case VK_RMENU: case VK_INSERT: case VK_DELETE:
    case VK_HOME: case VK_END: case VK_PRIOR: case VK_NEXT:
    case VK_LEFT: case VK_RIGHT: case VK_UP: case VK_DOWN:
    case VK_NUMLOCK: case VK_DIVIDE: case VK_SNAPSHOT:
    case VK_LWIN: case VK_RWIN: case VK_APPS:
        return true;
    default:
        return false;
    }
}

static bool SendInputs(INPUT* inputs, UINT count, const char* what)
{
    UINT sent = SendInput(count, inputs, sizeof(INPUT));
    if (sent != count)
    {
        Logger::Warn("SYNTH", std::string(what) + " rejected: " + WinUtil_ErrorText(GetLastError()));
        return false;
    }
    return true;
}

// Absolute coordinates normalized to 0..65535 over the virtual desktop
static void ToAbsolute(int x, int y, LONG& ax, LONG& ay)
{
    const RECT vs = WinUtil_GetVirtualScreenRect();
    const int w = (vs.right - vs.left) > 1 ? (vs.right - vs.left) : 2;
    const int h = (vs.bottom - vs.top) > 1 ? (vs.bottom - vs.top) : 2;
    ax = (LONG)MulDiv(x - vs.left, 65535, w - 1);
    ay = (LONG)MulDiv(y - vs.top, 65535, h - 1);
}

static INPUT MakeMouseInput(DWORD flags, int x, int y, DWORD data)
{
    INPUT i{};
    i.type = INPUT_MOUSE;
    ToAbsolute(x, y, i.mi.dx, i.mi.dy);
    i.mi.mouseData = data;
    i.mi.dwFlags = flags | MOUSEEVENTF_ABSOLUTE | MOUSEEVENTF_VIRTUALDESK | MOUSEEVENTF_MOVE;
    i.mi.dwExtraInfo = (ULONG_PTR)kSyntheticExtraInfo;
    return i;
}

bool WinInputSynthesizer::SendKey(uint16_t vk, bool down)
{
    if (vk == 0 || vk > 0xFE) return false;

    INPUT i{};
    i.type = INPUT_KEYBOARD;
    i.ki.wVk = vk;
    i.ki.wScan = (WORD)MapVirtualKeyW(vk, MAPVK_VK_TO_VSC);
    i.ki.dwFlags = (down ? 0 : KEYEVENTF_KEYUP);
    if (i.ki.wScan != 0) i.ki.dwFlags |= KEYEVENTF_SCANCODE;
    if (IsExtendedVk(vk)) i.ki.dwFlags |= KEYEVENTF_EXTENDEDKEY;
    i.ki.dwExtraInfo = (ULONG_PTR)kSyntheticExtraInfo;
    return SendInputs(&i, 1, "Key");
}

bool WinInputSynthesizer::SendMouseButton(MouseButton button, bool down, int x, int y)
{
    DWORD flags = 0, data = 0;
    switch (button)
    {
    case MouseButton::Left:   flags = down ? MOUSEEVENTF_LEFTDOWN : MOUSEEVENTF_LEFTUP; break;
    case MouseButton::Right:  flags = down ? MOUSEEVENTF_RIGHTDOWN : MOUSEEVENTF_RIGHTUP; break;
    case MouseButton::Middle: flags = down ? MOUSEEVENTF_MIDDLEDOWN : MOUSEEVENTF_MIDDLEUP; break;
    case MouseButton::X1:     flags = down ? MOUSEEVENTF_XDOWN : MOUSEEVENTF_XUP; data = XBUTTON1; break;
    case MouseButton::X2:     flags = down ? MOUSEEVENTF_XDOWN : MOUSEEVENTF_XUP; data = XBUTTON2; break;
    default: return false;
    }

    INPUT i = MakeMouseInput(flags, x, y, data);
    return SendInputs(&i, 1, "Mouse button");
}

bool WinInputSynthesizer::SendMouseMove(int x, int y)
{
    INPUT i = MakeMouseInput(0, x, y, 0);
    return SendInputs(&i, 1, "Mouse move");
}

bool WinInputSynthesizer::SendMouseWheel(int delta, int x, int y)
{
    INPUT i = MakeMouseInput(MOUSEEVENTF_WHEEL, x, y, (DWORD)delta);
    return SendInputs(&i, 1, "Mouse wheel");
}

bool WinInputSynthesizer::SendChar(wchar_t ch)
{
    INPUT inp[2] = {};
    inp[0].type = INPUT_KEYBOARD;
    inp[0].ki.wScan = (WORD)ch;
    inp[0].ki.dwFlags = KEYEVENTF_UNICODE;
    inp[0].ki.dwExtraInfo = (ULONG_PTR)kSyntheticExtraInfo;
    inp[1] = inp[0];
    inp[1].ki.dwFlags |= KEYEVENTF_KEYUP;
    return SendInputs(inp, 2, "Char");
}
