#include "win_input_hook.h"
#include "key_codes.h"
#include "logger.h"
#include "win_util.h"

#include <cstdlib>
#include <exception>

static WinInputHook* g_instance = nullptr;

WinInputHook::WinInputHook(InputInterceptor& interceptor)
    : m_interceptor(interceptor)
{
}

WinInputHook::~WinInputHook()
{
    Uninstall();
}

void WinInputHook::Install()
{
    if (IsInstalled()) return;
    if (g_instance && g_instance != this)
        throw HookInstallError("Another input hook is already installed");

    g_instance = this;
    HINSTANCE hMod = GetModuleHandleW(nullptr);

    Logger::Info("HOOK", "Avant SetWindowsHookExW keyboard");
    m_keyboardHook = SetWindowsHookExW(WH_KEYBOARD_LL, KeyboardProc, hMod, 0);
    if (!m_keyboardHook)
    {
        const std::string err = WinUtil_ErrorText(GetLastError());
        g_instance = nullptr;
        throw HookInstallError("Failed to install keyboard hook: " + err);
    }

    Logger::Info("HOOK", "Avant SetWindowsHookExW mouse");
    m_mouseHook = SetWindowsHookExW(WH_MOUSE_LL, MouseProc, hMod, 0);
    if (!m_mouseHook)
    {
        const std::string err = WinUtil_ErrorText(GetLastError());
        UnhookWindowsHookEx(m_keyboardHook);
        m_keyboardHook = nullptr;
        g_instance = nullptr;
        throw HookInstallError("Failed to install mouse hook: " + err);
    }

    Logger::Info("HOOK", "Hooks OK");
}

void WinInputHook::Uninstall()
{
    if (m_keyboardHook)
    {
        if (!UnhookWindowsHookEx(m_keyboardHook))
            Logger::Warn("HOOK", "UnhookWindowsHookEx keyboard failed: " + WinUtil_ErrorText(GetLastError()));
        m_keyboardHook = nullptr;
    }
    if (m_mouseHook)
    {
        if (!UnhookWindowsHookEx(m_mouseHook))
            Logger::Warn("HOOK", "UnhookWindowsHookEx mouse failed: " + WinUtil_ErrorText(GetLastError()));
        m_mouseHook = nullptr;
    }
    if (g_instance == this)
    {
        g_instance = nullptr;
        Logger::Info("HOOK", "Hooks removed");
    }
}

bool WinInputHook::IsInstalled() const
{
    return m_keyboardHook != nullptr && m_mouseHook != nullptr;
}

// ============================================================
// Callbacks
// ============================================================

LRESULT CALLBACK WinInputHook::KeyboardProc(int nCode, WPARAM wParam, LPARAM lParam)
{
    WinInputHook* self = g_instance;
    if (nCode == HC_ACTION && lParam && self)
    {
        const KBDLLHOOKSTRUCT* k = (const KBDLLHOOKSTRUCT*)lParam;
        if (self->HandleKeyboard(wParam, *k)) return 1;
    }
    return CallNextHookEx(self ? self->m_keyboardHook : nullptr, nCode, wParam, lParam);
}

LRESULT CALLBACK WinInputHook::MouseProc(int nCode, WPARAM wParam, LPARAM lParam)
{
    WinInputHook* self = g_instance;
    if (nCode == HC_ACTION && lParam && self)
    {
        const MSLLHOOKSTRUCT* m = (const MSLLHOOKSTRUCT*)lParam;
        if (self->HandleMouse(wParam, *m)) return 1;
    }
    return CallNextHookEx(self ? self->m_mouseHook : nullptr, nCode, wParam, lParam);
}

bool WinInputHook::HandleKeyboard(WPARAM wParam, const KBDLLHOOKSTRUCT& k)
{
    bool down = false;
    if (wParam == WM_KEYDOWN || wParam == WM_SYSKEYDOWN) down = true;
    else if (wParam != WM_KEYUP && wParam != WM_SYSKEYUP) return false;

    const uint16_t vk = (uint16_t)(k.vkCode & 0xFF);
    if (KeyCodes_IsCtrl(vk)) m_ctrlHeld = down;
    else if (KeyCodes_IsAlt(vk)) m_altHeld = down;
    else if (KeyCodes_IsShift(vk)) m_shiftHeld = down;

    RawInputEvent e = RawInput_MakeKey(vk, down, RawInput_NowMs(), m_ctrlHeld, m_altHeld, m_shiftHeld);
    e.injected = (k.flags & LLKHF_INJECTED) != 0;
    e.synthetic = (k.dwExtraInfo == (ULONG_PTR)kSyntheticExtraInfo);

    try
    {
        return m_interceptor.OnRawEvent(e);
    }
    catch (const std::exception& ex)
    {
        Logger::Error("HOOK_KB", std::string("Exception in keyboard callback: ") + ex.what());
        return false;
    }
}

bool WinInputHook::HandleMouse(WPARAM wParam, const MSLLHOOKSTRUCT& m)
{
    const uint64_t now = RawInput_NowMs();
    const int x = m.pt.x;
    const int y = m.pt.y;
    RawInputEvent e;

    switch (wParam)
    {
    case WM_MOUSEMOVE:   e = RawInput_MakeMouseMove(x, y, now); break;
    case WM_LBUTTONDOWN: e = RawInput_MakeMouseButton(MouseButton::Left, true, x, y, now); break;
    case WM_LBUTTONUP:   e = RawInput_MakeMouseButton(MouseButton::Left, false, x, y, now); break;
    case WM_RBUTTONDOWN: e = RawInput_MakeMouseButton(MouseButton::Right, true, x, y, now); break;
    case WM_RBUTTONUP:   e = RawInput_MakeMouseButton(MouseButton::Right, false, x, y, now); break;
    case WM_MBUTTONDOWN: e = RawInput_MakeMouseButton(MouseButton::Middle, true, x, y, now); break;
    case WM_MBUTTONUP:   e = RawInput_MakeMouseButton(MouseButton::Middle, false, x, y, now); break;
    case WM_XBUTTONDOWN:
    case WM_XBUTTONUP:
    {
        const MouseButton b = (HIWORD(m.mouseData) == XBUTTON2) ? MouseButton::X2 : MouseButton::X1;
        e = RawInput_MakeMouseButton(b, wParam == WM_XBUTTONDOWN, x, y, now);
        break;
    }
    case WM_MOUSEWHEEL:
    case WM_MOUSEHWHEEL:
        e = RawInput_MakeMouseWheel((int)(short)HIWORD(m.mouseData), x, y, now);
        e.horizontalWheel = (wParam == WM_MOUSEHWHEEL);
        break;
    default:
        return false;
    }

    e.ctrl = m_ctrlHeld;
    e.alt = m_altHeld;
    e.shift = m_shiftHeld;
    e.injected = (m.flags & LLMHF_INJECTED) != 0;
    e.synthetic = (m.dwExtraInfo == (ULONG_PTR)kSyntheticExtraInfo);

    if (e.edge == InputEdge::Down)
    {
        const DWORD dt = m.time - m_lastDownTime;
        const int cx = GetSystemMetrics(SM_CXDOUBLECLK) / 2;
        const int cy = GetSystemMetrics(SM_CYDOUBLECLK) / 2;
        e.doubleClick = (e.button == m_lastDownButton && dt <= GetDoubleClickTime() &&
                         std::abs(x - m_lastDownPt.x) <= cx && std::abs(y - m_lastDownPt.y) <= cy);

        // A double click does not chain into a triple
        m_lastDownButton = e.doubleClick ? MouseButton::None : e.button;
        m_lastDownTime = m.time;
        m_lastDownPt = m.pt;
    }

    try
    {
        return m_interceptor.OnRawEvent(e);
    }
    catch (const std::exception& ex)
    {
        Logger::Error("HOOK_MOUSE", std::string("Exception in mouse callback: ") + ex.what());
        return false;
    }
}
