#pragma once
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <windows.h>

#include "input_hook.h"
#include "input_interceptor.h"

// ============================================================
// WIN32 LOW-LEVEL HOOKS
// WH_KEYBOARD_LL + WH_MOUSE_LL. The callbacks run on the thread
// that installed them, which must pump messages. Each callback
// normalizes the OS struct to a RawInputEvent and returns the
// interceptor's verdict (1 = swallow).
// One instance per process.
// ============================================================

class WinInputHook : public IInputHook
{
public:
    explicit WinInputHook(InputInterceptor& interceptor);
    ~WinInputHook() override;

    WinInputHook(const WinInputHook&) = delete;
    WinInputHook& operator=(const WinInputHook&) = delete;

    void Install() override;
    void Uninstall() override;
    bool IsInstalled() const override;

private:
    static LRESULT CALLBACK KeyboardProc(int nCode, WPARAM wParam, LPARAM lParam);
    static LRESULT CALLBACK MouseProc(int nCode, WPARAM wParam, LPARAM lParam);

    bool HandleKeyboard(WPARAM wParam, const KBDLLHOOKSTRUCT& k);
    bool HandleMouse(WPARAM wParam, const MSLLHOOKSTRUCT& m);

    InputInterceptor& m_interceptor;
    HHOOK m_keyboardHook = nullptr;
    HHOOK m_mouseHook = nullptr;

    // Modifier state seen by the hook itself (GetAsyncKeyState lags inside LL hooks)
    bool m_ctrlHeld = false;
    bool m_altHeld = false;
    bool m_shiftHeld = false;

    // Double-click detection
    MouseButton m_lastDownButton = MouseButton::None;
    DWORD m_lastDownTime = 0;
    POINT m_lastDownPt{};
};
