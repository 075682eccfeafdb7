#include "input_interceptor.h"
#include "logger.h"

InputInterceptor::InputInterceptor()
    : m_keyboard("Keyboard", "keys")
    , m_mouse("Mouse", "mouse input")
{
}

bool InputInterceptor::OnRawEvent(const RawInputEvent& e)
{
    if (e.IsKeyboard())
    {
        const bool armed = m_keyboard.IsBlocked() || m_mouse.IsBlocked();
        if (!e.synthetic && m_unlock.ProcessKeyEvent(e, armed))
        {
            ForceUnlock();
            KeyboardEvents.Emit(e);
            PairWithPress(e, false);
            return false; // the press that completes the chord always gets through
        }

        KeyboardEvents.Emit(e);
        if (e.synthetic) return false;
        return PairWithPress(e, m_keyboard.IsSuppressed(e));
    }

    MouseEvents.Emit(e);
    if (e.synthetic) return false;
    return PairWithPress(e, m_mouse.IsSuppressed(e));
}

// A release gets the verdict of its press; untracked releases keep `suppress`
bool InputInterceptor::PairWithPress(const RawInputEvent& e, bool suppress)
{
    if (e.edge != InputEdge::Down && e.edge != InputEdge::Up) return suppress;

    std::lock_guard<std::mutex> lock(m_pressMutex);
    PressState* slot = nullptr;
    if (e.IsKeyboard())
    {
        if (e.keyCode >= kTrackedKeys) return suppress;
        slot = &m_keyPress[e.keyCode];
    }
    else
    {
        const size_t b = (size_t)e.button;
        if (b == 0 || b >= kTrackedButtons) return suppress;
        slot = &m_buttonPress[b];
    }

    if (e.IsDown())
    {
        if (!suppress) *slot = PressState::Passed;
        else if (*slot == PressState::None) *slot = PressState::Suppressed;
        return suppress;
    }

    const PressState press = *slot;
    *slot = PressState::None;
    if (press == PressState::Passed) return false;
    if (press == PressState::Suppressed) return true;
    return suppress;
}

void InputInterceptor::ToggleKeyboard(const std::string& reason)
{
    m_keyboard.Toggle(reason);
    Logger::Info("BLOCK", "Keyboard toggled: " + m_keyboard.Summary() + " (" + reason + ")");
}

void InputInterceptor::ToggleMouse(const std::string& reason)
{
    m_mouse.Toggle(reason);
    Logger::Info("BLOCK", "Mouse toggled: " + m_mouse.Summary() + " (" + reason + ")");
}

void InputInterceptor::SetKeyboardSimpleMode(const std::string& reason)
{
    m_keyboard.SetSimpleMode(reason);
    Logger::Info("BLOCK", "Keyboard mode: Simple");
}

void InputInterceptor::SetKeyboardAdvancedMode(const KeyboardAdvancedConfig& config, const std::string& reason)
{
    m_keyboard.SetAdvancedMode(config, reason);
    Logger::Info("BLOCK", "Keyboard mode: Advanced, " + config.Summary());
}

void InputInterceptor::SetKeyboardSelectMode(const KeyboardAdvancedConfig& config, const std::string& reason)
{
    m_keyboard.SetSelectMode(config, reason);
    Logger::Info("BLOCK", "Keyboard mode: Select");
}

bool InputInterceptor::ApplyKeyboardSelection(const std::string& reason)
{
    if (!m_keyboard.ApplySelection(reason))
    {
        Logger::Warn("BLOCK", "Keyboard selection not applied: no advanced configuration");
        return false;
    }
    Logger::Info("BLOCK", "Keyboard selection applied");
    return true;
}

void InputInterceptor::SetMouseSimpleMode(const std::string& reason)
{
    m_mouse.SetSimpleMode(reason);
    Logger::Info("BLOCK", "Mouse mode: Simple");
}

void InputInterceptor::SetMouseAdvancedMode(const MouseAdvancedConfig& config, const std::string& reason)
{
    m_mouse.SetAdvancedMode(config, reason);
    Logger::Info("BLOCK", "Mouse mode: Advanced, " + config.Summary());
}

void InputInterceptor::SetMouseSelectMode(const MouseAdvancedConfig& config, const std::string& reason)
{
    m_mouse.SetSelectMode(config, reason);
    Logger::Info("BLOCK", "Mouse mode: Select");
}

bool InputInterceptor::ApplyMouseSelection(const std::string& reason)
{
    if (!m_mouse.ApplySelection(reason))
    {
        Logger::Warn("BLOCK", "Mouse selection not applied: no advanced configuration");
        return false;
    }
    Logger::Info("BLOCK", "Mouse selection applied");
    return true;
}

void InputInterceptor::ForceUnlock()
{
    const std::string reason = m_unlock.UnlockReason();
    m_keyboard.SetBlocked(false, reason);
    m_mouse.SetBlocked(false, reason);
    Logger::Warn("UNLOCK", reason);
    EmergencyUnlocked.Emit(reason);
}

bool InputInterceptor::IsKeyboardBlocked() const
{
    return m_keyboard.IsBlocked();
}

bool InputInterceptor::IsMouseBlocked() const
{
    return m_mouse.IsBlocked();
}

void InputInterceptor::SetKeyboardBlocked(bool blocked, const std::string& reason)
{
    m_keyboard.SetBlocked(blocked, reason);
    Logger::Info("BLOCK", std::string("Keyboard ") + (blocked ? "blocked" : "unblocked") + " (" + reason + ")");
}

void InputInterceptor::SetMouseBlocked(bool blocked, const std::string& reason)
{
    m_mouse.SetBlocked(blocked, reason);
    Logger::Info("BLOCK", std::string("Mouse ") + (blocked ? "blocked" : "unblocked") + " (" + reason + ")");
}
