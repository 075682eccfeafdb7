#pragma once
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>

#include "blocking_control.h"
#include "blocking_state.h"
#include "emergency_unlock.h"
#include "event_signal.h"
#include "raw_input_event.h"

// ============================================================
// INPUT INTERCEPTOR
// Platform-neutral half of the interception layer. The OS hook
// normalizes each event and calls OnRawEvent(); the return value
// is the suppress (true) / pass-through (false) verdict.
//
// Order inside OnRawEvent:
//   1. emergency unlock (keyboard, pre-suppression)
//   2. publish to raw-stream subscribers
//   3. per-device blocking decision; a release follows its press
// ============================================================

class InputInterceptor : public IBlockingControl
{
public:
    InputInterceptor();

    InputInterceptor(const InputInterceptor&) = delete;
    InputInterceptor& operator=(const InputInterceptor&) = delete;

    // Hook entry point
    bool OnRawEvent(const RawInputEvent& e);

    KeyboardBlockingState& Keyboard() { return m_keyboard; }
    MouseBlockingState& Mouse() { return m_mouse; }
    const KeyboardBlockingState& Keyboard() const { return m_keyboard; }
    const MouseBlockingState& Mouse() const { return m_mouse; }
    EmergencyUnlockDetector& Unlock() { return m_unlock; }

    // Commands
    void ToggleKeyboard(const std::string& reason = BlockReason::UserToggle);
    void ToggleMouse(const std::string& reason = BlockReason::UserToggle);
    void SetKeyboardSimpleMode(const std::string& reason = BlockReason::SetSimple);
    void SetKeyboardAdvancedMode(const KeyboardAdvancedConfig& config, const std::string& reason = BlockReason::SetAdvanced);
    void SetKeyboardSelectMode(const KeyboardAdvancedConfig& config, const std::string& reason = BlockReason::SetSelect);
    bool ApplyKeyboardSelection(const std::string& reason = BlockReason::ApplySelection);
    void SetMouseSimpleMode(const std::string& reason = BlockReason::SetSimple);
    void SetMouseAdvancedMode(const MouseAdvancedConfig& config, const std::string& reason = BlockReason::SetAdvanced);
    void SetMouseSelectMode(const MouseAdvancedConfig& config, const std::string& reason = BlockReason::SetSelect);
    bool ApplyMouseSelection(const std::string& reason = BlockReason::ApplySelection);

    // Unblocks both devices with the detector's reason text
    void ForceUnlock();

    // IBlockingControl
    bool IsKeyboardBlocked() const override;
    bool IsMouseBlocked() const override;
    void SetKeyboardBlocked(bool blocked, const std::string& reason) override;
    void SetMouseBlocked(bool blocked, const std::string& reason) override;

    // Raw streams (hook thread)
    Signal<const RawInputEvent&> KeyboardEvents;
    Signal<const RawInputEvent&> MouseEvents;

    Signal<const std::string&> EmergencyUnlocked; // reason

private:
    enum class PressState : uint8_t { None, Passed, Suppressed };
    static constexpr size_t kTrackedKeys = 256;
    static constexpr size_t kTrackedButtons = 6;  // MouseButton::None..X2

    bool PairWithPress(const RawInputEvent& e, bool suppress);

    KeyboardBlockingState m_keyboard;
    MouseBlockingState m_mouse;
    EmergencyUnlockDetector m_unlock;

    std::mutex m_pressMutex;
    PressState m_keyPress[kTrackedKeys] = {};
    PressState m_buttonPress[kTrackedButtons] = {};
};
