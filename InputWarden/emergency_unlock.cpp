#include "emergency_unlock.h"
#include "logger.h"

#include <algorithm>

std::string EmergencyUnlockChord::ToString() const
{
    std::string s;
    if (ctrl)  s += "Ctrl+";
    if (alt)   s += "Alt+";
    if (shift) s += "Shift+";
    s += KeyCodes_Name(keyCode);
    return s;
}

EmergencyUnlockDetector::EmergencyUnlockDetector(const EmergencyUnlockChord& chord, int requiredPresses, uint32_t timeoutMs)
{
    Configure(chord, requiredPresses, timeoutMs);
}

void EmergencyUnlockDetector::Configure(const EmergencyUnlockChord& chord, int requiredPresses, uint32_t timeoutMs)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_chord = chord;
    m_requiredPresses = std::max(1, requiredPresses);
    m_timeoutMs = timeoutMs;
    m_pressCount = 0;
    m_lastPressMs = 0;
}

EmergencyUnlockChord EmergencyUnlockDetector::Chord() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_chord;
}

int EmergencyUnlockDetector::RequiredPresses() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_requiredPresses;
}

uint32_t EmergencyUnlockDetector::TimeoutMs() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_timeoutMs;
}

bool EmergencyUnlockDetector::IsChordPressLocked(const RawInputEvent& e) const
{
    if (!e.IsKeyboard() || !e.IsDown()) return false;
    if (e.keyCode != m_chord.keyCode) return false;

    // A bare key is never accepted as an unlock chord
    if (!m_chord.HasModifier()) return false;

    const bool ctrl  = m_ctrlHeld  || e.ctrl;
    const bool alt   = m_altHeld   || e.alt;
    const bool shift = m_shiftHeld || e.shift;

    if (m_chord.ctrl  && !ctrl)  return false;
    if (m_chord.alt   && !alt)   return false;
    if (m_chord.shift && !shift) return false;
    return true;
}

bool EmergencyUnlockDetector::IsChordPress(const RawInputEvent& e) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return IsChordPressLocked(e);
}

bool EmergencyUnlockDetector::ProcessKeyEvent(const RawInputEvent& e, bool armed)
{
    if (!e.IsKeyboard()) return false;

    int attempt = 0;
    bool unlocked = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (e.IsDown() || e.IsUp())
        {
            const bool down = e.IsDown();
            if (KeyCodes_IsCtrl(e.keyCode))  m_ctrlHeld = down;
            if (KeyCodes_IsAlt(e.keyCode))   m_altHeld = down;
            if (KeyCodes_IsShift(e.keyCode)) m_shiftHeld = down;
        }

        if (!armed || !IsChordPressLocked(e))
            return false;

        if (m_pressCount > 0 && e.timestampMs > m_lastPressMs + m_timeoutMs)
            m_pressCount = 0;

        ++m_pressCount;
        m_lastPressMs = e.timestampMs;
        attempt = m_pressCount;

        if (m_pressCount >= m_requiredPresses)
        {
            m_pressCount = 0;
            unlocked = true;
        }
    }

    Logger::Info("UNLOCK", "Chord press " + std::to_string(attempt) + "/" + std::to_string(RequiredPresses()));
    UnlockAttempt.Emit(attempt);
    return unlocked;
}

int EmergencyUnlockDetector::PressCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pressCount;
}

void EmergencyUnlockDetector::Reset()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_pressCount = 0;
    m_lastPressMs = 0;
    m_ctrlHeld = m_altHeld = m_shiftHeld = false;
}

std::string EmergencyUnlockDetector::UnlockReason() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return "Emergency unlock (" + std::to_string(m_requiredPresses) + "x " + m_chord.ToString() + ")";
}
