#pragma once
#include <cstdint>
#include <mutex>
#include <string>

#include "event_signal.h"
#include "key_codes.h"
#include "raw_input_event.h"

// ============================================================
// EMERGENCY UNLOCK
// A chord (key + required modifiers) pressed N times within a
// sliding window unblocks every device. Fed with the raw keyboard
// stream BEFORE the suppression decision, so the chord still counts
// when its own key is blocked.
// ============================================================

struct EmergencyUnlockChord
{
    uint16_t keyCode = 0x55; // 'U'
    bool ctrl  = true;
    bool alt   = true;
    bool shift = false;

    bool HasModifier() const { return ctrl || alt || shift; }
    std::string ToString() const; // "Ctrl+Alt+U"
};

class EmergencyUnlockDetector
{
public:
    static constexpr int      kDefaultRequiredPresses = 3;
    static constexpr uint32_t kDefaultTimeoutMs = 2000;

    EmergencyUnlockDetector() = default;
    EmergencyUnlockDetector(const EmergencyUnlockChord& chord, int requiredPresses, uint32_t timeoutMs);

    void Configure(const EmergencyUnlockChord& chord, int requiredPresses, uint32_t timeoutMs);
    EmergencyUnlockChord Chord() const;
    int RequiredPresses() const;
    uint32_t TimeoutMs() const;

    // Feeds one keyboard event. Modifier state is always tracked.
    // Chord presses are only counted while armed (some device blocked).
    // Returns true when the required press count is reached.
    bool ProcessKeyEvent(const RawInputEvent& e, bool armed);

    // True if e is a key-down of the chord key with the required modifiers held
    bool IsChordPress(const RawInputEvent& e) const;

    int PressCount() const;
    void Reset();

    // "Emergency unlock (3x Ctrl+Alt+U)"
    std::string UnlockReason() const;

    Signal<int> UnlockAttempt; // press count so far

private:
    bool IsChordPressLocked(const RawInputEvent& e) const;

    mutable std::mutex m_mutex;
    EmergencyUnlockChord m_chord;
    int m_requiredPresses = kDefaultRequiredPresses;
    uint32_t m_timeoutMs = kDefaultTimeoutMs;

    int m_pressCount = 0;
    uint64_t m_lastPressMs = 0;

    // Modifier state seen by the hook itself
    bool m_ctrlHeld = false;
    bool m_altHeld = false;
    bool m_shiftHeld = false;
};
