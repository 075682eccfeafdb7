#pragma once
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

#include "event_signal.h"
#include "macro_event.h"
#include "raw_input_event.h"

// ============================================================
// MACRO RECORDER
// Idle -> Recording -> (Paused <-> Recording) -> Idle
//
// Fed from the interceptor's raw streams (hook thread).
// Offsets are taken from the raw event's monotonic timestamp,
// minus the start time and the time spent paused.
// ============================================================

enum class RecorderState : uint8_t
{
    Idle = 0,
    Recording = 1,
    Paused = 2,
};

const char* RecorderStateToString(RecorderState s);

struct RecordingFilters
{
    bool recordKeyboard = true;
    bool recordMouse = true;
    bool recordMouseMovement = false;
    bool recordDelays = true;
};

class MacroRecorder
{
public:
    using ClockFn = std::function<uint64_t()>;

    static constexpr uint32_t kDefaultMinimumDelayMs = 10;
    static constexpr uint32_t kDefaultMaxDurationMs = 30u * 60u * 1000u;

    // clock: monotonic ms, same base as RawInputEvent::timestampMs
    explicit MacroRecorder(ClockFn clock = RawInput_NowMs);

    MacroRecorder(const MacroRecorder&) = delete;
    MacroRecorder& operator=(const MacroRecorder&) = delete;

    bool StartRecording();
    std::vector<MacroEvent> StopRecording();
    void CancelRecording();
    bool PauseRecording();
    bool ResumeRecording();

    // Raw stream input
    void OnRawEvent(const RawInputEvent& e);

    // Auto-stops when the maximum duration elapsed without any new event
    void Tick();

    void SetFilters(const RecordingFilters& filters);
    RecordingFilters GetFilters() const;
    void SetMinimumDelay(uint32_t ms);
    uint32_t GetMinimumDelay() const;
    void SetMaxDuration(uint32_t ms);
    uint32_t GetMaxDuration() const;

    RecorderState GetState() const;
    bool IsRecording() const;  // Recording or Paused
    bool IsPaused() const;
    size_t EventCount() const;
    uint64_t ElapsedMs() const;

    Signal<> RecordingStarted;
    Signal<uint64_t> RecordingStopped;            // duration ms
    Signal<const MacroEvent&> EventRecorded;

private:
    uint64_t ElapsedAtLocked(uint64_t now) const;
    bool AcceptLocked(const RawInputEvent& e, uint32_t offset) const;
    uint64_t AutoStopLocked(uint64_t now);

    ClockFn m_clock;

    mutable std::mutex m_mutex;
    RecorderState m_state = RecorderState::Idle;
    RecordingFilters m_filters;
    uint32_t m_minimumDelayMs = kDefaultMinimumDelayMs;
    uint32_t m_maxDurationMs = kDefaultMaxDurationMs;

    std::vector<MacroEvent> m_events;
    bool m_autoStopped = false;  // buffer kept for the next StopRecording()

    uint64_t m_startMs = 0;
    uint64_t m_pausedTotalMs = 0;
    uint64_t m_pauseStartMs = 0;

    bool m_hasLast = false;
    uint32_t m_lastOffset = 0;
    bool m_hasLastPos = false;
    int m_lastX = 0;
    int m_lastY = 0;
};
