#include "macro_recorder.h"
#include "logger.h"

#include <algorithm>

const char* RecorderStateToString(RecorderState s)
{
    switch (s)
    {
    case RecorderState::Idle:      return "Idle";
    case RecorderState::Recording: return "Recording";
    case RecorderState::Paused:    return "Paused";
    }
    return "Unknown";
}

MacroRecorder::MacroRecorder(ClockFn clock)
    : m_clock(clock ? std::move(clock) : ClockFn(RawInput_NowMs))
{
}

bool MacroRecorder::StartRecording()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state != RecorderState::Idle)
        {
            Logger::Warn("RECORDER", "Start refused: recording already in progress");
            return false;
        }

        m_events.clear();
        m_autoStopped = false;
        m_startMs = m_clock();
        m_pausedTotalMs = 0;
        m_pauseStartMs = 0;
        m_hasLast = false;
        m_lastOffset = 0;
        m_hasLastPos = false;
        m_state = RecorderState::Recording;
    }

    Logger::Info("RECORDER", "Recording started");
    RecordingStarted.Emit();
    return true;
}

std::vector<MacroEvent> MacroRecorder::StopRecording()
{
    std::vector<MacroEvent> out;
    uint64_t duration = 0;
    bool notify = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == RecorderState::Idle)
        {
            if (!m_autoStopped) return out;
            // Already stopped by the duration limit, hand over what was captured
            m_autoStopped = false;
        }
        else
        {
            duration = ElapsedAtLocked(m_clock());
            m_state = RecorderState::Idle;
            notify = true;
        }
        out.swap(m_events);
    }

    std::stable_sort(out.begin(), out.end(),
        [](const MacroEvent& a, const MacroEvent& b) { return a.timestampMs < b.timestampMs; });

    if (notify)
    {
        Logger::Info("RECORDER", "Recording stopped: " + std::to_string(out.size()) +
                     " events in " + std::to_string(duration) + " ms");
        RecordingStopped.Emit(duration);
    }
    return out;
}

void MacroRecorder::CancelRecording()
{
    bool wasActive = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        wasActive = (m_state != RecorderState::Idle);
        m_state = RecorderState::Idle;
        m_events.clear();
        m_autoStopped = false;
    }
    if (wasActive)
        Logger::Info("RECORDER", "Recording cancelled");
}

bool MacroRecorder::PauseRecording()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state != RecorderState::Recording) return false;
    m_state = RecorderState::Paused;
    m_pauseStartMs = m_clock();
    Logger::Info("RECORDER", "Recording paused");
    return true;
}

bool MacroRecorder::ResumeRecording()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state != RecorderState::Paused) return false;
    const uint64_t now = m_clock();
    if (now > m_pauseStartMs)
        m_pausedTotalMs += now - m_pauseStartMs;
    m_state = RecorderState::Recording;
    Logger::Info("RECORDER", "Recording resumed");
    return true;
}

uint64_t MacroRecorder::ElapsedAtLocked(uint64_t now) const
{
    // While paused the clock stands still at the pause instant
    const uint64_t end = (m_state == RecorderState::Paused) ? m_pauseStartMs : now;
    if (end <= m_startMs) return 0;
    const uint64_t raw = end - m_startMs;
    return (raw > m_pausedTotalMs) ? raw - m_pausedTotalMs : 0;
}

bool MacroRecorder::AcceptLocked(const RawInputEvent& e, uint32_t offset) const
{
    if (e.injected || e.synthetic) return false;

    if (e.IsKeyboard() && !m_filters.recordKeyboard) return false;
    if (e.IsMouse() && !m_filters.recordMouse) return false;

    if (e.IsMouse() && e.edge == InputEdge::Move)
    {
        if (!m_filters.recordMouseMovement) return false;
        if (m_hasLastPos && e.x == m_lastX && e.y == m_lastY) return false;
    }

    if (e.IsMouse() && (e.edge == InputEdge::Down || e.edge == InputEdge::Up) && e.button == MouseButton::None)
        return false;

    // Macros replay vertical wheel only
    if (e.IsMouse() && e.edge == InputEdge::Wheel && e.horizontalWheel)
        return false;

    if (m_filters.recordDelays && m_hasLast && offset < m_lastOffset + m_minimumDelayMs)
        return false;

    return true;
}

uint64_t MacroRecorder::AutoStopLocked(uint64_t now)
{
    const uint64_t duration = ElapsedAtLocked(now);
    m_state = RecorderState::Idle;
    m_autoStopped = true;
    return duration;
}

void MacroRecorder::OnRawEvent(const RawInputEvent& e)
{
    MacroEvent recorded;
    bool emitRecorded = false;
    bool autoStopped = false;
    uint64_t duration = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state != RecorderState::Recording) return;

        uint64_t elapsed = 0;
        if (e.timestampMs > m_startMs + m_pausedTotalMs)
            elapsed = e.timestampMs - m_startMs - m_pausedTotalMs;

        if (elapsed > m_maxDurationMs)
        {
            duration = AutoStopLocked(e.timestampMs);
            autoStopped = true;
        }
        else
        {
            const uint32_t offset = (uint32_t)elapsed;
            if (!AcceptLocked(e, offset)) return;

            if (e.IsKeyboard())
            {
                recorded = MacroEvent_Key(e.keyCode, e.IsDown(), offset);
            }
            else
            {
                switch (e.edge)
                {
                case InputEdge::Down:
                case InputEdge::Up:
                    recorded = MacroEvent_MouseButton(e.button, e.IsDown(), e.x, e.y, offset);
                    break;
                case InputEdge::Move:
                    recorded = MacroEvent_MouseMove(e.x, e.y, offset);
                    m_hasLastPos = true;
                    m_lastX = e.x;
                    m_lastY = e.y;
                    break;
                case InputEdge::Wheel:
                    recorded = MacroEvent_MouseWheel(e.wheelDelta, e.x, e.y, offset);
                    break;
                }
            }

            m_events.push_back(recorded);
            m_hasLast = true;
            m_lastOffset = offset;
            emitRecorded = true;
        }
    }

    if (autoStopped)
    {
        Logger::Warn("RECORDER", "Maximum recording duration reached, recording stopped");
        RecordingStopped.Emit(duration);
        return;
    }
    if (emitRecorded)
        EventRecorded.Emit(recorded);
}

void MacroRecorder::Tick()
{
    uint64_t duration = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state != RecorderState::Recording) return;
        const uint64_t now = m_clock();
        if (ElapsedAtLocked(now) <= m_maxDurationMs) return;
        duration = AutoStopLocked(now);
    }
    Logger::Warn("RECORDER", "Maximum recording duration reached, recording stopped");
    RecordingStopped.Emit(duration);
}

void MacroRecorder::SetFilters(const RecordingFilters& filters)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_filters = filters;
}

RecordingFilters MacroRecorder::GetFilters() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_filters;
}

void MacroRecorder::SetMinimumDelay(uint32_t ms)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_minimumDelayMs = ms;
}

uint32_t MacroRecorder::GetMinimumDelay() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_minimumDelayMs;
}

void MacroRecorder::SetMaxDuration(uint32_t ms)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_maxDurationMs = ms;
}

uint32_t MacroRecorder::GetMaxDuration() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_maxDurationMs;
}

RecorderState MacroRecorder::GetState() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

bool MacroRecorder::IsRecording() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state != RecorderState::Idle;
}

bool MacroRecorder::IsPaused() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state == RecorderState::Paused;
}

size_t MacroRecorder::EventCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_events.size();
}

uint64_t MacroRecorder::ElapsedMs() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state == RecorderState::Idle) return 0;
    return ElapsedAtLocked(m_clock());
}
