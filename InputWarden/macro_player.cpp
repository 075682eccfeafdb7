#include "macro_player.h"
#include "blocking_state.h"
#include "logger.h"
#include "text_util.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <limits>
#include <thread>

// ============================================================
// Blocking suspension
// ============================================================

MacroPlayer::BlockingSuspendGuard::BlockingSuspendGuard(IBlockingControl* blocking)
    : m_blocking(blocking)
{
    if (!m_blocking) return;
    m_keyboardWasBlocked = m_blocking->IsKeyboardBlocked();
    m_mouseWasBlocked = m_blocking->IsMouseBlocked();
    if (m_keyboardWasBlocked) m_blocking->SetKeyboardBlocked(false, BlockReason::PlaybackSuspend);
    if (m_mouseWasBlocked) m_blocking->SetMouseBlocked(false, BlockReason::PlaybackSuspend);
}

MacroPlayer::BlockingSuspendGuard::~BlockingSuspendGuard()
{
    if (!m_blocking) return;
    if (m_keyboardWasBlocked) m_blocking->SetKeyboardBlocked(true, BlockReason::PlaybackRestore);
    if (m_mouseWasBlocked) m_blocking->SetMouseBlocked(true, BlockReason::PlaybackRestore);
}

// ============================================================
// MacroPlayer
// ============================================================

MacroPlayer::MacroPlayer(IInputSynthesizer& synth, IBlockingControl* blocking)
    : m_synth(synth)
    , m_blocking(blocking)
{
}

std::string MacroPlayer::ValidateMacro(const Macro& macro) const
{
    if (!macro.enabled) return kErrDisabled;
    if (macro.events.empty()) return kErrEmpty;
    return std::string();
}

PlayResult MacroPlayer::Play(const Macro& macro, std::optional<MacroExecutionMode> mode, std::optional<int> repeatCount)
{
    const std::string invalid = ValidateMacro(macro);
    if (!invalid.empty())
    {
        Logger::Warn("PLAYER", "Cannot play macro '" + TextUtil_ToUtf8(macro.name) + "': " + invalid);
        return PlayResult::Failure(invalid);
    }

    bool expected = false;
    if (!m_playing.compare_exchange_strong(expected, true))
    {
        Logger::Warn("PLAYER", "Cannot play macro '" + TextUtil_ToUtf8(macro.name) + "': " + kErrBusy);
        return PlayResult::Failure(kErrBusy);
    }

    m_cancel.store(false);
    m_paused.store(false);
    m_eventIndex.store(0);
    m_iteration.store(0);
    {
        std::lock_guard<std::mutex> lock(m_currentMutex);
        m_current = macro;
    }

    const MacroExecutionMode effMode = mode.value_or(macro.mode);
    const int effRepeat = repeatCount.value_or(macro.repeatCount);

    Logger::Info("PLAYER", "Playing '" + TextUtil_ToUtf8(macro.name) + "' mode=" +
                 MacroExecutionModeToString(effMode) + " repeat=" + std::to_string(effRepeat));
    PlaybackStarted.Emit(macro);

    bool completed = false;
    std::string error;
    {
        BlockingSuspendGuard guard(m_blocking);
        try
        {
            completed = RunIterations(macro, effMode, effRepeat);
            if (!completed) error = kErrCancelled;
        }
        catch (const std::exception& ex)
        {
            error = ex.what();
            Logger::Error("PLAYER", "Playback of '" + TextUtil_ToUtf8(macro.name) + "' failed: " + error);
        }
    }

    m_paused.store(false);
    m_eventIndex.store(0);
    m_iteration.store(0);
    m_playing.store(false);

    if (completed)
        Logger::Info("PLAYER", "Completed '" + TextUtil_ToUtf8(macro.name) + "'");
    else if (error == kErrCancelled)
        Logger::Info("PLAYER", "Playback of '" + TextUtil_ToUtf8(macro.name) + "' was cancelled");

    PlaybackStopped.Emit(macro, completed, error);
    return completed ? PlayResult::Success() : PlayResult::Failure(error);
}

bool MacroPlayer::RunIterations(const Macro& macro, MacroExecutionMode mode, int repeatCount)
{
    const std::vector<MacroEvent> events = macro.PlayableEvents();

    switch (mode)
    {
    case MacroExecutionMode::Repeat:
        for (int i = 0; i < repeatCount; ++i)
        {
            if (Cancelled()) return false;
            m_iteration.store(i + 1);
            if (!RunOnce(events)) return false;
            if (i + 1 < repeatCount && !SleepCancelableMs(kIterationPauseMs)) return false;
        }
        return !Cancelled();

    case MacroExecutionMode::Loop:
        for (int i = 1; ; ++i)
        {
            m_iteration.store(i);
            if (!RunOnce(events)) return false;
            if (!SleepCancelableMs(kIterationPauseMs)) return false;
        }

    case MacroExecutionMode::Interval:
        for (int i = 1; ; ++i)
        {
            m_iteration.store(i);
            if (!RunOnce(events)) return false;
            if (!SleepCancelableMs(macro.intervalMs)) return false;
        }

    case MacroExecutionMode::RandomInterval:
    {
        const uint32_t lo = std::min(macro.randomMinMs, macro.randomMaxMs);
        const uint32_t hi = std::max(macro.randomMinMs, macro.randomMaxMs);
        std::uniform_int_distribution<uint32_t> dist(lo, hi);
        for (int i = 1; ; ++i)
        {
            m_iteration.store(i);
            if (!RunOnce(events)) return false;
            if (!SleepCancelableMs(dist(m_rng))) return false;
        }
    }

    case MacroExecutionMode::Once:
    case MacroExecutionMode::UntilCondition:
    default:
        m_iteration.store(1);
        return RunOnce(events);
    }
}

bool MacroPlayer::RunOnce(const std::vector<MacroEvent>& events)
{
    const int total = (int)events.size();
    for (int i = 0; i < total; ++i)
    {
        m_eventIndex.store(i);
        if (!WaitWhilePaused()) return false;

        const double speed = GetSpeed();
        if (m_respectTiming.load())
        {
            if (i > 0 && events[i].timestampMs > events[i - 1].timestampMs)
            {
                const double gap = (double)(events[i].timestampMs - events[i - 1].timestampMs);
                if (!SleepCancelableMs(ScaledDelayMs(gap, speed))) return false;
            }
        }
        else
        {
            if (!SleepCancelableMs(m_customDelayMs.load())) return false;
        }
        if (Cancelled()) return false;

        const MacroEvent& e = events[i];
        const bool ok = ExecuteEvent(e);
        if (Cancelled()) return false; // stopped inside the event
        if (!ok)
            Logger::Warn("PLAYER", "Event " + std::to_string(i) + " failed: " + e.ToString());

        EventExecuted.Emit(e, i, ok);
        ProgressChanged.Emit(i + 1, total, (double)(i + 1) * 100.0 / (double)total);
    }
    return !Cancelled();
}

bool MacroPlayer::ExecuteEvent(const MacroEvent& e)
{
    switch (e.type)
    {
    case MacroEventType::KeyDown:    return m_synth.SendKey(e.keyCode, true);
    case MacroEventType::KeyUp:      return m_synth.SendKey(e.keyCode, false);
    case MacroEventType::MouseDown:  return m_synth.SendMouseButton(e.mouseButton, true, e.x, e.y);
    case MacroEventType::MouseUp:    return m_synth.SendMouseButton(e.mouseButton, false, e.x, e.y);
    case MacroEventType::MouseMove:  return m_synth.SendMouseMove(e.x, e.y);
    case MacroEventType::MouseWheel: return m_synth.SendMouseWheel(e.wheelDelta, e.x, e.y);

    case MacroEventType::Delay:
        return SleepCancelableMs(ScaledDelayMs((double)e.delayMs, GetSpeed()));

    case MacroEventType::TextInput:
        for (size_t k = 0; k < e.text.size(); ++k)
        {
            if (Cancelled()) return false;
            if (!m_synth.SendChar(e.text[k])) return false;
            if (k + 1 < e.text.size() && !SleepCancelableMs(kTextCharDelayMs)) return false;
        }
        return true;

    default:
        Logger::Warn("PLAYER", std::string("Unsupported event type: ") + MacroEventTypeToString(e.type));
        return false;
    }
}

bool MacroPlayer::PlayEvent(const MacroEvent& e)
{
    try
    {
        return ExecuteEvent(e);
    }
    catch (const std::exception& ex)
    {
        Logger::Error("PLAYER", "Failed to play event " + e.ToString() + ": " + ex.what());
        return false;
    }
}

bool MacroPlayer::WaitWhilePaused()
{
    while (m_paused.load(std::memory_order_relaxed))
    {
        if (Cancelled()) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return !Cancelled();
}

uint32_t MacroPlayer::ScaledDelayMs(double ms, double speed)
{
    if (ms <= 0.0) return 0;
    const double scaled = ms / std::max(speed, kMinSpeed);
    if (scaled >= (double)std::numeric_limits<uint32_t>::max())
        return std::numeric_limits<uint32_t>::max();
    return (uint32_t)std::llround(scaled);
}

bool MacroPlayer::SleepCancelableMs(uint32_t ms)
{
    if (ms == 0) return !Cancelled();
    const auto start = std::chrono::steady_clock::now();
    const auto span = std::chrono::milliseconds(ms);
    while (true)
    {
        if (Cancelled()) return false;
        if (std::chrono::steady_clock::now() - start >= span) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

void MacroPlayer::Stop()
{
    if (!m_playing.load()) return;
    Logger::Info("PLAYER", "Stop requested");
    m_cancel.store(true);
}

void MacroPlayer::Pause()
{
    if (!m_playing.load()) return;
    bool expected = false;
    if (!m_paused.compare_exchange_strong(expected, true)) return;

    Macro current;
    {
        std::lock_guard<std::mutex> lock(m_currentMutex);
        current = m_current;
    }
    Logger::Info("PLAYER", "Playback paused");
    PlaybackPaused.Emit(current);
}

void MacroPlayer::Resume()
{
    if (!m_playing.load()) return;
    bool expected = true;
    if (!m_paused.compare_exchange_strong(expected, false)) return;

    Macro current;
    {
        std::lock_guard<std::mutex> lock(m_currentMutex);
        current = m_current;
    }
    Logger::Info("PLAYER", "Playback resumed");
    PlaybackResumed.Emit(current);
}

void MacroPlayer::SetSpeed(double speed)
{
    if (!(speed >= kMinSpeed)) speed = kMinSpeed; // NaN lands here too
    if (speed > kMaxSpeed) speed = kMaxSpeed;
    m_speed.store(speed);
}

double MacroPlayer::GetSpeed() const
{
    return m_speed.load();
}

int64_t MacroPlayer::EstimatedDurationMs(const Macro& macro, std::optional<MacroExecutionMode> mode, std::optional<int> repeatCount) const
{
    if (macro.events.empty()) return 0;

    const double base = (double)macro.DurationMs() / GetSpeed();
    switch (mode.value_or(macro.mode))
    {
    case MacroExecutionMode::Once:
        return (int64_t)std::llround(base);
    case MacroExecutionMode::Repeat:
        return (int64_t)std::llround(base * (double)std::max(0, repeatCount.value_or(macro.repeatCount)));
    default:
        return -1;
    }
}
