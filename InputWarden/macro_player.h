#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "blocking_control.h"
#include "event_signal.h"
#include "input_synthesizer.h"
#include "macro_event.h"

// ============================================================
// MACRO PLAYER
// Play() runs on the calling thread until every iteration is done,
// a Stop() is requested or validation fails. Callers that must not
// block (hotkeys, trigger mapping) run it on a worker std::thread.
// ============================================================

struct PlayResult
{
    bool ok = false;
    std::string error;

    static PlayResult Success() { return PlayResult{ true, std::string() }; }
    static PlayResult Failure(const std::string& why) { return PlayResult{ false, why }; }
};

class MacroPlayer
{
public:
    static constexpr double   kMinSpeed = 0.1;
    static constexpr double   kMaxSpeed = 10.0;
    static constexpr uint32_t kIterationPauseMs = 100;   // Repeat / Loop
    static constexpr uint32_t kDefaultCustomDelayMs = 50;
    static constexpr uint32_t kTextCharDelayMs = 10;

    static constexpr const char* kErrCancelled = "Playback was cancelled";
    static constexpr const char* kErrBusy = "Another macro is already playing";
    static constexpr const char* kErrDisabled = "Macro is disabled";
    static constexpr const char* kErrEmpty = "Macro has no events";

    // blocking may be null (no suspension of blocking during playback)
    MacroPlayer(IInputSynthesizer& synth, IBlockingControl* blocking = nullptr);

    MacroPlayer(const MacroPlayer&) = delete;
    MacroPlayer& operator=(const MacroPlayer&) = delete;

    PlayResult Play(const Macro& macro,
                    std::optional<MacroExecutionMode> mode = std::nullopt,
                    std::optional<int> repeatCount = std::nullopt);

    // Empty string when the macro can be played
    std::string ValidateMacro(const Macro& macro) const;

    // Executes a single event right away (no timing, no blocking suspension)
    bool PlayEvent(const MacroEvent& e);

    void Stop();
    void Pause();
    void Resume();

    bool IsPlaying() const { return m_playing.load(); }
    bool IsPaused() const { return m_paused.load(); }
    int  CurrentEventIndex() const { return m_eventIndex.load(); }
    int  CurrentIteration() const { return m_iteration.load(); }

    void   SetSpeed(double speed);  // clamped to [kMinSpeed, kMaxSpeed]
    double GetSpeed() const;
    void   SetRespectTiming(bool on) { m_respectTiming.store(on); }
    bool   GetRespectTiming() const { return m_respectTiming.load(); }
    void   SetCustomDelay(uint32_t ms) { m_customDelayMs.store(ms); }
    uint32_t GetCustomDelay() const { return m_customDelayMs.load(); }

    // ms / speed, rounded and saturated to the uint32_t range
    static uint32_t ScaledDelayMs(double ms, double speed);

    // -1 for modes without an upper bound (Loop, Interval, RandomInterval, UntilCondition)
    int64_t EstimatedDurationMs(const Macro& macro,
                                std::optional<MacroExecutionMode> mode = std::nullopt,
                                std::optional<int> repeatCount = std::nullopt) const;

    Signal<const Macro&> PlaybackStarted;
    Signal<const Macro&, bool, const std::string&> PlaybackStopped;  // macro, success, error
    Signal<const Macro&> PlaybackPaused;
    Signal<const Macro&> PlaybackResumed;
    Signal<const MacroEvent&, int, bool> EventExecuted;             // event, index, success
    Signal<int, int, double> ProgressChanged;                        // current, total, percentage

private:
    // Restores the blocking state captured at construction
    class BlockingSuspendGuard
    {
    public:
        explicit BlockingSuspendGuard(IBlockingControl* blocking);
        ~BlockingSuspendGuard();
        BlockingSuspendGuard(const BlockingSuspendGuard&) = delete;
        BlockingSuspendGuard& operator=(const BlockingSuspendGuard&) = delete;
    private:
        IBlockingControl* m_blocking;
        bool m_keyboardWasBlocked = false;
        bool m_mouseWasBlocked = false;
    };

    bool RunIterations(const Macro& macro, MacroExecutionMode mode, int repeatCount);
    bool RunOnce(const std::vector<MacroEvent>& events);
    bool ExecuteEvent(const MacroEvent& e);
    bool WaitWhilePaused();
    bool SleepCancelableMs(uint32_t ms);
    bool Cancelled() const { return m_cancel.load(std::memory_order_relaxed); }

    IInputSynthesizer& m_synth;
    IBlockingControl* m_blocking;

    std::atomic<bool> m_playing{ false };
    std::atomic<bool> m_paused{ false };
    std::atomic<bool> m_cancel{ false };
    std::atomic<int>  m_eventIndex{ 0 };
    std::atomic<int>  m_iteration{ 0 };

    std::atomic<double>   m_speed{ 1.0 };
    std::atomic<bool>     m_respectTiming{ true };
    std::atomic<uint32_t> m_customDelayMs{ kDefaultCustomDelayMs };

    mutable std::mutex m_currentMutex;
    Macro m_current;  // copy of the macro being played, for pause/resume notifications

    std::mt19937 m_rng{ std::random_device{}() };
};
