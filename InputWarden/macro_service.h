#pragma once
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "event_signal.h"
#include "input_interceptor.h"
#include "macro_player.h"
#include "macro_recorder.h"
#include "macro_runner.h"
#include "macro_storage.h"

// ============================================================
// MACRO SERVICE
// Ties the recorder (fed from the interceptor's raw streams),
// the player (blocking suspended through the interceptor) and
// the name-keyed storage together.
// ============================================================

class MacroService : public IMacroRunner
{
public:
    MacroService(InputInterceptor& interceptor, IMacroStorage& storage, IInputSynthesizer& synth,
                 MacroRecorder::ClockFn clock = RawInput_NowMs);
    ~MacroService() override;

    MacroService(const MacroService&) = delete;
    MacroService& operator=(const MacroService&) = delete;

    // --- Recording ---
    bool StartRecording(const std::wstring& macroName);
    // Sorted and saved. Also collects a session the recorder stopped on its own (max duration).
    std::optional<Macro> StopRecording();
    // Stops now, sorts and saves on a background thread. Returns the session's name.
    std::optional<std::wstring> StopRecordingAsync();
    void WaitForSave();  // joins a pending StopRecordingAsync() save
    bool PauseRecording();
    bool ResumeRecording();
    void CancelRecording();
    bool HasRecordingSession() const;  // started and not yet stopped/cancelled here
    void SetRecordingOptions(const RecordingFilters& filters, uint32_t minimumDelayMs, uint32_t maxDurationMs);

    // --- Playback ---
    PlayResult Play(const Macro& macro,
                    std::optional<MacroExecutionMode> mode = std::nullopt,
                    std::optional<int> repeatCount = std::nullopt);
    PlayResult PlayByName(const std::wstring& name,
                          std::optional<MacroExecutionMode> mode = std::nullopt,
                          std::optional<int> repeatCount = std::nullopt);
    // Runs Play() on the worker thread; false when a playback is already running
    bool PlayAsync(const Macro& macro,
                   std::optional<MacroExecutionMode> mode = std::nullopt,
                   std::optional<int> repeatCount = std::nullopt);
    void StopPlayback() override;
    void PausePlayback();
    void ResumePlayback();
    void WaitForPlayback();  // joins the worker
    void SetPlaybackOptions(double speed, bool respectTiming, uint32_t customDelayMs);

    // --- Management ---
    bool Save(const Macro& macro);
    std::optional<Macro> Load(const std::wstring& name);
    std::vector<std::wstring> List();
    bool Delete(const std::wstring& name);
    bool Rename(const std::wstring& oldName, const std::wstring& newName);
    bool Duplicate(const std::wstring& name, const std::wstring& newName);
    bool Exists(const std::wstring& name);
    bool Export(const std::wstring& name, const std::filesystem::path& path);
    std::optional<std::wstring> Import(const std::filesystem::path& path, bool overwrite);

    // --- IMacroRunner ---
    bool IsRecording() const override;
    bool IsPlaying() const override;
    std::optional<Macro> LoadMacro(const std::wstring& name) override;
    PlayResult PlayMacro(const Macro& macro) override;

    MacroRecorder& Recorder() { return m_recorder; }
    MacroPlayer& Player() { return m_player; }

    Signal<const std::wstring&> MacroDeleted;                       // name
    Signal<const std::wstring&, const std::wstring&> MacroRenamed;  // old, new
    Signal<> CollectionChanged;

private:
    bool TakeSession(std::wstring& name, std::vector<MacroEvent>& events);
    Macro FinishRecording(const std::wstring& name, std::vector<MacroEvent> events);
    void RecordExecution(const std::wstring& name);
    void JoinWorker();

    InputInterceptor& m_interceptor;
    IMacroStorage& m_storage;
    MacroRecorder m_recorder;
    MacroPlayer m_player;

    int m_keyboardConn = 0;
    int m_mouseConn = 0;

    mutable std::mutex m_sessionMutex;
    std::wstring m_recordingName;

    std::mutex m_statsMutex;

    std::mutex m_workerMutex;
    std::thread m_worker;

    std::mutex m_saveWorkerMutex;
    std::thread m_saveWorker;
};
