#include "macro_service.h"
#include "logger.h"
#include "text_util.h"

#include <exception>

MacroService::MacroService(InputInterceptor& interceptor, IMacroStorage& storage, IInputSynthesizer& synth,
                           MacroRecorder::ClockFn clock)
    : m_interceptor(interceptor)
    , m_storage(storage)
    , m_recorder(std::move(clock))
    , m_player(synth, &interceptor)
{
    m_keyboardConn = m_interceptor.KeyboardEvents.Connect([this](const RawInputEvent& e) { m_recorder.OnRawEvent(e); });
    m_mouseConn = m_interceptor.MouseEvents.Connect([this](const RawInputEvent& e) { m_recorder.OnRawEvent(e); });
}

MacroService::~MacroService()
{
    m_interceptor.KeyboardEvents.Disconnect(m_keyboardConn);
    m_interceptor.MouseEvents.Disconnect(m_mouseConn);
    m_player.Stop();
    JoinWorker();
    WaitForSave();
    m_recorder.CancelRecording();
}

// ============================================================
// Recording
// ============================================================

bool MacroService::StartRecording(const std::wstring& macroName)
{
    const std::string invalid = MacroStorage_ValidateName(macroName);
    if (!invalid.empty())
    {
        Logger::Warn("MACRO", "Cannot start recording: " + invalid);
        return false;
    }
    if (m_player.IsPlaying())
    {
        Logger::Warn("MACRO", "Cannot start recording while a macro is playing");
        return false;
    }

    std::lock_guard<std::mutex> lock(m_sessionMutex);
    if (!m_recordingName.empty() || !m_recorder.StartRecording())
    {
        Logger::Warn("MACRO", "Cannot start recording: a recording is already in progress");
        return false;
    }
    m_recordingName = macroName;
    Logger::Info("MACRO", "Recording macro '" + TextUtil_ToUtf8(macroName) + "'");
    return true;
}

bool MacroService::TakeSession(std::wstring& name, std::vector<MacroEvent>& events)
{
    std::lock_guard<std::mutex> lock(m_sessionMutex);
    if (m_recordingName.empty()) return false;
    events = m_recorder.StopRecording();
    name.swap(m_recordingName);
    return true;
}

Macro MacroService::FinishRecording(const std::wstring& name, std::vector<MacroEvent> events)
{
    Macro macro(name);
    macro.events = std::move(events);
    macro.SortEvents();

    if (macro.events.empty())
        Logger::Warn("MACRO", "Recording '" + TextUtil_ToUtf8(name) + "' captured no events");

    if (!Save(macro))
        Logger::Error("MACRO", "Recording '" + TextUtil_ToUtf8(name) + "' could not be saved");

    Logger::Info("MACRO", "Recording '" + TextUtil_ToUtf8(name) + "' finished with " +
                 std::to_string(macro.events.size()) + " events");
    return macro;
}

std::optional<Macro> MacroService::StopRecording()
{
    std::wstring name;
    std::vector<MacroEvent> events;
    if (!TakeSession(name, events)) return std::nullopt;
    return FinishRecording(name, std::move(events));
}

std::optional<std::wstring> MacroService::StopRecordingAsync()
{
    std::wstring name;
    std::vector<MacroEvent> events;
    if (!TakeSession(name, events)) return std::nullopt;

    std::lock_guard<std::mutex> lock(m_saveWorkerMutex);
    if (m_saveWorker.joinable()) m_saveWorker.join();
    m_saveWorker = std::thread([this, name, events = std::move(events)]() mutable
    {
        try
        {
            FinishRecording(name, std::move(events));
        }
        catch (const std::exception& ex)
        {
            Logger::Error("MACRO", std::string("Recording save error: ") + ex.what());
        }
    });
    return name;
}

void MacroService::WaitForSave()
{
    std::lock_guard<std::mutex> lock(m_saveWorkerMutex);
    if (m_saveWorker.joinable()) m_saveWorker.join();
}

bool MacroService::PauseRecording()
{
    return m_recorder.PauseRecording();
}

bool MacroService::ResumeRecording()
{
    return m_recorder.ResumeRecording();
}

void MacroService::CancelRecording()
{
    std::lock_guard<std::mutex> lock(m_sessionMutex);
    m_recorder.CancelRecording();
    m_recordingName.clear();
}

bool MacroService::HasRecordingSession() const
{
    std::lock_guard<std::mutex> lock(m_sessionMutex);
    return !m_recordingName.empty();
}

void MacroService::SetRecordingOptions(const RecordingFilters& filters, uint32_t minimumDelayMs, uint32_t maxDurationMs)
{
    m_recorder.SetFilters(filters);
    m_recorder.SetMinimumDelay(minimumDelayMs);
    m_recorder.SetMaxDuration(maxDurationMs);
}

// ============================================================
// Playback
// ============================================================

PlayResult MacroService::Play(const Macro& macro, std::optional<MacroExecutionMode> mode, std::optional<int> repeatCount)
{
    if (m_recorder.IsRecording())
    {
        Logger::Warn("MACRO", "Cannot play macro while recording is active");
        return PlayResult::Failure("Cannot play macro while recording is active");
    }

    PlayResult r = m_player.Play(macro, mode, repeatCount);
    if (r.ok)
        RecordExecution(macro.name);
    return r;
}

PlayResult MacroService::PlayByName(const std::wstring& name, std::optional<MacroExecutionMode> mode, std::optional<int> repeatCount)
{
    std::optional<Macro> macro = m_storage.Load(name);
    if (!macro)
    {
        Logger::Warn("MACRO", "Macro not found: '" + TextUtil_ToUtf8(name) + "'");
        return PlayResult::Failure("Macro not found");
    }
    return Play(*macro, mode, repeatCount);
}

bool MacroService::PlayAsync(const Macro& macro, std::optional<MacroExecutionMode> mode, std::optional<int> repeatCount)
{
    std::lock_guard<std::mutex> lock(m_workerMutex);
    if (m_player.IsPlaying())
    {
        Logger::Warn("MACRO", "Cannot play macro: another macro is already playing");
        return false;
    }
    if (m_worker.joinable()) m_worker.join();

    m_worker = std::thread([this, macro, mode, repeatCount]()
    {
        try
        {
            PlayResult r = Play(macro, mode, repeatCount);
            if (!r.ok && r.error != MacroPlayer::kErrCancelled)
                Logger::Warn("MACRO", "Playback of '" + TextUtil_ToUtf8(macro.name) + "' failed: " + r.error);
        }
        catch (const std::exception& ex)
        {
            Logger::Error("MACRO", std::string("Playback worker error: ") + ex.what());
        }
    });
    return true;
}

void MacroService::StopPlayback()
{
    m_player.Stop();
}

void MacroService::PausePlayback()
{
    m_player.Pause();
}

void MacroService::ResumePlayback()
{
    m_player.Resume();
}

void MacroService::WaitForPlayback()
{
    JoinWorker();
}

void MacroService::JoinWorker()
{
    std::lock_guard<std::mutex> lock(m_workerMutex);
    if (m_worker.joinable()) m_worker.join();
}

void MacroService::SetPlaybackOptions(double speed, bool respectTiming, uint32_t customDelayMs)
{
    m_player.SetSpeed(speed);
    m_player.SetRespectTiming(respectTiming);
    m_player.SetCustomDelay(customDelayMs);
}

void MacroService::RecordExecution(const std::wstring& name)
{
    std::lock_guard<std::mutex> lock(m_statsMutex);
    std::optional<Macro> stored = m_storage.Load(name);
    if (!stored) return; // ad-hoc macro, nothing to update

    stored->executionCount++;
    stored->lastExecutedAt = Macro_NowUnixMs();
    if (!m_storage.Save(*stored))
        Logger::Error("MACRO", "Could not update statistics of '" + TextUtil_ToUtf8(name) + "'");
}

// ============================================================
// Management
// ============================================================

bool MacroService::Save(const Macro& macro)
{
    Macro copy = macro;
    if (copy.id.empty()) copy.id = TextUtil_NewId();
    if (copy.createdAt == 0) copy.createdAt = Macro_NowUnixMs();
    copy.modifiedAt = Macro_NowUnixMs();

    if (!m_storage.Save(copy)) return false;
    CollectionChanged.Emit();
    return true;
}

std::optional<Macro> MacroService::Load(const std::wstring& name)
{
    return m_storage.Load(name);
}

std::vector<std::wstring> MacroService::List()
{
    return m_storage.List();
}

bool MacroService::Delete(const std::wstring& name)
{
    if (!m_storage.Delete(name))
    {
        Logger::Warn("MACRO", "Delete failed: '" + TextUtil_ToUtf8(name) + "' not found");
        return false;
    }
    Logger::Info("MACRO", "Deleted '" + TextUtil_ToUtf8(name) + "'");
    MacroDeleted.Emit(name);
    CollectionChanged.Emit();
    return true;
}

bool MacroService::Rename(const std::wstring& oldName, const std::wstring& newName)
{
    const std::string invalid = MacroStorage_ValidateName(newName);
    if (!invalid.empty())
    {
        Logger::Warn("MACRO", "Rename refused: " + invalid);
        return false;
    }
    if (oldName == newName) return m_storage.Exists(oldName);

    std::optional<Macro> macro = m_storage.Load(oldName);
    if (!macro)
    {
        Logger::Warn("MACRO", "Rename failed: '" + TextUtil_ToUtf8(oldName) + "' not found");
        return false;
    }
    const bool caseOnly = TextUtil_EqualsNoCase(oldName, newName);
    if (!caseOnly && m_storage.Exists(newName))
    {
        Logger::Warn("MACRO", "Rename failed: '" + TextUtil_ToUtf8(newName) + "' already exists");
        return false;
    }

    macro->name = newName;
    macro->modifiedAt = Macro_NowUnixMs();
    if (caseOnly)
    {
        // Same file on case-insensitive file systems: drop it before writing the new name
        if (!m_storage.Delete(oldName) || !m_storage.Save(*macro))
        {
            Logger::Error("MACRO", "Rename failed while rewriting '" + TextUtil_ToUtf8(newName) + "'");
            return false;
        }
    }
    else
    {
        if (!m_storage.Save(*macro)) return false;
        if (!m_storage.Delete(oldName))
            Logger::Warn("MACRO", "Old file of '" + TextUtil_ToUtf8(oldName) + "' could not be removed");
    }

    Logger::Info("MACRO", "Renamed '" + TextUtil_ToUtf8(oldName) + "' to '" + TextUtil_ToUtf8(newName) + "'");
    MacroRenamed.Emit(oldName, newName);
    CollectionChanged.Emit();
    return true;
}

bool MacroService::Duplicate(const std::wstring& name, const std::wstring& newName)
{
    std::optional<Macro> macro = m_storage.Load(name);
    if (!macro)
    {
        Logger::Warn("MACRO", "Duplicate failed: '" + TextUtil_ToUtf8(name) + "' not found");
        return false;
    }
    if (m_storage.Exists(newName))
    {
        Logger::Warn("MACRO", "Duplicate failed: '" + TextUtil_ToUtf8(newName) + "' already exists");
        return false;
    }
    return Save(macro->CloneAs(newName));
}

bool MacroService::Exists(const std::wstring& name)
{
    return m_storage.Exists(name);
}

bool MacroService::Export(const std::wstring& name, const std::filesystem::path& path)
{
    std::optional<Macro> macro = m_storage.Load(name);
    if (!macro)
    {
        Logger::Warn("MACRO", "Export failed: '" + TextUtil_ToUtf8(name) + "' not found");
        return false;
    }
    if (!MacroFile_Save(path, *macro)) return false;
    Logger::Info("MACRO", "Exported '" + TextUtil_ToUtf8(name) + "' to " + path.u8string());
    return true;
}

std::optional<std::wstring> MacroService::Import(const std::filesystem::path& path, bool overwrite)
{
    std::optional<Macro> macro = MacroFile_Load(path);
    if (!macro)
    {
        Logger::Warn("MACRO", "Import failed: cannot read " + path.u8string());
        return std::nullopt;
    }
    const std::string invalid = MacroStorage_ValidateName(macro->name);
    if (!invalid.empty())
    {
        Logger::Warn("MACRO", "Import failed: " + invalid);
        return std::nullopt;
    }
    if (!overwrite && m_storage.Exists(macro->name))
    {
        Logger::Warn("MACRO", "Import skipped: '" + TextUtil_ToUtf8(macro->name) + "' already exists");
        return std::nullopt;
    }
    if (!Save(*macro)) return std::nullopt;

    Logger::Info("MACRO", "Imported '" + TextUtil_ToUtf8(macro->name) + "'");
    return macro->name;
}

// ============================================================
// IMacroRunner
// ============================================================

bool MacroService::IsRecording() const
{
    return m_recorder.IsRecording();
}

bool MacroService::IsPlaying() const
{
    return m_player.IsPlaying();
}

std::optional<Macro> MacroService::LoadMacro(const std::wstring& name)
{
    return m_storage.Load(name);
}

PlayResult MacroService::PlayMacro(const Macro& macro)
{
    return Play(macro);
}
