#include "macro_mapping_service.h"
#include "logger.h"
#include "text_util.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <fstream>
#include <sstream>
#include <system_error>

MacroMappingService::MacroMappingService(InputInterceptor& interceptor, IMacroRunner& runner, std::filesystem::path bindingsFile)
    : m_interceptor(interceptor)
    , m_runner(runner)
    , m_file(std::move(bindingsFile))
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        LoadLocked();
    }

    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        m_workerRunning = true;
    }
    m_worker = std::thread(&MacroMappingService::WorkerFunc, this);

    m_keyboardConn = m_interceptor.KeyboardEvents.Connect([this](const RawInputEvent& e) { OnRawEvent(e); });
    m_mouseConn = m_interceptor.MouseEvents.Connect([this](const RawInputEvent& e) { OnRawEvent(e); });
}

MacroMappingService::~MacroMappingService()
{
    m_interceptor.KeyboardEvents.Disconnect(m_keyboardConn);
    m_interceptor.MouseEvents.Disconnect(m_mouseConn);

    {
        std::unique_lock<std::mutex> lock(m_queueMutex);
        m_workerRunning = false;
        m_queue = std::queue<MacroBinding>();
        if (m_inFlight)
            Logger::Info("MAPPING", "Stopping triggered playback on shutdown");

        // Repeated: a stop sent while the macro is still loading is reset by Play()
        while (m_inFlight)
        {
            lock.unlock();
            m_runner.StopPlayback();
            lock.lock();
            m_idleCv.wait_for(lock, std::chrono::milliseconds(10), [this] { return !m_inFlight; });
        }
    }
    m_queueCv.notify_all();
    if (m_worker.joinable()) m_worker.join();
}

// ============================================================
// Persistence
// ============================================================

void MacroMappingService::LoadLocked()
{
    m_set = MacroBindingSet();

    std::error_code ec;
    if (!std::filesystem::exists(m_file, ec))
    {
        Logger::Info("MAPPING", "No bindings file, starting empty");
        return;
    }

    std::ifstream f(m_file, std::ios::in | std::ios::binary);
    if (!f)
    {
        Logger::Warn("MAPPING", "Cannot open " + m_file.u8string() + ", starting empty");
        return;
    }

    MacroBindingSet loaded;
    if (!MacroBindings_Read(f, loaded))
    {
        Logger::Warn("MAPPING", "Failed to parse " + m_file.u8string() + ", starting empty");
        return;
    }

    for (auto& b : loaded.bindings)
        if (b.id.empty()) b.id = TextUtil_NewId();

    m_set = std::move(loaded);
    Logger::Info("MAPPING", "Loaded " + std::to_string(m_set.bindings.size()) + " bindings (enabled=" +
                 (m_set.enabled ? "1" : "0") + ")");
}

// The file is written outside m_mutex so the hook callback never waits on disk.
// Sequence numbers keep a slow older write from landing after a newer one.
MacroMappingService::PendingSave MacroMappingService::SnapshotLocked()
{
    std::ostringstream out;
    MacroBindings_Write(out, m_set);
    return PendingSave{ out.str(), ++m_saveSeq };
}

bool MacroMappingService::Persist(const PendingSave& save)
{
    std::lock_guard<std::mutex> lock(m_saveMutex);
    if (save.seq <= m_savedSeq) return true; // superseded

    std::error_code ec;
    const std::filesystem::path dir = m_file.parent_path();
    if (!dir.empty() && !std::filesystem::is_directory(dir, ec))
        std::filesystem::create_directories(dir, ec);

    if (!TextUtil_ReplaceFile(m_file, save.content, "MAPPING"))
    {
        Logger::Error("MAPPING", "Failed to save bindings");
        return false;
    }
    m_savedSeq = save.seq;
    return true;
}

// ============================================================
// CRUD
// ============================================================

bool MacroMappingService::AddOrUpdate(const MacroBinding& binding)
{
    const std::wstring name = TextUtil_Trim(binding.macroName);
    if (name.empty())
    {
        Logger::Warn("MAPPING", "Binding rejected: empty macro name");
        return false;
    }

    PendingSave save;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = std::find_if(m_set.bindings.begin(), m_set.bindings.end(),
            [&](const MacroBinding& b) { return b.trigger == binding.trigger; });
        if (it != m_set.bindings.end())
        {
            it->macroName = name;
            it->enabled = binding.enabled;
            Logger::Info("MAPPING", "Updated binding " + binding.trigger.ToString() + " -> '" + TextUtil_ToUtf8(name) + "'");
        }
        else
        {
            MacroBinding b = binding;
            b.macroName = name;
            if (b.id.empty()) b.id = TextUtil_NewId();
            m_set.bindings.push_back(b);
            Logger::Info("MAPPING", "Added binding " + b.trigger.ToString() + " -> '" + TextUtil_ToUtf8(name) + "'");
        }
        save = SnapshotLocked();
    }
    Persist(save);
    BindingsChanged.Emit();
    return true;
}

bool MacroMappingService::Remove(const std::string& bindingId)
{
    if (bindingId.empty()) return false;
    PendingSave save;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto& v = m_set.bindings;
        const size_t before = v.size();
        v.erase(std::remove_if(v.begin(), v.end(),
            [&](const MacroBinding& b) { return TextUtil_EqualsNoCase(b.id, bindingId); }), v.end());
        if (v.size() == before) return false;
        m_lastFireMs.erase(bindingId);
        save = SnapshotLocked();
    }
    Persist(save);
    Logger::Info("MAPPING", "Removed binding " + bindingId);
    BindingsChanged.Emit();
    return true;
}

bool MacroMappingService::Enable(const std::string& bindingId, bool enabled)
{
    if (bindingId.empty()) return false;
    PendingSave save;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = std::find_if(m_set.bindings.begin(), m_set.bindings.end(),
            [&](const MacroBinding& b) { return TextUtil_EqualsNoCase(b.id, bindingId); });
        if (it == m_set.bindings.end()) return false;
        it->enabled = enabled;
        save = SnapshotLocked();
    }
    Persist(save);
    BindingsChanged.Emit();
    return true;
}

bool MacroMappingService::RemoveForMacro(const std::wstring& macroName)
{
    if (TextUtil_Trim(macroName).empty()) return false;
    size_t removed = 0;
    PendingSave save;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto& v = m_set.bindings;
        const size_t before = v.size();
        v.erase(std::remove_if(v.begin(), v.end(),
            [&](const MacroBinding& b) { return TextUtil_EqualsNoCase(b.macroName, macroName); }), v.end());
        removed = before - v.size();
        if (removed == 0) return false;
        save = SnapshotLocked();
    }
    Persist(save);
    Logger::Info("MAPPING", "Removed " + std::to_string(removed) + " bindings of '" + TextUtil_ToUtf8(macroName) + "'");
    BindingsChanged.Emit();
    return true;
}

bool MacroMappingService::RenameMacro(const std::wstring& oldName, const std::wstring& newName)
{
    if (TextUtil_Trim(newName).empty()) return false;
    bool changed = false;
    PendingSave save;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& b : m_set.bindings)
        {
            if (TextUtil_EqualsNoCase(b.macroName, oldName))
            {
                b.macroName = newName;
                changed = true;
            }
        }
        if (!changed) return false;
        save = SnapshotLocked();
    }
    Persist(save);
    BindingsChanged.Emit();
    return true;
}

void MacroMappingService::ClearAll()
{
    PendingSave save;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_set.bindings.clear();
        m_lastFireMs.clear();
        save = SnapshotLocked();
    }
    Persist(save);
    Logger::Info("MAPPING", "All bindings cleared");
    BindingsChanged.Emit();
}

std::vector<MacroBinding> MacroMappingService::List() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_set.bindings;
}

void MacroMappingService::SetEnabled(bool enabled)
{
    PendingSave save;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_set.enabled = enabled;
        save = SnapshotLocked();
    }
    Persist(save);
    Logger::Info("MAPPING", std::string("Trigger mapping ") + (enabled ? "enabled" : "disabled"));
    BindingsChanged.Emit();
}

bool MacroMappingService::IsEnabled() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_set.enabled;
}

void MacroMappingService::SetDebounceMs(uint32_t ms)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_debounceMs = ms;
}

uint32_t MacroMappingService::GetDebounceMs() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_debounceMs;
}

// ============================================================
// Matching
// ============================================================

void MacroMappingService::OnRawEvent(const RawInputEvent& e)
{
    if (e.synthetic) return;
    if (e.IsMouse() && e.edge != InputEdge::Down && e.edge != InputEdge::Up) return;
    if (m_runner.IsRecording() || m_runner.IsPlaying()) return;

    MacroBinding match;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_set.enabled) return;

        auto it = std::find_if(m_set.bindings.begin(), m_set.bindings.end(),
            [&](const MacroBinding& b) { return b.enabled && b.trigger.Matches(e); });
        if (it == m_set.bindings.end()) return;

        auto last = m_lastFireMs.find(it->id);
        if (last != m_lastFireMs.end() && e.timestampMs >= last->second &&
            e.timestampMs - last->second < m_debounceMs)
        {
            return; // debounced
        }
        m_lastFireMs[it->id] = e.timestampMs;
        match = *it;
    }

    Enqueue(match);
}

void MacroMappingService::Enqueue(const MacroBinding& binding)
{
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        if (m_queue.size() >= kMaxQueuedTriggers)
        {
            Logger::Warn("MAPPING", "Trigger queue full, dropping '" + TextUtil_ToUtf8(binding.macroName) + "'");
            return;
        }
        m_queue.push(binding);
    }
    m_queueCv.notify_one();
}

void MacroMappingService::WaitIdle()
{
    std::unique_lock<std::mutex> lock(m_queueMutex);
    m_idleCv.wait(lock, [this] { return (m_queue.empty() && !m_inFlight) || !m_workerRunning; });
}

void MacroMappingService::WorkerFunc()
{
    while (true)
    {
        MacroBinding item;
        {
            std::unique_lock<std::mutex> lock(m_queueMutex);
            m_queueCv.wait(lock, [this] { return !m_queue.empty() || !m_workerRunning; });
            if (!m_workerRunning) break;
            item = m_queue.front();
            m_queue.pop();
            m_inFlight = true;
        }

        RunBinding(item);

        {
            std::lock_guard<std::mutex> lock(m_queueMutex);
            m_inFlight = false;
        }
        m_idleCv.notify_all();
    }

    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        m_inFlight = false;
    }
    m_idleCv.notify_all();
}

void MacroMappingService::RunBinding(const MacroBinding& binding)
{
    const std::string name = TextUtil_ToUtf8(binding.macroName);
    try
    {
        std::optional<Macro> macro = m_runner.LoadMacro(binding.macroName);
        if (!macro)
        {
            Logger::Warn("MAPPING", "Macro '" + name + "' not found for binding " + binding.id);
            return;
        }

        Logger::Info("MAPPING", "Triggering '" + name + "' via " + binding.trigger.ToString());
        PlayResult r = m_runner.PlayMacro(*macro);
        if (!r.ok)
            Logger::Warn("MAPPING", "Playback of '" + name + "' failed: " + r.error);
    }
    catch (const std::exception& ex)
    {
        Logger::Error("MAPPING", "Error triggering '" + name + "': " + ex.what());
    }
}
