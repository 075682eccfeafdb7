#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "event_signal.h"
#include "input_interceptor.h"
#include "macro_binding.h"
#include "macro_runner.h"

// ============================================================
// MACRO TRIGGER MAPPING
// Watches the raw streams and plays the bound macro when a trigger
// matches. Matching and debounce share one lock; playback runs on
// the service's worker thread so the hook callback never waits.
// ============================================================

class MacroMappingService
{
public:
    static constexpr uint32_t kDefaultDebounceMs = 200;
    static constexpr size_t kMaxQueuedTriggers = 16;  // further triggers are dropped

    MacroMappingService(InputInterceptor& interceptor, IMacroRunner& runner, std::filesystem::path bindingsFile);
    ~MacroMappingService();

    MacroMappingService(const MacroMappingService&) = delete;
    MacroMappingService& operator=(const MacroMappingService&) = delete;

    // --- CRUD (each mutation is saved) ---
    bool AddOrUpdate(const MacroBinding& binding);  // upsert keyed by trigger equality
    bool Remove(const std::string& bindingId);
    bool Enable(const std::string& bindingId, bool enabled);
    bool RemoveForMacro(const std::wstring& macroName);
    bool RenameMacro(const std::wstring& oldName, const std::wstring& newName);
    void ClearAll();
    std::vector<MacroBinding> List() const;

    void SetEnabled(bool enabled);
    bool IsEnabled() const;

    void SetDebounceMs(uint32_t ms);
    uint32_t GetDebounceMs() const;

    // Raw stream input (hook thread)
    void OnRawEvent(const RawInputEvent& e);

    // Blocks until every queued trigger has been handled
    void WaitIdle();

    const std::filesystem::path& BindingsFile() const { return m_file; }

    Signal<> BindingsChanged;

private:
    struct PendingSave
    {
        std::string content;
        uint64_t seq = 0;
    };

    void LoadLocked();
    PendingSave SnapshotLocked();
    bool Persist(const PendingSave& save);
    void Enqueue(const MacroBinding& binding);
    void WorkerFunc();
    void RunBinding(const MacroBinding& binding);

    InputInterceptor& m_interceptor;
    IMacroRunner& m_runner;
    std::filesystem::path m_file;

    int m_keyboardConn = 0;
    int m_mouseConn = 0;

    // Bindings + debounce table
    mutable std::mutex m_mutex;
    MacroBindingSet m_set;
    std::unordered_map<std::string, uint64_t> m_lastFireMs;
    uint32_t m_debounceMs = kDefaultDebounceMs;
    uint64_t m_saveSeq = 0;

    // File writes
    std::mutex m_saveMutex;
    uint64_t m_savedSeq = 0;

    // Worker
    std::mutex m_queueMutex;
    std::condition_variable m_queueCv;
    std::condition_variable m_idleCv;
    std::queue<MacroBinding> m_queue;
    bool m_inFlight = false;
    bool m_workerRunning = false;
    std::thread m_worker;
};
