#pragma once
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "advanced_config.h"
#include "event_signal.h"
#include "raw_input_event.h"

// ============================================================
// BLOCKING STATE MACHINE
// One instance per device. States:
//   Unblocked, Blocked x Simple, Blocked x Advanced(config), Select(config)
// The mode is a tagged union: the config only exists in Advanced/Select.
// ============================================================

struct SimpleMode {};

template <typename Config>
struct AdvancedMode { Config config; };

template <typename Config>
struct SelectMode { Config config; };

template <typename Config>
using BlockingMode = std::variant<SimpleMode, AdvancedMode<Config>, SelectMode<Config>>;

enum class BlockingModeKind
{
    Simple,
    Advanced,
    Select,
};

const char* BlockingModeKindToString(BlockingModeKind kind);

namespace BlockReason
{
    constexpr const char* UserToggle      = "User toggle";
    constexpr const char* UserRequest     = "User request";
    constexpr const char* SetSimple       = "User set simple mode";
    constexpr const char* SetAdvanced     = "User set advanced mode";
    constexpr const char* SetSelect       = "User set select mode";
    constexpr const char* SelectionEdit   = "User edited selection";
    constexpr const char* ApplySelection  = "User applied selection";
    constexpr const char* PlaybackSuspend = "Macro playback started";
    constexpr const char* PlaybackRestore = "Macro playback finished";
}

template <typename Config>
struct BlockingSnapshot
{
    bool isBlocked = false;
    BlockingMode<Config> mode = SimpleMode{};
    std::chrono::system_clock::time_point lastToggleTime{};
    std::string lastToggleReason;

    BlockingModeKind Kind() const
    {
        return (BlockingModeKind)mode.index();
    }

    // nullptr in Simple mode
    const Config* ModeConfig() const
    {
        if (auto a = std::get_if<AdvancedMode<Config>>(&mode)) return &a->config;
        if (auto s = std::get_if<SelectMode<Config>>(&mode)) return &s->config;
        return nullptr;
    }
};

template <typename Config>
class BlockingStateMachine
{
public:
    using Snapshot = BlockingSnapshot<Config>;

    // allLabel is used by Summary(): "All <allLabel> blocked"
    BlockingStateMachine(std::string deviceName, std::string allLabel)
        : m_deviceName(std::move(deviceName)), m_allLabel(std::move(allLabel))
    {
        m_state.lastToggleTime = std::chrono::system_clock::now();
    }

    BlockingStateMachine(const BlockingStateMachine&) = delete;
    BlockingStateMachine& operator=(const BlockingStateMachine&) = delete;

    void Toggle(const std::string& reason = BlockReason::UserToggle)
    {
        Mutate([](Snapshot& s) { s.isBlocked = !s.isBlocked; return true; }, reason);
    }

    void SetBlocked(bool blocked, const std::string& reason = BlockReason::UserRequest)
    {
        Mutate([blocked](Snapshot& s) { s.isBlocked = blocked; return true; }, reason);
    }

    void SetSimpleMode(const std::string& reason = BlockReason::SetSimple)
    {
        Mutate([](Snapshot& s) { s.mode = SimpleMode{}; return true; }, reason);
    }

    void SetAdvancedMode(const Config& config, const std::string& reason = BlockReason::SetAdvanced)
    {
        Mutate([&config](Snapshot& s) { s.mode = AdvancedMode<Config>{ config }; return true; }, reason);
    }

    // Takes a copy of config; the previous selection is dropped so only
    // controls picked from now on are highlighted.
    void SetSelectMode(const Config& config, const std::string& reason = BlockReason::SetSelect)
    {
        Mutate([&config](Snapshot& s) {
            SelectMode<Config> sel{ config };
            sel.config.ClearSelection();
            s.mode = std::move(sel);
            return true;
        }, reason);
    }

    // Select mode only: edit the working selection in place
    bool EditSelection(const std::function<void(Config&)>& edit,
                       const std::string& reason = BlockReason::SelectionEdit)
    {
        return Mutate([&edit](Snapshot& s) {
            auto sel = std::get_if<SelectMode<Config>>(&s.mode);
            if (!sel) return false;
            edit(sel->config);
            return true;
        }, reason);
    }

    // Merges the selected set into the blocked set and switches to Advanced.
    // No-op (false) in Simple mode.
    bool ApplySelection(const std::string& reason = BlockReason::ApplySelection)
    {
        return Mutate([](Snapshot& s) {
            const Config* current = s.ModeConfig();
            if (!current) return false;
            Config merged = *current;
            merged.ApplySelection();
            s.mode = AdvancedMode<Config>{ std::move(merged) };
            return true;
        }, reason);
    }

    // Suppression decision. Called from the hook callback.
    bool IsSuppressed(const RawInputEvent& e) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_state.isBlocked) return false;

        return std::visit([&e](const auto& mode) -> bool {
            using T = std::decay_t<decltype(mode)>;
            if constexpr (std::is_same_v<T, SimpleMode>)
                return true;
            else if constexpr (std::is_same_v<T, AdvancedMode<Config>>)
                return mode.config.IsBlocked(e);
            else
                return false; // Select never suppresses
        }, m_state.mode);
    }

    bool IsBlocked() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_state.isBlocked;
    }

    BlockingModeKind ModeKind() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_state.Kind();
    }

    Snapshot GetSnapshot() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_state;
    }

    std::string Summary() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_state.isBlocked) return "Not blocked";
        switch (m_state.Kind())
        {
        case BlockingModeKind::Simple:   return "All " + m_allLabel + " blocked";
        case BlockingModeKind::Advanced: return m_state.ModeConfig()->Summary();
        case BlockingModeKind::Select:   return "Select mode";
        }
        return "Not blocked";
    }

    const std::string& DeviceName() const { return m_deviceName; }

    Signal<const Snapshot&> StateChanged;

private:
    template <typename Fn>
    bool Mutate(Fn&& fn, const std::string& reason)
    {
        Snapshot after;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!fn(m_state)) return false;
            m_state.lastToggleTime = std::chrono::system_clock::now();
            m_state.lastToggleReason = reason;
            after = m_state;
        }
        StateChanged.Emit(after);
        return true;
    }

    std::string m_deviceName;
    std::string m_allLabel;
    mutable std::mutex m_mutex;
    Snapshot m_state;
};

using KeyboardBlockingState = BlockingStateMachine<KeyboardAdvancedConfig>;
using MouseBlockingState = BlockingStateMachine<MouseAdvancedConfig>;

extern template class BlockingStateMachine<KeyboardAdvancedConfig>;
extern template class BlockingStateMachine<MouseAdvancedConfig>;
