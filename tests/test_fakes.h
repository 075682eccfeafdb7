#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "blocking_control.h"
#include "input_synthesizer.h"
#include "macro_runner.h"
#include "macro_storage.h"
#include "text_util.h"

// Records every call; SendKey(failVk) is refused
class FakeSynthesizer : public IInputSynthesizer
{
public:
    struct Call
    {
        std::string what;     // "key", "button", "move", "wheel", "char"
        int a = 0;            // vk / button / x / delta / char
        int b = 0;            // down / x / y
        uint64_t atMs = 0;
    };

    uint16_t failVk = 0;

    bool SendKey(uint16_t vk, bool down) override
    {
        Push({ "key", vk, down ? 1 : 0 });
        return vk != failVk;
    }
    bool SendMouseButton(MouseButton button, bool down, int, int) override
    {
        Push({ "button", (int)button, down ? 1 : 0 });
        return true;
    }
    bool SendMouseMove(int x, int y) override
    {
        Push({ "move", x, y });
        return true;
    }
    bool SendMouseWheel(int delta, int, int) override
    {
        Push({ "wheel", delta, 0 });
        return true;
    }
    bool SendChar(wchar_t ch) override
    {
        Push({ "char", (int)ch, 0 });
        return true;
    }

    std::vector<Call> Calls() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_calls;
    }
    size_t Count() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_calls.size();
    }

private:
    void Push(Call c)
    {
        c.atMs = RawInput_NowMs();
        std::lock_guard<std::mutex> lock(m_mutex);
        m_calls.push_back(c);
    }

    mutable std::mutex m_mutex;
    std::vector<Call> m_calls;
};

class FakeBlockingControl : public IBlockingControl
{
public:
    bool keyboard = false;
    bool mouse = false;
    std::vector<std::string> log;  // "kb:0:<reason>"

    bool IsKeyboardBlocked() const override { return keyboard; }
    bool IsMouseBlocked() const override { return mouse; }
    void SetKeyboardBlocked(bool blocked, const std::string& reason) override
    {
        keyboard = blocked;
        log.push_back(std::string("kb:") + (blocked ? "1:" : "0:") + reason);
    }
    void SetMouseBlocked(bool blocked, const std::string& reason) override
    {
        mouse = blocked;
        log.push_back(std::string("mouse:") + (blocked ? "1:" : "0:") + reason);
    }
};

// In-memory runner for the mapping service
class FakeRunner : public IMacroRunner
{
public:
    std::atomic<bool> recording{ false };
    std::atomic<bool> playing{ false };
    std::atomic<int> plays{ 0 };
    std::atomic<bool> hold{ false };  // PlayMacro() spins until cleared or stopped
    std::atomic<int> stops{ 0 };
    std::map<std::wstring, Macro> macros;

    bool IsRecording() const override { return recording.load(); }
    bool IsPlaying() const override { return playing.load(); }

    std::optional<Macro> LoadMacro(const std::wstring& name) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = macros.find(name);
        if (it == macros.end()) return std::nullopt;
        return it->second;
    }

    PlayResult PlayMacro(const Macro& macro) override
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_played.push_back(macro.name);
        }
        plays++;
        while (hold.load())
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        return PlayResult::Success();
    }

    void StopPlayback() override
    {
        stops++;
        hold = false;
    }

    std::vector<std::wstring> Played() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_played;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<std::wstring> m_played;
};

inline void WaitUntil(const std::function<bool()>& cond, int timeoutMs = 2000)
{
    const auto end = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (!cond() && std::chrono::steady_clock::now() < end)
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
}

// Manually advanced monotonic clock
struct FakeClock
{
    std::atomic<uint64_t> now{ 1000 };
    uint64_t operator()() const { return now.load(); }
};

// Unique directory under the system temp dir, removed on destruction
class TempDir
{
public:
    TempDir()
        : m_path(std::filesystem::temp_directory_path() / ("inputwarden_test_" + TextUtil_NewId()))
    {
        std::filesystem::create_directories(m_path);
    }
    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& Path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

inline Macro MakeKeyMacro(const std::wstring& name, std::vector<uint32_t> offsets, uint16_t vk = 0x41)
{
    Macro m(name);
    bool down = true;
    for (uint32_t ts : offsets)
    {
        m.events.push_back(MacroEvent_Key(vk, down, ts));
        down = !down;
    }
    return m;
}
