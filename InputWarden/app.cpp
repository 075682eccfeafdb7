#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <windows.h>

#include <ctime>
#include <exception>
#include <memory>
#include <optional>
#include <string>

#include "app.h"
#include "app_paths.h"
#include "input_interceptor.h"
#include "logger.h"
#include "macro_mapping_service.h"
#include "macro_service.h"
#include "macro_storage.h"
#include "settings.h"
#include "settings_ini.h"
#include "text_util.h"
#include "win_input_hook.h"
#include "win_input_synthesizer.h"
#include "win_util.h"

// Global hotkeys (Ctrl+Alt+...)
enum HotkeyId : int
{
    HK_TOGGLE_KEYBOARD = 1, // K
    HK_TOGGLE_MOUSE,        // M
    HK_RECORD,              // R  start / stop + save
    HK_PLAY_LAST,           // P
    HK_STOP_PLAYBACK,       // S
    HK_QUIT,                // Q
};

static const UINT_PTR RECORDER_TICK_TIMER_ID = 1;
static const UINT RECORDER_TICK_TIMER_MS = 250;

struct AppContext
{
    InputInterceptor* interceptor = nullptr;
    MacroService* macros = nullptr;
    MacroMappingService* mapping = nullptr;
    std::wstring lastRecording;
};

static AppContext g_app;

static std::wstring MakeRecordingName()
{
    std::time_t t = std::time(nullptr);
    std::tm tm_val{};
    localtime_s(&tm_val, &t);
    wchar_t buf[64]{};
    wcsftime(buf, 64, L"Recording %Y%m%d-%H%M%S", &tm_val);
    return buf;
}

static void ApplySettings(InputInterceptor& interceptor, MacroService& macros, MacroMappingService& mapping)
{
    EmergencyUnlockChord chord;
    chord.keyCode = Settings_GetUnlockKey();
    chord.ctrl = Settings_GetUnlockCtrl();
    chord.alt = Settings_GetUnlockAlt();
    chord.shift = Settings_GetUnlockShift();
    interceptor.Unlock().Configure(chord, Settings_GetUnlockPresses(), Settings_GetUnlockTimeoutMs());

    RecordingFilters filters;
    filters.recordKeyboard = Settings_GetRecordKeyboard();
    filters.recordMouse = Settings_GetRecordMouse();
    filters.recordMouseMovement = Settings_GetRecordMouseMovement();
    filters.recordDelays = Settings_GetRecordDelays();
    macros.SetRecordingOptions(filters, Settings_GetRecordMinDelayMs(), Settings_GetRecordMaxMinutes() * 60u * 1000u);

    macros.SetPlaybackOptions(Settings_GetPlaybackSpeed(), Settings_GetRespectTiming(), Settings_GetCustomDelayMs());
    mapping.SetDebounceMs(Settings_GetTriggerDebounceMs());

    Logger::Info("APP_RUN", "Emergency unlock: " + interceptor.Unlock().UnlockReason());
}

static void OnRecordHotkey()
{
    MacroService& macros = *g_app.macros;
    if (!macros.HasRecordingSession())
    {
        const std::wstring name = MakeRecordingName();
        if (macros.StartRecording(name))
            Logger::Info("APP_RUN", "Recording '" + TextUtil_ToUtf8(name) + "' (Ctrl+Alt+R again to save)");
        return;
    }

    // The message loop also pumps the hooks: keep the file write off this thread
    std::optional<std::wstring> name = macros.StopRecordingAsync();
    if (name)
    {
        g_app.lastRecording = *name;
        Logger::Info("APP_RUN", "Recording '" + TextUtil_ToUtf8(*name) + "' stopped, saving");
    }
}

static void OnPlayLastHotkey()
{
    MacroService& macros = *g_app.macros;
    if (g_app.lastRecording.empty())
    {
        Logger::Warn("APP_RUN", "Nothing recorded in this session");
        return;
    }

    macros.WaitForSave();
    std::optional<Macro> m = macros.Load(g_app.lastRecording);
    if (!m)
    {
        Logger::Warn("APP_RUN", "Macro '" + TextUtil_ToUtf8(g_app.lastRecording) + "' not found");
        return;
    }
    if (!macros.PlayAsync(*m))
        Logger::Warn("APP_RUN", "Playback not started (already playing)");
}

static LRESULT CALLBACK HiddenWndProc(HWND hwnd, UINT msg, WPARAM wParam, LPARAM lParam)
{
    switch (msg)
    {
    case WM_HOTKEY:
        if (!g_app.interceptor) break;
        switch ((int)wParam)
        {
        case HK_TOGGLE_KEYBOARD: g_app.interceptor->ToggleKeyboard(); break;
        case HK_TOGGLE_MOUSE:    g_app.interceptor->ToggleMouse(); break;
        case HK_RECORD:          OnRecordHotkey(); break;
        case HK_PLAY_LAST:       OnPlayLastHotkey(); break;
        case HK_STOP_PLAYBACK:   g_app.macros->StopPlayback(); break;
        case HK_QUIT:
            Logger::Info("APP_RUN", "Quit requested");
            PostQuitMessage(kExitOk);
            break;
        }
        return 0;

    case WM_TIMER:
        if (wParam == RECORDER_TICK_TIMER_ID && g_app.macros)
            g_app.macros->Recorder().Tick();
        return 0;
    }
    return DefWindowProcW(hwnd, msg, wParam, lParam);
}

static void RegisterHotkeys(HWND hwnd)
{
    struct { int id; UINT vk; const char* name; } keys[] = {
        { HK_TOGGLE_KEYBOARD, 'K', "Ctrl+Alt+K" },
        { HK_TOGGLE_MOUSE,    'M', "Ctrl+Alt+M" },
        { HK_RECORD,          'R', "Ctrl+Alt+R" },
        { HK_PLAY_LAST,       'P', "Ctrl+Alt+P" },
        { HK_STOP_PLAYBACK,   'S', "Ctrl+Alt+S" },
        { HK_QUIT,            'Q', "Ctrl+Alt+Q" },
    };
    for (const auto& k : keys)
    {
        if (!RegisterHotKey(hwnd, k.id, MOD_CONTROL | MOD_ALT | MOD_NOREPEAT, k.vk))
            Logger::Warn("APP_RUN", std::string("RegisterHotKey ") + k.name + " failed: " + WinUtil_ErrorText(GetLastError()));
    }
}

static void UnregisterHotkeys(HWND hwnd)
{
    for (int id = HK_TOGGLE_KEYBOARD; id <= HK_QUIT; ++id)
        UnregisterHotKey(hwnd, id);
}

int App_Run(HINSTANCE hInst)
{
    // 1. Settings
    const std::wstring& iniPath = AppPaths_SettingsIni();
    if (!SettingsIni_Load(iniPath.c_str()))
    {
        Logger::Info("APP_RUN", "settings.ini absent - ecriture des valeurs par defaut");
        SettingsIni_Save(iniPath.c_str());
    }

    // 2. Services
    InputInterceptor interceptor;
    FileMacroStorage storage{ std::filesystem::path(AppPaths_MacroDir()) };
    WinInputSynthesizer synth;
    MacroService macros(interceptor, storage, synth);
    MacroMappingService mapping(interceptor, macros, std::filesystem::path(AppPaths_BindingsFile()));

    const int delConn = macros.MacroDeleted.Connect([&mapping](const std::wstring& name) {
        mapping.RemoveForMacro(name);
    });
    const int renConn = macros.MacroRenamed.Connect([&mapping](const std::wstring& oldName, const std::wstring& newName) {
        mapping.RenameMacro(oldName, newName);
    });
    const int unlockConn = interceptor.EmergencyUnlocked.Connect([](const std::string& reason) {
        Logger::Warn("APP_RUN", reason);
    });

    ApplySettings(interceptor, macros, mapping);

    g_app.interceptor = &interceptor;
    g_app.macros = &macros;
    g_app.mapping = &mapping;

    // 3. Message-only window for hotkeys and timers
    Logger::Info("APP_RUN", "Avant CreateWindowExW");
    WNDCLASSW wc{};
    wc.lpfnWndProc = HiddenWndProc;
    wc.hInstance = hInst;
    wc.lpszClassName = L"InputWardenHidden";
    RegisterClassW(&wc);

    HWND hwnd = CreateWindowExW(0, wc.lpszClassName, L"InputWarden", 0, 0, 0, 0, 0, HWND_MESSAGE, nullptr, hInst, nullptr);
    if (!hwnd)
        Logger::Error("APP_RUN", "CreateWindowExW failed: " + WinUtil_ErrorText(GetLastError()) + " - no hotkeys");
    else
    {
        RegisterHotkeys(hwnd);
        SetTimer(hwnd, RECORDER_TICK_TIMER_ID, RECORDER_TICK_TIMER_MS, nullptr);
        Logger::Info("APP_RUN", "CreateWindowExW OK");
    }

    int exitCode = kExitOk;

    // 4. Hooks + message loop
    WinInputHook hook(interceptor);
    try
    {
        hook.Install();
    }
    catch (const HookInstallError& ex)
    {
        Logger::Critical("APP_RUN", ex.what());
        exitCode = kExitHookFailed;
    }

    if (exitCode == kExitOk)
    {
        Logger::Info("APP_RUN", "Entree boucle messages");
        MSG msg{};
        while (true)
        {
            BOOL gm = GetMessageW(&msg, nullptr, 0, 0);
            if (gm == -1)
            {
                Logger::Critical("APP_RUN", "GetMessageW retourne -1 !");
                exitCode = kExitMessageLoopFailed;
                break;
            }
            if (gm == 0) { exitCode = (int)msg.wParam; break; }
            TranslateMessage(&msg);
            DispatchMessageW(&msg);
        }
        Logger::Info("APP_RUN", "Sortie boucle messages - nettoyage");
    }

    // 5. Cleanup
    hook.Uninstall();
    if (hwnd)
    {
        KillTimer(hwnd, RECORDER_TICK_TIMER_ID);
        UnregisterHotkeys(hwnd);
        DestroyWindow(hwnd);
    }

    if (macros.HasRecordingSession())
    {
        Logger::Info("APP_RUN", "Recording still active at exit - saving");
        macros.StopRecording();
    }
    macros.WaitForSave();
    macros.StopPlayback();
    macros.WaitForPlayback();

    macros.MacroDeleted.Disconnect(delConn);
    macros.MacroRenamed.Disconnect(renConn);
    interceptor.EmergencyUnlocked.Disconnect(unlockConn);

    g_app = AppContext();

    Logger::Info("APP_RUN", "App_Run termine, code " + std::to_string(exitCode));
    return exitCode;
}
