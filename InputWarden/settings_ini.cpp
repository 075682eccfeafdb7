// settings_ini.cpp
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <windows.h>

#include <string>

#include "settings_ini.h"
#include "settings.h"
#include "ini_util.h"
#include "logger.h"

bool SettingsIni_Load(const wchar_t* path)
{
    if (!path) return false;

    DWORD attr = GetFileAttributesW(path);
    if (attr == INVALID_FILE_ATTRIBUTES) return false;

    // Logging
    int loggingEnabled = GetPrivateProfileIntW(L"Main", L"Logging", 0, path);
    Logger::SetEnabled(loggingEnabled != 0);
    int logLevel = GetPrivateProfileIntW(L"Main", L"LogLevel", (int)Logger::INFO, path);
    if (logLevel < (int)Logger::INFO) logLevel = (int)Logger::INFO;
    if (logLevel > (int)Logger::CRITICAL) logLevel = (int)Logger::CRITICAL;
    Logger::SetMinLevel((Logger::Level)logLevel);

    // Unlock
    UINT unlockVk = IniUtil_ReadU32(L"Unlock", L"Key", Settings_GetUnlockKey(), path);
    bool unlockCtrl = IniUtil_ReadBool(L"Unlock", L"Ctrl", Settings_GetUnlockCtrl(), path);
    bool unlockAlt = IniUtil_ReadBool(L"Unlock", L"Alt", Settings_GetUnlockAlt(), path);
    bool unlockShift = IniUtil_ReadBool(L"Unlock", L"Shift", Settings_GetUnlockShift(), path);
    int presses = GetPrivateProfileIntW(L"Unlock", L"Presses", Settings_GetUnlockPresses(), path);
    UINT timeoutMs = IniUtil_ReadU32(L"Unlock", L"TimeoutMs", Settings_GetUnlockTimeoutMs(), path);

    // Recording
    bool recKb = IniUtil_ReadBool(L"Recording", L"Keyboard", Settings_GetRecordKeyboard(), path);
    bool recMouse = IniUtil_ReadBool(L"Recording", L"Mouse", Settings_GetRecordMouse(), path);
    bool recMove = IniUtil_ReadBool(L"Recording", L"MouseMovement", Settings_GetRecordMouseMovement(), path);
    bool recDelays = IniUtil_ReadBool(L"Recording", L"Delays", Settings_GetRecordDelays(), path);
    UINT minDelay = IniUtil_ReadU32(L"Recording", L"MinDelayMs", Settings_GetRecordMinDelayMs(), path);
    UINT maxMinutes = IniUtil_ReadU32(L"Recording", L"MaxMinutes", Settings_GetRecordMaxMinutes(), path);

    // Playback
    float speed = IniUtil_ReadFloat1000(L"Playback", L"Speed", Settings_GetPlaybackSpeed(), path);
    bool respectTiming = IniUtil_ReadBool(L"Playback", L"RespectTiming", Settings_GetRespectTiming(), path);
    UINT customDelay = IniUtil_ReadU32(L"Playback", L"CustomDelayMs", Settings_GetCustomDelayMs(), path);

    // Mapping
    UINT debounce = IniUtil_ReadU32(L"Mapping", L"DebounceMs", Settings_GetTriggerDebounceMs(), path);

    // The chord needs at least one modifier, otherwise keep the defaults
    if (unlockCtrl || unlockAlt || unlockShift)
    {
        Settings_SetUnlockCtrl(unlockCtrl);
        Settings_SetUnlockAlt(unlockAlt);
        Settings_SetUnlockShift(unlockShift);
    }
    else
    {
        Logger::Warn("SETTINGS", "[Unlock] without modifier ignored");
    }
    Settings_SetUnlockKey((uint16_t)unlockVk);
    Settings_SetUnlockPresses(presses);
    Settings_SetUnlockTimeoutMs(timeoutMs);

    Settings_SetRecordKeyboard(recKb);
    Settings_SetRecordMouse(recMouse);
    Settings_SetRecordMouseMovement(recMove);
    Settings_SetRecordDelays(recDelays);
    Settings_SetRecordMinDelayMs(minDelay);
    Settings_SetRecordMaxMinutes(maxMinutes);

    Settings_SetPlaybackSpeed(speed);
    Settings_SetRespectTiming(respectTiming);
    Settings_SetCustomDelayMs(customDelay);

    Settings_SetTriggerDebounceMs(debounce);
    return true;
}

static bool SettingsIni_Save_Internal(const wchar_t* tmpPath)
{
    if (!tmpPath) return false;
    IniUtil_WriteU32(L"Main", L"Logging", Logger::IsEnabled() ? 1 : 0, tmpPath);
    IniUtil_WriteU32(L"Main", L"LogLevel", (UINT)Logger::GetMinLevel(), tmpPath);

    IniUtil_WriteU32(L"Unlock", L"Key", Settings_GetUnlockKey(), tmpPath);
    IniUtil_WriteBool(L"Unlock", L"Ctrl", Settings_GetUnlockCtrl(), tmpPath);
    IniUtil_WriteBool(L"Unlock", L"Alt", Settings_GetUnlockAlt(), tmpPath);
    IniUtil_WriteBool(L"Unlock", L"Shift", Settings_GetUnlockShift(), tmpPath);
    IniUtil_WriteU32(L"Unlock", L"Presses", (UINT)Settings_GetUnlockPresses(), tmpPath);
    IniUtil_WriteU32(L"Unlock", L"TimeoutMs", Settings_GetUnlockTimeoutMs(), tmpPath);

    IniUtil_WriteBool(L"Recording", L"Keyboard", Settings_GetRecordKeyboard(), tmpPath);
    IniUtil_WriteBool(L"Recording", L"Mouse", Settings_GetRecordMouse(), tmpPath);
    IniUtil_WriteBool(L"Recording", L"MouseMovement", Settings_GetRecordMouseMovement(), tmpPath);
    IniUtil_WriteBool(L"Recording", L"Delays", Settings_GetRecordDelays(), tmpPath);
    IniUtil_WriteU32(L"Recording", L"MinDelayMs", Settings_GetRecordMinDelayMs(), tmpPath);
    IniUtil_WriteU32(L"Recording", L"MaxMinutes", Settings_GetRecordMaxMinutes(), tmpPath);

    IniUtil_WriteFloat1000(L"Playback", L"Speed", Settings_GetPlaybackSpeed(), tmpPath);
    IniUtil_WriteBool(L"Playback", L"RespectTiming", Settings_GetRespectTiming(), tmpPath);
    IniUtil_WriteU32(L"Playback", L"CustomDelayMs", Settings_GetCustomDelayMs(), tmpPath);

    IniUtil_WriteU32(L"Mapping", L"DebounceMs", Settings_GetTriggerDebounceMs(), tmpPath);
    return true;
}

bool SettingsIni_Save(const wchar_t* path)
{
    if (!path) return false;

    std::wstring tmp = std::wstring(path) + L".tmp";
    DeleteFileW(tmp.c_str());

    if (!SettingsIni_Save_Internal(tmp.c_str()))
    {
        DeleteFileW(tmp.c_str());
        return false;
    }

    return IniUtil_AtomicReplace(tmp.c_str(), path);
}
