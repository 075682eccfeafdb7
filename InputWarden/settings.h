// settings.h
#pragma once
#include <cstdint>

// Process-wide settings (loaded from settings.ini by settings_ini.cpp).
// Setters clamp to the documented range.

// Emergency unlock chord: key + required modifiers, pressed N times within the timeout
void Settings_SetUnlockKey(uint16_t vk);          // 0 keeps the current key
uint16_t Settings_GetUnlockKey();

void Settings_SetUnlockCtrl(bool on);
bool Settings_GetUnlockCtrl();
void Settings_SetUnlockAlt(bool on);
bool Settings_GetUnlockAlt();
void Settings_SetUnlockShift(bool on);
bool Settings_GetUnlockShift();

void Settings_SetUnlockPresses(int n);            // 2..10
int Settings_GetUnlockPresses();

void Settings_SetUnlockTimeoutMs(uint32_t ms);    // 500..10000
uint32_t Settings_GetUnlockTimeoutMs();

// Trigger mapping
void Settings_SetTriggerDebounceMs(uint32_t ms);  // 0..5000
uint32_t Settings_GetTriggerDebounceMs();

// Recording filters
void Settings_SetRecordKeyboard(bool on);
bool Settings_GetRecordKeyboard();
void Settings_SetRecordMouse(bool on);
bool Settings_GetRecordMouse();
void Settings_SetRecordMouseMovement(bool on);
bool Settings_GetRecordMouseMovement();
void Settings_SetRecordDelays(bool on);
bool Settings_GetRecordDelays();

void Settings_SetRecordMinDelayMs(uint32_t ms);   // 0..1000
uint32_t Settings_GetRecordMinDelayMs();

void Settings_SetRecordMaxMinutes(uint32_t min);  // 1..240
uint32_t Settings_GetRecordMaxMinutes();

// Playback
void Settings_SetPlaybackSpeed(float speed);      // 0.1..10
float Settings_GetPlaybackSpeed();

void Settings_SetRespectTiming(bool on);
bool Settings_GetRespectTiming();

void Settings_SetCustomDelayMs(uint32_t ms);      // 0..10000
uint32_t Settings_GetCustomDelayMs();

// Back to defaults (tests, "reset" command)
void Settings_ResetDefaults();
