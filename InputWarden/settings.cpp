// settings.cpp
#include "settings.h"

#include <algorithm>
#include <atomic>
#include <cmath>

// Emergency unlock (Ctrl+Alt+U x3 within 2 s)
static std::atomic<uint16_t> g_unlockVk{ 0x55 };
static std::atomic<bool> g_unlockCtrl{ true };
static std::atomic<bool> g_unlockAlt{ true };
static std::atomic<bool> g_unlockShift{ false };
static std::atomic<int> g_unlockPresses{ 3 };
static std::atomic<uint32_t> g_unlockTimeoutMs{ 2000 };

// Mapping
static std::atomic<uint32_t> g_triggerDebounceMs{ 200 };

// Recording
static std::atomic<bool> g_recKeyboard{ true };
static std::atomic<bool> g_recMouse{ true };
static std::atomic<bool> g_recMouseMove{ false };
static std::atomic<bool> g_recDelays{ true };
static std::atomic<uint32_t> g_recMinDelayMs{ 10 };
static std::atomic<uint32_t> g_recMaxMinutes{ 30 };

// Playback (speed stored as x1000)
static std::atomic<int> g_speedM{ 1000 };
static std::atomic<bool> g_respectTiming{ true };
static std::atomic<uint32_t> g_customDelayMs{ 50 };

// ---------------- Unlock ----------------
void Settings_SetUnlockKey(uint16_t vk)
{
    if (vk == 0 || vk > 0xFE) return;
    g_unlockVk.store(vk, std::memory_order_relaxed);
}
uint16_t Settings_GetUnlockKey() { return g_unlockVk.load(std::memory_order_relaxed); }

void Settings_SetUnlockCtrl(bool on) { g_unlockCtrl.store(on, std::memory_order_relaxed); }
bool Settings_GetUnlockCtrl() { return g_unlockCtrl.load(std::memory_order_relaxed); }
void Settings_SetUnlockAlt(bool on) { g_unlockAlt.store(on, std::memory_order_relaxed); }
bool Settings_GetUnlockAlt() { return g_unlockAlt.load(std::memory_order_relaxed); }
void Settings_SetUnlockShift(bool on) { g_unlockShift.store(on, std::memory_order_relaxed); }
bool Settings_GetUnlockShift() { return g_unlockShift.load(std::memory_order_relaxed); }

void Settings_SetUnlockPresses(int n)
{
    g_unlockPresses.store(std::clamp(n, 2, 10), std::memory_order_relaxed);
}
int Settings_GetUnlockPresses() { return g_unlockPresses.load(std::memory_order_relaxed); }

void Settings_SetUnlockTimeoutMs(uint32_t ms)
{
    g_unlockTimeoutMs.store(std::clamp(ms, 500u, 10000u), std::memory_order_relaxed);
}
uint32_t Settings_GetUnlockTimeoutMs() { return g_unlockTimeoutMs.load(std::memory_order_relaxed); }

// ---------------- Mapping ----------------
void Settings_SetTriggerDebounceMs(uint32_t ms)
{
    g_triggerDebounceMs.store(std::min(ms, 5000u), std::memory_order_relaxed);
}
uint32_t Settings_GetTriggerDebounceMs() { return g_triggerDebounceMs.load(std::memory_order_relaxed); }

// ---------------- Recording ----------------
void Settings_SetRecordKeyboard(bool on) { g_recKeyboard.store(on, std::memory_order_relaxed); }
bool Settings_GetRecordKeyboard() { return g_recKeyboard.load(std::memory_order_relaxed); }
void Settings_SetRecordMouse(bool on) { g_recMouse.store(on, std::memory_order_relaxed); }
bool Settings_GetRecordMouse() { return g_recMouse.load(std::memory_order_relaxed); }
void Settings_SetRecordMouseMovement(bool on) { g_recMouseMove.store(on, std::memory_order_relaxed); }
bool Settings_GetRecordMouseMovement() { return g_recMouseMove.load(std::memory_order_relaxed); }
void Settings_SetRecordDelays(bool on) { g_recDelays.store(on, std::memory_order_relaxed); }
bool Settings_GetRecordDelays() { return g_recDelays.load(std::memory_order_relaxed); }

void Settings_SetRecordMinDelayMs(uint32_t ms)
{
    g_recMinDelayMs.store(std::min(ms, 1000u), std::memory_order_relaxed);
}
uint32_t Settings_GetRecordMinDelayMs() { return g_recMinDelayMs.load(std::memory_order_relaxed); }

void Settings_SetRecordMaxMinutes(uint32_t min)
{
    g_recMaxMinutes.store(std::clamp(min, 1u, 240u), std::memory_order_relaxed);
}
uint32_t Settings_GetRecordMaxMinutes() { return g_recMaxMinutes.load(std::memory_order_relaxed); }

// ---------------- Playback ----------------
void Settings_SetPlaybackSpeed(float speed)
{
    if (!std::isfinite(speed)) speed = 1.0f;
    int m = (int)lroundf(speed * 1000.0f);
    g_speedM.store(std::clamp(m, 100, 10000), std::memory_order_relaxed);
}
float Settings_GetPlaybackSpeed() { return (float)g_speedM.load(std::memory_order_relaxed) / 1000.0f; }

void Settings_SetRespectTiming(bool on) { g_respectTiming.store(on, std::memory_order_relaxed); }
bool Settings_GetRespectTiming() { return g_respectTiming.load(std::memory_order_relaxed); }

void Settings_SetCustomDelayMs(uint32_t ms)
{
    g_customDelayMs.store(std::min(ms, 10000u), std::memory_order_relaxed);
}
uint32_t Settings_GetCustomDelayMs() { return g_customDelayMs.load(std::memory_order_relaxed); }

void Settings_ResetDefaults()
{
    g_unlockVk = 0x55;
    g_unlockCtrl = true;
    g_unlockAlt = true;
    g_unlockShift = false;
    g_unlockPresses = 3;
    g_unlockTimeoutMs = 2000;
    g_triggerDebounceMs = 200;
    g_recKeyboard = true;
    g_recMouse = true;
    g_recMouseMove = false;
    g_recDelays = true;
    g_recMinDelayMs = 10;
    g_recMaxMinutes = 30;
    g_speedM = 1000;
    g_respectTiming = true;
    g_customDelayMs = 50;
}
