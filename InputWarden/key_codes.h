#pragma once
#include <cstdint>
#include <string>

// Virtual-key codes used by the core. Values match the Windows VK_* constants so
// hook payloads and persisted macros can be used without translation.
namespace Vk
{
    constexpr uint16_t Back       = 0x08;
    constexpr uint16_t Tab        = 0x09;
    constexpr uint16_t Return     = 0x0D;
    constexpr uint16_t Shift      = 0x10;
    constexpr uint16_t Control    = 0x11;
    constexpr uint16_t Menu       = 0x12; // Alt
    constexpr uint16_t Pause      = 0x13;
    constexpr uint16_t Capital    = 0x14; // CapsLock
    constexpr uint16_t Escape     = 0x1B;
    constexpr uint16_t Space      = 0x20;
    constexpr uint16_t Prior      = 0x21; // PageUp
    constexpr uint16_t Next       = 0x22; // PageDown
    constexpr uint16_t End        = 0x23;
    constexpr uint16_t Home       = 0x24;
    constexpr uint16_t Left       = 0x25;
    constexpr uint16_t Up         = 0x26;
    constexpr uint16_t Right      = 0x27;
    constexpr uint16_t Down       = 0x28;
    constexpr uint16_t Snapshot   = 0x2C; // PrintScreen
    constexpr uint16_t Insert     = 0x2D;
    constexpr uint16_t Delete     = 0x2E;
    constexpr uint16_t Digit0     = 0x30;
    constexpr uint16_t Digit9     = 0x39;
    constexpr uint16_t A          = 0x41;
    constexpr uint16_t Z          = 0x5A;
    constexpr uint16_t LWin       = 0x5B;
    constexpr uint16_t RWin       = 0x5C;
    constexpr uint16_t NumPad0    = 0x60;
    constexpr uint16_t NumPad9    = 0x69;
    constexpr uint16_t F1         = 0x70;
    constexpr uint16_t F24        = 0x87;
    constexpr uint16_t NumLock    = 0x90;
    constexpr uint16_t Scroll     = 0x91;
    constexpr uint16_t LShift     = 0xA0;
    constexpr uint16_t RShift     = 0xA1;
    constexpr uint16_t LControl   = 0xA2;
    constexpr uint16_t RControl   = 0xA3;
    constexpr uint16_t LMenu      = 0xA4;
    constexpr uint16_t RMenu      = 0xA5;
}

bool KeyCodes_IsCtrl(uint16_t vk);
bool KeyCodes_IsAlt(uint16_t vk);
bool KeyCodes_IsShift(uint16_t vk);
bool KeyCodes_IsModifier(uint16_t vk);   // Shift/Ctrl/Alt (any side) + Win keys
bool KeyCodes_IsFunction(uint16_t vk);   // F1..F24
bool KeyCodes_IsNumber(uint16_t vk);     // 0..9 row + NumPad0..9
bool KeyCodes_IsLetter(uint16_t vk);     // A..Z
bool KeyCodes_IsArrow(uint16_t vk);
bool KeyCodes_IsSpecial(uint16_t vk);    // Space, Enter, Tab, Back, Delete, Insert, Home, End, ...

// Short display name: "A", "F5", "Space", falls back to "VK(n)".
std::string KeyCodes_Name(uint16_t vk);
