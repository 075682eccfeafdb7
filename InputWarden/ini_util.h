#pragma once
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <windows.h>

#include <string>

// Typed GetPrivateProfile/WritePrivateProfile wrappers
void IniUtil_WriteU32(const wchar_t* section, const wchar_t* key, UINT v, const wchar_t* path);
UINT IniUtil_ReadU32(const wchar_t* section, const wchar_t* key, UINT def, const wchar_t* path);

void IniUtil_WriteBool(const wchar_t* section, const wchar_t* key, bool v, const wchar_t* path);
bool IniUtil_ReadBool(const wchar_t* section, const wchar_t* key, bool def, const wchar_t* path);

// Fixed point x1000 (speed multipliers)
void IniUtil_WriteFloat1000(const wchar_t* section, const wchar_t* key, float v, const wchar_t* path);
float IniUtil_ReadFloat1000(const wchar_t* section, const wchar_t* key, float def, const wchar_t* path);

// Forces WritePrivateProfile* buffers to be flushed to disk for this INI file.
void IniUtil_Flush(const wchar_t* path);

// Atomically replace destination INI file with tmp file.
// - Flushes tmp
// - MoveFileEx(REPLACE_EXISTING | WRITE_THROUGH)
// - Deletes tmp on failure
bool IniUtil_AtomicReplace(const wchar_t* tmpPath, const wchar_t* dstPath);
