#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <windows.h>

#include <cmath>
#include <cwchar>

#include "ini_util.h"

void IniUtil_WriteU32(const wchar_t* section, const wchar_t* key, UINT v, const wchar_t* path)
{
    wchar_t buf[32]{};
    swprintf_s(buf, L"%u", (unsigned)v);
    WritePrivateProfileStringW(section, key, buf, path);
}

UINT IniUtil_ReadU32(const wchar_t* section, const wchar_t* key, UINT def, const wchar_t* path)
{
    return (UINT)GetPrivateProfileIntW(section, key, (int)def, path);
}

void IniUtil_WriteBool(const wchar_t* section, const wchar_t* key, bool v, const wchar_t* path)
{
    WritePrivateProfileStringW(section, key, v ? L"1" : L"0", path);
}

bool IniUtil_ReadBool(const wchar_t* section, const wchar_t* key, bool def, const wchar_t* path)
{
    return GetPrivateProfileIntW(section, key, def ? 1 : 0, path) != 0;
}

void IniUtil_WriteFloat1000(const wchar_t* section, const wchar_t* key, float v, const wchar_t* path)
{
    int iv = (int)lroundf(v * 1000.0f);
    wchar_t buf[32]{};
    swprintf_s(buf, L"%d", iv);
    WritePrivateProfileStringW(section, key, buf, path);
}

float IniUtil_ReadFloat1000(const wchar_t* section, const wchar_t* key, float def, const wchar_t* path)
{
    int defI = (int)lroundf(def * 1000.0f);
    int iv = GetPrivateProfileIntW(section, key, defI, path);
    return (float)iv / 1000.0f;
}

void IniUtil_Flush(const wchar_t* path)
{
    if (!path) return;
    WritePrivateProfileStringW(nullptr, nullptr, nullptr, path);
}

bool IniUtil_AtomicReplace(const wchar_t* tmpPath, const wchar_t* dstPath)
{
    if (!tmpPath || !dstPath) return false;

    IniUtil_Flush(tmpPath);

    BOOL ok = MoveFileExW(tmpPath, dstPath, MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH);
    if (!ok)
    {
        DeleteFileW(tmpPath);
        return false;
    }
    return true;
}
