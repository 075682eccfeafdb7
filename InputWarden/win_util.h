#pragma once
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <windows.h>

#include <string>

// Paths
std::wstring WinUtil_GetExeDir();
std::wstring WinUtil_BuildPathNearExe(const wchar_t* fileName);

// "message (code N)" for GetLastError() values, UTF-8
std::string WinUtil_ErrorText(DWORD code);

// Virtual screen rectangle (all monitors), used for absolute mouse coordinates
RECT WinUtil_GetVirtualScreenRect();
