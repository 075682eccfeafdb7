#pragma once
#include <string>

// Centralized paths near exe.
// Returned references are valid for the entire process lifetime.
const std::wstring& AppPaths_SettingsIni();
const std::wstring& AppPaths_MacroDir();
const std::wstring& AppPaths_BindingsFile();
const std::wstring& AppPaths_LogFile();
