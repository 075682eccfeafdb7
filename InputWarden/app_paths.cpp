#include "app_paths.h"
#include "win_util.h"

const std::wstring& AppPaths_SettingsIni()
{
    static std::wstring p = WinUtil_BuildPathNearExe(L"settings.ini");
    return p;
}

const std::wstring& AppPaths_MacroDir()
{
    static std::wstring p = WinUtil_BuildPathNearExe(L"macros");
    return p;
}

const std::wstring& AppPaths_BindingsFile()
{
    static std::wstring p = WinUtil_BuildPathNearExe(L"macro_bindings.dat");
    return p;
}

const std::wstring& AppPaths_LogFile()
{
    static std::wstring p = WinUtil_BuildPathNearExe(L"InputWarden_log.txt");
    return p;
}
