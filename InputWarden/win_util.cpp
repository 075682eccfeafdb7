#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <windows.h>

#include "win_util.h"

#include <string>
#include <vector>

std::wstring WinUtil_GetExeDir()
{
    std::vector<wchar_t> buf(1024);
    for (;;)
    {
        DWORD len = GetModuleFileNameW(nullptr, buf.data(), (DWORD)buf.size());
        if (len == 0) return L"";

        if (len < buf.size())
        {
            std::wstring p(buf.data(), len);
            size_t slash = p.find_last_of(L"\\/");
            if (slash != std::wstring::npos) p.erase(slash + 1);
            else p.clear();
            return p;
        }
        if (buf.size() > 65536) return L"";
        buf.resize(buf.size() * 2);
    }
}

std::wstring WinUtil_BuildPathNearExe(const wchar_t* fileName)
{
    std::wstring dir = WinUtil_GetExeDir();
    if (!fileName) fileName = L"";
    dir += fileName;
    return dir;
}

std::string WinUtil_ErrorText(DWORD code)
{
    char* msg = nullptr;
    DWORD n = FormatMessageA(FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
                             nullptr, code, 0, (LPSTR)&msg, 0, nullptr);
    std::string text;
    if (n && msg)
    {
        text.assign(msg, n);
        while (!text.empty() && (text.back() == '\r' || text.back() == '\n' || text.back() == ' '))
            text.pop_back();
    }
    if (msg) LocalFree(msg);
    if (text.empty()) text = "Unknown error";
    return text + " (code " + std::to_string((unsigned long)code) + ")";
}

RECT WinUtil_GetVirtualScreenRect()
{
    RECT r{};
    r.left = GetSystemMetrics(SM_XVIRTUALSCREEN);
    r.top = GetSystemMetrics(SM_YVIRTUALSCREEN);
    r.right = r.left + GetSystemMetrics(SM_CXVIRTUALSCREEN);
    r.bottom = r.top + GetSystemMetrics(SM_CYVIRTUALSCREEN);
    return r;
}
