#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <windows.h>
#include <filesystem>
#include <string>

#include "app.h"
#include "app_paths.h"
#include "logger.h"

int WINAPI wWinMain(HINSTANCE hInst, HINSTANCE, PWSTR, int)
{
    // 1. Logger : lire settings.ini AVANT d'initialiser
    int loggingEnabled = GetPrivateProfileIntW(L"Main", L"Logging", 0, AppPaths_SettingsIni().c_str());
    Logger::SetEnabled(loggingEnabled != 0);
    int logLevel = GetPrivateProfileIntW(L"Main", L"LogLevel", (int)Logger::INFO, AppPaths_SettingsIni().c_str());
    if (logLevel >= (int)Logger::INFO && logLevel <= (int)Logger::CRITICAL)
        Logger::SetMinLevel((Logger::Level)logLevel);
    Logger::Init(std::filesystem::path(AppPaths_LogFile()));
    Logger::Info("MAIN", "=== wWinMain demarre ===");

    // 2. Single instance
    HANDLE mutex = CreateMutexW(nullptr, TRUE, L"Local\\InputWarden.SingleInstance");
    if (mutex && GetLastError() == ERROR_ALREADY_EXISTS)
    {
        Logger::Warn("MAIN", "Another instance is running - arret");
        CloseHandle(mutex);
        Logger::Close();
        return 1;
    }

    // 3. Boucle principale
    Logger::Info("MAIN", "Avant App_Run");
    int result = App_Run(hInst);
    Logger::Info("MAIN", "App_Run termine, code retour : " + std::to_string(result));

    if (result == kExitHookFailed)
        MessageBoxW(nullptr, L"Failed to install the keyboard/mouse hooks.", L"InputWarden", MB_ICONERROR | MB_OK);

    if (mutex) CloseHandle(mutex);
    Logger::Close();
    return result;
}
