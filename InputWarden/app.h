#pragma once
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <windows.h>

// Process exit codes
constexpr int kExitOk = 0;
constexpr int kExitHookFailed = 2;
constexpr int kExitMessageLoopFailed = 3;

// Builds the services, installs the hooks and pumps messages until
// Ctrl+Alt+Q (or WM_QUIT). Returns one of the kExit* codes.
int App_Run(HINSTANCE hInst);
