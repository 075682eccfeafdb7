#pragma once
#include <stdexcept>
#include <string>

// Thrown when the OS refuses a low-level hook (fatal at startup)
class HookInstallError : public std::runtime_error
{
public:
    explicit HookInstallError(const std::string& what) : std::runtime_error(what) {}
};

// OS-level keyboard + mouse interception
class IInputHook
{
public:
    virtual ~IInputHook() = default;

    // Throws HookInstallError; a partial install is rolled back
    virtual void Install() = 0;
    virtual void Uninstall() = 0;
    virtual bool IsInstalled() const = 0;
};
