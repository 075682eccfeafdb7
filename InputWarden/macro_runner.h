#pragma once
#include <optional>
#include <string>

#include "macro_event.h"
#include "macro_player.h"

// What the trigger mapping needs from the macro service.
class IMacroRunner
{
public:
    virtual ~IMacroRunner() = default;

    virtual bool IsRecording() const = 0;
    virtual bool IsPlaying() const = 0;

    virtual std::optional<Macro> LoadMacro(const std::wstring& name) = 0;

    // Synchronous, called from a worker thread
    virtual PlayResult PlayMacro(const Macro& macro) = 0;

    // Cancels a PlayMacro() in progress on another thread
    virtual void StopPlayback() = 0;
};
