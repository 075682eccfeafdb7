#pragma once
#include <string>

// Narrow view of the blocking state used by macro playback:
// it suspends blocking while it injects input, then restores it.
class IBlockingControl
{
public:
    virtual ~IBlockingControl() = default;

    virtual bool IsKeyboardBlocked() const = 0;
    virtual bool IsMouseBlocked() const = 0;
    virtual void SetKeyboardBlocked(bool blocked, const std::string& reason) = 0;
    virtual void SetMouseBlocked(bool blocked, const std::string& reason) = 0;
};
