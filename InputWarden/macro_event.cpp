#include "macro_event.h"
#include "key_codes.h"
#include "text_util.h"

#include <algorithm>
#include <chrono>

const char* MacroEventTypeToString(MacroEventType type)
{
    switch (type)
    {
    case MacroEventType::KeyDown:     return "KeyDown";
    case MacroEventType::KeyUp:       return "KeyUp";
    case MacroEventType::MouseDown:   return "MouseDown";
    case MacroEventType::MouseUp:     return "MouseUp";
    case MacroEventType::MouseMove:   return "MouseMove";
    case MacroEventType::MouseWheel:  return "MouseWheel";
    case MacroEventType::Delay:       return "Delay";
    case MacroEventType::TextInput:   return "TextInput";
    case MacroEventType::Script:      return "Script";
    case MacroEventType::VariableSet: return "VariableSet";
    case MacroEventType::Condition:   return "Condition";
    case MacroEventType::LoopStart:   return "LoopStart";
    case MacroEventType::LoopEnd:     return "LoopEnd";
    }
    return "Unknown";
}

const char* MacroExecutionModeToString(MacroExecutionMode mode)
{
    switch (mode)
    {
    case MacroExecutionMode::Once:           return "Once";
    case MacroExecutionMode::Repeat:         return "Repeat";
    case MacroExecutionMode::Loop:           return "Loop";
    case MacroExecutionMode::UntilCondition: return "UntilCondition";
    case MacroExecutionMode::Interval:       return "Interval";
    case MacroExecutionMode::RandomInterval: return "RandomInterval";
    }
    return "Unknown";
}

static const char* ButtonName(MouseButton b)
{
    switch (b)
    {
    case MouseButton::Left:   return "Left";
    case MouseButton::Right:  return "Right";
    case MouseButton::Middle: return "Middle";
    case MouseButton::X1:     return "X1";
    case MouseButton::X2:     return "X2";
    default:                  return "None";
    }
}

bool MacroEvent::IsMouse() const
{
    return type == MacroEventType::MouseDown || type == MacroEventType::MouseUp ||
           type == MacroEventType::MouseMove || type == MacroEventType::MouseWheel;
}

std::string MacroEvent::ToString() const
{
    std::string s = MacroEventTypeToString(type);
    switch (type)
    {
    case MacroEventType::KeyDown:
    case MacroEventType::KeyUp:
        s += " " + KeyCodes_Name(keyCode);
        break;
    case MacroEventType::MouseDown:
    case MacroEventType::MouseUp:
        s += std::string(" ") + ButtonName(mouseButton) + " (" + std::to_string(x) + "," + std::to_string(y) + ")";
        break;
    case MacroEventType::MouseMove:
        s += " (" + std::to_string(x) + "," + std::to_string(y) + ")";
        break;
    case MacroEventType::MouseWheel:
        s += " " + std::to_string(wheelDelta);
        break;
    case MacroEventType::Delay:
        s += " " + std::to_string(delayMs) + "ms";
        break;
    case MacroEventType::TextInput:
        s += " \"" + TextUtil_ToUtf8(text) + "\"";
        break;
    default:
        break;
    }
    s += " @" + std::to_string(timestampMs) + "ms";
    return s;
}

static MacroEvent MakeEvent(MacroEventType type, uint32_t timestampMs)
{
    MacroEvent e;
    e.id = TextUtil_NewId();
    e.type = type;
    e.timestampMs = timestampMs;
    return e;
}

MacroEvent MacroEvent_Key(uint16_t vk, bool down, uint32_t timestampMs)
{
    MacroEvent e = MakeEvent(down ? MacroEventType::KeyDown : MacroEventType::KeyUp, timestampMs);
    e.keyCode = vk;
    return e;
}

MacroEvent MacroEvent_MouseButton(MouseButton button, bool down, int x, int y, uint32_t timestampMs)
{
    MacroEvent e = MakeEvent(down ? MacroEventType::MouseDown : MacroEventType::MouseUp, timestampMs);
    e.mouseButton = button;
    e.x = x;
    e.y = y;
    return e;
}

MacroEvent MacroEvent_MouseMove(int x, int y, uint32_t timestampMs)
{
    MacroEvent e = MakeEvent(MacroEventType::MouseMove, timestampMs);
    e.x = x;
    e.y = y;
    return e;
}

MacroEvent MacroEvent_MouseWheel(int delta, int x, int y, uint32_t timestampMs)
{
    MacroEvent e = MakeEvent(MacroEventType::MouseWheel, timestampMs);
    e.wheelDelta = delta;
    e.x = x;
    e.y = y;
    return e;
}

MacroEvent MacroEvent_Delay(uint32_t delayMs, uint32_t timestampMs)
{
    MacroEvent e = MakeEvent(MacroEventType::Delay, timestampMs);
    e.delayMs = delayMs;
    return e;
}

MacroEvent MacroEvent_Text(const std::wstring& text, uint32_t timestampMs)
{
    MacroEvent e = MakeEvent(MacroEventType::TextInput, timestampMs);
    e.text = text;
    return e;
}

bool MacroEvent_SamePayload(const MacroEvent& a, const MacroEvent& b)
{
    return a.type == b.type &&
           a.timestampMs == b.timestampMs &&
           a.keyCode == b.keyCode &&
           a.mouseButton == b.mouseButton &&
           a.x == b.x && a.y == b.y &&
           a.wheelDelta == b.wheelDelta &&
           a.delayMs == b.delayMs &&
           a.text == b.text &&
           a.enabled == b.enabled;
}

// ============================================================
// Macro
// ============================================================

int64_t Macro_NowUnixMs()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

Macro::Macro(const std::wstring& macroName)
    : id(TextUtil_NewId())
    , name(macroName)
{
    createdAt = Macro_NowUnixMs();
    modifiedAt = createdAt;
}

uint32_t Macro::DurationMs() const
{
    uint32_t last = 0;
    for (const auto& e : events)
        last = std::max(last, e.timestampMs);
    return last;
}

void Macro::SortEvents()
{
    std::stable_sort(events.begin(), events.end(),
        [](const MacroEvent& a, const MacroEvent& b) { return a.timestampMs < b.timestampMs; });
}

std::vector<MacroEvent> Macro::PlayableEvents() const
{
    std::vector<MacroEvent> out;
    out.reserve(events.size());
    for (const auto& e : events)
        if (e.enabled) out.push_back(e);
    std::stable_sort(out.begin(), out.end(),
        [](const MacroEvent& a, const MacroEvent& b) { return a.timestampMs < b.timestampMs; });
    return out;
}

std::vector<std::string> Macro::Validate() const
{
    std::vector<std::string> errors;

    if (TextUtil_Trim(name).empty())
        errors.push_back("Macro name is empty");
    if (events.empty())
        errors.push_back("Macro has no events");
    if (mode == MacroExecutionMode::Repeat && repeatCount < 1)
        errors.push_back("Repeat count must be at least 1");
    if (mode == MacroExecutionMode::Interval && intervalMs == 0)
        errors.push_back("Interval must be greater than 0");
    if (mode == MacroExecutionMode::RandomInterval && randomMinMs > randomMaxMs)
        errors.push_back("Random interval minimum is greater than maximum");

    for (size_t i = 0; i < events.size(); ++i)
    {
        const MacroEvent& e = events[i];
        const std::string at = "Event " + std::to_string(i) + ": ";
        switch (e.type)
        {
        case MacroEventType::KeyDown:
        case MacroEventType::KeyUp:
            if (e.keyCode == 0) errors.push_back(at + "missing key code");
            break;
        case MacroEventType::MouseDown:
        case MacroEventType::MouseUp:
            if (e.mouseButton == MouseButton::None) errors.push_back(at + "missing mouse button");
            break;
        case MacroEventType::MouseWheel:
            if (e.wheelDelta == 0) errors.push_back(at + "wheel delta is 0");
            break;
        case MacroEventType::TextInput:
            if (e.text.empty()) errors.push_back(at + "empty text");
            break;
        default:
            break;
        }
    }
    return errors;
}

Macro Macro::CloneAs(const std::wstring& newName) const
{
    Macro copy = *this;
    copy.id = TextUtil_NewId();
    copy.name = newName;
    for (auto& e : copy.events)
        e.id = TextUtil_NewId();
    copy.createdAt = Macro_NowUnixMs();
    copy.modifiedAt = copy.createdAt;
    copy.executionCount = 0;
    copy.lastExecutedAt = 0;
    return copy;
}
