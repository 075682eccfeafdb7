#include "macro_storage.h"
#include "logger.h"
#include "text_util.h"

#include <algorithm>
#include <cwchar>
#include <fstream>
#include <sstream>
#include <system_error>

static const char* kMacroHeader = "INPUTWARDEN_MACRO_V1";
static const size_t kMaxNameLength = 100;
static const size_t kMaxEvents = 1000000;

std::string MacroStorage_ValidateName(const std::wstring& name)
{
    const std::wstring trimmed = TextUtil_Trim(name);
    if (trimmed.empty())
        return "Macro name is empty";
    if (name.size() > kMaxNameLength)
        return "Macro name is longer than " + std::to_string(kMaxNameLength) + " characters";
    if (trimmed != name)
        return "Macro name has leading or trailing spaces";
    for (wchar_t ch : name)
    {
        if (ch < 0x20 || std::wcschr(L"\\/:*?\"<>|", ch))
            return "Macro name contains invalid characters";
    }
    return std::string();
}

// ============================================================
// Codec
// ============================================================

static std::string IdToken(const std::string& id)
{
    return id.empty() ? "~" : id;
}

static std::string IdFromToken(const std::string& tok)
{
    return (tok == "~") ? std::string() : tok;
}

void MacroFile_Write(std::ostream& out, const Macro& macro)
{
    out << kMacroHeader << "\n";
    out << IdToken(macro.id) << "\n";
    out << TextUtil_EscapeLine(macro.name) << "\n";
    out << TextUtil_EscapeLine(macro.description) << "\n";
    out << (int)macro.mode << " " << macro.repeatCount << " " << macro.intervalMs << " "
        << macro.randomMinMs << " " << macro.randomMaxMs << " " << (macro.enabled ? 1 : 0) << "\n";
    out << macro.createdAt << " " << macro.modifiedAt << " "
        << macro.executionCount << " " << macro.lastExecutedAt << "\n";
    out << macro.events.size() << "\n";

    for (const auto& e : macro.events)
    {
        out << (int)e.type << " " << e.timestampMs << " " << e.keyCode << " " << (int)e.mouseButton << " "
            << e.x << " " << e.y << " " << e.wheelDelta << " " << e.delayMs << " "
            << (e.enabled ? 1 : 0) << " " << IdToken(e.id) << "\n";
        out << TextUtil_EscapeLine(e.text) << "\n";
        out << TextUtil_EscapeLine(e.description) << "\n";
    }
}

static bool ReadEscaped(std::istream& in, std::wstring& out)
{
    std::string line;
    if (!TextUtil_ReadLine(in, line)) return false;
    return TextUtil_UnescapeLine(line, out);
}

bool MacroFile_Read(std::istream& in, Macro& out)
{
    std::string line;
    if (!TextUtil_ReadLine(in, line) || line != kMacroHeader) return false;

    Macro m;
    if (!TextUtil_ReadLine(in, line)) return false;
    m.id = IdFromToken(line);
    if (!ReadEscaped(in, m.name)) return false;
    if (!ReadEscaped(in, m.description)) return false;

    {
        if (!TextUtil_ReadLine(in, line)) return false;
        std::istringstream ss(line);
        int mode = 0, enabled = 0;
        if (!(ss >> mode >> m.repeatCount >> m.intervalMs >> m.randomMinMs >> m.randomMaxMs >> enabled))
            return false;
        if (mode < (int)MacroExecutionMode::Once || mode > (int)MacroExecutionMode::RandomInterval)
            return false;
        m.mode = (MacroExecutionMode)mode;
        m.enabled = (enabled != 0);
    }
    {
        if (!TextUtil_ReadLine(in, line)) return false;
        std::istringstream ss(line);
        if (!(ss >> m.createdAt >> m.modifiedAt >> m.executionCount >> m.lastExecutedAt))
            return false;
    }

    size_t count = 0;
    {
        if (!TextUtil_ReadLine(in, line)) return false;
        std::istringstream ss(line);
        if (!(ss >> count) || count > kMaxEvents) return false;
    }

    m.events.reserve(count);
    for (size_t i = 0; i < count; ++i)
    {
        MacroEvent e;
        if (!TextUtil_ReadLine(in, line)) return false;
        std::istringstream ss(line);
        int type = 0, button = 0, enabled = 0;
        std::string id;
        if (!(ss >> type >> e.timestampMs >> e.keyCode >> button >> e.x >> e.y
                 >> e.wheelDelta >> e.delayMs >> enabled >> id))
            return false;
        if (type < (int)MacroEventType::KeyDown || type > (int)MacroEventType::LoopEnd) return false;
        if (button < (int)MouseButton::None || button > (int)MouseButton::X2) return false;
        e.type = (MacroEventType)type;
        e.mouseButton = (MouseButton)button;
        e.enabled = (enabled != 0);
        e.id = IdFromToken(id);

        if (!ReadEscaped(in, e.text)) return false;
        if (!ReadEscaped(in, e.description)) return false;
        m.events.push_back(std::move(e));
    }

    out = std::move(m);
    return true;
}

bool MacroFile_Save(const std::filesystem::path& path, const Macro& macro)
{
    std::ostringstream out;
    MacroFile_Write(out, macro);
    return TextUtil_ReplaceFile(path, out.str(), "STORAGE");
}

std::optional<Macro> MacroFile_Load(const std::filesystem::path& path)
{
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f) return std::nullopt;

    Macro m;
    if (!MacroFile_Read(f, m))
    {
        Logger::Error("STORAGE", "Corrupt macro file: " + path.u8string());
        return std::nullopt;
    }
    return m;
}

// ============================================================
// FileMacroStorage
// ============================================================

FileMacroStorage::FileMacroStorage(std::filesystem::path directory)
    : m_dir(std::move(directory))
{
}

std::filesystem::path FileMacroStorage::PathFor(const std::wstring& name) const
{
    return m_dir / std::filesystem::u8path(TextUtil_ToUtf8(name) + kExtension);
}

bool FileMacroStorage::EnsureDirectory()
{
    std::error_code ec;
    if (std::filesystem::is_directory(m_dir, ec)) return true;
    std::filesystem::create_directories(m_dir, ec);
    if (ec)
    {
        Logger::Error("STORAGE", "Cannot create macro directory " + m_dir.u8string() + ": " + ec.message());
        return false;
    }
    return true;
}

bool FileMacroStorage::Save(const Macro& macro)
{
    const std::string invalid = MacroStorage_ValidateName(macro.name);
    if (!invalid.empty())
    {
        Logger::Warn("STORAGE", "Save refused: " + invalid);
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!EnsureDirectory()) return false;
    if (!MacroFile_Save(PathFor(macro.name), macro)) return false;
    Logger::Info("STORAGE", "Saved macro '" + TextUtil_ToUtf8(macro.name) + "' (" +
                 std::to_string(macro.events.size()) + " events)");
    return true;
}

std::optional<Macro> FileMacroStorage::Load(const std::wstring& name)
{
    if (!MacroStorage_ValidateName(name).empty()) return std::nullopt;

    std::lock_guard<std::mutex> lock(m_mutex);
    return MacroFile_Load(PathFor(name));
}

std::vector<std::wstring> FileMacroStorage::List()
{
    std::vector<std::wstring> names;

    std::lock_guard<std::mutex> lock(m_mutex);
    std::error_code ec;
    if (!std::filesystem::is_directory(m_dir, ec)) return names;

    std::filesystem::directory_iterator it(m_dir, ec), end;
    if (ec)
    {
        Logger::Error("STORAGE", "Cannot list " + m_dir.u8string() + ": " + ec.message());
        return names;
    }
    for (; it != end; it.increment(ec))
    {
        if (ec) break;
        const auto& p = it->path();
        if (p.extension().u8string() != kExtension) continue;
        if (!it->is_regular_file(ec)) continue;
        names.push_back(TextUtil_FromUtf8(p.stem().u8string()));
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool FileMacroStorage::Delete(const std::wstring& name)
{
    if (!MacroStorage_ValidateName(name).empty()) return false;

    std::lock_guard<std::mutex> lock(m_mutex);
    std::error_code ec;
    const bool removed = std::filesystem::remove(PathFor(name), ec);
    if (ec)
    {
        Logger::Error("STORAGE", "Delete failed for '" + TextUtil_ToUtf8(name) + "': " + ec.message());
        return false;
    }
    if (removed)
        Logger::Info("STORAGE", "Deleted macro '" + TextUtil_ToUtf8(name) + "'");
    return removed;
}

bool FileMacroStorage::Exists(const std::wstring& name)
{
    if (!MacroStorage_ValidateName(name).empty()) return false;

    std::lock_guard<std::mutex> lock(m_mutex);
    std::error_code ec;
    return std::filesystem::is_regular_file(PathFor(name), ec);
}
