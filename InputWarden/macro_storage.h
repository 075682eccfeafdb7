#pragma once
#include <filesystem>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "macro_event.h"

// ============================================================
// MACRO STORAGE
// Name-keyed macro collection.
//
// File format (one file per macro, "<name>.iwm"):
//   INPUTWARDEN_MACRO_V1
//   <id>
//   <name>                     escaped (text_util.h)
//   <description>              escaped
//   <mode> <repeat> <intervalMs> <randomMinMs> <randomMaxMs> <enabled>
//   <createdAt> <modifiedAt> <executionCount> <lastExecutedAt>
//   <eventCount>
//   per event:
//     <type> <ts> <vk> <button> <x> <y> <wheel> <delayMs> <enabled> <id>
//     <text>                   escaped
//     <description>            escaped
// ============================================================

class IMacroStorage
{
public:
    virtual ~IMacroStorage() = default;

    virtual bool Save(const Macro& macro) = 0;
    virtual std::optional<Macro> Load(const std::wstring& name) = 0;
    virtual std::vector<std::wstring> List() = 0;
    virtual bool Delete(const std::wstring& name) = 0;
    virtual bool Exists(const std::wstring& name) = 0;
};

// Empty when the name can be used as a macro key (and file name)
std::string MacroStorage_ValidateName(const std::wstring& name);

// Stream codec
void MacroFile_Write(std::ostream& out, const Macro& macro);
bool MacroFile_Read(std::istream& in, Macro& out);

// Single file helpers (export/import). Save writes "<path>.tmp" then replaces <path>.
bool MacroFile_Save(const std::filesystem::path& path, const Macro& macro);
std::optional<Macro> MacroFile_Load(const std::filesystem::path& path);

class FileMacroStorage : public IMacroStorage
{
public:
    static constexpr const char* kExtension = ".iwm";

    explicit FileMacroStorage(std::filesystem::path directory);

    bool Save(const Macro& macro) override;
    std::optional<Macro> Load(const std::wstring& name) override;
    std::vector<std::wstring> List() override;
    bool Delete(const std::wstring& name) override;
    bool Exists(const std::wstring& name) override;

    const std::filesystem::path& Directory() const { return m_dir; }
    std::filesystem::path PathFor(const std::wstring& name) const;

private:
    bool EnsureDirectory();

    std::filesystem::path m_dir;
    std::mutex m_mutex;
};
