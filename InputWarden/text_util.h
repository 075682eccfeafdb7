#pragma once
#include <filesystem>
#include <istream>
#include <string>

// Helpers for the line-based save files and for logging wide strings.

// Trims spaces, tabs, CR and LF on both ends
std::wstring TextUtil_Trim(const std::wstring& s);

// Reads one line, strips the trailing CR and a leading UTF-8 BOM
bool TextUtil_ReadLine(std::istream& in, std::string& out);

// Escapes a wide string into printable ASCII for one save-file line:
//   \\ -> "\\\\", space kept, other control/non-ASCII -> \uXXXX or \UXXXXXXXX
// Empty strings are written as "~" so a blank line never means "missing".
std::string TextUtil_EscapeLine(const std::wstring& s);
bool TextUtil_UnescapeLine(const std::string& line, std::wstring& out);

// UTF-8 conversion (used for log messages and file names)
std::string TextUtil_ToUtf8(const std::wstring& s);
std::wstring TextUtil_FromUtf8(const std::string& s);

// 32 lowercase hex characters, random
std::string TextUtil_NewId();

bool TextUtil_EqualsNoCase(const std::wstring& a, const std::wstring& b);
bool TextUtil_EqualsNoCase(const std::string& a, const std::string& b);

// Writes <path>.tmp then renames it over <path>. Failures are logged under `section`.
bool TextUtil_ReplaceFile(const std::filesystem::path& path, const std::string& content, const char* section);
