#include "text_util.h"
#include "logger.h"

#include <cstdint>
#include <cwctype>
#include <cctype>
#include <fstream>
#include <random>
#include <system_error>

std::wstring TextUtil_Trim(const std::wstring& s)
{
    size_t start = 0;
    while (start < s.size() && (s[start] == L' ' || s[start] == L'\t' || s[start] == L'\r' || s[start] == L'\n'))
        ++start;
    size_t end = s.size();
    while (end > start && (s[end - 1] == L' ' || s[end - 1] == L'\t' || s[end - 1] == L'\r' || s[end - 1] == L'\n'))
        --end;
    return s.substr(start, end - start);
}

bool TextUtil_ReadLine(std::istream& in, std::string& out)
{
    if (!std::getline(in, out))
        return false;
    if (!out.empty() && out.back() == '\r')
        out.pop_back();
    if (out.size() >= 3 && (unsigned char)out[0] == 0xEF && (unsigned char)out[1] == 0xBB && (unsigned char)out[2] == 0xBF)
        out.erase(0, 3);
    return true;
}

static const char* kHex = "0123456789ABCDEF";

static void AppendHex(std::string& out, uint32_t v, int digits)
{
    for (int i = digits - 1; i >= 0; --i)
        out += kHex[(v >> (i * 4)) & 0xF];
}

static bool ParseHex(const std::string& s, size_t pos, int digits, uint32_t& out)
{
    if (pos + (size_t)digits > s.size()) return false;
    out = 0;
    for (int i = 0; i < digits; ++i)
    {
        char c = s[pos + (size_t)i];
        uint32_t d;
        if (c >= '0' && c <= '9') d = (uint32_t)(c - '0');
        else if (c >= 'A' && c <= 'F') d = (uint32_t)(c - 'A' + 10);
        else if (c >= 'a' && c <= 'f') d = (uint32_t)(c - 'a' + 10);
        else return false;
        out = (out << 4) | d;
    }
    return true;
}

std::string TextUtil_EscapeLine(const std::wstring& s)
{
    if (s.empty()) return "~";

    std::string out;
    out.reserve(s.size());
    for (wchar_t ch : s)
    {
        const uint32_t c = (uint32_t)ch;
        if (ch == L'\\')
            out += "\\\\";
        else if (ch == L'~' && s.size() == 1)
            out += "\\u007E"; // a lone '~' would read back as empty
        else if (c >= 0x20 && c < 0x7F)
            out += (char)c;
        else if (c <= 0xFFFF)
        {
            out += "\\u";
            AppendHex(out, c, 4);
        }
        else
        {
            out += "\\U";
            AppendHex(out, c, 8);
        }
    }
    return out;
}

bool TextUtil_UnescapeLine(const std::string& line, std::wstring& out)
{
    out.clear();
    if (line == "~") return true;

    for (size_t i = 0; i < line.size(); ++i)
    {
        char c = line[i];
        if (c != '\\')
        {
            if ((unsigned char)c >= 0x80) return false;
            out += (wchar_t)c;
            continue;
        }
        if (i + 1 >= line.size()) return false;
        char kind = line[i + 1];
        if (kind == '\\')
        {
            out += L'\\';
            i += 1;
        }
        else if (kind == 'u' || kind == 'U')
        {
            const int digits = (kind == 'u') ? 4 : 8;
            uint32_t v = 0;
            if (!ParseHex(line, i + 2, digits, v)) return false;
            out += (wchar_t)v;
            i += 1 + (size_t)digits;
        }
        else
        {
            return false;
        }
    }
    return true;
}

std::string TextUtil_ToUtf8(const std::wstring& s)
{
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i)
    {
        uint32_t cp = (uint32_t)s[i];

        // UTF-16 surrogate pair (Windows wchar_t)
        if (cp >= 0xD800 && cp <= 0xDBFF && i + 1 < s.size())
        {
            uint32_t lo = (uint32_t)s[i + 1];
            if (lo >= 0xDC00 && lo <= 0xDFFF)
            {
                cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                ++i;
            }
        }

        if (cp < 0x80)
            out += (char)cp;
        else if (cp < 0x800)
        {
            out += (char)(0xC0 | (cp >> 6));
            out += (char)(0x80 | (cp & 0x3F));
        }
        else if (cp < 0x10000)
        {
            out += (char)(0xE0 | (cp >> 12));
            out += (char)(0x80 | ((cp >> 6) & 0x3F));
            out += (char)(0x80 | (cp & 0x3F));
        }
        else
        {
            out += (char)(0xF0 | (cp >> 18));
            out += (char)(0x80 | ((cp >> 12) & 0x3F));
            out += (char)(0x80 | ((cp >> 6) & 0x3F));
            out += (char)(0x80 | (cp & 0x3F));
        }
    }
    return out;
}

std::wstring TextUtil_FromUtf8(const std::string& s)
{
    std::wstring out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size())
    {
        unsigned char c = (unsigned char)s[i];
        uint32_t cp = 0;
        size_t extra = 0;
        if (c < 0x80) { cp = c; }
        else if ((c & 0xE0) == 0xC0) { cp = c & 0x1F; extra = 1; }
        else if ((c & 0xF0) == 0xE0) { cp = c & 0x0F; extra = 2; }
        else if ((c & 0xF8) == 0xF0) { cp = c & 0x07; extra = 3; }
        else { out += L'?'; ++i; continue; }

        if (extra && i + extra >= s.size())
        {
            out += L'?';
            break;
        }
        for (size_t k = 1; k <= extra; ++k)
            cp = (cp << 6) | ((unsigned char)s[i + k] & 0x3F);
        i += extra + 1;

        if (sizeof(wchar_t) == 2 && cp >= 0x10000)
        {
            cp -= 0x10000;
            out += (wchar_t)(0xD800 + (cp >> 10));
            out += (wchar_t)(0xDC00 + (cp & 0x3FF));
        }
        else
        {
            out += (wchar_t)cp;
        }
    }
    return out;
}

std::string TextUtil_NewId()
{
    static thread_local std::mt19937_64 rng{ std::random_device{}() };
    std::string id;
    id.reserve(32);
    for (int i = 0; i < 2; ++i)
    {
        uint64_t v = rng();
        for (int k = 15; k >= 0; --k)
            id += "0123456789abcdef"[(v >> (k * 4)) & 0xF];
    }
    return id;
}

bool TextUtil_EqualsNoCase(const std::wstring& a, const std::wstring& b)
{
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i)
    {
        if (std::towlower((wint_t)a[i]) != std::towlower((wint_t)b[i]))
            return false;
    }
    return true;
}

bool TextUtil_EqualsNoCase(const std::string& a, const std::string& b)
{
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i)
    {
        if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i]))
            return false;
    }
    return true;
}

bool TextUtil_ReplaceFile(const std::filesystem::path& path, const std::string& content, const char* section)
{
    std::filesystem::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream f(tmp, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!f)
        {
            Logger::Error(section, "Cannot open for writing: " + tmp.u8string());
            return false;
        }
        f.write(content.data(), (std::streamsize)content.size());
        f.flush();
        if (!f)
        {
            Logger::Error(section, "Write failed: " + tmp.u8string());
            f.close();
            std::error_code ec;
            std::filesystem::remove(tmp, ec);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec)
    {
        Logger::Error(section, "Replace failed for " + path.u8string() + ": " + ec.message());
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        return false;
    }
    return true;
}
