#include <gtest/gtest.h>

#include <fstream>
#include <set>
#include <sstream>

#include "test_fakes.h"
#include "text_util.h"

TEST(TextUtil, Trim)
{
    EXPECT_EQ(TextUtil_Trim(L"  a b \t\r\n"), L"a b");
    EXPECT_EQ(TextUtil_Trim(L" \t "), L"");
    EXPECT_EQ(TextUtil_Trim(L""), L"");
    EXPECT_EQ(TextUtil_Trim(L"x"), L"x");
}

TEST(TextUtil, ReadLineStripsCrAndBom)
{
    std::istringstream in("\xEF\xBB\xBFheader\r\nsecond\n");
    std::string line;
    ASSERT_TRUE(TextUtil_ReadLine(in, line));
    EXPECT_EQ(line, "header");
    ASSERT_TRUE(TextUtil_ReadLine(in, line));
    EXPECT_EQ(line, "second");
    EXPECT_FALSE(TextUtil_ReadLine(in, line));
}

TEST(TextUtil, EscapeLine)
{
    EXPECT_EQ(TextUtil_EscapeLine(L""), "~");
    EXPECT_EQ(TextUtil_EscapeLine(L"~"), "\\u007E");
    EXPECT_EQ(TextUtil_EscapeLine(L"a~b"), "a~b");
    EXPECT_EQ(TextUtil_EscapeLine(L"a\\b"), "a\\\\b");
    EXPECT_EQ(TextUtil_EscapeLine(L"x\ny"), "x\\u000Ay");
    EXPECT_EQ(TextUtil_EscapeLine(L"caf\u00E9"), "caf\\u00E9");
}

TEST(TextUtil, UnescapeRestoresOriginal)
{
    const std::wstring samples[] = {
        L"", L"~", L"~~", L"plain text", L"back\\slash\\", L"tab\there\r\n",
        L"caf\u00E9 \u4E2D\u6587", L"smile \U0001F600",
    };
    for (const auto& s : samples)
    {
        std::wstring back;
        ASSERT_TRUE(TextUtil_UnescapeLine(TextUtil_EscapeLine(s), back));
        EXPECT_EQ(back, s);
    }
}

TEST(TextUtil, UnescapeRejectsMalformed)
{
    std::wstring out;
    EXPECT_FALSE(TextUtil_UnescapeLine("dangling\\", out));
    EXPECT_FALSE(TextUtil_UnescapeLine("bad\\q", out));
    EXPECT_FALSE(TextUtil_UnescapeLine("short\\u00", out));
    EXPECT_FALSE(TextUtil_UnescapeLine("hex\\u00G1", out));
    EXPECT_FALSE(TextUtil_UnescapeLine("raw\xC3\xA9", out));
}

TEST(TextUtil, Utf8)
{
    EXPECT_EQ(TextUtil_ToUtf8(L"abc"), "abc");
    EXPECT_EQ(TextUtil_ToUtf8(L"\u00E9"), "\xC3\xA9");
    EXPECT_EQ(TextUtil_ToUtf8(L"\u20AC"), "\xE2\x82\xAC");
    EXPECT_EQ(TextUtil_ToUtf8(L"\U0001F600"), "\xF0\x9F\x98\x80");

    EXPECT_EQ(TextUtil_FromUtf8("\xC3\xA9t\xC3\xA9"), L"\u00E9t\u00E9");
    EXPECT_EQ(TextUtil_FromUtf8("\xF0\x9F\x98\x80"), L"\U0001F600");
    EXPECT_EQ(TextUtil_FromUtf8("cut\xE2\x82"), L"cut?");
}

TEST(TextUtil, NewIdIsHexAndUnique)
{
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i)
    {
        const std::string id = TextUtil_NewId();
        ASSERT_EQ(id.size(), 32u);
        EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 100u);
}

TEST(TextUtil, EqualsNoCase)
{
    EXPECT_TRUE(TextUtil_EqualsNoCase(L"Macro", L"mACRO"));
    EXPECT_FALSE(TextUtil_EqualsNoCase(L"Macro", L"Macros"));
    EXPECT_TRUE(TextUtil_EqualsNoCase(std::string("ABCdef"), std::string("abcDEF")));
    EXPECT_FALSE(TextUtil_EqualsNoCase(std::string("abc"), std::string("abd")));
}

TEST(TextUtil, ReplaceFile)
{
    TempDir dir;
    const auto path = dir.Path() / "data.txt";

    ASSERT_TRUE(TextUtil_ReplaceFile(path, "first\n", "TEST"));
    ASSERT_TRUE(TextUtil_ReplaceFile(path, "second\n", "TEST"));
    EXPECT_FALSE(std::filesystem::exists(dir.Path() / "data.txt.tmp"));

    std::ifstream f(path, std::ios::binary);
    std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "second\n");

    EXPECT_FALSE(TextUtil_ReplaceFile(dir.Path() / "no_such_dir" / "x.txt", "x", "TEST"));
}
