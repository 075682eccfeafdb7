#include <gtest/gtest.h>

#include <fstream>
#include <sstream>

#include "macro_storage.h"
#include "test_fakes.h"

class MacroStorageTest : public ::testing::Test
{
protected:
    TempDir dir;
    FileMacroStorage storage{ dir.Path() / "macros" };
};

TEST_F(MacroStorageTest, SaveLoadKeepsEveryField)
{
    Macro m(L"Caf\u00E9 \U0001F600 run");
    m.description = L"line one\nline two\ttab \\ back";
    m.mode = MacroExecutionMode::RandomInterval;
    m.repeatCount = 7;
    m.intervalMs = 1500;
    m.randomMinMs = 100;
    m.randomMaxMs = 900;
    m.enabled = false;
    m.executionCount = 4;
    m.lastExecutedAt = 1700000000123;
    m.events.push_back(MacroEvent_Key(0x41, true, 0));
    m.events.push_back(MacroEvent_MouseButton(MouseButton::X2, false, -5, 1080, 40));
    m.events.push_back(MacroEvent_MouseWheel(-240, 10, 20, 60));
    m.events.push_back(MacroEvent_Delay(250, 80));
    m.events.push_back(MacroEvent_Text(L"~", 90));
    m.events.push_back(MacroEvent_Text(L"", 95));
    m.events.back().description = L"r\u00E9sum\u00E9\r\n";
    m.events.back().enabled = false;

    ASSERT_TRUE(storage.Save(m));
    EXPECT_TRUE(storage.Exists(m.name));

    auto loaded = storage.Load(m.name);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->id, m.id);
    EXPECT_EQ(loaded->name, m.name);
    EXPECT_EQ(loaded->description, m.description);
    EXPECT_EQ(loaded->mode, m.mode);
    EXPECT_EQ(loaded->repeatCount, 7);
    EXPECT_EQ(loaded->intervalMs, 1500u);
    EXPECT_EQ(loaded->randomMinMs, 100u);
    EXPECT_EQ(loaded->randomMaxMs, 900u);
    EXPECT_FALSE(loaded->enabled);
    EXPECT_EQ(loaded->createdAt, m.createdAt);
    EXPECT_EQ(loaded->modifiedAt, m.modifiedAt);
    EXPECT_EQ(loaded->executionCount, 4u);
    EXPECT_EQ(loaded->lastExecutedAt, m.lastExecutedAt);

    ASSERT_EQ(loaded->events.size(), m.events.size());
    for (size_t i = 0; i < m.events.size(); ++i)
    {
        EXPECT_TRUE(MacroEvent_SamePayload(loaded->events[i], m.events[i])) << "event " << i;
        EXPECT_EQ(loaded->events[i].id, m.events[i].id);
        EXPECT_EQ(loaded->events[i].enabled, m.events[i].enabled);
        EXPECT_EQ(loaded->events[i].description, m.events[i].description);
    }
}

TEST_F(MacroStorageTest, ListIsSortedAndIgnoresOtherFiles)
{
    ASSERT_TRUE(storage.Save(MakeKeyMacro(L"zeta", { 0 })));
    ASSERT_TRUE(storage.Save(MakeKeyMacro(L"Alpha", { 0 })));
    ASSERT_TRUE(storage.Save(MakeKeyMacro(L"beta", { 0 })));
    {
        std::ofstream f(storage.Directory() / "notes.txt");
        f << "not a macro";
    }

    EXPECT_EQ(storage.List(), (std::vector<std::wstring>{ L"Alpha", L"beta", L"zeta" }));
}

TEST_F(MacroStorageTest, ListOfMissingDirectoryIsEmpty)
{
    EXPECT_TRUE(storage.List().empty());
}

TEST_F(MacroStorageTest, DeleteRemovesFile)
{
    ASSERT_TRUE(storage.Save(MakeKeyMacro(L"Gone", { 0 })));
    EXPECT_TRUE(storage.Delete(L"Gone"));
    EXPECT_FALSE(storage.Exists(L"Gone"));
    EXPECT_FALSE(storage.Load(L"Gone").has_value());
    EXPECT_FALSE(storage.Delete(L"Gone"));
}

TEST_F(MacroStorageTest, SaveOverwrites)
{
    ASSERT_TRUE(storage.Save(MakeKeyMacro(L"Same", { 0 })));
    ASSERT_TRUE(storage.Save(MakeKeyMacro(L"Same", { 0, 10, 20 })));
    auto loaded = storage.Load(L"Same");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->events.size(), 3u);
    EXPECT_EQ(storage.List().size(), 1u);
}

TEST_F(MacroStorageTest, InvalidNamesAreRefused)
{
    EXPECT_FALSE(storage.Save(MakeKeyMacro(L"a/b", { 0 })));
    EXPECT_FALSE(storage.Save(MakeKeyMacro(L"  ", { 0 })));
    EXPECT_FALSE(storage.Load(L"..\\x").has_value());
    EXPECT_FALSE(storage.Exists(L""));
    EXPECT_TRUE(storage.List().empty());
}

TEST_F(MacroStorageTest, CorruptFileLoadsAsNothing)
{
    ASSERT_TRUE(storage.Save(MakeKeyMacro(L"Broken", { 0, 10 })));
    {
        std::ofstream f(storage.PathFor(L"Broken"), std::ios::trunc);
        f << "INPUTWARDEN_MACRO_V1\n~\nBroken\n~\n0 1 1000\n";
    }
    EXPECT_FALSE(storage.Load(L"Broken").has_value());

    {
        std::ofstream f(storage.PathFor(L"Broken"), std::ios::trunc);
        f << "something else entirely\n";
    }
    EXPECT_FALSE(storage.Load(L"Broken").has_value());
}

TEST(MacroStorageNameTest, Validation)
{
    EXPECT_EQ(MacroStorage_ValidateName(L"Daily login"), "");
    EXPECT_EQ(MacroStorage_ValidateName(L""), "Macro name is empty");
    EXPECT_EQ(MacroStorage_ValidateName(L" \t "), "Macro name is empty");
    EXPECT_EQ(MacroStorage_ValidateName(std::wstring(101, L'x')), "Macro name is longer than 100 characters");
    EXPECT_EQ(MacroStorage_ValidateName(std::wstring(100, L'x')), "");
    EXPECT_EQ(MacroStorage_ValidateName(L" lead"), "Macro name has leading or trailing spaces");
    EXPECT_EQ(MacroStorage_ValidateName(L"trail "), "Macro name has leading or trailing spaces");
    for (const wchar_t* bad : { L"a\\b", L"a/b", L"a:b", L"a*b", L"a?b", L"a\"b", L"a<b", L"a>b", L"a|b", L"a\x01" L"b" })
        EXPECT_EQ(MacroStorage_ValidateName(bad), "Macro name contains invalid characters");
}

TEST(MacroFileTest, StreamCodecRejectsBadCounts)
{
    Macro m = MakeKeyMacro(L"Count", { 0, 10 });
    std::ostringstream out;
    MacroFile_Write(out, m);

    std::string text = out.str();
    const std::string needle = "\n2\n";
    const size_t pos = text.find(needle);
    ASSERT_NE(pos, std::string::npos);
    text.replace(pos, needle.size(), "\n3\n");

    std::istringstream in(text);
    Macro read;
    EXPECT_FALSE(MacroFile_Read(in, read));
}

TEST(MacroFileTest, ExportImportSingleFile)
{
    TempDir dir;
    const auto path = dir.Path() / "export" / "m.iwm";
    std::filesystem::create_directories(path.parent_path());

    Macro m = MakeKeyMacro(L"Exported", { 0, 25 });
    ASSERT_TRUE(MacroFile_Save(path, m));
    EXPECT_FALSE(std::filesystem::exists(path.string() + ".tmp"));

    auto loaded = MacroFile_Load(path);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->name, L"Exported");
    EXPECT_EQ(loaded->events.size(), 2u);

    EXPECT_FALSE(MacroFile_Load(dir.Path() / "missing.iwm").has_value());
}
