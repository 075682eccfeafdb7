#include <gtest/gtest.h>

#include "macro_event.h"

TEST(MacroEvent, FactoriesAssignIdsAndPayload)
{
    MacroEvent a = MacroEvent_Key(0x41, true, 120);
    MacroEvent b = MacroEvent_Key(0x41, false, 130);
    EXPECT_EQ(a.type, MacroEventType::KeyDown);
    EXPECT_EQ(b.type, MacroEventType::KeyUp);
    EXPECT_EQ(a.id.size(), 32u);
    EXPECT_NE(a.id, b.id);
    EXPECT_TRUE(a.IsKeyboard());
    EXPECT_FALSE(a.IsMouse());

    MacroEvent w = MacroEvent_MouseWheel(-240, 3, 4, 0);
    EXPECT_EQ(w.type, MacroEventType::MouseWheel);
    EXPECT_EQ(w.wheelDelta, -240);
    EXPECT_TRUE(w.IsMouse());
}

TEST(MacroEvent, ToString)
{
    EXPECT_EQ(MacroEvent_Key(0x41, true, 120).ToString(), "KeyDown A @120ms");
    EXPECT_EQ(MacroEvent_MouseButton(MouseButton::Right, false, 10, 20, 5).ToString(), "MouseUp Right (10,20) @5ms");
    EXPECT_EQ(MacroEvent_Delay(250, 0).ToString(), "Delay 250ms @0ms");
}

TEST(Macro, ConstructorStampsIdAndTimes)
{
    Macro m(L"Test");
    EXPECT_EQ(m.id.size(), 32u);
    EXPECT_EQ(m.name, L"Test");
    EXPECT_GT(m.createdAt, 0);
    EXPECT_EQ(m.createdAt, m.modifiedAt);
    EXPECT_EQ(m.mode, MacroExecutionMode::Once);
    EXPECT_EQ(m.repeatCount, 1);
    EXPECT_EQ(m.intervalMs, 1000u);
    EXPECT_EQ(m.randomMinMs, 500u);
    EXPECT_EQ(m.randomMaxMs, 2000u);
}

TEST(Macro, DurationAndSorting)
{
    Macro m(L"Sort");
    m.events.push_back(MacroEvent_Key(0x42, true, 300));
    m.events.push_back(MacroEvent_Key(0x41, true, 100));
    m.events.push_back(MacroEvent_Key(0x43, true, 100));
    EXPECT_EQ(m.DurationMs(), 300u);

    m.SortEvents();
    EXPECT_EQ(m.events[0].keyCode, 0x41);
    EXPECT_EQ(m.events[1].keyCode, 0x43); // stable for equal offsets
    EXPECT_EQ(m.events[2].keyCode, 0x42);
}

TEST(Macro, PlayableEventsSkipDisabled)
{
    Macro m(L"P");
    m.events.push_back(MacroEvent_Key(0x41, true, 50));
    m.events.push_back(MacroEvent_Key(0x42, true, 10));
    m.events[1].enabled = false;
    m.events.push_back(MacroEvent_Key(0x43, true, 0));

    std::vector<MacroEvent> p = m.PlayableEvents();
    ASSERT_EQ(p.size(), 2u);
    EXPECT_EQ(p[0].keyCode, 0x43);
    EXPECT_EQ(p[1].keyCode, 0x41);
}

TEST(Macro, ValidateReportsProblems)
{
    Macro m(L" ");
    std::vector<std::string> errors = m.Validate();
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0], "Macro name is empty");
    EXPECT_EQ(errors[1], "Macro has no events");

    Macro bad(L"Bad");
    bad.events.push_back(MacroEvent_Key(0, true, 0));
    bad.events.push_back(MacroEvent_MouseButton(MouseButton::None, true, 0, 0, 0));
    bad.mode = MacroExecutionMode::RandomInterval;
    bad.randomMinMs = 900;
    bad.randomMaxMs = 100;
    errors = bad.Validate();
    ASSERT_EQ(errors.size(), 3u);
    EXPECT_EQ(errors[0], "Random interval minimum is greater than maximum");
    EXPECT_EQ(errors[1], "Event 0: missing key code");
    EXPECT_EQ(errors[2], "Event 1: missing mouse button");

    Macro good(L"Good");
    good.events.push_back(MacroEvent_Text(L"hi", 0));
    EXPECT_TRUE(good.Validate().empty());
}

TEST(Macro, CloneAsResetsIdsAndStatistics)
{
    Macro m(L"Orig");
    m.events.push_back(MacroEvent_Key(0x41, true, 0));
    m.executionCount = 7;
    m.lastExecutedAt = 12345;

    Macro c = m.CloneAs(L"Copy");
    EXPECT_EQ(c.name, L"Copy");
    EXPECT_NE(c.id, m.id);
    ASSERT_EQ(c.events.size(), 1u);
    EXPECT_NE(c.events[0].id, m.events[0].id);
    EXPECT_TRUE(MacroEvent_SamePayload(c.events[0], m.events[0]));
    EXPECT_EQ(c.executionCount, 0u);
    EXPECT_EQ(c.lastExecutedAt, 0);
}

TEST(MacroEnums, Names)
{
    EXPECT_STREQ(MacroEventTypeToString(MacroEventType::LoopEnd), "LoopEnd");
    EXPECT_STREQ(MacroExecutionModeToString(MacroExecutionMode::RandomInterval), "RandomInterval");
}
