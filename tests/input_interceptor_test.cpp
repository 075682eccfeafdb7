#include <gtest/gtest.h>

#include "input_interceptor.h"
#include "key_codes.h"

namespace {

RawInputEvent Unlock(uint64_t ts)
{
    return RawInput_MakeKey('U', true, ts, true, true, false);
}

} // namespace

TEST(InputInterceptor, PassesEverythingWhenUnblocked)
{
    InputInterceptor ic;
    EXPECT_FALSE(ic.OnRawEvent(RawInput_MakeKey(Vk::A, true, 0)));
    EXPECT_FALSE(ic.OnRawEvent(RawInput_MakeMouseMove(10, 10, 0)));
}

TEST(InputInterceptor, DevicesAreIndependent)
{
    InputInterceptor ic;
    ic.ToggleKeyboard();
    EXPECT_TRUE(ic.OnRawEvent(RawInput_MakeKey(Vk::A, true, 0)));
    EXPECT_FALSE(ic.OnRawEvent(RawInput_MakeMouseButton(MouseButton::Left, true, 0, 0, 0)));

    ic.ToggleMouse();
    EXPECT_TRUE(ic.OnRawEvent(RawInput_MakeMouseButton(MouseButton::Left, true, 0, 0, 0)));
}

TEST(InputInterceptor, SyntheticEventsAlwaysPass)
{
    InputInterceptor ic;
    ic.ToggleKeyboard();
    ic.ToggleMouse();

    RawInputEvent k = RawInput_MakeKey(Vk::A, true, 0);
    k.synthetic = true;
    RawInputEvent m = RawInput_MakeMouseMove(1, 1, 0);
    m.synthetic = true;
    EXPECT_FALSE(ic.OnRawEvent(k));
    EXPECT_FALSE(ic.OnRawEvent(m));
}

TEST(InputInterceptor, SubscribersSeeSuppressedEvents)
{
    InputInterceptor ic;
    int keys = 0, mice = 0;
    ic.KeyboardEvents.Connect([&](const RawInputEvent&) { ++keys; });
    ic.MouseEvents.Connect([&](const RawInputEvent&) { ++mice; });

    ic.ToggleKeyboard();
    ic.ToggleMouse();
    EXPECT_TRUE(ic.OnRawEvent(RawInput_MakeKey(Vk::A, true, 0)));
    EXPECT_TRUE(ic.OnRawEvent(RawInput_MakeMouseWheel(120, 0, 0, 0)));
    EXPECT_EQ(keys, 1);
    EXPECT_EQ(mice, 1);
}

TEST(InputInterceptor, EmergencyUnlockWorksWhenUnlockKeyIsBlocked)
{
    InputInterceptor ic;
    KeyboardAdvancedConfig cfg;
    cfg.BlockAllCategories();
    cfg.blockedKeys.insert('U');
    ic.SetKeyboardAdvancedMode(cfg);
    ic.ToggleKeyboard();
    ic.ToggleMouse();

    std::string reason;
    ic.EmergencyUnlocked.Connect([&](const std::string& r) { reason = r; });

    EXPECT_TRUE(ic.OnRawEvent(Unlock(0)));
    EXPECT_TRUE(ic.OnRawEvent(Unlock(300)));
    EXPECT_FALSE(ic.OnRawEvent(Unlock(600)));

    EXPECT_FALSE(ic.IsKeyboardBlocked());
    EXPECT_FALSE(ic.IsMouseBlocked());
    EXPECT_EQ(reason, "Emergency unlock (3x Ctrl+Alt+U)");
    EXPECT_EQ(ic.Keyboard().GetSnapshot().lastToggleReason, reason);
    EXPECT_EQ(ic.Mouse().GetSnapshot().lastToggleReason, reason);
}

TEST(InputInterceptor, EmergencyUnlockAfterTooLongGapFails)
{
    InputInterceptor ic;
    ic.ToggleKeyboard();

    ic.OnRawEvent(Unlock(0));
    ic.OnRawEvent(Unlock(100));
    ic.OnRawEvent(Unlock(2500));
    EXPECT_TRUE(ic.IsKeyboardBlocked());
}

TEST(InputInterceptor, EmergencyUnlockIgnoresSyntheticPresses)
{
    InputInterceptor ic;
    ic.ToggleKeyboard();
    for (int i = 0; i < 3; ++i)
    {
        RawInputEvent e = Unlock((uint64_t)i * 10);
        e.synthetic = true;
        ic.OnRawEvent(e);
    }
    EXPECT_TRUE(ic.IsKeyboardBlocked());
}

TEST(InputInterceptor, ApplySelectionNeedsConfig)
{
    InputInterceptor ic;
    EXPECT_FALSE(ic.ApplyKeyboardSelection());

    MouseAdvancedConfig cfg;
    cfg.ToggleActionSelection(MouseAction::RightButton);
    ic.SetMouseSelectMode(cfg);
    ic.Mouse().EditSelection([](MouseAdvancedConfig& c) { c.ToggleActionSelection(MouseAction::RightButton); });
    EXPECT_TRUE(ic.ApplyMouseSelection());
    ic.ToggleMouse();

    EXPECT_TRUE(ic.OnRawEvent(RawInput_MakeMouseButton(MouseButton::Right, true, 0, 0, 0)));
    EXPECT_FALSE(ic.OnRawEvent(RawInput_MakeMouseButton(MouseButton::Left, true, 0, 0, 0)));
}

TEST(InputInterceptor, BlockingControlSeam)
{
    InputInterceptor ic;
    IBlockingControl& ctl = ic;
    ctl.SetKeyboardBlocked(true, "test");
    EXPECT_TRUE(ic.Keyboard().IsBlocked());
    EXPECT_EQ(ic.Keyboard().GetSnapshot().lastToggleReason, "test");
    ctl.SetMouseBlocked(true, "test");
    EXPECT_TRUE(ctl.IsMouseBlocked());
}

TEST(InputInterceptor, ReleaseOfKeyHeldBeforeBlockingPasses)
{
    InputInterceptor ic;
    EXPECT_FALSE(ic.OnRawEvent(RawInput_MakeKey(Vk::Control, true, 0)));

    ic.ToggleKeyboard();
    EXPECT_FALSE(ic.OnRawEvent(RawInput_MakeKey(Vk::Control, false, 10)));
    EXPECT_TRUE(ic.OnRawEvent(RawInput_MakeKey(Vk::A, true, 20)));
}

TEST(InputInterceptor, ReleaseOfKeyPressedWhileBlockedStaysSuppressed)
{
    InputInterceptor ic;
    ic.ToggleKeyboard();
    EXPECT_TRUE(ic.OnRawEvent(RawInput_MakeKey(Vk::A, true, 0)));

    ic.ToggleKeyboard();
    EXPECT_TRUE(ic.OnRawEvent(RawInput_MakeKey(Vk::A, false, 10)));
    EXPECT_FALSE(ic.OnRawEvent(RawInput_MakeKey(Vk::A, true, 20)));
    EXPECT_FALSE(ic.OnRawEvent(RawInput_MakeKey(Vk::A, false, 30)));
}

TEST(InputInterceptor, ReleaseOfButtonHeldBeforeBlockingPasses)
{
    InputInterceptor ic;
    EXPECT_FALSE(ic.OnRawEvent(RawInput_MakeMouseButton(MouseButton::Left, true, 0, 0, 0)));

    ic.ToggleMouse();
    EXPECT_FALSE(ic.OnRawEvent(RawInput_MakeMouseButton(MouseButton::Left, false, 0, 0, 10)));
    EXPECT_TRUE(ic.OnRawEvent(RawInput_MakeMouseButton(MouseButton::Left, true, 0, 0, 20)));
}

TEST(InputInterceptor, SuppressedDoubleClickAlsoSuppressesItsRelease)
{
    InputInterceptor ic;
    MouseAdvancedConfig cfg;
    cfg.SetActionBlocked(MouseAction::DoubleClick, true);
    ic.SetMouseAdvancedMode(cfg);
    ic.ToggleMouse();

    EXPECT_FALSE(ic.OnRawEvent(RawInput_MakeMouseButton(MouseButton::Left, true, 0, 0, 0)));
    EXPECT_FALSE(ic.OnRawEvent(RawInput_MakeMouseButton(MouseButton::Left, false, 0, 0, 50)));

    RawInputEvent second = RawInput_MakeMouseButton(MouseButton::Left, true, 0, 0, 100);
    second.doubleClick = true;
    EXPECT_TRUE(ic.OnRawEvent(second));
    EXPECT_TRUE(ic.OnRawEvent(RawInput_MakeMouseButton(MouseButton::Left, false, 0, 0, 150)));

    // the pairing resets after the release
    EXPECT_FALSE(ic.OnRawEvent(RawInput_MakeMouseButton(MouseButton::Left, true, 0, 0, 900)));
    EXPECT_FALSE(ic.OnRawEvent(RawInput_MakeMouseButton(MouseButton::Left, false, 0, 0, 950)));
}
