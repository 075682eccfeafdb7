#include <gtest/gtest.h>

#include "advanced_config.h"
#include "key_codes.h"

TEST(KeyboardAdvancedConfig, ExplicitKeyIsBlocked)
{
    KeyboardAdvancedConfig c;
    c.blockedKeys.insert(Vk::A);
    EXPECT_TRUE(c.IsKeyBlocked(Vk::A));
    EXPECT_FALSE(c.IsKeyBlocked(Vk::A + 1));
}

TEST(KeyboardAdvancedConfig, CategoryFlags)
{
    KeyboardAdvancedConfig c;
    c.SetCategory(KeyCategory::Function, true);
    EXPECT_TRUE(c.IsKeyBlocked(Vk::F1));
    EXPECT_TRUE(c.IsKeyBlocked(Vk::F24));
    EXPECT_FALSE(c.IsKeyBlocked(Vk::A));

    c.SetCategory(KeyCategory::Number, true);
    EXPECT_TRUE(c.IsKeyBlocked(Vk::Digit0 + 5));
    EXPECT_TRUE(c.IsKeyBlocked(Vk::NumPad0 + 7));

    c.SetCategory(KeyCategory::Modifier, true);
    EXPECT_TRUE(c.IsKeyBlocked(Vk::LControl));
    EXPECT_TRUE(c.IsKeyBlocked(Vk::RWin));

    c.SetCategory(KeyCategory::Arrow, true);
    EXPECT_TRUE(c.IsKeyBlocked(Vk::Left));

    c.SetCategory(KeyCategory::Special, true);
    EXPECT_TRUE(c.IsKeyBlocked(Vk::Space));
    EXPECT_TRUE(c.IsKeyBlocked(Vk::Capital));

    EXPECT_FALSE(c.IsKeyBlocked(Vk::Z));
    c.SetCategory(KeyCategory::Letter, true);
    EXPECT_TRUE(c.IsKeyBlocked(Vk::Z));
    EXPECT_TRUE(c.GetCategory(KeyCategory::Letter));
}

TEST(KeyboardAdvancedConfig, BlockAllAndClear)
{
    KeyboardAdvancedConfig c;
    c.BlockAllCategories();
    EXPECT_TRUE(c.HasAnyCategory());
    EXPECT_TRUE(c.IsKeyBlocked(Vk::Escape));

    c.ClearAll();
    EXPECT_FALSE(c.HasAnyCategory());
    EXPECT_FALSE(c.IsKeyBlocked(Vk::Escape));
}

TEST(KeyboardAdvancedConfig, SelectionIsNotBlockingUntilApplied)
{
    KeyboardAdvancedConfig c;
    c.ToggleKeySelection(Vk::A);
    c.ToggleKeySelection(Vk::Z);
    c.ToggleKeySelection(Vk::Z);
    EXPECT_TRUE(c.IsKeySelected(Vk::A));
    EXPECT_FALSE(c.IsKeySelected(Vk::Z));
    EXPECT_FALSE(c.IsKeyBlocked(Vk::A));

    c.ApplySelection();
    EXPECT_TRUE(c.IsKeyBlocked(Vk::A));
    EXPECT_FALSE(c.HasSelectedKeys());
}

TEST(KeyboardAdvancedConfig, OnlyKeyboardEventsAreBlocked)
{
    KeyboardAdvancedConfig c;
    c.BlockAllCategories();
    EXPECT_TRUE(c.IsBlocked(RawInput_MakeKey(Vk::A, true, 0)));
    EXPECT_FALSE(c.IsBlocked(RawInput_MakeMouseButton(MouseButton::Left, true, 0, 0, 0)));
}

TEST(KeyboardAdvancedConfig, Summary)
{
    KeyboardAdvancedConfig c;
    c.blockedKeys = { Vk::A, Vk::Z, Vk::Space };
    c.blockModifierKeys = true;
    c.blockFunctionKeys = true;
    EXPECT_EQ(c.Summary(), "3 individual keys + Modifiers, Function");

    KeyboardAdvancedConfig empty;
    EXPECT_EQ(empty.Summary(), "0 individual keys");
}

TEST(MouseAdvancedConfig, EventToActionMapping)
{
    MouseAdvancedConfig c;
    c.SetActionBlocked(MouseAction::RightButton, true);
    EXPECT_TRUE(c.IsBlocked(RawInput_MakeMouseButton(MouseButton::Right, true, 0, 0, 0)));
    EXPECT_TRUE(c.IsBlocked(RawInput_MakeMouseButton(MouseButton::Right, false, 0, 0, 0)));
    EXPECT_FALSE(c.IsBlocked(RawInput_MakeMouseButton(MouseButton::Left, true, 0, 0, 0)));

    c.SetActionBlocked(MouseAction::X2Button, true);
    EXPECT_TRUE(c.IsBlocked(RawInput_MakeMouseButton(MouseButton::X2, true, 0, 0, 0)));
    EXPECT_FALSE(c.IsBlocked(RawInput_MakeMouseButton(MouseButton::X1, true, 0, 0, 0)));

    EXPECT_FALSE(c.IsBlocked(RawInput_MakeMouseMove(5, 5, 0)));
    c.SetActionBlocked(MouseAction::Movement, true);
    EXPECT_TRUE(c.IsBlocked(RawInput_MakeMouseMove(5, 5, 0)));
}

TEST(MouseAdvancedConfig, HorizontalWheelCountsAsWheel)
{
    MouseAdvancedConfig c;
    c.SetActionBlocked(MouseAction::Wheel, true);
    RawInputEvent e = RawInput_MakeMouseWheel(-120, 0, 0, 0);
    e.horizontalWheel = true;
    EXPECT_TRUE(c.IsBlocked(e));
}

TEST(MouseAdvancedConfig, DoubleClickBlockedByEitherAction)
{
    RawInputEvent dbl = RawInput_MakeMouseButton(MouseButton::Left, true, 0, 0, 0);
    dbl.doubleClick = true;

    MouseAdvancedConfig byDouble;
    byDouble.SetActionBlocked(MouseAction::DoubleClick, true);
    EXPECT_TRUE(byDouble.IsBlocked(dbl));
    EXPECT_FALSE(byDouble.IsBlocked(RawInput_MakeMouseButton(MouseButton::Left, true, 0, 0, 0)));

    MouseAdvancedConfig byButton;
    byButton.SetActionBlocked(MouseAction::LeftButton, true);
    EXPECT_TRUE(byButton.IsBlocked(dbl));
}

TEST(MouseAdvancedConfig, SelectionAndSummary)
{
    MouseAdvancedConfig c;
    EXPECT_EQ(c.Summary(), "None");
    c.ToggleActionSelection(MouseAction::LeftButton);
    c.ToggleActionSelection(MouseAction::Wheel);
    EXPECT_FALSE(c.HasAnyBlocking());

    c.ApplySelection();
    EXPECT_TRUE(c.HasAnyBlocking());
    EXPECT_FALSE(c.HasSelectedActions());
    EXPECT_EQ(c.Summary(), "Left Button, Mouse Wheel");

    c.BlockAll();
    EXPECT_TRUE(c.IsActionBlocked(MouseAction::DoubleClick));
    c.ClearAll();
    EXPECT_FALSE(c.HasAnyBlocking());
}
