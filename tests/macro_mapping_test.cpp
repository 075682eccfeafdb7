#include <gtest/gtest.h>

#include <atomic>
#include <fstream>
#include <future>
#include <iterator>
#include <thread>

#ifndef _WIN32
#include <sys/stat.h>
#endif

#include "macro_mapping_service.h"
#include "test_fakes.h"

namespace {

MacroBinding Bind(const std::wstring& name, const MacroTrigger& trigger)
{
    MacroBinding b;
    b.macroName = name;
    b.trigger = trigger;
    return b;
}

RawInputEvent CtrlF5(uint64_t ts)
{
    return RawInput_MakeKey(0x74, true, ts, true, false, false);
}

} // namespace

class MacroMappingTest : public ::testing::Test
{
protected:
    MacroMappingTest()
    {
        runner.macros[L"Combo"] = MakeKeyMacro(L"Combo", { 0, 10 });
        runner.macros[L"Click"] = MakeKeyMacro(L"Click", { 0 });
    }

    std::filesystem::path File() const { return dir.Path() / "macro_bindings.dat"; }

    TempDir dir;
    InputInterceptor interceptor;
    FakeRunner runner;
};

TEST_F(MacroMappingTest, TriggerPlaysBoundMacro)
{
    MacroMappingService svc(interceptor, runner, File());
    ASSERT_TRUE(svc.AddOrUpdate(Bind(L"Combo", MacroTrigger::Key(0x74, true))));

    interceptor.OnRawEvent(CtrlF5(1000));
    svc.WaitIdle();
    EXPECT_EQ(runner.Played(), (std::vector<std::wstring>{ L"Combo" }));
}

TEST_F(MacroMappingTest, ModifiersMustMatchExactly)
{
    MacroMappingService svc(interceptor, runner, File());
    ASSERT_TRUE(svc.AddOrUpdate(Bind(L"Combo", MacroTrigger::Key(0x74, true))));

    interceptor.OnRawEvent(RawInput_MakeKey(0x74, true, 1000));
    interceptor.OnRawEvent(RawInput_MakeKey(0x74, true, 2000, true, false, true));
    interceptor.OnRawEvent(RawInput_MakeKey(0x74, false, 3000, true));
    svc.WaitIdle();
    EXPECT_EQ(runner.plays.load(), 0);
}

TEST_F(MacroMappingTest, MouseTrigger)
{
    MacroMappingService svc(interceptor, runner, File());
    ASSERT_TRUE(svc.AddOrUpdate(Bind(L"Click", MacroTrigger::Mouse(MouseButton::Middle, false))));

    interceptor.OnRawEvent(RawInput_MakeMouseButton(MouseButton::Middle, true, 0, 0, 1000));
    interceptor.OnRawEvent(RawInput_MakeMouseMove(5, 5, 1010));
    interceptor.OnRawEvent(RawInput_MakeMouseButton(MouseButton::Middle, false, 0, 0, 1020));
    svc.WaitIdle();
    EXPECT_EQ(runner.plays.load(), 1);
}

TEST_F(MacroMappingTest, Debounce)
{
    MacroMappingService svc(interceptor, runner, File());
    ASSERT_TRUE(svc.AddOrUpdate(Bind(L"Combo", MacroTrigger::Key(0x74, true))));
    EXPECT_EQ(svc.GetDebounceMs(), MacroMappingService::kDefaultDebounceMs);

    interceptor.OnRawEvent(CtrlF5(1000));
    interceptor.OnRawEvent(CtrlF5(1100));
    svc.WaitIdle();
    EXPECT_EQ(runner.plays.load(), 1);

    interceptor.OnRawEvent(CtrlF5(1300));
    svc.WaitIdle();
    EXPECT_EQ(runner.plays.load(), 2);

    svc.SetDebounceMs(0);
    interceptor.OnRawEvent(CtrlF5(1301));
    svc.WaitIdle();
    EXPECT_EQ(runner.plays.load(), 3);
}

TEST_F(MacroMappingTest, IgnoredWhileRunnerBusyOrDisabled)
{
    MacroMappingService svc(interceptor, runner, File());
    ASSERT_TRUE(svc.AddOrUpdate(Bind(L"Combo", MacroTrigger::Key(0x74, true))));

    runner.recording = true;
    interceptor.OnRawEvent(CtrlF5(1000));
    runner.recording = false;

    runner.playing = true;
    interceptor.OnRawEvent(CtrlF5(2000));
    runner.playing = false;

    svc.SetEnabled(false);
    EXPECT_FALSE(svc.IsEnabled());
    interceptor.OnRawEvent(CtrlF5(3000));

    MacroBinding off = Bind(L"Combo", MacroTrigger::Key(0x74, true));
    off.enabled = false;
    svc.SetEnabled(true);
    ASSERT_TRUE(svc.AddOrUpdate(off));
    interceptor.OnRawEvent(CtrlF5(4000));

    svc.WaitIdle();
    EXPECT_EQ(runner.plays.load(), 0);
}

TEST_F(MacroMappingTest, SyntheticEventsIgnored)
{
    MacroMappingService svc(interceptor, runner, File());
    ASSERT_TRUE(svc.AddOrUpdate(Bind(L"Combo", MacroTrigger::Key(0x74, true))));

    RawInputEvent e = CtrlF5(1000);
    e.synthetic = true;
    interceptor.OnRawEvent(e);

    RawInputEvent injected = CtrlF5(2000);
    injected.injected = true;
    interceptor.OnRawEvent(injected);

    svc.WaitIdle();
    EXPECT_EQ(runner.plays.load(), 1);
}

TEST_F(MacroMappingTest, MissingMacroIsSkipped)
{
    MacroMappingService svc(interceptor, runner, File());
    ASSERT_TRUE(svc.AddOrUpdate(Bind(L"Ghost", MacroTrigger::Key(0x74, true))));
    interceptor.OnRawEvent(CtrlF5(1000));
    svc.WaitIdle();
    EXPECT_EQ(runner.plays.load(), 0);
}

TEST_F(MacroMappingTest, UpsertByTrigger)
{
    MacroMappingService svc(interceptor, runner, File());
    int changes = 0;
    svc.BindingsChanged.Connect([&] { ++changes; });

    EXPECT_FALSE(svc.AddOrUpdate(Bind(L"  ", MacroTrigger::Key(0x74, true))));
    ASSERT_TRUE(svc.AddOrUpdate(Bind(L"Combo", MacroTrigger::Key(0x74, true))));
    ASSERT_TRUE(svc.AddOrUpdate(Bind(L" Click ", MacroTrigger::Key(0x74, true))));
    ASSERT_TRUE(svc.AddOrUpdate(Bind(L"Combo", MacroTrigger::Key(0x74, true, false, false, false))));

    auto list = svc.List();
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].macroName, L"Click");
    EXPECT_EQ(list[1].macroName, L"Combo");
    EXPECT_NE(list[0].id, list[1].id);
    EXPECT_EQ(list[0].id.size(), 32u);
    EXPECT_EQ(changes, 3);
}

TEST_F(MacroMappingTest, RemoveAndEnableById)
{
    MacroMappingService svc(interceptor, runner, File());
    ASSERT_TRUE(svc.AddOrUpdate(Bind(L"Combo", MacroTrigger::Key(0x74, true))));
    const std::string id = svc.List().at(0).id;

    EXPECT_FALSE(svc.Enable("unknown", false));
    ASSERT_TRUE(svc.Enable(id, false));
    EXPECT_FALSE(svc.List().at(0).enabled);

    EXPECT_FALSE(svc.Remove(""));
    ASSERT_TRUE(svc.Remove(id));
    EXPECT_TRUE(svc.List().empty());
    EXPECT_FALSE(svc.Remove(id));
}

TEST_F(MacroMappingTest, FollowsMacroRenameAndDelete)
{
    MacroMappingService svc(interceptor, runner, File());
    ASSERT_TRUE(svc.AddOrUpdate(Bind(L"Combo", MacroTrigger::Key(0x74, true))));
    ASSERT_TRUE(svc.AddOrUpdate(Bind(L"Combo", MacroTrigger::Mouse(MouseButton::Right))));
    ASSERT_TRUE(svc.AddOrUpdate(Bind(L"Click", MacroTrigger::Key(0x75))));

    ASSERT_TRUE(svc.RenameMacro(L"combo", L"Combo2"));
    EXPECT_FALSE(svc.RenameMacro(L"Nothing", L"X"));
    for (const auto& b : svc.List())
        EXPECT_NE(b.macroName, L"Combo");

    ASSERT_TRUE(svc.RemoveForMacro(L"Combo2"));
    auto list = svc.List();
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].macroName, L"Click");
    EXPECT_FALSE(svc.RemoveForMacro(L"Combo2"));

    svc.ClearAll();
    EXPECT_TRUE(svc.List().empty());
}

TEST_F(MacroMappingTest, PersistsAcrossInstances)
{
    {
        MacroMappingService svc(interceptor, runner, File());
        ASSERT_TRUE(svc.AddOrUpdate(Bind(L"Caf\u00E9", MacroTrigger::Key(0x41, true, true, true, false))));
        ASSERT_TRUE(svc.AddOrUpdate(Bind(L"Click", MacroTrigger::Mouse(MouseButton::Left))));
        svc.SetEnabled(false);
    }
    EXPECT_TRUE(std::filesystem::exists(File()));

    MacroMappingService reloaded(interceptor, runner, File());
    EXPECT_FALSE(reloaded.IsEnabled());
    auto list = reloaded.List();
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].macroName, L"Caf\u00E9");
    EXPECT_TRUE(list[0].trigger == MacroTrigger::Key(0x41, true, true, true, false));
    EXPECT_TRUE(list[1].trigger == MacroTrigger::Mouse(MouseButton::Left));
}

TEST_F(MacroMappingTest, CorruptFileStartsEmpty)
{
    {
        std::ofstream f(File());
        f << "INPUTWARDEN_BINDINGS_V1\n1\n5\nabc\n";
    }
    MacroMappingService svc(interceptor, runner, File());
    EXPECT_TRUE(svc.List().empty());
    EXPECT_TRUE(svc.IsEnabled());
}

TEST_F(MacroMappingTest, DetachesFromInterceptorOnDestruction)
{
    {
        MacroMappingService svc(interceptor, runner, File());
        ASSERT_TRUE(svc.AddOrUpdate(Bind(L"Combo", MacroTrigger::Key(0x74, true))));
    }
    EXPECT_EQ(interceptor.KeyboardEvents.Count(), 0u);
    interceptor.OnRawEvent(CtrlF5(1000));
    EXPECT_EQ(runner.plays.load(), 0);
}

TEST_F(MacroMappingTest, TriggerStormWhilePlayingIsCapped)
{
    MacroMappingService svc(interceptor, runner, File());
    ASSERT_TRUE(svc.AddOrUpdate(Bind(L"Combo", MacroTrigger::Key(0x74, true))));
    svc.SetDebounceMs(0);

    runner.hold = true;
    interceptor.OnRawEvent(CtrlF5(1000));
    WaitUntil([&] { return runner.plays.load() == 1; });
    ASSERT_EQ(runner.plays.load(), 1);

    for (int i = 1; i <= 100; ++i)
        interceptor.OnRawEvent(CtrlF5(1000 + (uint64_t)i));

    runner.hold = false;
    svc.WaitIdle();
    EXPECT_EQ(runner.plays.load(), 1 + (int)MacroMappingService::kMaxQueuedTriggers);
}

TEST_F(MacroMappingTest, DestructionStopsRunningPlayback)
{
    {
        MacroMappingService svc(interceptor, runner, File());
        ASSERT_TRUE(svc.AddOrUpdate(Bind(L"Combo", MacroTrigger::Key(0x74, true))));
        svc.SetDebounceMs(0);

        runner.hold = true;
        interceptor.OnRawEvent(CtrlF5(1000));
        interceptor.OnRawEvent(CtrlF5(1001));
        WaitUntil([&] { return runner.plays.load() == 1; });
    }
    EXPECT_GE(runner.stops.load(), 1);
    EXPECT_EQ(runner.plays.load(), 1);  // the queued trigger was dropped
}

TEST_F(MacroMappingTest, IdleDestructionDoesNotStopPlayback)
{
    {
        MacroMappingService svc(interceptor, runner, File());
        ASSERT_TRUE(svc.AddOrUpdate(Bind(L"Combo", MacroTrigger::Key(0x74, true))));
    }
    EXPECT_EQ(runner.stops.load(), 0);
}

#ifndef _WIN32
// A writer blocked on the bindings file must not hold up the hook path
TEST_F(MacroMappingTest, SlowSaveDoesNotBlockTriggers)
{
    MacroMappingService svc(interceptor, runner, File());
    std::filesystem::path tmp = File();
    tmp += ".tmp";
    ASSERT_EQ(mkfifo(tmp.c_str(), 0600), 0);

    std::atomic<bool> added{ false };
    std::thread writer([&] { added = svc.AddOrUpdate(Bind(L"Combo", MacroTrigger::Key(0x74, true))); });
    WaitUntil([&] { return !svc.List().empty(); });

    std::future<void> hook = std::async(std::launch::async, [&] { interceptor.OnRawEvent(CtrlF5(1000)); });
    const std::future_status status = hook.wait_for(std::chrono::milliseconds(1000));

    // Drain the pipe so the writer can finish
    {
        std::ifstream reader(tmp, std::ios::in | std::ios::binary);
        std::string content((std::istreambuf_iterator<char>(reader)), std::istreambuf_iterator<char>());
        EXPECT_NE(content.find("INPUTWARDEN_BINDINGS_V1"), std::string::npos);
    }
    writer.join();
    hook.wait();
    svc.WaitIdle();

    EXPECT_EQ(status, std::future_status::ready);
    EXPECT_TRUE(added.load());
    EXPECT_EQ(runner.plays.load(), 1);
}
#endif
