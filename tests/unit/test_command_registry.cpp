#include <atomic>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <thread>

#include "ui/commands/command_registry.hpp"

using namespace tabswitch;

// ─── Registration ────────────────────────────────────────────────────────────

TEST(CommandRegistry, InitiallyEmpty)
{
    CommandRegistry reg;
    EXPECT_EQ(reg.count(), 0u);
}

TEST(CommandRegistry, RegisterOverwritesSameId)
{
    CommandRegistry reg;
    reg.register_command("tab_switcher.toggle", "Old", []() {});
    reg.register_command("tab_switcher.toggle", "Switch Tab", []() {});
    EXPECT_EQ(reg.count(), 1u);
    EXPECT_EQ(reg.find("tab_switcher.toggle")->label, "Switch Tab");
}

TEST(CommandRegistry, UnregisterRemoves)
{
    CommandRegistry reg;
    reg.register_command("a", "A", []() {});
    reg.unregister_command("a");
    reg.unregister_command("missing");
    EXPECT_EQ(reg.count(), 0u);
    EXPECT_EQ(reg.find("a"), nullptr);
}

TEST(CommandRegistry, RegisterFullStruct)
{
    CommandRegistry reg;
    Command         cmd;
    cmd.id       = "tab_switcher.toggle_all";
    cmd.label    = "Switch Tab (All Panes)";
    cmd.category = "Tabs";
    cmd.shortcut = "Ctrl+Alt+Tab";
    cmd.callback = []() {};
    reg.register_command(std::move(cmd));

    const Command* found = reg.find("tab_switcher.toggle_all");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->category, "Tabs");
    EXPECT_EQ(found->shortcut, "Ctrl+Alt+Tab");
    EXPECT_TRUE(found->enabled);
}

// ─── Execution ───────────────────────────────────────────────────────────────

TEST(CommandRegistry, ExecuteCallsCallback)
{
    CommandRegistry reg;
    int             calls = 0;
    reg.register_command("a", "A", [&calls]() { ++calls; });
    EXPECT_TRUE(reg.execute("a"));
    EXPECT_EQ(calls, 1);
}

TEST(CommandRegistry, ExecuteUnknownDisabledOrEmpty)
{
    CommandRegistry reg;
    int             calls = 0;
    reg.register_command("a", "A", [&calls]() { ++calls; });
    reg.register_command("b", "B", nullptr);
    reg.set_enabled("a", false);

    EXPECT_FALSE(reg.execute("missing"));
    EXPECT_FALSE(reg.execute("a"));
    EXPECT_FALSE(reg.execute("b"));
    EXPECT_EQ(calls, 0);

    reg.set_enabled("a", true);
    EXPECT_TRUE(reg.execute("a"));
}

TEST(CommandRegistry, ThrowingCallbackReportsFailure)
{
    CommandRegistry reg;
    reg.register_command("boom", "Boom", []() { throw std::runtime_error("nope"); });
    EXPECT_FALSE(reg.execute("boom"));
    EXPECT_TRUE(reg.recent_commands().empty());
}

TEST(CommandRegistry, CallbackMayUseRegistry)
{
    CommandRegistry reg;
    reg.register_command("inner", "Inner", []() {});
    reg.register_command("outer", "Outer", [&reg]() { reg.execute("inner"); });
    EXPECT_TRUE(reg.execute("outer"));
    EXPECT_EQ(reg.recent_commands().size(), 2u);
}

// ─── Search ──────────────────────────────────────────────────────────────────

TEST(CommandRegistry, SearchEmptyQueryReturnsAll)
{
    CommandRegistry reg;
    reg.register_command("a", "Alpha", []() {});
    reg.register_command("b", "Beta", []() {});
    EXPECT_EQ(reg.search("").size(), 2u);
}

TEST(CommandRegistry, SearchRanksLabelPrefixFirst)
{
    CommandRegistry reg;
    reg.register_command("tab_switcher.toggle", "Switch Tab", []() {});
    reg.register_command("tab_switcher.close_selected", "Close Selected Tab", []() {});
    auto results = reg.search("switch");
    ASSERT_FALSE(results.empty());
    EXPECT_EQ(results[0].command->id, "tab_switcher.toggle");
}

TEST(CommandRegistry, SearchMatchesId)
{
    CommandRegistry reg;
    reg.register_command("tab_switcher.dismiss", "Cancel", []() {});
    auto results = reg.search("dismiss");
    ASSERT_EQ(results.size(), 1u);
}

TEST(CommandRegistry, SearchNoMatchAndLimit)
{
    CommandRegistry reg;
    for (int i = 0; i < 10; ++i)
        reg.register_command("cmd." + std::to_string(i), "Command " + std::to_string(i), []() {});
    EXPECT_TRUE(reg.search("zzzz").empty());
    EXPECT_EQ(reg.search("command", 3).size(), 3u);
}

// ─── Categories / shortcuts ──────────────────────────────────────────────────

TEST(CommandRegistry, CommandsInCategorySortedByLabel)
{
    CommandRegistry reg;
    reg.register_command("t.b", "Beta", []() {}, "", "Tabs");
    reg.register_command("t.a", "Alpha", []() {}, "", "Tabs");
    reg.register_command("g.x", "Other", []() {});
    auto tabs = reg.commands_in_category("Tabs");
    ASSERT_EQ(tabs.size(), 2u);
    EXPECT_EQ(tabs[0]->label, "Alpha");
}

TEST(CommandRegistry, AllCommandsSortedByCategoryThenLabel)
{
    CommandRegistry reg;
    reg.register_command("t.z", "Zed", []() {}, "", "Tabs");
    reg.register_command("g.a", "Apple", []() {}, "", "General");
    reg.register_command("t.a", "Ant", []() {}, "", "Tabs");
    auto all = reg.all_commands();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0]->id, "g.a");
    EXPECT_EQ(all[1]->id, "t.a");
    EXPECT_EQ(all[2]->id, "t.z");
}

TEST(CommandRegistry, ShortcutLabelUpdates)
{
    CommandRegistry reg;
    reg.register_command("a", "A", []() {}, "Ctrl+Tab");
    reg.set_shortcut_label("a", "Alt+Tab");
    reg.set_shortcut_label("missing", "Ctrl+X");
    EXPECT_EQ(reg.find("a")->shortcut, "Alt+Tab");
}

// ─── Recent ──────────────────────────────────────────────────────────────────

TEST(CommandRegistry, RecentCommandsMostRecentFirstWithoutDuplicates)
{
    CommandRegistry reg;
    reg.register_command("a", "A", []() {});
    reg.register_command("b", "B", []() {});
    reg.execute("a");
    reg.execute("b");
    reg.execute("a");

    auto recent = reg.recent_commands();
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0]->id, "a");
    EXPECT_EQ(recent[1]->id, "b");
    EXPECT_EQ(reg.recent_commands(1).size(), 1u);
}

// ─── Thread safety ───────────────────────────────────────────────────────────

TEST(CommandRegistry, ConcurrentRegisterAndSearch)
{
    CommandRegistry reg;
    for (int i = 0; i < 20; ++i)
        reg.register_command("cmd." + std::to_string(i), "Command " + std::to_string(i), []() {});

    std::thread writer(
        [&reg]()
        {
            for (int i = 20; i < 40; ++i)
                reg.register_command(
                    "cmd." + std::to_string(i), "Command " + std::to_string(i), []() {});
        });
    std::thread reader(
        [&reg]()
        {
            for (int i = 0; i < 50; ++i)
                (void)reg.count();
        });

    writer.join();
    reader.join();
    EXPECT_EQ(reg.count(), 40u);
}
