#include <gtest/gtest.h>
#include <vector>

#include "ui/commands/command_registry.hpp"
#include "ui/commands/shortcut_manager.hpp"

using namespace tabswitch;

namespace
{
constexpr int kPress   = 1;
constexpr int kRelease = 0;
constexpr int kRepeat  = 2;
}   // namespace

// ─── Shortcut string conversion ──────────────────────────────────────────────

TEST(Shortcut, ToString)
{
    EXPECT_EQ((Shortcut{keys::KEY_A, KeyMod::None}).to_string(), "A");
    EXPECT_EQ((Shortcut{keys::KEY_TAB, KeyMod::Control}).to_string(), "Ctrl+Tab");
    EXPECT_EQ((Shortcut{keys::KEY_TAB, KeyMod::Control | KeyMod::Shift}).to_string(),
              "Ctrl+Shift+Tab");
    EXPECT_EQ((Shortcut{keys::KEY_BACKSPACE, KeyMod::Control}).to_string(), "Ctrl+Backspace");
    EXPECT_EQ((Shortcut{keys::KEY_F1 + 4, KeyMod::None}).to_string(), "F5");
}

TEST(Shortcut, FromStringModifiersAndKeys)
{
    Shortcut s = Shortcut::from_string("Ctrl+Alt+Tab");
    EXPECT_EQ(s.key, keys::KEY_TAB);
    EXPECT_EQ(s.mods, KeyMod::Control | KeyMod::Alt);

    EXPECT_EQ(Shortcut::from_string("esc").key, keys::KEY_ESCAPE);
    EXPECT_EQ(Shortcut::from_string("Return").key, keys::KEY_ENTER);
    EXPECT_EQ(Shortcut::from_string("F12").key, keys::KEY_F12);
    EXPECT_EQ(Shortcut::from_string("ctrl + k").key, keys::KEY_A + ('K' - 'A'));
}

TEST(Shortcut, FromStringRejectsGarbage)
{
    EXPECT_FALSE(Shortcut::from_string("").valid());
    EXPECT_FALSE(Shortcut::from_string("Hyper+Tab").valid());
    EXPECT_FALSE(Shortcut::from_string("Ctrl+Banana").valid());
    EXPECT_FALSE(Shortcut::from_string("Ctrl+#").valid());
    EXPECT_FALSE(Shortcut::from_string("F13").valid());
}

TEST(Shortcut, RoundTrip)
{
    for (const char* text : {"Ctrl+Tab", "Ctrl+Shift+Tab", "Ctrl+Alt+Tab", "Ctrl+Backspace",
                             "Shift+Enter", "Super+9", "PageDown"})
    {
        EXPECT_EQ(Shortcut::from_string(text).to_string(), text);
    }
}

TEST(Shortcut, ModsFromGlfwMasksExtraBits)
{
    // Caps/Num lock bits (0x10, 0x20) are not modifiers for binding purposes.
    EXPECT_EQ(mods_from_glfw(0x02 | 0x10), KeyMod::Control);
}

// ─── ShortcutManager ─────────────────────────────────────────────────────────

TEST(ShortcutManager, BindAndLookup)
{
    ShortcutManager mgr;
    Shortcut        sc{keys::KEY_TAB, KeyMod::Control};
    mgr.bind(sc, "tab_switcher.toggle");
    EXPECT_EQ(mgr.count(), 1u);
    EXPECT_EQ(mgr.command_for_shortcut(sc), "tab_switcher.toggle");
    EXPECT_EQ(mgr.shortcut_for_command("tab_switcher.toggle"), sc);
    EXPECT_EQ(mgr.command_for_shortcut({keys::KEY_TAB, KeyMod::None}), "");
    EXPECT_FALSE(mgr.shortcut_for_command("missing").valid());
}

TEST(ShortcutManager, InvalidShortcutIgnored)
{
    ShortcutManager mgr;
    mgr.bind({}, "x");
    EXPECT_EQ(mgr.count(), 0u);
}

TEST(ShortcutManager, BindReplacesExisting)
{
    ShortcutManager mgr;
    Shortcut        sc{keys::KEY_TAB, KeyMod::Control};
    mgr.bind(sc, "a");
    mgr.bind(sc, "b");
    EXPECT_EQ(mgr.count(), 1u);
    EXPECT_EQ(mgr.command_for_shortcut(sc), "b");
}

TEST(ShortcutManager, UnbindAndClear)
{
    ShortcutManager mgr;
    mgr.bind({keys::KEY_TAB, KeyMod::Control}, "a");
    mgr.bind({keys::KEY_TAB, KeyMod::Alt}, "a");
    mgr.bind({keys::KEY_UP, KeyMod::None}, "b");

    mgr.unbind_command("a");
    EXPECT_EQ(mgr.count(), 1u);
    mgr.unbind({keys::KEY_UP, KeyMod::None});
    EXPECT_EQ(mgr.count(), 0u);

    mgr.bind({keys::KEY_UP, KeyMod::None}, "b");
    mgr.clear();
    EXPECT_TRUE(mgr.all_bindings().empty());
}

TEST(ShortcutManager, BindingUpdatesRegistryLabel)
{
    CommandRegistry reg;
    ShortcutManager mgr;
    mgr.set_command_registry(&reg);
    reg.register_command("tab_switcher.toggle", "Switch Tab", []() {});

    mgr.bind(Shortcut::from_string("Alt+Tab"), "tab_switcher.toggle");
    EXPECT_EQ(reg.find("tab_switcher.toggle")->shortcut, "Alt+Tab");
    mgr.unbind_command("tab_switcher.toggle");
    EXPECT_EQ(reg.find("tab_switcher.toggle")->shortcut, "");
}

// ─── Key dispatch ────────────────────────────────────────────────────────────

TEST(ShortcutManager, OnKeyExecutesOnPressAndRepeat)
{
    CommandRegistry reg;
    ShortcutManager mgr;
    mgr.set_command_registry(&reg);
    int calls = 0;
    reg.register_command("cycle", "Cycle", [&calls]() { ++calls; });
    mgr.bind({keys::KEY_TAB, KeyMod::Control}, "cycle");

    EXPECT_TRUE(mgr.on_key(keys::KEY_TAB, kPress, 0x02));
    EXPECT_TRUE(mgr.on_key(keys::KEY_TAB, kRepeat, 0x02));
    EXPECT_FALSE(mgr.on_key(keys::KEY_TAB, kRelease, 0x02));
    EXPECT_EQ(calls, 2);
}

TEST(ShortcutManager, OnKeyRequiresExactModifiers)
{
    CommandRegistry reg;
    ShortcutManager mgr;
    mgr.set_command_registry(&reg);
    int calls = 0;
    reg.register_command("cycle", "Cycle", [&calls]() { ++calls; });
    mgr.bind({keys::KEY_TAB, KeyMod::Control}, "cycle");

    EXPECT_FALSE(mgr.on_key(keys::KEY_TAB, kPress, 0));
    EXPECT_FALSE(mgr.on_key(keys::KEY_TAB, kPress, 0x02 | 0x01));
    EXPECT_EQ(calls, 0);
}

TEST(ShortcutManager, OnKeyWithoutRegistry)
{
    ShortcutManager mgr;
    mgr.bind({keys::KEY_TAB, KeyMod::Control}, "cycle");
    EXPECT_FALSE(mgr.on_key(keys::KEY_TAB, kPress, 0x02));
}

TEST(ShortcutManager, RegisterDefaults)
{
    ShortcutManager mgr;
    mgr.register_defaults();
    EXPECT_EQ(mgr.count(), 4u);
    EXPECT_EQ(mgr.command_for_shortcut(Shortcut::from_string("Ctrl+Tab")), "tab_switcher.toggle");
}

TEST(ShortcutManager, HeldAfterTracksModifierKeys)
{
    EXPECT_EQ(ShortcutManager::held_after(keys::KEY_TAB, kPress, 0x02), KeyMod::Control);
    EXPECT_EQ(ShortcutManager::held_after(keys::KEY_LEFT_CONTROL, kPress, 0), KeyMod::Control);
    EXPECT_EQ(ShortcutManager::held_after(keys::KEY_RIGHT_CONTROL, kRelease, 0x02), KeyMod::None);
    EXPECT_EQ(ShortcutManager::held_after(keys::KEY_LEFT_SHIFT, kRelease, 0x02 | 0x01),
              KeyMod::Control);
    EXPECT_EQ(ShortcutManager::held_after(keys::KEY_LEFT_ALT, kPress, 0x02),
              KeyMod::Control | KeyMod::Alt);
}

TEST(ShortcutManager, ModifierCallbackSeesEveryEvent)
{
    ShortcutManager     mgr;
    std::vector<KeyMod> seen;
    mgr.set_on_modifiers_changed([&seen](KeyMod mods) { seen.push_back(mods); });

    mgr.on_key(keys::KEY_LEFT_CONTROL, kPress, 0);
    mgr.on_key(keys::KEY_TAB, kRepeat, 0x02);
    mgr.on_key(keys::KEY_LEFT_CONTROL, kRelease, 0x02);

    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0], KeyMod::Control);
    EXPECT_EQ(seen[1], KeyMod::Control);
    EXPECT_EQ(seen[2], KeyMod::None);
}
