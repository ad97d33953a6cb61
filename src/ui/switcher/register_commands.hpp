#pragma once

namespace tabswitch
{

class CommandRegistry;
class ShortcutManager;
class TabSwitcherModal;

// Objects the switcher commands act on. The modal must outlive the
// registered commands.
struct SwitcherCommandBindings
{
    CommandRegistry*  registry  = nullptr;
    ShortcutManager*  shortcuts = nullptr;   // Optional: default bindings
    TabSwitcherModal* modal     = nullptr;
};

// Register the tab_switcher.* commands. When a ShortcutManager is given, the
// default key bindings are installed as well.
void register_switcher_commands(const SwitcherCommandBindings& bindings);

}   // namespace tabswitch
