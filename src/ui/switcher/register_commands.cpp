#include "register_commands.hpp"

#include <tabswitch/logger.hpp>

#include "tab_switcher_modal.hpp"
#include "ui/commands/command_registry.hpp"
#include "ui/commands/shortcut_manager.hpp"

namespace tabswitch
{

void register_switcher_commands(const SwitcherCommandBindings& b)
{
    if (!b.registry || !b.modal)
    {
        TABSWITCH_LOG_WARN(log_category::Commands,
                           "switcher commands not registered: missing registry or modal");
        return;
    }

    auto& registry = *b.registry;
    auto& modal    = *b.modal;

    // ─── Open / cycle ────────────────────────────────────────────────────
    registry.register_command(
        "tab_switcher.toggle",
        "Switch Tab",
        [&modal]() { modal.toggle(false); },
        "Ctrl+Tab",
        "Tabs");

    registry.register_command(
        "tab_switcher.toggle_select_last",
        "Switch Tab (Select Last)",
        [&modal]() { modal.toggle(true); },
        "Ctrl+Shift+Tab",
        "Tabs");

    registry.register_command(
        "tab_switcher.toggle_all",
        "Switch Tab (All Panes)",
        [&modal]() { modal.toggle_all(); },
        "Ctrl+Alt+Tab",
        "Tabs");

    // ─── Inside the popup ────────────────────────────────────────────────
    registry.register_command(
        "tab_switcher.close_selected",
        "Close Selected Tab",
        [&modal]() { modal.close_selected(); },
        "Ctrl+Backspace",
        "Tabs");

    registry.register_command(
        "tab_switcher.confirm", "Open Selected Tab", [&modal]() { modal.confirm(); }, "", "Tabs");

    registry.register_command(
        "tab_switcher.dismiss", "Cancel Tab Switch", [&modal]() { modal.dismiss(); }, "", "Tabs");

    registry.register_command(
        "tab_switcher.select_next", "Select Next Tab", [&modal]() { modal.select_next(); }, "", "Tabs");

    registry.register_command(
        "tab_switcher.select_prev",
        "Select Previous Tab",
        [&modal]() { modal.select_prev(); },
        "",
        "Tabs");

    if (b.shortcuts)
    {
        b.shortcuts->set_command_registry(&registry);
        b.shortcuts->register_defaults();
        b.shortcuts->set_on_modifiers_changed([&modal](KeyMod mods)
                                              { modal.on_modifiers_changed(mods); });
    }

    TABSWITCH_LOG_DEBUG(log_category::Commands, "registered {} commands", registry.count());
}

}   // namespace tabswitch
