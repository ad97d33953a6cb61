// Drives the tab switcher from simulated key events against a small
// two-pane workspace and prints what the user would see.

#include <iostream>
#include <memory>
#include <tabswitch/logger.hpp>

#include "ui/commands/command_queue.hpp"
#include "ui/commands/command_registry.hpp"
#include "ui/commands/shortcut_manager.hpp"
#include "ui/switcher/register_commands.hpp"
#include "ui/switcher/switcher_config.hpp"
#include "ui/switcher/tab_switcher_modal.hpp"
#include "workspace/document.hpp"
#include "workspace/workspace.hpp"

using namespace tabswitch;

namespace
{

constexpr int kPress   = 1;
constexpr int kRelease = 0;
constexpr int kCtrl    = 0x02;
constexpr int kAlt     = 0x04;

void print_workspace(const Workspace& ws)
{
    for (PaneId id : ws.pane_ids())
    {
        const ItemPane* pane = ws.pane(id);
        auto            item = pane->active_item();
        std::cout << "  pane " << id << (id == ws.active_pane_id() ? " *" : "  ") << "  active: "
                  << (item ? item->tab_label(8) : std::string("-")) << "\n";
    }
}

void print_switcher(TabSwitcherModal& modal)
{
    TabSwitcher* sw = modal.switcher();
    if (!sw)
    {
        std::cout << "  (closed)\n";
        return;
    }
    std::cout << "  [" << (modal.query().empty() ? sw->placeholder_text() : modal.query()) << "]\n";
    if (sw->match_count() == 0)
        std::cout << "    " << sw->no_matches_text() << "\n";
    for (size_t i = 0; i < sw->match_count(); ++i)
    {
        auto row = sw->row(i);
        if (!row)
            continue;
        std::cout << (row->selected ? "  > " : "    ") << row->label
                  << (row->dirty ? " \xE2\x97\x8F" : "") << "\n";
    }
}

}   // namespace

int main()
{
    Logger::instance().set_level(LogLevel::Debug);
    Logger::instance().add_sink(sinks::console_sink());

    SwitcherConfig config;
    if (!config.load(SwitcherConfig::default_path()))
    {
        TABSWITCH_LOG_INFO("demo", "using default switcher config");
    }

    Workspace ws;
    auto&     left = ws.add_pane();
    for (const char* path : {"src/core/main.cpp", "src/ui/main.cpp", "README.md"})
        left.add_item(std::make_shared<Document>(path));
    auto& right = ws.add_pane();
    auto  notes = std::make_shared<Document>("docs/notes.md");
    notes->set_dirty(true);
    right.add_item(notes);
    right.add_item(std::make_shared<Document>("CMakeLists.txt"));

    CommandQueue     queue;
    CommandRegistry  registry;
    ShortcutManager  shortcuts;
    TabSwitcherModal modal(ws, config);
    modal.set_scheduler(queue.scheduler());
    register_switcher_commands({&registry, &shortcuts, &modal});

    auto key = [&](int k, int action, int mods)
    {
        shortcuts.on_key(k, action, mods);
        queue.drain();
    };

    std::cout << "Initial workspace:\n";
    print_workspace(ws);

    std::cout << "\nCtrl+Tab, Tab (holding Ctrl):\n";
    key(keys::KEY_TAB, kPress, kCtrl);
    key(keys::KEY_TAB, kPress, kCtrl);
    print_switcher(modal);
    print_workspace(ws);

    std::cout << "\nRelease Ctrl:\n";
    key(keys::KEY_LEFT_CONTROL, kRelease, 0);
    print_workspace(ws);

    std::cout << "\nCtrl+Alt+Tab, type \"main\", Escape:\n";
    key(keys::KEY_TAB, kPress, kCtrl | kAlt);
    modal.set_query("main");
    queue.drain();
    print_switcher(modal);
    modal.handle_key(keys::KEY_ESCAPE);
    print_workspace(ws);

    std::cout << "\nRegistered commands:\n";
    for (const Command* cmd : registry.all_commands())
        std::cout << "  " << cmd->id << "  " << cmd->shortcut << "\n";

    return 0;
}
