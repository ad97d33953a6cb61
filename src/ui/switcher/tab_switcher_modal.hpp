#pragma once

#include <functional>
#include <memory>
#include <string>
#include <tabswitch/fuzzy_matcher.hpp>
#include <tabswitch/pane.hpp>

#include "fuzzy_matcher.hpp"
#include "switcher_config.hpp"
#include "tab_switcher.hpp"
#include "ui/commands/shortcut_manager.hpp"

namespace tabswitch
{

// Hosts at most one TabSwitcher at a time and plays the role of the list
// widget around it: query text, keyboard navigation, toggle/cycle actions and
// confirm-on-modifier-release. Main-thread only.
class TabSwitcherModal
{
   public:
    using ClosedCallback = std::function<void()>;

    explicit TabSwitcherModal(PaneLookup& panes, SwitcherConfig config = {});
    ~TabSwitcherModal();

    TabSwitcherModal(const TabSwitcherModal&)            = delete;
    TabSwitcherModal& operator=(const TabSwitcherModal&) = delete;

    // Optional collaborators. The matcher must outlive any open switcher.
    void set_matcher(const FuzzyMatcher* matcher);
    void set_scheduler(TabSwitcher::Scheduler scheduler) { scheduler_ = std::move(scheduler); }

    const SwitcherConfig& config() const { return config_; }
    void                  set_config(SwitcherConfig config) { config_ = std::move(config); }

    // ── Toggle actions ──────────────────────────────────────────────────
    // Open scoped to the current pane / to all panes. When already open,
    // cycle the selection instead (backwards for select_last).

    void toggle(bool select_last = false);
    void toggle_all();

    bool         is_open() const { return switcher_ != nullptr; }
    TabSwitcher* switcher() { return switcher_.get(); }
    const TabSwitcher* switcher() const { return switcher_.get(); }

    // ── List widget input ───────────────────────────────────────────────

    void               set_query(const std::string& query);
    const std::string& query() const { return query_; }

    void select_next();
    void select_prev();
    bool confirm();
    void dismiss();
    bool close_selected();

    // Enter / Escape / Up / Down while open. Returns true if consumed.
    bool handle_key(int key);

    // Call on every key event with the currently held modifiers, including
    // while closed. register_switcher_commands wires this to the
    // ShortcutManager. When the switcher was opened with modifiers held and
    // all of them are released, the selection is confirmed.
    void on_modifiers_changed(KeyMod mods);
    KeyMod held_modifiers() const { return held_mods_; }
    KeyMod init_modifiers() const { return init_mods_; }

    void set_on_closed(ClosedCallback cb) { on_closed_ = std::move(cb); }

   private:
    void open(PaneScope scope, bool select_last);
    void close_if_finished();

    PaneLookup&                  panes_;
    SwitcherConfig               config_;
    DefaultFuzzyMatcher          default_matcher_;
    const FuzzyMatcher*          matcher_ = &default_matcher_;
    TabSwitcher::Scheduler       scheduler_;
    std::unique_ptr<TabSwitcher> switcher_;
    std::string                  query_;
    bool                         finished_  = false;   // Switcher signalled dismissal
    KeyMod                       held_mods_ = KeyMod::None;
    KeyMod                       init_mods_ = KeyMod::None;
    ClosedCallback               on_closed_;
};

}   // namespace tabswitch
