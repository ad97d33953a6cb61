#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <tabswitch/fuzzy_matcher.hpp>
#include <tabswitch/pane.hpp>

#include "switcher_config.hpp"
#include "tab_match_list.hpp"
#include "tab_snapshot.hpp"

namespace tabswitch
{

enum class SwitcherState
{
    Active,
    Confirmed,
    Dismissed
};

// ─── TabSwitcher ─────────────────────────────────────────────────────────────
// State of one open switcher popup.
//
// Opening takes a snapshot of the panes in scope. Moving the selection
// previews the selected tab in its pane (non-permanent activation). Confirm
// puts every pane back the way it was and then commits the chosen tab;
// dismiss only puts the panes back. Either of them ends the popup.
//
// Panes are referenced by id and resolved on every use; a pane destroyed by
// someone else turns the corresponding operation into a no-op.
//
// Main-thread only. Recomputations may be deferred through a Scheduler; a
// deferred result is applied only if no newer query was issued meanwhile and
// the popup is still active.

class TabSwitcher
{
   public:
    using Task            = std::function<void()>;
    using Scheduler       = std::function<void(Task)>;
    using DismissCallback = std::function<void()>;

    TabSwitcher(PaneLookup&           panes,
                const FuzzyMatcher&   matcher,
                PaneScope             scope,
                bool                  select_last = false,
                SwitcherConfig        config      = {},
                Scheduler             scheduler   = nullptr);
    ~TabSwitcher() = default;

    TabSwitcher(const TabSwitcher&)            = delete;
    TabSwitcher& operator=(const TabSwitcher&) = delete;

    // ── Presented interface ─────────────────────────────────────────────

    const std::string&    placeholder_text() const { return config_.placeholder; }
    const std::string&    no_matches_text() const { return config_.no_matches; }
    size_t                match_count() const { return list_.size(); }
    std::optional<size_t> selected_index() const { return list_.selected(); }
    const TabMatch*       match_at(size_t ix) const { return list_.at(ix); }
    std::optional<TabRow> row(size_t ix) const;
    std::vector<size_t>   separators_after_indices() const { return {}; }

    // ── Commands ────────────────────────────────────────────────────────

    // Start a recomputation for `query`. Supersedes any in-flight one.
    void update_matches(std::string query);

    // Select a row and preview its tab. False for out-of-range indices or
    // once the popup has ended.
    bool set_selected_index(size_t ix);

    // Move the selection by one, wrapping around.
    void cycle_selection(bool backwards = false);

    // Restore every pane, then permanently activate the selected tab.
    // No-op (false) without a selection or once the popup has ended.
    bool confirm();

    // Restore every pane unless confirm already did. Signals the host at
    // most once. Returns false if nothing was done.
    bool dismiss();

    // Close the tab at `ix` in its pane and drop it from the list.
    bool close_item_at(size_t ix);

    // ── State ───────────────────────────────────────────────────────────

    SwitcherState         state() const { return state_; }
    bool                  restored() const { return restored_; }
    const std::string&    query() const { return query_; }
    const TabSnapshot&    snapshot() const { return snapshot_; }
    const TabMatchList&   matches() const { return list_; }
    const SwitcherConfig& config() const { return config_; }
    bool has_pending_update() const { return list_.applied_generation() != list_.latest_generation(); }

    void set_on_dismiss(DismissCallback cb) { on_dismiss_ = std::move(cb); }

   private:
    void   apply_result(MatchResult result);
    void   restore_original_items();
    size_t initial_index() const;
    bool   is_live(const TabMatch& m);

    PaneLookup&         panes_;
    const FuzzyMatcher& matcher_;
    SwitcherConfig      config_;
    Scheduler           scheduler_;
    bool                select_last_;

    TabSnapshot   snapshot_;
    TabMatchList  list_;
    std::string   query_;
    SwitcherState state_             = SwitcherState::Active;
    bool          restored_          = false;
    bool          initial_selection_ = true;   // Next applied result picks the initial row

    DismissCallback on_dismiss_;

    // Deferred tasks hold a weak reference so they can outlive the popup.
    std::shared_ptr<int> alive_ = std::make_shared<int>(0);
};

}   // namespace tabswitch
