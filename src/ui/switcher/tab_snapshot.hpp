#pragma once

#include <tabswitch/pane.hpp>
#include <vector>

#include "tab_match.hpp"

namespace tabswitch
{

// ─── TabSnapshot ─────────────────────────────────────────────────────────────
// What the switcher saw when it opened: which panes are in scope, which tab
// each of them had active, and the baseline (most recently used first) list.
// Capturing is read-only with respect to the workspace.

class TabSnapshot
{
   public:
    TabSnapshot() = default;

    static TabSnapshot capture(PaneLookup& panes, PaneScope scope);

    PaneScope scope() const { return scope_; }

    // Active pane when the snapshot was taken.
    PaneId origin_pane() const { return origin_pane_; }

    // Panes in scope, in workspace order.
    const std::vector<PaneId>& scope_panes() const { return scope_panes_; }

    // One entry per non-empty pane in scope. Never modified after capture.
    const std::vector<OriginalItem>& original_items() const { return original_items_; }

    // Unfiltered list at capture time.
    const std::vector<TabMatch>& baseline() const { return baseline_; }

    // Re-enumerate the panes in scope as they are now, in baseline order.
    // Destroyed panes and closed tabs are skipped.
    std::vector<TabMatch> enumerate(PaneLookup& panes) const;

   private:
    PaneScope                 scope_       = PaneScope::CurrentPane;
    PaneId                    origin_pane_ = INVALID_PANE_ID;
    std::vector<PaneId>       scope_panes_;
    std::vector<OriginalItem> original_items_;
    std::vector<TabMatch>     baseline_;
};

}   // namespace tabswitch
