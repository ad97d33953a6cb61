#include "tab_snapshot.hpp"

#include <algorithm>
#include <tabswitch/logger.hpp>

namespace tabswitch
{

TabSnapshot TabSnapshot::capture(PaneLookup& panes, PaneScope scope)
{
    TabSnapshot snap;
    snap.scope_       = scope;
    snap.origin_pane_ = panes.active_pane_id();

    if (scope == PaneScope::AllPanes)
    {
        snap.scope_panes_ = panes.pane_ids();
    }
    else if (panes.find_pane(snap.origin_pane_))
    {
        snap.scope_panes_.push_back(snap.origin_pane_);
    }

    for (PaneId id : snap.scope_panes_)
    {
        Pane* pane = panes.find_pane(id);
        if (!pane)
            continue;
        auto active = pane->active_index();
        if (!active)
            continue;
        snap.original_items_.push_back({id, *active, pane->item_at(*active)});
    }

    snap.baseline_ = snap.enumerate(panes);

    TABSWITCH_LOG_DEBUG(log_category::Switcher,
                        "snapshot: {} panes, {} tabs, scope={}",
                        snap.scope_panes_.size(),
                        snap.baseline_.size(),
                        scope == PaneScope::AllPanes ? "all" : "pane");
    return snap;
}

std::vector<TabMatch> TabSnapshot::enumerate(PaneLookup& panes) const
{
    struct Entry
    {
        TabMatch match;
        uint64_t stamp;
    };

    std::vector<Entry> entries;
    for (PaneId id : scope_panes_)
    {
        Pane* pane = panes.find_pane(id);
        if (!pane)
            continue;

        auto items = pane->enumerate_items();
        for (size_t i = 0; i < items.size(); ++i)
        {
            TabMatch m;
            m.pane_id    = id;
            m.item_index = i;
            m.item       = items[i];
            m.preview    = pane->is_preview_item(items[i].get());
            entries.push_back({std::move(m), pane->last_activation(items[i].get())});
        }
    }

    // Most recently activated first. Ties (including never-activated tabs)
    // keep pane order, then tab order.
    std::stable_sort(entries.begin(),
                     entries.end(),
                     [](const Entry& a, const Entry& b) { return a.stamp > b.stamp; });

    std::vector<TabMatch> out;
    out.reserve(entries.size());
    for (auto& e : entries)
        out.push_back(std::move(e.match));
    return out;
}

}   // namespace tabswitch
