#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <tabswitch/fwd.hpp>
#include <tabswitch/tab_item.hpp>

namespace tabswitch
{

// One candidate in the switcher list.
struct TabMatch
{
    PaneId        pane_id    = INVALID_PANE_ID;   // Resolved through PaneLookup on every use
    size_t        item_index = 0;                 // Position in the pane when enumerated
    TabItemHandle item;
    size_t        detail  = 0;
    bool          preview = false;
    int           score   = 0;                    // 0 for unscored (baseline) matches
};

// A pane's active tab at the moment the switcher opened.
struct OriginalItem
{
    PaneId                 pane_id      = INVALID_PANE_ID;
    size_t                 active_index = 0;
    std::weak_ptr<TabItem> active_item;
};

// Render data for one row of the list.
struct TabRow
{
    std::string label;
    size_t      detail   = 0;
    bool        preview  = false;
    bool        selected = false;
    bool        dirty    = false;
    // The selected row always shows its close button; other rows show the
    // dirty indicator and reveal the close button on hover.
    bool show_close          = false;
    bool show_close_on_hover = false;
    bool show_indicator      = false;

    bool close_visible(bool hovered) const
    {
        return show_close || (hovered && show_close_on_hover);
    }
    // The close button takes the indicator's place while it is shown.
    bool indicator_visible(bool hovered) const
    {
        return show_indicator && !close_visible(hovered);
    }
};

enum class PaneScope
{
    CurrentPane,
    AllPanes
};

}   // namespace tabswitch
