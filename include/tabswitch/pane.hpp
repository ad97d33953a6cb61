#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <tabswitch/fwd.hpp>
#include <tabswitch/tab_item.hpp>
#include <vector>

namespace tabswitch
{

// Capability interface of a tab container.
class Pane
{
   public:
    virtual ~Pane() = default;

    virtual PaneId id() const = 0;

    virtual size_t        item_count() const               = 0;
    virtual TabItemHandle item_at(size_t index) const      = 0;
    virtual std::vector<TabItemHandle> enumerate_items() const = 0;

    // Identity lookup. nullopt if the item is not (or no longer) in this pane.
    virtual std::optional<size_t> index_for_item(const TabItem* item) const = 0;

    // nullopt when the pane holds no items.
    virtual std::optional<size_t> active_index() const = 0;

    // Make the item at `index` the visible one.
    // permanent: commit the activation (recorded in the activation history).
    //            A non-permanent activation is a preview and can be undone by
    //            activating the previous item again.
    // focus:     also make this pane the workspace's active pane.
    // Out-of-range indices are ignored.
    virtual void activate_item(size_t index, bool permanent, bool focus) = 0;

    // Remove the item at `index`. Out-of-range indices are ignored.
    virtual void close_item(size_t index) = 0;

    // Whether `item` is this pane's unpinned preview tab.
    virtual bool is_preview_item(const TabItem* item) const = 0;

    // Monotonic stamp of the last permanent activation of `item`; 0 if never.
    virtual uint64_t last_activation(const TabItem* item) const = 0;
};

// Liveness lookup for panes. Holders keep a PaneId and resolve it on every
// use; a nullptr result means the pane has been destroyed.
class PaneLookup
{
   public:
    virtual ~PaneLookup() = default;

    virtual Pane*               find_pane(PaneId id)  = 0;
    virtual std::vector<PaneId> pane_ids() const      = 0;   // Stable pane order
    virtual PaneId              active_pane_id() const = 0;
};

}   // namespace tabswitch
