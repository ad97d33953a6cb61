#pragma once

#include <functional>
#include <memory>
#include <tabswitch/pane.hpp>
#include <unordered_map>
#include <vector>

#include "item_pane.hpp"

namespace tabswitch
{

/**
 * Workspace: owns the panes of one window.
 *
 * Panes are keyed by monotonic PaneIds that are never reused, so a PaneId held
 * elsewhere either resolves to the same pane or to nothing.  Iteration follows
 * creation order.  Main-thread only.
 */
class Workspace : public PaneLookup
{
   public:
    using PaneChangeCallback = std::function<void(PaneId pane_id)>;

    Workspace();
    ~Workspace() override = default;

    Workspace(const Workspace&)            = delete;
    Workspace& operator=(const Workspace&) = delete;

    // Create a new empty pane. The first pane created becomes the active one.
    ItemPane& add_pane();

    // Destroy a pane and every tab it holds. If it was active, the first
    // remaining pane becomes active. Returns false for unknown ids.
    bool close_pane(PaneId id);

    ItemPane*       pane(PaneId id);
    const ItemPane* pane(PaneId id) const;

    ItemPane* active_pane();
    void      set_active_pane(PaneId id);

    size_t pane_count() const { return panes_.size(); }

    // ── PaneLookup ──────────────────────────────────────────────────────

    Pane*               find_pane(PaneId id) override { return pane(id); }
    std::vector<PaneId> pane_ids() const override { return order_; }
    PaneId              active_pane_id() const override { return active_; }

    void set_on_active_changed(PaneChangeCallback cb) { on_active_changed_ = std::move(cb); }

   private:
    std::unordered_map<PaneId, std::unique_ptr<ItemPane>> panes_;
    std::vector<PaneId>                                   order_;
    PaneId                                                active_  = INVALID_PANE_ID;
    PaneId                                                next_id_ = 1;
    std::shared_ptr<ActivationClock>                      clock_;
    PaneChangeCallback                                    on_active_changed_;
};

}   // namespace tabswitch
