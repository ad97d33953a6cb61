#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <tabswitch/pane.hpp>
#include <unordered_map>
#include <vector>

namespace tabswitch
{

// Source of activation stamps. Shared by all panes of a workspace so stamps
// are comparable across panes.
class ActivationClock
{
   public:
    uint64_t tick() { return ++now_; }
    uint64_t now() const { return now_; }

   private:
    uint64_t now_ = 0;
};

// ─── ItemPane ────────────────────────────────────────────────────────────────
// An ordered tab strip with one active item, an optional preview tab and a
// per-item activation history. Main-thread only.

class ItemPane : public Pane
{
   public:
    using FocusCallback = std::function<void(PaneId pane_id)>;

    explicit ItemPane(PaneId id, std::shared_ptr<ActivationClock> clock = nullptr);
    ~ItemPane() override = default;

    ItemPane(const ItemPane&)            = delete;
    ItemPane& operator=(const ItemPane&) = delete;

    // ── Pane ────────────────────────────────────────────────────────────

    PaneId id() const override { return id_; }

    size_t                     item_count() const override { return items_.size(); }
    TabItemHandle              item_at(size_t index) const override;
    std::vector<TabItemHandle> enumerate_items() const override { return items_; }

    std::optional<size_t> index_for_item(const TabItem* item) const override;
    std::optional<size_t> active_index() const override;

    void activate_item(size_t index, bool permanent, bool focus) override;
    void close_item(size_t index) override;

    bool     is_preview_item(const TabItem* item) const override;
    uint64_t last_activation(const TabItem* item) const override;

    // ── Editing ─────────────────────────────────────────────────────────

    // Append an item (or find it if already present). When `activate` is
    // set the item becomes the active one, permanently. Returns its index.
    size_t add_item(TabItemHandle item, bool activate = true);

    // Mark `item` as the pane's preview tab (nullptr clears it). Ignored if
    // the item is not in this pane.
    void set_preview_item(const TabItem* item);

    // Close by identity. Returns false if the item is not in this pane.
    bool close(const TabItem* item);

    TabItemHandle active_item() const;

    void set_on_focus_requested(FocusCallback cb) { on_focus_requested_ = std::move(cb); }

   private:
    PaneId                                         id_;
    std::vector<TabItemHandle>                     items_;
    size_t                                         active_ = 0;   // Index into items_
    const TabItem*                                 preview_ = nullptr;
    std::unordered_map<const TabItem*, uint64_t>   activations_;
    std::shared_ptr<ActivationClock>               clock_;
    FocusCallback                                  on_focus_requested_;
};

}   // namespace tabswitch
