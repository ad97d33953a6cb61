#include "item_pane.hpp"

#include <algorithm>
#include <tabswitch/logger.hpp>

namespace tabswitch
{

ItemPane::ItemPane(PaneId id, std::shared_ptr<ActivationClock> clock)
    : id_(id), clock_(clock ? std::move(clock) : std::make_shared<ActivationClock>())
{
}

TabItemHandle ItemPane::item_at(size_t index) const
{
    if (index >= items_.size())
        return nullptr;
    return items_[index];
}

std::optional<size_t> ItemPane::index_for_item(const TabItem* item) const
{
    if (!item)
        return std::nullopt;
    auto it = std::find_if(items_.begin(),
                           items_.end(),
                           [item](const TabItemHandle& h) { return h.get() == item; });
    if (it == items_.end())
        return std::nullopt;
    return static_cast<size_t>(it - items_.begin());
}

std::optional<size_t> ItemPane::active_index() const
{
    if (items_.empty())
        return std::nullopt;
    return active_;
}

TabItemHandle ItemPane::active_item() const
{
    if (items_.empty())
        return nullptr;
    return items_[active_];
}

void ItemPane::activate_item(size_t index, bool permanent, bool focus)
{
    if (index >= items_.size())
        return;

    active_ = index;
    if (permanent)
    {
        activations_[items_[index].get()] = clock_->tick();
    }
    if (focus && on_focus_requested_)
    {
        on_focus_requested_(id_);
    }
}

void ItemPane::close_item(size_t index)
{
    if (index >= items_.size())
        return;

    const TabItem* removed = items_[index].get();
    activations_.erase(removed);
    if (preview_ == removed)
        preview_ = nullptr;

    items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(index));
    if (items_.empty())
    {
        active_ = 0;
        return;
    }
    if (active_ >= items_.size())
    {
        active_ = items_.size() - 1;
    }
    else if (active_ > index)
    {
        active_--;
    }
    TABSWITCH_LOG_TRACE(log_category::Workspace,
                        "pane {} closed item {}, {} left",
                        id_,
                        index,
                        items_.size());
}

bool ItemPane::is_preview_item(const TabItem* item) const
{
    return item && item == preview_;
}

uint64_t ItemPane::last_activation(const TabItem* item) const
{
    auto it = activations_.find(item);
    return it != activations_.end() ? it->second : 0;
}

size_t ItemPane::add_item(TabItemHandle item, bool activate)
{
    auto existing = index_for_item(item.get());
    size_t index  = existing ? *existing : items_.size();
    if (!existing)
    {
        items_.push_back(std::move(item));
    }
    if (activate)
    {
        activate_item(index, true, false);
    }
    return index;
}

void ItemPane::set_preview_item(const TabItem* item)
{
    if (item && !index_for_item(item))
        return;
    preview_ = item;
}

bool ItemPane::close(const TabItem* item)
{
    auto index = index_for_item(item);
    if (!index)
        return false;
    close_item(*index);
    return true;
}

}   // namespace tabswitch
