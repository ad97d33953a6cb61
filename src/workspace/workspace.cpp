#include "workspace.hpp"

#include <algorithm>
#include <tabswitch/logger.hpp>

namespace tabswitch
{

Workspace::Workspace() : clock_(std::make_shared<ActivationClock>()) {}

ItemPane& Workspace::add_pane()
{
    PaneId id   = next_id_++;
    auto   pane = std::make_unique<ItemPane>(id, clock_);
    pane->set_on_focus_requested([this](PaneId pane_id) { set_active_pane(pane_id); });

    ItemPane& ref = *pane;
    panes_[id]    = std::move(pane);
    order_.push_back(id);

    if (active_ == INVALID_PANE_ID)
    {
        active_ = id;
    }
    TABSWITCH_LOG_DEBUG(log_category::Workspace, "added pane {}", id);
    return ref;
}

bool Workspace::close_pane(PaneId id)
{
    auto it = panes_.find(id);
    if (it == panes_.end())
        return false;

    panes_.erase(it);
    order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    TABSWITCH_LOG_DEBUG(log_category::Workspace, "closed pane {}", id);

    if (active_ == id)
    {
        active_ = order_.empty() ? INVALID_PANE_ID : order_.front();
        if (on_active_changed_)
            on_active_changed_(active_);
    }
    return true;
}

ItemPane* Workspace::pane(PaneId id)
{
    auto it = panes_.find(id);
    return it != panes_.end() ? it->second.get() : nullptr;
}

const ItemPane* Workspace::pane(PaneId id) const
{
    auto it = panes_.find(id);
    return it != panes_.end() ? it->second.get() : nullptr;
}

ItemPane* Workspace::active_pane()
{
    return pane(active_);
}

void Workspace::set_active_pane(PaneId id)
{
    if (!panes_.count(id) || id == active_)
        return;
    active_ = id;
    if (on_active_changed_)
        on_active_changed_(active_);
}

}   // namespace tabswitch
