#include "tab_switcher.hpp"

#include <algorithm>
#include <tabswitch/logger.hpp>

namespace tabswitch
{

TabSwitcher::TabSwitcher(PaneLookup&         panes,
                         const FuzzyMatcher& matcher,
                         PaneScope           scope,
                         bool                select_last,
                         SwitcherConfig      config,
                         Scheduler           scheduler)
    : panes_(panes),
      matcher_(matcher),
      config_(std::move(config)),
      scheduler_(std::move(scheduler)),
      select_last_(select_last),
      snapshot_(TabSnapshot::capture(panes, scope))
{
    TABSWITCH_LOG_INFO(log_category::Switcher,
                       "opened ({} tabs, {})",
                       snapshot_.baseline().size(),
                       scope == PaneScope::AllPanes ? "all panes" : "current pane");

    // The baseline list is available right away; only later queries are
    // routed through the scheduler.
    MatchOptions options{config_.max_detail, config_.max_results};
    auto         request = list_.begin_update("", snapshot_.baseline());
    apply_result(TabMatchList::compute(request, matcher_, options));
}

// ─── Presented interface ─────────────────────────────────────────────────────

std::optional<TabRow> TabSwitcher::row(size_t ix) const
{
    const TabMatch* m = list_.at(ix);
    if (!m || !m->item)
        return std::nullopt;

    TabRow r;
    r.label               = m->item->tab_label(m->detail);
    r.detail              = m->detail;
    r.preview             = m->preview;
    r.selected            = list_.selected() == ix;
    r.dirty               = m->item->is_dirty();
    r.show_close          = r.selected;
    r.show_close_on_hover = !r.selected;
    r.show_indicator      = !r.selected && r.dirty;
    return r;
}

// ─── Match list ──────────────────────────────────────────────────────────────

void TabSwitcher::update_matches(std::string query)
{
    if (state_ != SwitcherState::Active)
        return;

    query_       = query;
    auto request = list_.begin_update(std::move(query), snapshot_.enumerate(panes_));
    TABSWITCH_LOG_TRACE(log_category::Matches,
                        "request {} for '{}' ({} candidates)",
                        request.generation,
                        request.query,
                        request.candidates.size());

    MatchOptions         options{config_.max_detail, config_.max_results};
    std::weak_ptr<int>   alive = alive_;
    const FuzzyMatcher*  matcher = &matcher_;
    Task job = [this, alive, matcher, options, request = std::move(request)]()
    {
        if (alive.expired())
            return;
        apply_result(TabMatchList::compute(request, *matcher, options));
    };

    if (scheduler_)
        scheduler_(std::move(job));
    else
        job();
}

bool TabSwitcher::is_live(const TabMatch& m)
{
    Pane* pane = panes_.find_pane(m.pane_id);
    return pane && m.item && pane->index_for_item(m.item.get()).has_value();
}

void TabSwitcher::apply_result(MatchResult result)
{
    if (state_ != SwitcherState::Active)
    {
        TABSWITCH_LOG_DEBUG(log_category::Matches,
                            "dropping result {} after the switcher closed",
                            result.generation);
        return;
    }

    // Tabs closed or panes destroyed while the result was pending.
    std::erase_if(result.matches, [this](const TabMatch& m) { return !is_live(m); });

    if (!list_.apply(std::move(result)))
        return;

    if (list_.empty())
        return;

    size_t ix          = initial_selection_ ? initial_index() : 0;
    initial_selection_ = false;
    set_selected_index(ix);
}

size_t TabSwitcher::initial_index() const
{
    if (list_.empty())
        return 0;
    if (select_last_)
        return list_.size() - 1;
    if (config_.initial_selection == InitialSelection::Previous && list_.size() > 1)
    {
        const TabMatch* first = list_.at(0);
        for (const auto& orig : snapshot_.original_items())
        {
            if (orig.pane_id == snapshot_.origin_pane() && first->pane_id == orig.pane_id
                && orig.active_item.lock() == first->item)
            {
                return 1;
            }
        }
    }
    return 0;
}

// ─── Selection / preview ─────────────────────────────────────────────────────

bool TabSwitcher::set_selected_index(size_t ix)
{
    if (state_ != SwitcherState::Active)
        return false;
    if (!list_.select(ix))
        return false;

    const TabMatch* m    = list_.at(ix);
    Pane*           pane = panes_.find_pane(m->pane_id);
    if (!pane)
    {
        TABSWITCH_LOG_DEBUG(log_category::Switcher, "preview skipped: pane {} is gone", m->pane_id);
        return true;
    }
    auto index = pane->index_for_item(m->item.get());
    if (!index)
    {
        TABSWITCH_LOG_DEBUG(log_category::Switcher,
                            "preview skipped: tab no longer in pane {}",
                            m->pane_id);
        return true;
    }
    pane->activate_item(*index, false, false);
    return true;
}

void TabSwitcher::cycle_selection(bool backwards)
{
    size_t n = list_.size();
    if (n == 0)
        return;
    size_t current = list_.selected().value_or(0);
    size_t next    = backwards ? (current + n - 1) % n : (current + 1) % n;
    set_selected_index(next);
}

// ─── Commit / restore ────────────────────────────────────────────────────────

void TabSwitcher::restore_original_items()
{
    for (const auto& orig : snapshot_.original_items())
    {
        Pane* pane = panes_.find_pane(orig.pane_id);
        if (!pane)
            continue;

        std::optional<size_t> index;
        if (auto item = orig.active_item.lock())
            index = pane->index_for_item(item.get());

        // The original tab was closed: fall back to the recorded position,
        // which is where the pane put its successor.
        if (!index)
        {
            if (pane->item_count() == 0)
                continue;
            index = std::min(orig.active_index, pane->item_count() - 1);
        }
        pane->activate_item(*index, false, false);
    }
}

bool TabSwitcher::confirm()
{
    if (state_ != SwitcherState::Active)
        return false;
    auto selected = list_.selected();
    if (!selected)
        return false;

    TabMatch chosen = *list_.at(*selected);

    restore_original_items();
    restored_ = true;
    state_    = SwitcherState::Confirmed;
    list_.cancel();

    Pane* pane = panes_.find_pane(chosen.pane_id);
    if (pane)
    {
        if (auto index = pane->index_for_item(chosen.item.get()))
        {
            pane->activate_item(*index, true, true);
        }
    }
    TABSWITCH_LOG_INFO(log_category::Switcher,
                       "confirmed '{}' in pane {}",
                       chosen.item ? chosen.item->tab_label(0) : std::string("?"),
                       chosen.pane_id);

    if (on_dismiss_)
        on_dismiss_();
    return true;
}

bool TabSwitcher::dismiss()
{
    if (restored_ || state_ != SwitcherState::Active)
        return false;

    restore_original_items();
    restored_ = true;
    state_    = SwitcherState::Dismissed;
    list_.cancel();
    TABSWITCH_LOG_INFO(log_category::Switcher, "dismissed");

    if (on_dismiss_)
        on_dismiss_();
    return true;
}

// ─── Close ───────────────────────────────────────────────────────────────────

bool TabSwitcher::close_item_at(size_t ix)
{
    if (state_ != SwitcherState::Active)
        return false;
    const TabMatch* m = list_.at(ix);
    if (!m)
        return false;

    if (Pane* pane = panes_.find_pane(m->pane_id))
    {
        if (auto index = pane->index_for_item(m->item.get()))
        {
            pane->close_item(*index);
        }
    }
    else
    {
        TABSWITCH_LOG_DEBUG(log_category::Switcher, "close: pane {} is gone", m->pane_id);
    }

    TABSWITCH_LOG_DEBUG(log_category::Switcher,
                        "closed '{}'",
                        m->item ? m->item->tab_label(0) : std::string("?"));
    list_.remove_at(ix);
    return true;
}

}   // namespace tabswitch
