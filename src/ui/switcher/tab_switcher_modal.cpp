#include "tab_switcher_modal.hpp"

#include <tabswitch/logger.hpp>

namespace tabswitch
{

TabSwitcherModal::TabSwitcherModal(PaneLookup& panes, SwitcherConfig config)
    : panes_(panes), config_(std::move(config))
{
}

TabSwitcherModal::~TabSwitcherModal()
{
    // Losing the host counts as a dismissal: never leave a preview behind.
    if (switcher_)
        switcher_->dismiss();
}

void TabSwitcherModal::set_matcher(const FuzzyMatcher* matcher)
{
    matcher_ = matcher ? matcher : &default_matcher_;
}

// ─── Toggle actions ──────────────────────────────────────────────────────────

void TabSwitcherModal::toggle(bool select_last)
{
    if (switcher_)
    {
        switcher_->cycle_selection(select_last);
        return;
    }
    open(PaneScope::CurrentPane, select_last);
}

void TabSwitcherModal::toggle_all()
{
    if (switcher_)
    {
        switcher_->cycle_selection(false);
        return;
    }
    open(PaneScope::AllPanes, false);
}

void TabSwitcherModal::open(PaneScope scope, bool select_last)
{
    query_.clear();
    finished_  = false;
    init_mods_ = held_mods_;
    switcher_  = std::make_unique<TabSwitcher>(panes_, *matcher_, scope, select_last, config_, scheduler_);
    switcher_->set_on_dismiss([this]() { finished_ = true; });
}

// Destroying the switcher from inside its own dismiss callback would pull the
// object out from under the running member function, so teardown happens
// here, after the call has returned.
void TabSwitcherModal::close_if_finished()
{
    if (!switcher_ || !finished_)
        return;
    switcher_.reset();
    query_.clear();
    init_mods_ = KeyMod::None;
    finished_  = false;
    if (on_closed_)
        on_closed_();
}

// ─── List widget input ───────────────────────────────────────────────────────

void TabSwitcherModal::set_query(const std::string& query)
{
    if (!switcher_ || query == query_)
        return;
    query_ = query;
    switcher_->update_matches(query);
}

void TabSwitcherModal::select_next()
{
    if (!switcher_ || switcher_->match_count() == 0)
        return;
    size_t current = switcher_->selected_index().value_or(0);
    if (current + 1 < switcher_->match_count())
        switcher_->set_selected_index(current + 1);
}

void TabSwitcherModal::select_prev()
{
    if (!switcher_ || switcher_->match_count() == 0)
        return;
    size_t current = switcher_->selected_index().value_or(0);
    if (current > 0)
        switcher_->set_selected_index(current - 1);
}

bool TabSwitcherModal::confirm()
{
    if (!switcher_)
        return false;
    bool confirmed = switcher_->confirm();
    close_if_finished();
    return confirmed;
}

void TabSwitcherModal::dismiss()
{
    if (!switcher_)
        return;
    switcher_->dismiss();
    close_if_finished();
}

bool TabSwitcherModal::close_selected()
{
    if (!switcher_)
        return false;
    auto selected = switcher_->selected_index();
    if (!selected)
        return false;
    return switcher_->close_item_at(*selected);
}

bool TabSwitcherModal::handle_key(int key)
{
    if (!switcher_)
        return false;

    switch (key)
    {
        case keys::KEY_ESCAPE:
            dismiss();
            return true;
        case keys::KEY_ENTER:
            confirm();
            return true;
        case keys::KEY_UP:
            select_prev();
            return true;
        case keys::KEY_DOWN:
            select_next();
            return true;
        default:
            return false;
    }
}

void TabSwitcherModal::on_modifiers_changed(KeyMod mods)
{
    held_mods_ = mods;
    if (!switcher_ || !config_.confirm_on_modifier_release)
        return;
    if (init_mods_ == KeyMod::None)
        return;
    if ((mods & init_mods_) != KeyMod::None)
        return;

    TABSWITCH_LOG_DEBUG(log_category::Switcher, "modifiers released, confirming");
    if (!confirm())
    {
        // Nothing to confirm (empty list): just close.
        dismiss();
    }
}

}   // namespace tabswitch
