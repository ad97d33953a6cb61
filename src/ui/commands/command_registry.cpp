#include "command_registry.hpp"

#include <algorithm>
#include <exception>
#include <tabswitch/logger.hpp>

#include "ui/switcher/fuzzy_matcher.hpp"

namespace tabswitch
{

// ─── Registration ────────────────────────────────────────────────────────────

void CommandRegistry::register_command(Command cmd)
{
    std::lock_guard lock(mutex_);
    commands_[cmd.id] = std::move(cmd);
}

void CommandRegistry::register_command(const std::string&    id,
                                       const std::string&    label,
                                       std::function<void()> callback,
                                       const std::string&    shortcut,
                                       const std::string&    category)
{
    Command cmd;
    cmd.id       = id;
    cmd.label    = label;
    cmd.callback = std::move(callback);
    cmd.shortcut = shortcut;
    cmd.category = category;
    register_command(std::move(cmd));
}

void CommandRegistry::unregister_command(const std::string& id)
{
    std::lock_guard lock(mutex_);
    commands_.erase(id);
}

// ─── Execution ───────────────────────────────────────────────────────────────

bool CommandRegistry::execute(const std::string& id)
{
    std::function<void()> cb;
    {
        std::lock_guard lock(mutex_);
        auto            it = commands_.find(id);
        if (it == commands_.end() || !it->second.enabled || !it->second.callback)
        {
            return false;
        }
        cb = it->second.callback;
    }

    // Execute outside the lock so callbacks may use the registry
    try
    {
        cb();
    }
    catch (const std::exception& e)
    {
        TABSWITCH_LOG_ERROR(log_category::Commands, "command '{}' failed: {}", id, e.what());
        return false;
    }
    record_execution(id);
    return true;
}

// ─── Search ──────────────────────────────────────────────────────────────────

std::vector<CommandSearchResult> CommandRegistry::search(const std::string& query,
                                                         size_t             max_results) const
{
    std::lock_guard                  lock(mutex_);
    std::vector<CommandSearchResult> results;
    results.reserve(commands_.size());

    for (const auto& [id, cmd] : commands_)
    {
        int label_score = DefaultFuzzyMatcher::fuzzy_score(query, cmd.label);
        int id_score    = DefaultFuzzyMatcher::fuzzy_score(query, cmd.id);
        int best        = std::max(label_score, id_score);
        if (best > 0)
        {
            results.push_back({&cmd, best});
        }
    }

    std::sort(results.begin(),
              results.end(),
              [](const CommandSearchResult& a, const CommandSearchResult& b)
              {
                  if (a.score != b.score)
                      return a.score > b.score;
                  if (a.command->category != b.command->category)
                      return a.command->category < b.command->category;
                  return a.command->label < b.command->label;
              });

    if (results.size() > max_results)
    {
        results.resize(max_results);
    }
    return results;
}

// ─── Queries ─────────────────────────────────────────────────────────────────

const Command* CommandRegistry::find(const std::string& id) const
{
    std::lock_guard lock(mutex_);
    auto            it = commands_.find(id);
    return it != commands_.end() ? &it->second : nullptr;
}

std::vector<const Command*> CommandRegistry::all_commands() const
{
    std::lock_guard             lock(mutex_);
    std::vector<const Command*> result;
    result.reserve(commands_.size());
    for (const auto& [id, cmd] : commands_)
    {
        result.push_back(&cmd);
    }
    std::sort(result.begin(),
              result.end(),
              [](const Command* a, const Command* b)
              {
                  if (a->category != b->category)
                      return a->category < b->category;
                  return a->label < b->label;
              });
    return result;
}

std::vector<const Command*> CommandRegistry::commands_in_category(const std::string& category) const
{
    std::lock_guard             lock(mutex_);
    std::vector<const Command*> result;
    for (const auto& [id, cmd] : commands_)
    {
        if (cmd.category == category)
        {
            result.push_back(&cmd);
        }
    }
    std::sort(result.begin(),
              result.end(),
              [](const Command* a, const Command* b) { return a->label < b->label; });
    return result;
}

size_t CommandRegistry::count() const
{
    std::lock_guard lock(mutex_);
    return commands_.size();
}

void CommandRegistry::set_enabled(const std::string& id, bool enabled)
{
    std::lock_guard lock(mutex_);
    auto            it = commands_.find(id);
    if (it != commands_.end())
    {
        it->second.enabled = enabled;
    }
}

void CommandRegistry::set_shortcut_label(const std::string& id, const std::string& shortcut)
{
    std::lock_guard lock(mutex_);
    auto            it = commands_.find(id);
    if (it != commands_.end())
    {
        it->second.shortcut = shortcut;
    }
}

// ─── Recent commands ─────────────────────────────────────────────────────────

void CommandRegistry::record_execution(const std::string& id)
{
    std::lock_guard lock(mutex_);
    std::erase(recent_ids_, id);
    recent_ids_.insert(recent_ids_.begin(), id);
    if (recent_ids_.size() > MAX_RECENT)
    {
        recent_ids_.resize(MAX_RECENT);
    }
}

std::vector<const Command*> CommandRegistry::recent_commands(size_t max_count) const
{
    std::lock_guard             lock(mutex_);
    std::vector<const Command*> result;
    for (const auto& id : recent_ids_)
    {
        if (result.size() >= max_count)
            break;
        auto it = commands_.find(id);
        if (it != commands_.end())
        {
            result.push_back(&it->second);
        }
    }
    return result;
}

}   // namespace tabswitch
