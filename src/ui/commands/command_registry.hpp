#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tabswitch
{

// A single command that can be executed, searched, and bound to shortcuts.
struct Command
{
    std::string           id;         // Unique identifier, e.g. "tab_switcher.toggle"
    std::string           label;      // Display label, e.g. "Switch Tab"
    std::string           category;   // Category for grouping, e.g. "Tabs"
    std::string           shortcut;   // Human-readable shortcut, e.g. "Ctrl+Tab"
    std::function<void()> callback;
    bool                  enabled = true;
};

// Result from a fuzzy search query.
struct CommandSearchResult
{
    const Command* command = nullptr;
    int            score   = 0;   // Higher = better match
};

// Central registry for application commands.
// Thread-safe: register/unregister/search/execute may be called from any thread.
class CommandRegistry
{
   public:
    CommandRegistry()  = default;
    ~CommandRegistry() = default;

    CommandRegistry(const CommandRegistry&)            = delete;
    CommandRegistry& operator=(const CommandRegistry&) = delete;

    // Register a command. Overwrites if id already exists.
    void register_command(Command cmd);

    void register_command(const std::string&    id,
                          const std::string&    label,
                          std::function<void()> callback,
                          const std::string&    shortcut = "",
                          const std::string&    category = "General");

    void unregister_command(const std::string& id);

    // Execute a command by id. Returns false if not found, disabled, or if
    // the callback threw.
    bool execute(const std::string& id);

    // Fuzzy search over label and id. Empty query returns all commands
    // (sorted by category, then label).
    std::vector<CommandSearchResult> search(const std::string& query,
                                            size_t             max_results = 50) const;

    const Command* find(const std::string& id) const;

    std::vector<const Command*> all_commands() const;
    std::vector<const Command*> commands_in_category(const std::string& category) const;

    size_t count() const;

    void set_enabled(const std::string& id, bool enabled);

    // Keep the displayed shortcut in sync with the active binding.
    void set_shortcut_label(const std::string& id, const std::string& shortcut);

    void                        record_execution(const std::string& id);
    std::vector<const Command*> recent_commands(size_t max_count = 10) const;

   private:
    mutable std::mutex                       mutex_;
    std::unordered_map<std::string, Command> commands_;
    std::vector<std::string>                 recent_ids_;   // Most recent first
    static constexpr size_t                  MAX_RECENT = 20;
};

}   // namespace tabswitch
