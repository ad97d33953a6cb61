#pragma once

#include <cstddef>
#include <string>

namespace tabswitch
{

enum class InitialSelection
{
    First,      // Most recently used tab
    Previous    // Second entry when the first is the current tab (alt-tab style)
};

// User-tunable switcher behavior, persisted as JSON.
struct SwitcherConfig
{
    static constexpr int CURRENT_VERSION = 1;

    std::string      placeholder                 = "Search all tabs\xE2\x80\xA6";
    std::string      no_matches                  = "No tabs";
    size_t           max_detail                  = 8;
    InitialSelection initial_selection           = InitialSelection::First;
    bool             confirm_on_modifier_release = true;
    size_t           max_results                 = 0;   // 0 = unlimited

    std::string serialize() const;

    // Missing keys keep their current values; unknown keys are ignored.
    // Returns false for empty input or a newer document version.
    bool deserialize(const std::string& json);

    bool save(const std::string& path) const;
    bool load(const std::string& path);

    // ~/.config/tabswitch/switcher.json
    static std::string default_path();

    static const char*                      selection_to_string(InitialSelection s);
    static bool                             selection_from_string(const std::string& s,
                                                                  InitialSelection&  out);
};

}   // namespace tabswitch
