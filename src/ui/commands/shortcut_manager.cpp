#include "shortcut_manager.hpp"

#include <cctype>
#include <cstdlib>
#include <sstream>
#include <tabswitch/logger.hpp>

#include "command_registry.hpp"

namespace tabswitch
{

// ─── Shortcut string conversion ──────────────────────────────────────────────

struct NamedKey
{
    int         key;
    const char* name;
};

static constexpr NamedKey kNamedKeys[] = {
    {keys::KEY_SPACE, "Space"},
    {keys::KEY_ESCAPE, "Escape"},
    {keys::KEY_ENTER, "Enter"},
    {keys::KEY_TAB, "Tab"},
    {keys::KEY_BACKSPACE, "Backspace"},
    {keys::KEY_DELETE, "Delete"},
    {keys::KEY_RIGHT, "Right"},
    {keys::KEY_LEFT, "Left"},
    {keys::KEY_DOWN, "Down"},
    {keys::KEY_UP, "Up"},
    {keys::KEY_PAGE_UP, "PageUp"},
    {keys::KEY_PAGE_DOWN, "PageDown"},
    {keys::KEY_HOME, "Home"},
    {keys::KEY_END, "End"},
};

static std::string lowercase(const std::string& s)
{
    std::string lower;
    lower.reserve(s.size());
    for (char c : s)
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return lower;
}

static std::string key_to_string(int key)
{
    using namespace keys;
    if ((key >= KEY_A && key <= KEY_Z) || (key >= KEY_0 && key <= KEY_9))
    {
        return std::string(1, static_cast<char>(key));
    }
    if (key >= KEY_F1 && key <= KEY_F12)
    {
        return "F" + std::to_string(key - KEY_F1 + 1);
    }
    for (const auto& nk : kNamedKeys)
    {
        if (nk.key == key)
            return nk.name;
    }
    return "Key" + std::to_string(key);
}

static int string_to_key(const std::string& str)
{
    using namespace keys;
    if (str.size() == 1)
    {
        char c = static_cast<char>(std::toupper(static_cast<unsigned char>(str[0])));
        if ((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9'))
            return c;
        return 0;
    }

    std::string lower = lowercase(str);
    for (const auto& nk : kNamedKeys)
    {
        if (lower == lowercase(nk.name))
            return nk.key;
    }
    if (lower == "esc")
        return KEY_ESCAPE;
    if (lower == "return")
        return KEY_ENTER;
    if (lower == "del")
        return KEY_DELETE;

    if (lower.size() >= 2 && lower[0] == 'f')
    {
        int n = std::atoi(lower.c_str() + 1);
        if (n >= 1 && n <= 12)
            return KEY_F1 + n - 1;
    }
    return 0;
}

std::string Shortcut::to_string() const
{
    std::string result;
    if (has_mod(mods, KeyMod::Control))
        result += "Ctrl+";
    if (has_mod(mods, KeyMod::Shift))
        result += "Shift+";
    if (has_mod(mods, KeyMod::Alt))
        result += "Alt+";
    if (has_mod(mods, KeyMod::Super))
        result += "Super+";
    result += key_to_string(key);
    return result;
}

Shortcut Shortcut::from_string(const std::string& str)
{
    Shortcut                 s;
    std::istringstream       iss(str);
    std::string              token;
    std::vector<std::string> parts;

    while (std::getline(iss, token, '+'))
    {
        while (!token.empty() && std::isspace(static_cast<unsigned char>(token.front())))
            token.erase(token.begin());
        while (!token.empty() && std::isspace(static_cast<unsigned char>(token.back())))
            token.pop_back();
        if (!token.empty())
            parts.push_back(token);
    }

    if (parts.empty())
        return s;

    // Last part is the key, everything before is modifiers
    for (size_t i = 0; i + 1 < parts.size(); ++i)
    {
        std::string lower = lowercase(parts[i]);
        if (lower == "ctrl" || lower == "control")
            s.mods = s.mods | KeyMod::Control;
        else if (lower == "shift")
            s.mods = s.mods | KeyMod::Shift;
        else if (lower == "alt")
            s.mods = s.mods | KeyMod::Alt;
        else if (lower == "super" || lower == "meta" || lower == "cmd")
            s.mods = s.mods | KeyMod::Super;
        else
            return {};
    }

    s.key = string_to_key(parts.back());
    if (!s.valid())
        return {};
    return s;
}

// ─── ShortcutManager ─────────────────────────────────────────────────────────

void ShortcutManager::bind(Shortcut shortcut, const std::string& command_id)
{
    if (!shortcut.valid())
        return;
    {
        std::lock_guard lock(mutex_);
        bindings_[shortcut] = command_id;
    }
    if (registry_)
        registry_->set_shortcut_label(command_id, shortcut.to_string());
}

void ShortcutManager::unbind(const Shortcut& shortcut)
{
    std::lock_guard lock(mutex_);
    bindings_.erase(shortcut);
}

void ShortcutManager::unbind_command(const std::string& command_id)
{
    {
        std::lock_guard lock(mutex_);
        std::erase_if(bindings_, [&](const auto& pair) { return pair.second == command_id; });
    }
    if (registry_)
        registry_->set_shortcut_label(command_id, "");
}

std::string ShortcutManager::command_for_shortcut(const Shortcut& shortcut) const
{
    std::lock_guard lock(mutex_);
    auto            it = bindings_.find(shortcut);
    return it != bindings_.end() ? it->second : "";
}

Shortcut ShortcutManager::shortcut_for_command(const std::string& command_id) const
{
    std::lock_guard lock(mutex_);
    for (const auto& [sc, id] : bindings_)
    {
        if (id == command_id)
            return sc;
    }
    return {};
}

std::vector<ShortcutBinding> ShortcutManager::all_bindings() const
{
    std::lock_guard              lock(mutex_);
    std::vector<ShortcutBinding> result;
    result.reserve(bindings_.size());
    for (const auto& [sc, id] : bindings_)
    {
        result.push_back({sc, id});
    }
    return result;
}

KeyMod ShortcutManager::held_after(int key, int action, int mods)
{
    KeyMod held = mods_from_glfw(mods);
    KeyMod own  = modifier_for_key(key);
    if (own == KeyMod::None)
        return held;
    if (action == kGlfwRelease)
        return static_cast<KeyMod>(static_cast<uint8_t>(held) & ~static_cast<uint8_t>(own));
    return held | own;
}

bool ShortcutManager::on_key(int key, int action, int mods)
{
    if (on_modifiers_)
        on_modifiers_(held_after(key, action, mods));

    // Repeats matter here: holding Ctrl+Tab keeps cycling the switcher.
    if (action != kGlfwPress && action != kGlfwRepeat)
        return false;
    if (!registry_)
        return false;

    Shortcut sc;
    sc.key  = key;
    sc.mods = mods_from_glfw(mods);

    std::string cmd_id;
    {
        std::lock_guard lock(mutex_);
        auto            it = bindings_.find(sc);
        if (it == bindings_.end())
            return false;
        cmd_id = it->second;
    }

    TABSWITCH_LOG_TRACE(log_category::Commands, "{} -> {}", sc.to_string(), cmd_id);
    return registry_->execute(cmd_id);
}

void ShortcutManager::register_defaults()
{
    using namespace keys;

    bind({KEY_TAB, KeyMod::Control}, "tab_switcher.toggle");
    bind({KEY_TAB, KeyMod::Control | KeyMod::Shift}, "tab_switcher.toggle_select_last");
    bind({KEY_TAB, KeyMod::Control | KeyMod::Alt}, "tab_switcher.toggle_all");
    bind({KEY_BACKSPACE, KeyMod::Control}, "tab_switcher.close_selected");
}

size_t ShortcutManager::count() const
{
    std::lock_guard lock(mutex_);
    return bindings_.size();
}

void ShortcutManager::clear()
{
    std::lock_guard lock(mutex_);
    bindings_.clear();
}

}   // namespace tabswitch
