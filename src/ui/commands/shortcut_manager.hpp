#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tabswitch
{

class CommandRegistry;

// Modifier flags (matching GLFW modifier bits)
enum class KeyMod : uint8_t
{
    None    = 0,
    Shift   = 0x01,
    Control = 0x02,
    Alt     = 0x04,
    Super   = 0x08,
};

inline KeyMod operator|(KeyMod a, KeyMod b)
{
    return static_cast<KeyMod>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}
inline KeyMod operator&(KeyMod a, KeyMod b)
{
    return static_cast<KeyMod>(static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}
inline bool has_mod(KeyMod mods, KeyMod flag)
{
    return (static_cast<uint8_t>(mods) & static_cast<uint8_t>(flag)) != 0;
}
inline KeyMod mods_from_glfw(int mods)
{
    return static_cast<KeyMod>(mods & 0x0F);
}

// GLFW key codes used by the default bindings and string conversion.
namespace keys
{
constexpr int KEY_SPACE         = 32;
constexpr int KEY_0             = 48;
constexpr int KEY_9             = 57;
constexpr int KEY_A             = 65;
constexpr int KEY_Z             = 90;
constexpr int KEY_ESCAPE        = 256;
constexpr int KEY_ENTER         = 257;
constexpr int KEY_TAB           = 258;
constexpr int KEY_BACKSPACE     = 259;
constexpr int KEY_DELETE        = 261;
constexpr int KEY_RIGHT         = 262;
constexpr int KEY_LEFT          = 263;
constexpr int KEY_DOWN          = 264;
constexpr int KEY_UP            = 265;
constexpr int KEY_PAGE_UP       = 266;
constexpr int KEY_PAGE_DOWN     = 267;
constexpr int KEY_HOME          = 268;
constexpr int KEY_END           = 269;
constexpr int KEY_F1            = 290;
constexpr int KEY_F12           = 301;
constexpr int KEY_LEFT_SHIFT    = 340;
constexpr int KEY_LEFT_CONTROL  = 341;
constexpr int KEY_LEFT_ALT      = 342;
constexpr int KEY_LEFT_SUPER    = 343;
constexpr int KEY_RIGHT_SHIFT   = 344;
constexpr int KEY_RIGHT_CONTROL = 345;
constexpr int KEY_RIGHT_ALT     = 346;
constexpr int KEY_RIGHT_SUPER   = 347;
}   // namespace keys

// Modifier flag carried by a modifier key itself, None for other keys.
inline KeyMod modifier_for_key(int key)
{
    switch (key)
    {
        case keys::KEY_LEFT_SHIFT:
        case keys::KEY_RIGHT_SHIFT:
            return KeyMod::Shift;
        case keys::KEY_LEFT_CONTROL:
        case keys::KEY_RIGHT_CONTROL:
            return KeyMod::Control;
        case keys::KEY_LEFT_ALT:
        case keys::KEY_RIGHT_ALT:
            return KeyMod::Alt;
        case keys::KEY_LEFT_SUPER:
        case keys::KEY_RIGHT_SUPER:
            return KeyMod::Super;
        default:
            return KeyMod::None;
    }
}

// A keyboard shortcut: key + modifiers.
struct Shortcut
{
    int    key  = 0;   // GLFW key code
    KeyMod mods = KeyMod::None;

    bool operator==(const Shortcut& o) const { return key == o.key && mods == o.mods; }
    bool operator!=(const Shortcut& o) const { return !(*this == o); }

    // Convert to human-readable string, e.g. "Ctrl+Tab"
    std::string to_string() const;

    // Parse from human-readable string. Returns empty shortcut on failure.
    static Shortcut from_string(const std::string& str);

    bool valid() const { return key != 0; }
};

struct ShortcutHash
{
    size_t operator()(const Shortcut& s) const
    {
        return std::hash<int>()(s.key) ^ (std::hash<uint8_t>()(static_cast<uint8_t>(s.mods)) << 16);
    }
};

struct ShortcutBinding
{
    Shortcut    shortcut;
    std::string command_id;
};

// Maps shortcuts to command ids and dispatches key presses.
// Thread-safe for bind/unbind. on_key should be called from the main thread.
class ShortcutManager
{
   public:
    using ModifierCallback = std::function<void(KeyMod)>;

    ShortcutManager()  = default;
    ~ShortcutManager() = default;

    ShortcutManager(const ShortcutManager&)            = delete;
    ShortcutManager& operator=(const ShortcutManager&) = delete;

    void             set_command_registry(CommandRegistry* registry) { registry_ = registry; }
    CommandRegistry* command_registry() const { return registry_; }

    // Bind a shortcut to a command id. Replaces existing binding for that shortcut.
    void bind(Shortcut shortcut, const std::string& command_id);
    void unbind(const Shortcut& shortcut);
    void unbind_command(const std::string& command_id);

    std::string command_for_shortcut(const Shortcut& shortcut) const;
    Shortcut    shortcut_for_command(const std::string& command_id) const;

    std::vector<ShortcutBinding> all_bindings() const;

    // Handle a key event. Returns true if a command was executed.
    // key: GLFW key code, action: GLFW_PRESS/RELEASE/REPEAT, mods: GLFW modifier bits.
    bool on_key(int key, int action, int mods);

    // Called from on_key with the modifiers held after every key event,
    // releases included, before any command runs.
    void set_on_modifiers_changed(ModifierCallback cb) { on_modifiers_ = std::move(cb); }

    // Modifiers held after a key event. GLFW may report a modifier key's own
    // bit stale on press/release, so that bit is derived from the action.
    static KeyMod held_after(int key, int action, int mods);

    // Tab switcher bindings. Also refreshes the shortcut labels shown in the
    // command registry, if one is set.
    void register_defaults();

    size_t count() const;
    void   clear();

   private:
    CommandRegistry*                                        registry_ = nullptr;
    mutable std::mutex                                      mutex_;
    std::unordered_map<Shortcut, std::string, ShortcutHash> bindings_;
    ModifierCallback                                        on_modifiers_;

    // GLFW_PRESS / GLFW_REPEAT without including GLFW.
    static constexpr int kGlfwRelease = 0;
    static constexpr int kGlfwPress   = 1;
    static constexpr int kGlfwRepeat  = 2;
};

}   // namespace tabswitch
