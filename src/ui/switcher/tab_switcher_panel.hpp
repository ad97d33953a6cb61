#pragma once

#ifdef TABSWITCH_USE_IMGUI

    #include <string>

struct ImFont;

namespace tabswitch
{

class TabSwitcherModal;

// ImGui overlay for the tab switcher popup. Renders a centered search box
// above the match rows. Arrow keys navigate, Enter confirms, Escape cancels,
// and releasing the modifiers that opened the popup confirms. The modal only
// sees the modifiers held at open time if the host's key events reach it
// while closed, normally through the ShortcutManager passed to
// register_switcher_commands.
class TabSwitcherPanel
{
   public:
    explicit TabSwitcherPanel(TabSwitcherModal& modal) : modal_(modal) {}
    ~TabSwitcherPanel() = default;

    TabSwitcherPanel(const TabSwitcherPanel&)            = delete;
    TabSwitcherPanel& operator=(const TabSwitcherPanel&) = delete;

    // Draw the popup if the modal is open. Call each frame inside an ImGui
    // context. Returns true if the popup closed this frame.
    bool draw(float window_width, float window_height);

    void set_body_font(ImFont* font) { font_body_ = font; }

   private:
    // Returns true if an action closed the popup.
    bool handle_keyboard();
    bool draw_rows(float width);

    TabSwitcherModal& modal_;
    ImFont*           font_body_   = nullptr;
    bool              was_open_    = false;
    bool              focus_input_ = false;
    char              search_buf_[256] = {};

    static constexpr float PANEL_WIDTH     = 480.0f;
    static constexpr float PANEL_MAX_ROWS  = 12.0f;
    static constexpr float ROW_HEIGHT      = 26.0f;
    static constexpr float INPUT_HEIGHT    = 34.0f;
    static constexpr float CLOSE_BOX_SIZE  = 16.0f;
};

}   // namespace tabswitch

#endif   // TABSWITCH_USE_IMGUI
