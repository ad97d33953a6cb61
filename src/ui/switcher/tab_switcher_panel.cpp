#ifdef TABSWITCH_USE_IMGUI

    #include "tab_switcher_panel.hpp"

    #include <algorithm>
    #include <imgui.h>

    #include "tab_switcher_modal.hpp"

namespace tabswitch
{

namespace
{

KeyMod current_mods()
{
    const ImGuiIO& io   = ImGui::GetIO();
    KeyMod         mods = KeyMod::None;
    if (io.KeyShift)
        mods = mods | KeyMod::Shift;
    if (io.KeyCtrl)
        mods = mods | KeyMod::Control;
    if (io.KeyAlt)
        mods = mods | KeyMod::Alt;
    if (io.KeySuper)
        mods = mods | KeyMod::Super;
    return mods;
}

ImU32 style_color(ImGuiCol idx, float alpha_scale = 1.0f)
{
    ImVec4 c = ImGui::GetStyle().Colors[idx];
    c.w *= alpha_scale;
    return ImGui::ColorConvertFloat4ToU32(c);
}

}   // namespace

// ─── Keyboard ────────────────────────────────────────────────────────────────

bool TabSwitcherPanel::handle_keyboard()
{
    if (ImGui::IsKeyPressed(ImGuiKey_Escape))
    {
        modal_.dismiss();
        return true;
    }
    if (ImGui::IsKeyPressed(ImGuiKey_UpArrow))
        modal_.select_prev();
    if (ImGui::IsKeyPressed(ImGuiKey_DownArrow))
        modal_.select_next();
    if (ImGui::IsKeyPressed(ImGuiKey_Enter) || ImGui::IsKeyPressed(ImGuiKey_KeypadEnter))
    {
        modal_.confirm();
        return !modal_.is_open();
    }

    modal_.on_modifiers_changed(current_mods());
    return !modal_.is_open();
}

// ─── Rows ────────────────────────────────────────────────────────────────────

bool TabSwitcherPanel::draw_rows(float width)
{
    TabSwitcher* switcher = modal_.switcher();
    if (!switcher)
        return true;

    ImDrawList* dl = ImGui::GetWindowDrawList();

    if (switcher->match_count() == 0)
    {
        ImGui::PushStyleColor(ImGuiCol_Text, ImGui::GetStyle().Colors[ImGuiCol_TextDisabled]);
        ImGui::TextUnformatted(switcher->no_matches_text().c_str());
        ImGui::PopStyleColor();
        return false;
    }

    for (size_t i = 0; i < switcher->match_count(); ++i)
    {
        auto row = switcher->row(i);
        if (!row)
            continue;

        ImVec2 pos = ImGui::GetCursorScreenPos();
        ImGui::PushID(static_cast<int>(i));
        bool clicked = ImGui::InvisibleButton("##row", ImVec2(width, ROW_HEIGHT));
        bool hovered = ImGui::IsItemHovered();
        ImGui::PopID();

        if (row->selected)
        {
            dl->AddRectFilled(ImVec2(pos.x + 2, pos.y + 1),
                              ImVec2(pos.x + width - 2, pos.y + ROW_HEIGHT - 1),
                              style_color(ImGuiCol_Header),
                              4.0f);
        }
        else if (hovered)
        {
            dl->AddRectFilled(ImVec2(pos.x + 2, pos.y + 1),
                              ImVec2(pos.x + width - 2, pos.y + ROW_HEIGHT - 1),
                              style_color(ImGuiCol_HeaderHovered, 0.5f),
                              4.0f);
        }

        float text_y = pos.y + (ROW_HEIGHT - ImGui::GetTextLineHeight()) * 0.5f;
        dl->AddText(ImVec2(pos.x + 10.0f, text_y),
                    style_color(row->preview ? ImGuiCol_TextDisabled : ImGuiCol_Text),
                    row->label.c_str());

        // Close box on the right; a dot instead while the item is dirty.
        ImVec2 box_min(pos.x + width - CLOSE_BOX_SIZE - 8.0f,
                       pos.y + (ROW_HEIGHT - CLOSE_BOX_SIZE) * 0.5f);
        ImVec2 box_max(box_min.x + CLOSE_BOX_SIZE, box_min.y + CLOSE_BOX_SIZE);
        bool   over_close = ImGui::IsMouseHoveringRect(box_min, box_max);
        bool   show_close = row->close_visible(hovered);

        if (row->indicator_visible(hovered))
        {
            ImVec2 c((box_min.x + box_max.x) * 0.5f, (box_min.y + box_max.y) * 0.5f);
            dl->AddCircleFilled(c, 3.5f, style_color(ImGuiCol_Text));
        }
        else if (show_close)
        {
            ImU32  col = style_color(over_close ? ImGuiCol_Text : ImGuiCol_TextDisabled);
            float  pad = 4.0f;
            dl->AddLine(ImVec2(box_min.x + pad, box_min.y + pad),
                        ImVec2(box_max.x - pad, box_max.y - pad),
                        col,
                        1.5f);
            dl->AddLine(ImVec2(box_max.x - pad, box_min.y + pad),
                        ImVec2(box_min.x + pad, box_max.y - pad),
                        col,
                        1.5f);
        }

        if (clicked)
        {
            if (over_close && show_close)
            {
                switcher->close_item_at(i);
                return false;   // Rows shifted; redraw next frame.
            }
            switcher->set_selected_index(i);
            modal_.confirm();
            return !modal_.is_open();
        }
    }
    return false;
}

// ─── Draw ────────────────────────────────────────────────────────────────────

bool TabSwitcherPanel::draw(float window_width, float window_height)
{
    if (!modal_.is_open())
    {
        bool closed = was_open_;
        was_open_   = false;
        return closed;
    }

    if (!was_open_)
    {
        was_open_      = true;
        focus_input_   = true;
        search_buf_[0] = '\0';
    }

    TabSwitcher* switcher = modal_.switcher();
    float        rows     = std::clamp(static_cast<float>(switcher->match_count()), 1.0f, PANEL_MAX_ROWS);
    float        panel_h  = INPUT_HEIGHT + rows * ROW_HEIGHT + ImGui::GetStyle().WindowPadding.y * 3;
    float        panel_x  = (window_width - PANEL_WIDTH) * 0.5f;
    float        panel_y  = window_height * 0.2f;

    ImGui::SetNextWindowPos(ImVec2(panel_x, panel_y));
    ImGui::SetNextWindowSize(ImVec2(PANEL_WIDTH, panel_h));
    ImGui::SetNextWindowFocus();

    ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove
                             | ImGuiWindowFlags_NoSavedSettings;

    bool closed = false;
    if (ImGui::Begin("##tab_switcher", nullptr, flags))
    {
        if (focus_input_)
        {
            ImGui::SetKeyboardFocusHere();
            focus_input_ = false;
        }

        if (font_body_)
            ImGui::PushFont(font_body_);

        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::InputTextWithHint("##tab_switcher_query",
                                     switcher->placeholder_text().c_str(),
                                     search_buf_,
                                     sizeof(search_buf_)))
        {
            modal_.set_query(search_buf_);
        }

        closed = handle_keyboard();
        if (!closed)
        {
            ImGui::Separator();
            closed = draw_rows(ImGui::GetContentRegionAvail().x);
        }

        if (font_body_)
            ImGui::PopFont();
    }
    ImGui::End();

    if (closed)
        was_open_ = false;
    return closed;
}

}   // namespace tabswitch

#endif   // TABSWITCH_USE_IMGUI
