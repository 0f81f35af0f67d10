#ifdef TERMDECK_USE_IMGUI

    #include "workspace_renderer.hpp"

    #include <imgui.h>

    #include <string>
    #include <vector>

    #include "app/workspace_controller.hpp"

namespace termdeck
{

namespace
{

constexpr ImU32 COLOR_FRAME        = IM_COL32(60, 64, 72, 255);
constexpr ImU32 COLOR_FRAME_ACTIVE = IM_COL32(90, 140, 230, 255);
constexpr ImU32 COLOR_HEADER       = IM_COL32(36, 38, 44, 255);
constexpr ImU32 COLOR_CONTENT      = IM_COL32(20, 21, 24, 255);
constexpr ImU32 COLOR_SPLITTER     = IM_COL32(48, 50, 56, 255);
constexpr ImU32 COLOR_SPLITTER_HOT = IM_COL32(90, 140, 230, 255);
constexpr ImU32 COLOR_ALIVE        = IM_COL32(80, 200, 120, 255);
constexpr ImU32 COLOR_DEAD         = IM_COL32(220, 80, 80, 255);
constexpr ImU32 COLOR_UNKNOWN      = IM_COL32(130, 130, 130, 255);
constexpr ImU32 COLOR_NOTICE       = IM_COL32(92, 64, 28, 255);

ImVec2 top_left(const Rect& r)
{
    return ImVec2(r.x, r.y);
}

ImVec2 bottom_right(const Rect& r)
{
    return ImVec2(r.x + r.w, r.y + r.h);
}

}   // namespace

WorkspaceRenderer::WorkspaceRenderer(WorkspaceController& controller, PointerCapture* capture)
    : controller_(controller), capture_(capture)
{
}

void WorkspaceRenderer::draw(float width, float height)
{
    const LayoutSnapshot snapshot = controller_.layout(width, height);

    ImGui::SetNextWindowPos(ImVec2(0.0f, 0.0f));
    ImGui::SetNextWindowSize(ImVec2(width, height));
    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(0.0f, 0.0f));
    ImGui::Begin("##workspace",
                 nullptr,
                 ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove
                     | ImGuiWindowFlags_NoBringToFrontOnFocus | ImGuiWindowFlags_NoSavedSettings);

    ImDrawList* dl = ImGui::GetWindowDrawList();

    draw_pinned_zone(snapshot, dl);
    draw_notice(snapshot, dl);
    for (const auto& pane : snapshot.grid_panes)
        draw_grid_pane(pane, dl);
    draw_splitters(snapshot, dl);
    handle_drags(snapshot);

    ImGui::End();
    ImGui::PopStyleVar();
}

// ─── Pinned zone ─────────────────────────────────────────────────────────────

void WorkspaceRenderer::draw_pinned_zone(const LayoutSnapshot& snapshot, ImDrawList* dl)
{
    if (snapshot.pinned_state == PinnedZoneState::Hidden)
        return;

    const PanelStore& store = controller_.store();
    dl->AddRectFilled(top_left(snapshot.pinned_zone), bottom_right(snapshot.pinned_zone), COLOR_CONTENT);
    dl->AddRectFilled(top_left(snapshot.pinned_header), bottom_right(snapshot.pinned_header), COLOR_HEADER);

    ImGui::PushID("pinned");

    if (snapshot.pinned_state == PinnedZoneState::Collapsed)
    {
        ImGui::SetCursorScreenPos(top_left(snapshot.pinned_header));
        if (ImGui::Button(">", ImVec2(snapshot.pinned_header.w, snapshot.pinned_header.h)))
            controller_.toggle_pinned_collapsed();

        for (const auto& marker : snapshot.markers)
        {
            ImGui::PushID(marker.panel_id.c_str());
            ImGui::SetCursorScreenPos(top_left(marker.bounds));
            if (ImGui::Button("##marker", ImVec2(marker.bounds.w, marker.bounds.h)))
                controller_.toggle_pinned_collapsed();
            if (ImGui::IsItemHovered())
                ImGui::SetTooltip("%s", marker.tooltip.c_str());
            if (const Panel* panel = store.find_panel(marker.panel_id))
                draw_liveness_dot(*panel,
                                  marker.bounds.x + marker.bounds.w * 0.5f,
                                  marker.bounds.y + marker.bounds.h * 0.5f,
                                  dl);
            ImGui::PopID();
        }
        ImGui::PopID();
        return;
    }

    ImGui::SetCursorScreenPos(ImVec2(snapshot.pinned_header.x + 8.0f, snapshot.pinned_header.y + 6.0f));
    ImGui::TextUnformatted(snapshot.pinned_title.c_str());
    ImGui::SetCursorScreenPos(
        ImVec2(snapshot.pinned_header.x + snapshot.pinned_header.w - 28.0f, snapshot.pinned_header.y + 4.0f));
    if (ImGui::SmallButton("<"))
        controller_.toggle_pinned_collapsed();

    for (const auto& pl : snapshot.pinned)
    {
        const Panel* panel = store.find_panel(pl.panel_id);
        if (!panel)
            continue;

        ImGui::PushID(pl.panel_id.c_str());
        dl->AddRect(top_left(pl.bounds), bottom_right(pl.bounds), COLOR_FRAME);
        dl->AddRectFilled(top_left(pl.header), bottom_right(pl.header), COLOR_HEADER);

        ImGui::SetCursorScreenPos(ImVec2(pl.header.x + 4.0f, pl.header.y + 4.0f));
        if (ImGui::SmallButton(pl.expanded ? "v" : ">"))
            controller_.toggle_panel_expanded(pl.panel_id);
        ImGui::SameLine();
        draw_session_tabs(*panel, pl.header, true);
        ImGui::PopID();
    }

    const Rect& handle = snapshot.pinned_resize_handle;
    const bool  hot    = handle.contains(ImGui::GetIO().MousePos.x, ImGui::GetIO().MousePos.y)
                     || controller_.pinned_width().is_dragging();
    dl->AddRectFilled(top_left(handle), bottom_right(handle), hot ? COLOR_SPLITTER_HOT : COLOR_SPLITTER);

    ImGui::PopID();
}

// ─── Notice ──────────────────────────────────────────────────────────────────

void WorkspaceRenderer::draw_notice(const LayoutSnapshot& snapshot, ImDrawList* dl)
{
    const Rect& bar = snapshot.notice_bar;
    if (snapshot.notice.empty() || bar.h <= 0.0f)
        return;

    dl->AddRectFilled(top_left(bar), bottom_right(bar), COLOR_NOTICE);
    dl->AddText(ImVec2(bar.x + 8.0f, bar.y + (bar.h - ImGui::GetFontSize()) * 0.5f),
                IM_COL32(240, 220, 190, 255),
                snapshot.notice.c_str());

    ImGui::PushID("notice");
    ImGui::SetCursorScreenPos(ImVec2(bar.x + bar.w - 24.0f, bar.y + 4.0f));
    if (ImGui::SmallButton("x"))
        controller_.dismiss_hydration_message();
    ImGui::PopID();
}

// ─── Grid ────────────────────────────────────────────────────────────────────

void WorkspaceRenderer::draw_grid_pane(const GridPaneLayout& pane, ImDrawList* dl)
{
    const Panel* panel = controller_.store().find_panel(pane.panel_id);
    if (!panel)
        return;

    ImGui::PushID(pane.panel_id.c_str());

    dl->AddRectFilled(top_left(pane.content), bottom_right(pane.content), COLOR_CONTENT);
    dl->AddRectFilled(top_left(pane.header), bottom_right(pane.header), COLOR_HEADER);
    dl->AddRect(top_left(pane.bounds), bottom_right(pane.bounds), pane.active ? COLOR_FRAME_ACTIVE : COLOR_FRAME);

    ImGui::SetCursorScreenPos(ImVec2(pane.header.x + 4.0f, pane.header.y + 4.0f));
    draw_session_tabs(*panel, pane.header, false);

    // The tab buttons may have closed or moved the panel.
    panel = controller_.store().find_panel(pane.panel_id);

    // Terminal content is rendered elsewhere; show which process backs it.
    if (const Session* active = panel ? panel->active_session() : nullptr)
    {
        ImGui::SetCursorScreenPos(ImVec2(pane.content.x + 8.0f, pane.content.y + 8.0f));
        ImGui::TextDisabled("%s  [%s]", active->title.c_str(), active->process_id.c_str());
    }

    // Clicking anywhere in the content focuses the panel.
    ImGui::SetCursorScreenPos(top_left(pane.content));
    if (pane.content.w > 0.0f && pane.content.h > 0.0f
        && ImGui::InvisibleButton("##content", ImVec2(pane.content.w, pane.content.h)) && !pane.active)
        controller_.focus_panel(pane.panel_id);

    ImGui::PopID();
}

void WorkspaceRenderer::draw_session_tabs(const Panel& panel, const Rect& header, bool pinned)
{
    ImDrawList* dl = ImGui::GetWindowDrawList();

    // Copy ids: every button below may mutate the panel.
    const PanelId panel_id = panel.id;
    struct Tab
    {
        SessionId id;
        std::string title;
        bool        active;
    };
    std::vector<Tab> tabs;
    for (const auto& s : panel.sessions)
        tabs.push_back({s.id, s.title, s.id == panel.active_session_id});

    draw_liveness_dot(panel, ImGui::GetCursorScreenPos().x + 6.0f, header.y + header.h * 0.5f, dl);
    ImGui::SetCursorScreenPos(ImVec2(ImGui::GetCursorScreenPos().x + 14.0f, ImGui::GetCursorScreenPos().y));

    for (const auto& tab : tabs)
    {
        ImGui::PushID(tab.id.c_str());
        if (tab.active)
            ImGui::PushStyleColor(ImGuiCol_Button, ImGui::GetStyleColorVec4(ImGuiCol_ButtonActive));
        if (ImGui::SmallButton(tab.title.c_str()))
            controller_.select_session(panel_id, tab.id);
        if (tab.active)
            ImGui::PopStyleColor();
        ImGui::SameLine(0.0f, 2.0f);
        if (ImGui::SmallButton("x"))
            controller_.close_session(panel_id, tab.id);
        ImGui::SameLine();
        ImGui::PopID();
    }

    if (ImGui::SmallButton("+"))
        controller_.add_session(panel_id);

    // Panel actions, right-aligned.
    const float actions_w = pinned ? 90.0f : 150.0f;
    ImGui::SameLine();
    ImGui::SetCursorScreenPos(ImVec2(header.x + header.w - actions_w, header.y + 4.0f));
    if (!pinned)
    {
        if (ImGui::SmallButton("|"))
            controller_.split_panel(panel_id, SplitDirection::Horizontal);
        ImGui::SameLine();
        if (ImGui::SmallButton("-"))
            controller_.split_panel(panel_id, SplitDirection::Vertical);
        ImGui::SameLine();
    }
    if (ImGui::SmallButton(pinned ? "Unpin" : "Pin"))
    {
        controller_.toggle_shared(panel_id);
        return;
    }
    ImGui::SameLine();
    if (ImGui::SmallButton("R"))
        controller_.reload_panel(panel_id);
    ImGui::SameLine();
    if (ImGui::SmallButton("X"))
        controller_.close_panel(panel_id);
}

void WorkspaceRenderer::draw_liveness_dot(const Panel& panel, float x, float y, ImDrawList* dl)
{
    ImU32 color = COLOR_UNKNOWN;
    if (const Session* active = panel.active_session())
    {
        if (auto running = controller_.is_running(active->process_id))
            color = *running ? COLOR_ALIVE : COLOR_DEAD;
    }
    dl->AddCircleFilled(ImVec2(x, y), 4.0f, color);
}

// ─── Drags ───────────────────────────────────────────────────────────────────

void WorkspaceRenderer::draw_splitters(const LayoutSnapshot& snapshot, ImDrawList* dl)
{
    const ImVec2 mouse = ImGui::GetIO().MousePos;
    for (const auto& s : snapshot.splitters)
    {
        const bool hot = s.bounds.contains(mouse.x, mouse.y);
        dl->AddRectFilled(top_left(s.bounds), bottom_right(s.bounds), hot ? COLOR_SPLITTER_HOT : COLOR_SPLITTER);
        if (hot)
            ImGui::SetMouseCursor(s.direction == SplitDirection::Horizontal ? ImGuiMouseCursor_ResizeEW
                                                                            : ImGuiMouseCursor_ResizeNS);
    }
}

void WorkspaceRenderer::handle_drags(const LayoutSnapshot& snapshot)
{
    const ImGuiIO& io = ImGui::GetIO();

    // Without a window-level capture the view forwards the events itself.
    if (!capture_)
    {
        if (controller_.is_splitter_dragging())
        {
            if (io.MouseDown[0])
                controller_.update_splitter_drag(io.MousePos.x, io.MousePos.y);
            else
                controller_.end_splitter_drag();
        }
        if (controller_.pinned_width().is_dragging())
        {
            if (io.MouseDown[0])
                controller_.update_pinned_resize(io.MousePos.x, io.MousePos.y);
            else
                controller_.end_pinned_resize();
        }
    }

    if (!ImGui::IsMouseClicked(ImGuiMouseButton_Left))
        return;

    if (const SplitterRect* s = hit_splitter(snapshot, io.MousePos.x, io.MousePos.y))
    {
        controller_.begin_splitter_drag(*s, io.MousePos.x, io.MousePos.y, capture_);
        return;
    }
    if (snapshot.pinned_state == PinnedZoneState::Expanded
        && snapshot.pinned_resize_handle.contains(io.MousePos.x, io.MousePos.y))
    {
        controller_.begin_pinned_resize(io.MousePos.x, io.MousePos.y, capture_);
    }
}

}   // namespace termdeck

#endif   // TERMDECK_USE_IMGUI
