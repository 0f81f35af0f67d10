#pragma once

#ifdef TERMDECK_USE_IMGUI

    #include "ui/layout_engine.hpp"

struct ImDrawList;

namespace termdeck
{

class PointerCapture;
class WorkspaceController;
struct Panel;

// Draws one frame of the workspace with Dear ImGui and turns clicks into
// controller calls. Holds no model state of its own.
class WorkspaceRenderer
{
   public:
    // `capture` receives resize drags; may be null, in which case drags end
    // on the next frame without the button held.
    WorkspaceRenderer(WorkspaceController& controller, PointerCapture* capture);

    void draw(float width, float height);

   private:
    WorkspaceController& controller_;
    PointerCapture*      capture_ = nullptr;

    void draw_pinned_zone(const LayoutSnapshot& snapshot, ImDrawList* dl);
    void draw_notice(const LayoutSnapshot& snapshot, ImDrawList* dl);
    void draw_grid_pane(const GridPaneLayout& pane, ImDrawList* dl);
    void draw_session_tabs(const Panel& panel, const Rect& header, bool pinned);
    void draw_splitters(const LayoutSnapshot& snapshot, ImDrawList* dl);
    void draw_liveness_dot(const Panel& panel, float x, float y, ImDrawList* dl);
    void handle_drags(const LayoutSnapshot& snapshot);
};

}   // namespace termdeck

#endif   // TERMDECK_USE_IMGUI
