#pragma once

#include <termdeck/types.hpp>

#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "workspace/layout_tree.hpp"

namespace termdeck
{

class PanelStore;
class PreferenceStore;

enum class PinnedZoneState
{
    Hidden,      // no pinned panels
    Collapsed,   // narrow strip with one marker per panel
    Expanded
};

struct PinnedMarker
{
    PanelId     panel_id;
    std::string tooltip;   // active session title, "Shared" if none
    Rect        bounds;
};

struct PinnedPanelLayout
{
    PanelId panel_id;
    Rect    bounds;
    Rect    header;
    bool    expanded = false;
    bool    flexed   = false;   // shares the leftover height
};

struct GridPaneLayout
{
    PanelId panel_id;
    Rect    bounds;
    Rect    header;    // session tabs
    Rect    content;   // terminal area
    bool    active = false;
};

// Everything a renderer needs for one frame.
struct LayoutSnapshot
{
    Rect window;

    PinnedZoneState                pinned_state = PinnedZoneState::Hidden;
    Rect                           pinned_zone;
    Rect                           pinned_header;
    Rect                           pinned_resize_handle;
    std::string                    pinned_title;
    std::vector<PinnedMarker>      markers;   // collapsed state only
    std::vector<PinnedPanelLayout> pinned;    // expanded state only

    // One-line message over the grid, e.g. a detail view that failed to
    // load. Empty text means no bar and the grid starts at the top.
    std::string notice;
    Rect        notice_bar;

    Rect                        grid;
    std::vector<GridPaneLayout> grid_panes;
    std::vector<SplitterRect>   splitters;
};

const SplitterRect* hit_splitter(const LayoutSnapshot& snapshot, float x, float y);

// Zone-based layout for the workspace window.
//
// Owns the presentation-only state: pinned zone collapsed/expanded, the
// per-panel expanded set, the zone width and the grid orientation. Reads
// PanelStore but never writes it.
class LayoutEngine
{
   public:
    LayoutEngine() = default;

    LayoutEngine(const LayoutEngine&)            = delete;
    LayoutEngine& operator=(const LayoutEngine&) = delete;

    // Prefs are read now and written on every later change. May be null.
    // The zone width is not among them: its owner pushes it through
    // set_pinned_zone_width().
    void attach_preferences(PreferenceStore* prefs);

    // Reconcile with the committed model: newly pinned panels join the
    // expanded set, ids no longer pinned leave it. Returns true if the
    // expanded set changed.
    bool sync(const PanelStore& store);

    LayoutSnapshot compute(const PanelStore& store,
                           float             window_width,
                           float             window_height,
                           std::string_view  notice = {}) const;

    // ── Pinned zone ─────────────────────────────────────────────────────

    bool is_pinned_collapsed() const { return pinned_collapsed_; }
    void set_pinned_collapsed(bool collapsed);
    void toggle_pinned_collapsed() { set_pinned_collapsed(!pinned_collapsed_); }

    bool                     is_panel_expanded(const PanelId& panel_id) const;
    bool                     toggle_panel_expanded(const PanelId& panel_id);
    const std::set<PanelId>& expanded_panels() const { return expanded_; }

    float pinned_zone_width() const { return pinned_zone_width_; }
    void  set_pinned_zone_width(float width);

    // ── Grid ────────────────────────────────────────────────────────────

    SplitDirection layout_mode() const { return layout_mode_; }
    void           set_layout_mode(SplitDirection mode);

    // ── Constants ────────────────────────────────────────────────────────

    static constexpr float PINNED_DEFAULT_WIDTH  = 360.0f;
    static constexpr float PINNED_MIN_WIDTH      = 240.0f;
    static constexpr float PINNED_MAX_WIDTH      = 720.0f;
    static constexpr float PINNED_STRIP_WIDTH    = 36.0f;
    static constexpr float PINNED_HEADER_HEIGHT  = 32.0f;
    static constexpr float PANE_HEADER_HEIGHT    = 30.0f;
    static constexpr float RESIZE_HANDLE_WIDTH   = 6.0f;
    static constexpr float MARKER_SIZE           = 24.0f;
    static constexpr float MARKER_SPACING        = 4.0f;
    static constexpr float NOTICE_HEIGHT         = 26.0f;

   private:
    PreferenceStore* prefs_ = nullptr;

    bool              pinned_collapsed_  = false;
    std::set<PanelId> expanded_;
    std::set<PanelId> known_pinned_;
    bool              seed_known_       = false;   // expanded set came from prefs
    float             pinned_zone_width_ = PINNED_DEFAULT_WIDTH;
    SplitDirection    layout_mode_       = SplitDirection::Horizontal;

    void persist_expanded();

    void layout_pinned_zone(const PanelStore& store, LayoutSnapshot& out) const;
    void layout_grid(const PanelStore& store, LayoutSnapshot& out) const;
};

}   // namespace termdeck
