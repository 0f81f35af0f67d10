#include "layout_engine.hpp"

#include <termdeck/logger.hpp>
#include <termdeck/preferences.hpp>

#include <algorithm>
#include <cmath>

#include "workspace/panel_store.hpp"

namespace termdeck
{

const SplitterRect* hit_splitter(const LayoutSnapshot& snapshot, float x, float y)
{
    for (const auto& s : snapshot.splitters)
    {
        if (s.bounds.contains(x, y))
            return &s;
    }
    return nullptr;
}

// ─── Preferences ─────────────────────────────────────────────────────────────

void LayoutEngine::attach_preferences(PreferenceStore* prefs)
{
    prefs_ = prefs;
    if (!prefs_)
        return;

    if (auto collapsed = prefs_->get_bool(pref_keys::PINNED_ZONE_COLLAPSED))
        pinned_collapsed_ = *collapsed;

    if (auto mode = prefs_->get_string(pref_keys::LAYOUT_MODE))
        layout_mode_ = split_direction_from_string(*mode);

    if (auto list = prefs_->get_list(pref_keys::PINNED_EXPANDED_PANELS))
    {
        expanded_   = std::set<PanelId>(list->begin(), list->end());
        seed_known_ = true;
        TERMDECK_LOG_DEBUG("layout", "Restored {} expanded pinned panels", expanded_.size());
    }
}

void LayoutEngine::persist_expanded()
{
    if (prefs_)
        prefs_->set_list(pref_keys::PINNED_EXPANDED_PANELS,
                         std::vector<std::string>(expanded_.begin(), expanded_.end()));
}

// ─── Reconciliation ──────────────────────────────────────────────────────────

bool LayoutEngine::sync(const PanelStore& store)
{
    std::set<PanelId> pinned;
    for (const Panel* p : store.pinned_panels())
        pinned.insert(p->id);

    // A restored expanded set already says what the user wants for the panels
    // pinned at startup; only later arrivals are auto-expanded.
    if (seed_known_)
    {
        known_pinned_ = pinned;
        seed_known_   = false;
    }

    bool changed = false;
    for (const auto& id : pinned)
    {
        if (known_pinned_.count(id) == 0 && expanded_.insert(id).second)
        {
            TERMDECK_LOG_DEBUG("layout", "Auto-expanding newly pinned panel {}", id);
            changed = true;
        }
    }

    for (auto it = expanded_.begin(); it != expanded_.end();)
    {
        if (pinned.count(*it) == 0)
        {
            it      = expanded_.erase(it);
            changed = true;
        }
        else
        {
            ++it;
        }
    }

    known_pinned_ = std::move(pinned);
    if (changed)
        persist_expanded();
    return changed;
}

// ─── State ───────────────────────────────────────────────────────────────────

void LayoutEngine::set_pinned_collapsed(bool collapsed)
{
    if (pinned_collapsed_ == collapsed)
        return;
    pinned_collapsed_ = collapsed;
    if (prefs_)
        prefs_->set_bool(pref_keys::PINNED_ZONE_COLLAPSED, collapsed);
}

bool LayoutEngine::is_panel_expanded(const PanelId& panel_id) const
{
    return expanded_.count(panel_id) != 0;
}

bool LayoutEngine::toggle_panel_expanded(const PanelId& panel_id)
{
    if (known_pinned_.count(panel_id) == 0)
    {
        TERMDECK_LOG_DEBUG("layout", "toggle_panel_expanded: {} is not pinned", panel_id);
        return false;
    }
    if (expanded_.erase(panel_id) == 0)
        expanded_.insert(panel_id);
    persist_expanded();
    return true;
}

void LayoutEngine::set_pinned_zone_width(float width)
{
    if (!std::isfinite(width))
        return;
    pinned_zone_width_ = std::clamp(width, PINNED_MIN_WIDTH, PINNED_MAX_WIDTH);
}

void LayoutEngine::set_layout_mode(SplitDirection mode)
{
    if (layout_mode_ == mode)
        return;
    layout_mode_ = mode;
    if (prefs_)
        prefs_->set_string(pref_keys::LAYOUT_MODE, std::string(to_string(mode)));
}

// ─── Compute ─────────────────────────────────────────────────────────────────

LayoutSnapshot LayoutEngine::compute(const PanelStore& store,
                                     float             window_width,
                                     float             window_height,
                                     std::string_view  notice) const
{
    LayoutSnapshot out;
    out.window = Rect{0.0f, 0.0f, std::max(0.0f, window_width), std::max(0.0f, window_height)};
    out.grid   = out.window;

    layout_pinned_zone(store, out);

    if (!notice.empty())
    {
        const float bar_h = std::min(NOTICE_HEIGHT, out.grid.h);
        out.notice        = std::string(notice);
        out.notice_bar    = Rect{out.grid.x, out.grid.y, out.grid.w, bar_h};
        out.grid.y += bar_h;
        out.grid.h -= bar_h;
    }

    layout_grid(store, out);
    return out;
}

void LayoutEngine::layout_pinned_zone(const PanelStore& store, LayoutSnapshot& out) const
{
    const auto pinned = store.pinned_panels();
    if (pinned.empty())
        return;

    const float w = out.window.w;
    const float h = out.window.h;

    out.pinned_title = pinned.size() > 1 ? "Pinned (" + std::to_string(pinned.size()) + ")" : "Pinned";

    if (pinned_collapsed_)
    {
        out.pinned_state  = PinnedZoneState::Collapsed;
        const float strip = std::min(PINNED_STRIP_WIDTH, w);
        out.pinned_zone   = Rect{0.0f, 0.0f, strip, h};
        out.pinned_header = Rect{0.0f, 0.0f, strip, std::min(PINNED_HEADER_HEIGHT, h)};

        float y = out.pinned_header.h + MARKER_SPACING;
        for (const Panel* p : pinned)
        {
            PinnedMarker m;
            m.panel_id            = p->id;
            const Session* active = p->active_session();
            m.tooltip             = active && !active->title.empty() ? active->title : "Shared";
            m.bounds              = Rect{(strip - MARKER_SIZE) * 0.5f, y, MARKER_SIZE, MARKER_SIZE};
            out.markers.push_back(std::move(m));
            y += MARKER_SIZE + MARKER_SPACING;
        }

        out.grid = Rect{strip, 0.0f, std::max(0.0f, w - strip), h};
        return;
    }

    out.pinned_state = PinnedZoneState::Expanded;

    // The grid keeps at least one minimum pane beside the zone.
    float zone_w = std::min(pinned_zone_width_, w - LayoutNode::MIN_PANE_SIZE - RESIZE_HANDLE_WIDTH);
    zone_w       = std::max(0.0f, zone_w);

    out.pinned_zone          = Rect{0.0f, 0.0f, zone_w, h};
    out.pinned_header        = Rect{0.0f, 0.0f, zone_w, std::min(PINNED_HEADER_HEIGHT, h)};
    out.pinned_resize_handle = Rect{zone_w, 0.0f, RESIZE_HANDLE_WIDTH, h};

    const float body_y = out.pinned_header.h;
    const float body_h = std::max(0.0f, h - body_y);

    size_t n_expanded = 0;
    for (const Panel* p : pinned)
    {
        if (is_panel_expanded(p->id))
            ++n_expanded;
    }

    // Expanded panels split whatever the collapsed headers leave; with none
    // expanded every panel sits at header height.
    float flex_h = 0.0f;
    if (n_expanded > 0)
    {
        const float fixed = static_cast<float>(pinned.size() - n_expanded) * PANE_HEADER_HEIGHT;
        flex_h            = std::max(PANE_HEADER_HEIGHT, (body_h - fixed) / static_cast<float>(n_expanded));
    }

    float y = body_y;
    for (const Panel* p : pinned)
    {
        PinnedPanelLayout pl;
        pl.panel_id = p->id;
        pl.expanded = is_panel_expanded(p->id);
        pl.flexed   = pl.expanded && n_expanded > 0;

        const float ph = pl.flexed ? flex_h : PANE_HEADER_HEIGHT;
        pl.bounds      = Rect{0.0f, y, zone_w, ph};
        pl.header      = Rect{0.0f, y, zone_w, std::min(PANE_HEADER_HEIGHT, ph)};
        out.pinned.push_back(std::move(pl));
        y += ph;
    }

    const float grid_x = zone_w + RESIZE_HANDLE_WIDTH;
    out.grid           = Rect{grid_x, 0.0f, std::max(0.0f, w - grid_x), h};
}

void LayoutEngine::layout_grid(const PanelStore& store, LayoutSnapshot& out) const
{
    TreeLayout tree = store.grid_layout().compute(out.grid);
    out.splitters   = std::move(tree.splitters);

    const auto& active = store.active_panel_id();
    out.grid_panes.reserve(tree.panes.size());
    for (auto& pane : tree.panes)
    {
        GridPaneLayout g;
        const float    header_h = std::min(PANE_HEADER_HEIGHT, pane.bounds.h);
        g.bounds                = pane.bounds;
        g.header                = Rect{pane.bounds.x, pane.bounds.y, pane.bounds.w, header_h};
        g.content = Rect{pane.bounds.x, pane.bounds.y + header_h, pane.bounds.w, pane.bounds.h - header_h};
        g.active   = active && *active == pane.panel_id;
        g.panel_id = std::move(pane.panel_id);
        out.grid_panes.push_back(std::move(g));
    }
}

}   // namespace termdeck
