#include "panel_store.hpp"

#include <termdeck/logger.hpp>

#include "workspace/workspace_file.hpp"

#include <algorithm>
#include <unordered_set>

namespace termdeck
{

// ─── Panel ───────────────────────────────────────────────────────────────────

const Session* Panel::find_session(const SessionId& session_id) const
{
    auto it = std::find_if(sessions.begin(),
                           sessions.end(),
                           [&](const Session& s) { return s.id == session_id; });
    return it != sessions.end() ? &*it : nullptr;
}

const Session* Panel::active_session() const
{
    return find_session(active_session_id);
}

// ─── PanelStore ──────────────────────────────────────────────────────────────

PanelStore::PanelStore() : PanelStore(Options{}) {}

PanelStore::PanelStore(Options options) : options_(std::move(options))
{
    if (!options_.ids)
        options_.ids = random_id;
    ensure_grid_not_empty();
}

std::string PanelStore::default_title_for(const std::optional<std::string>& command)
{
    if (command)
    {
        if (command->rfind("claude", 0) == 0)
            return "Claude Code";
        if (command->rfind("codex", 0) == 0)
            return "Codex";
    }
    return "Terminal";
}

Session PanelStore::make_session(std::string title, std::optional<std::string> command)
{
    Session s;
    s.id         = options_.ids();
    s.process_id = options_.ids();
    s.title      = std::move(title);
    s.command    = std::move(command);
    return s;
}

Panel PanelStore::make_panel(std::string title, std::optional<std::string> command)
{
    Panel p;
    p.id  = options_.ids();
    p.cwd = options_.default_cwd;
    p.sessions.push_back(make_session(std::move(title), std::move(command)));
    p.active_session_id = p.sessions.front().id;
    return p;
}

Panel* PanelStore::find_mutable(const PanelId& panel_id)
{
    auto it = std::find_if(panels_.begin(),
                           panels_.end(),
                           [&](const Panel& p) { return p.id == panel_id; });
    return it != panels_.end() ? &*it : nullptr;
}

const Panel* PanelStore::find_panel(const PanelId& panel_id) const
{
    return const_cast<PanelStore*>(this)->find_mutable(panel_id);
}

void PanelStore::release(std::vector<ProcessId> ids)
{
    if (ids.empty() || !on_released_)
        return;
    on_released_(ids);
}

void PanelStore::ensure_grid_not_empty()
{
    if (!grid_.empty())
        return;
    PanelId id = add_panel(options_.default_direction);
    TERMDECK_LOG_DEBUG("workspace", "Grid was empty, created panel {}", id);
}

void PanelStore::focus_first_grid_panel()
{
    auto order = grid_.panel_order();
    if (order.empty())
        active_panel_id_.reset();
    else
        active_panel_id_ = order.front();
}

// ── Panels ──────────────────────────────────────────────────────────────────

PanelId PanelStore::add_panel(SplitDirection direction, std::optional<std::string> command)
{
    // Title first: the command is moved into the panel below.
    std::string title = default_title_for(command);
    Panel       panel = make_panel(std::move(title), std::move(command));
    PanelId     id    = panel.id;

    if (grid_.empty())
    {
        grid_.append(id, direction);
    }
    else
    {
        PanelId target;
        if (active_panel_id_ && grid_.contains(*active_panel_id_))
            target = *active_panel_id_;
        else
            target = grid_.panel_order().back();
        grid_.split(target, direction, id);
    }

    panels_.push_back(std::move(panel));
    active_panel_id_ = id;
    return id;
}

std::optional<PanelId> PanelStore::split_panel(const PanelId&             target,
                                               SplitDirection             direction,
                                               std::optional<std::string> command)
{
    if (!grid_.contains(target))
    {
        TERMDECK_LOG_DEBUG("workspace", "split_panel: {} is not a grid panel", target);
        return std::nullopt;
    }

    std::string title = command ? default_title_for(command) : std::string(UNTITLED);
    Panel       panel = make_panel(std::move(title), std::move(command));
    PanelId     id    = panel.id;

    grid_.split(target, direction, id);
    panels_.push_back(std::move(panel));
    active_panel_id_ = id;
    return id;
}

bool PanelStore::close_panel(const PanelId& panel_id)
{
    // Callers may pass a reference into the panel being erased.
    const PanelId target = panel_id;

    auto it = std::find_if(panels_.begin(),
                           panels_.end(),
                           [&](const Panel& p) { return p.id == target; });
    if (it == panels_.end())
    {
        TERMDECK_LOG_DEBUG("workspace", "close_panel: unknown panel {}", target);
        return false;
    }

    std::vector<ProcessId> released;
    for (const auto& s : it->sessions)
        released.push_back(s.process_id);

    panels_.erase(it);
    grid_.remove(target);

    if (active_panel_id_ == target)
        focus_first_grid_panel();

    release(std::move(released));
    ensure_grid_not_empty();
    return true;
}

bool PanelStore::toggle_shared(const PanelId& panel_id)
{
    Panel* panel = find_mutable(panel_id);
    if (!panel)
    {
        TERMDECK_LOG_DEBUG("workspace", "toggle_shared: unknown panel {}", panel_id);
        return false;
    }

    panel->is_shared = !panel->is_shared;
    if (panel->is_shared)
        grid_.remove(panel_id);
    else
        grid_.append(panel_id, options_.default_direction);

    ensure_grid_not_empty();
    return true;
}

bool PanelStore::focus_panel(const PanelId& panel_id)
{
    if (!find_panel(panel_id))
        return false;
    active_panel_id_ = panel_id;
    return true;
}

std::optional<ProcessId> PanelStore::reload_panel(const PanelId& panel_id)
{
    Panel* panel = find_mutable(panel_id);
    if (!panel)
        return std::nullopt;

    auto it = std::find_if(panel->sessions.begin(),
                           panel->sessions.end(),
                           [&](const Session& s) { return s.id == panel->active_session_id; });
    if (it == panel->sessions.end())
        return std::nullopt;

    ProcessId old_id = it->process_id;
    it->process_id   = options_.ids();
    ProcessId new_id = it->process_id;

    TERMDECK_LOG_INFO("workspace", "Reloaded panel {}: process {} -> {}", panel_id, old_id, new_id);
    release({old_id});
    return new_id;
}

// ── Sessions ────────────────────────────────────────────────────────────────

std::optional<SessionId> PanelStore::add_session(const PanelId& panel_id)
{
    Panel* panel = find_mutable(panel_id);
    if (!panel)
    {
        TERMDECK_LOG_DEBUG("workspace", "add_session: unknown panel {}", panel_id);
        return std::nullopt;
    }

    Session   session = make_session(UNTITLED, std::nullopt);
    SessionId id      = session.id;
    panel->sessions.push_back(std::move(session));
    panel->active_session_id = id;
    active_panel_id_         = panel_id;
    return id;
}

bool PanelStore::close_session(const PanelId& panel_id, const SessionId& session_id)
{
    Panel* panel = find_mutable(panel_id);
    if (!panel)
        return false;

    auto it = std::find_if(panel->sessions.begin(),
                           panel->sessions.end(),
                           [&](const Session& s) { return s.id == session_id; });
    if (it == panel->sessions.end())
    {
        TERMDECK_LOG_DEBUG("workspace", "close_session: {} not in panel {}", session_id, panel_id);
        return false;
    }

    const size_t index     = static_cast<size_t>(it - panel->sessions.begin());
    const bool   was_active = panel->active_session_id == session_id;
    ProcessId    released   = it->process_id;
    panel->sessions.erase(it);

    if (panel->sessions.empty())
    {
        // The panel goes with its last session.
        release({released});
        return close_panel(panel_id);
    }

    if (was_active)
    {
        // Prefer the next session in order, else the previous one.
        size_t next              = index < panel->sessions.size() ? index : index - 1;
        panel->active_session_id = panel->sessions[next].id;
    }
    active_panel_id_ = panel_id;

    release({released});
    return true;
}

bool PanelStore::select_session(const PanelId& panel_id, const SessionId& session_id)
{
    Panel* panel = find_mutable(panel_id);
    if (!panel || !panel->find_session(session_id))
        return false;
    panel->active_session_id = session_id;
    return true;
}

bool PanelStore::rename_session(const PanelId&   panel_id,
                                const SessionId& session_id,
                                std::string      title)
{
    Panel* panel = find_mutable(panel_id);
    if (!panel)
        return false;
    for (auto& s : panel->sessions)
    {
        if (s.id == session_id)
        {
            s.title = std::move(title);
            return true;
        }
    }
    return false;
}

bool PanelStore::set_split_ratio(LayoutNode::NodeId node_id, float ratio)
{
    return grid_.set_ratio(node_id, ratio);
}

// ── Queries ─────────────────────────────────────────────────────────────────

std::vector<const Panel*> PanelStore::grid_panels() const
{
    std::vector<const Panel*> out;
    for (const auto& id : grid_.panel_order())
    {
        if (const Panel* p = find_panel(id))
            out.push_back(p);
    }
    return out;
}

std::vector<const Panel*> PanelStore::pinned_panels() const
{
    std::vector<const Panel*> out;
    for (const auto& p : panels_)
    {
        if (p.is_shared)
            out.push_back(&p);
    }
    return out;
}

size_t PanelStore::grid_panel_count() const
{
    return grid_.size();
}

size_t PanelStore::pinned_panel_count() const
{
    return static_cast<size_t>(
        std::count_if(panels_.begin(), panels_.end(), [](const Panel& p) { return p.is_shared; }));
}

std::vector<ProcessId> PanelStore::process_ids() const
{
    std::vector<ProcessId> out;
    for (const auto& p : panels_)
    {
        for (const auto& s : p.sessions)
            out.push_back(s.process_id);
    }
    return out;
}

bool PanelStore::validate() const
{
    std::unordered_set<PanelId> grid_ids;
    for (const auto& id : grid_.panel_order())
        grid_ids.insert(id);

    size_t grid_count = 0;
    for (const auto& p : panels_)
    {
        if (p.sessions.empty() || !p.find_session(p.active_session_id))
            return false;
        if (p.is_shared == (grid_ids.count(p.id) > 0))
            return false;   // pinned panel in the tree, or grid panel missing from it
        if (!p.is_shared)
            ++grid_count;
    }
    if (grid_count != grid_ids.size() || grid_count == 0)
        return false;
    if (active_panel_id_ && !find_panel(*active_panel_id_))
        return false;
    return true;
}

// ── Persistence ─────────────────────────────────────────────────────────────

WorkspaceData PanelStore::capture() const
{
    WorkspaceData data;
    for (const auto& p : panels_)
    {
        WorkspaceData::PanelState ps;
        ps.id                = p.id;
        ps.cwd               = p.cwd;
        ps.is_shared         = p.is_shared;
        ps.active_session_id = p.active_session_id;
        for (const auto& s : p.sessions)
            ps.sessions.push_back({s.id, s.process_id, s.title, s.command});
        data.panels.push_back(std::move(ps));
    }
    data.active_panel_id = active_panel_id_.value_or(std::string{});
    data.grid_layout     = grid_.to_json();
    return data;
}

size_t PanelStore::restore(const WorkspaceData& data)
{
    std::vector<Panel>          panels;
    std::unordered_set<PanelId> seen;

    for (const auto& ps : data.panels)
    {
        if (ps.id.empty() || !seen.insert(ps.id).second)
            continue;

        Panel p;
        p.id        = ps.id;
        p.cwd       = ps.cwd.empty() ? options_.default_cwd : ps.cwd;
        p.is_shared = ps.is_shared;
        for (const auto& ss : ps.sessions)
        {
            if (ss.id.empty() || p.find_session(ss.id))
                continue;
            Session s;
            s.id         = ss.id;
            s.process_id = ss.process_id.empty() ? options_.ids() : ss.process_id;
            s.title      = ss.title.empty() ? std::string(UNTITLED) : ss.title;
            s.command    = ss.command;
            p.sessions.push_back(std::move(s));
        }
        if (p.sessions.empty())
        {
            TERMDECK_LOG_WARN("workspace", "Dropping restored panel {} without sessions", ps.id);
            continue;
        }
        p.active_session_id =
            p.find_session(ps.active_session_id) ? ps.active_session_id : p.sessions.front().id;
        panels.push_back(std::move(p));
    }

    LayoutTree grid;
    if (!grid.from_json(data.grid_layout))
        TERMDECK_LOG_WARN("workspace", "Ignoring malformed grid layout");

    // Drop leaves that do not name a restored grid panel.
    for (const auto& id : grid.panel_order())
    {
        auto it = std::find_if(panels.begin(),
                               panels.end(),
                               [&](const Panel& p) { return p.id == id; });
        if (it == panels.end() || it->is_shared)
            grid.remove(id);
    }
    // Grid panels the tree does not know about go to the end.
    for (const auto& p : panels)
    {
        if (!p.is_shared && !grid.contains(p.id))
            grid.append(p.id, options_.default_direction);
    }

    panels_ = std::move(panels);
    grid_   = std::move(grid);

    active_panel_id_.reset();
    if (!data.active_panel_id.empty() && find_panel(data.active_panel_id))
        active_panel_id_ = data.active_panel_id;
    else
        focus_first_grid_panel();

    const size_t kept = panels_.size();
    TERMDECK_LOG_INFO("workspace", "Restored {} panels ({} pinned)", kept, pinned_panel_count());
    ensure_grid_not_empty();
    return kept;
}

}   // namespace termdeck
