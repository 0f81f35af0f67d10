#pragma once

#include <termdeck/types.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "core/ids.hpp"
#include "workspace/layout_tree.hpp"

namespace termdeck
{

struct WorkspaceData;

struct Session
{
    SessionId                  id;
    ProcessId                  process_id;
    std::string                title;
    std::optional<std::string> command;
};

struct Panel
{
    PanelId              id;
    std::vector<Session> sessions;
    SessionId            active_session_id;
    bool                 is_shared = false;
    std::string          cwd;

    const Session* find_session(const SessionId& session_id) const;
    const Session* active_session() const;
};

// Sole writer of the panel/session tree.
//
// Non-shared panels are the grid, laid out by the split tree; shared panels
// form the pinned zone. Every grid panel has exactly one leaf in the tree.
// The grid is never left empty: whenever it would be, a default panel is
// created in the same call.
//
// Operations naming an unknown panel or session do nothing and report it
// through their return value.
class PanelStore
{
   public:
    using ProcessesReleasedCallback = std::function<void(const std::vector<ProcessId>&)>;

    struct Options
    {
        std::string    default_cwd;
        SplitDirection default_direction = SplitDirection::Horizontal;
        IdGenerator    ids;   // random_id() when empty
    };

    PanelStore();
    explicit PanelStore(Options options);

    PanelStore(const PanelStore&)            = delete;
    PanelStore& operator=(const PanelStore&) = delete;

    // ── Panels ──────────────────────────────────────────────────────────

    // Split the active grid panel (else the last grid panel, else start the
    // grid) and put a new single-session panel beside it. The session title
    // comes from `command`.
    PanelId add_panel(SplitDirection direction, std::optional<std::string> command = std::nullopt);

    // Split a specific grid panel. The new panel becomes active.
    std::optional<PanelId> split_panel(const PanelId&             target,
                                       SplitDirection             direction,
                                       std::optional<std::string> command = std::nullopt);

    bool close_panel(const PanelId& panel_id);
    bool toggle_shared(const PanelId& panel_id);
    bool focus_panel(const PanelId& panel_id);

    // Assigns a fresh process id to the panel's active session; the old one is
    // released. Returns the new process id.
    std::optional<ProcessId> reload_panel(const PanelId& panel_id);

    // ── Sessions ────────────────────────────────────────────────────────

    std::optional<SessionId> add_session(const PanelId& panel_id);
    bool close_session(const PanelId& panel_id, const SessionId& session_id);
    bool select_session(const PanelId& panel_id, const SessionId& session_id);
    bool rename_session(const PanelId& panel_id, const SessionId& session_id, std::string title);

    // ── Grid ────────────────────────────────────────────────────────────

    const LayoutTree& grid_layout() const { return grid_; }
    bool              set_split_ratio(LayoutNode::NodeId node_id, float ratio);

    SplitDirection default_direction() const { return options_.default_direction; }
    void           set_default_direction(SplitDirection dir) { options_.default_direction = dir; }

    // ── Queries ─────────────────────────────────────────────────────────

    const std::vector<Panel>& panels() const { return panels_; }
    const Panel*              find_panel(const PanelId& panel_id) const;

    // Grid panels in split-tree leaf order.
    std::vector<const Panel*> grid_panels() const;
    // Pinned panels in creation order.
    std::vector<const Panel*> pinned_panels() const;

    size_t grid_panel_count() const;
    size_t pinned_panel_count() const;

    const std::optional<PanelId>& active_panel_id() const { return active_panel_id_; }

    // Every backend process id currently owned by a session.
    std::vector<ProcessId> process_ids() const;

    // True if every structural invariant holds.
    bool validate() const;

    // ── Persistence ─────────────────────────────────────────────────────

    WorkspaceData capture() const;

    // Replaces the whole model. Invalid entries (panels without sessions,
    // dangling active ids, tree leaves naming unknown panels) are repaired or
    // dropped. Returns the number of panels kept.
    size_t restore(const WorkspaceData& data);

    void set_on_processes_released(ProcessesReleasedCallback cb) { on_released_ = std::move(cb); }

    static std::string default_title_for(const std::optional<std::string>& command);
    static constexpr const char* UNTITLED = "Untitled";

   private:
    Options                   options_;
    std::vector<Panel>        panels_;
    LayoutTree                grid_;
    std::optional<PanelId>    active_panel_id_;
    ProcessesReleasedCallback on_released_;

    Panel*  find_mutable(const PanelId& panel_id);
    Panel   make_panel(std::string title, std::optional<std::string> command);
    Session make_session(std::string title, std::optional<std::string> command);
    void    ensure_grid_not_empty();
    void    focus_first_grid_panel();
    void    release(std::vector<ProcessId> ids);
};

}   // namespace termdeck
