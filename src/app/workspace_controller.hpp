#pragma once

#include <termdeck/catalog.hpp>
#include <termdeck/preferences.hpp>
#include <termdeck/process_backend.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "app/queued_collaborators.hpp"
#include "core/command_queue.hpp"
#include "nav/navigation_history.hpp"
#include "session/liveness_tracker.hpp"
#include "ui/layout_engine.hpp"
#include "ui/resize_controller.hpp"
#include "workspace/panel_store.hpp"
#include "workspace/workspace_file.hpp"

namespace termdeck
{

// Workspace-level orchestration.
//
// Owns the panel model, the layout state, the liveness tracker, navigation
// history and the pinned-zone width controller, and borrows the external
// collaborators. Every mutating call runs synchronously on the UI thread and
// then commits: layout re-sync, tracked-set re-sync, workspace save, change
// notification.
class WorkspaceController
{
   public:
    using ChangeCallback = std::function<void()>;

    struct Options
    {
        // Workspace file; empty disables workspace persistence.
        std::string workspace_path = WorkspaceFile::default_path();
        // Seeds navigation history; detail paths start a catalog lookup.
        std::string initial_location = "/workspace";
        // Route completions through the command queue (drained by pump()).
        // Needed whenever a collaborator calls back from another thread.
        bool marshal_completions = true;
        // Ring size of the completion queue; completions beyond it wait in
        // the queue's overflow list.
        size_t queue_capacity = CommandQueue::DEFAULT_CAPACITY;

        PanelStore::Options store;
    };

    WorkspaceController(ProcessBackend& backend, CatalogService& catalog, PreferenceStore& prefs);
    WorkspaceController(ProcessBackend&  backend,
                        CatalogService&  catalog,
                        PreferenceStore& prefs,
                        Options          options);
    ~WorkspaceController();

    WorkspaceController(const WorkspaceController&)            = delete;
    WorkspaceController& operator=(const WorkspaceController&) = delete;

    // Load workspace and preferences, start liveness, start hydration.
    void mount();
    // Release the exit subscription and save. Safe to call twice.
    void unmount();
    bool is_mounted() const { return mounted_; }

    // Run queued completions. Call once per frame on the UI thread.
    size_t pump();

    // ── Panels ──────────────────────────────────────────────────────────

    PanelId                  add_panel(std::optional<std::string> command = std::nullopt);
    std::optional<PanelId>   split_panel(const PanelId&             target,
                                         SplitDirection             direction,
                                         std::optional<std::string> command = std::nullopt);
    bool                     close_panel(const PanelId& panel_id);
    bool                     toggle_shared(const PanelId& panel_id);
    bool                     focus_panel(const PanelId& panel_id);
    std::optional<ProcessId> reload_panel(const PanelId& panel_id);

    // ── Sessions ────────────────────────────────────────────────────────

    std::optional<SessionId> add_session(const PanelId& panel_id);
    bool close_session(const PanelId& panel_id, const SessionId& session_id);
    bool select_session(const PanelId& panel_id, const SessionId& session_id);
    bool rename_session(const PanelId& panel_id, const SessionId& session_id, std::string title);

    // ── Layout ──────────────────────────────────────────────────────────

    // Also fits the pinned-width drag range to the window, so the grid keeps
    // room for one minimum pane beside the zone.
    LayoutSnapshot layout(float window_width, float window_height);

    SplitDirection layout_mode() const { return engine_.layout_mode(); }
    void           set_layout_mode(SplitDirection mode);

    void toggle_pinned_collapsed();
    bool toggle_panel_expanded(const PanelId& panel_id);

    // Pinned zone width drag. Forward move/up events yourself when no
    // capture is given.
    void begin_pinned_resize(float x, float y, PointerCapture* capture = nullptr);
    void update_pinned_resize(float x, float y);
    void end_pinned_resize();

    // Splitter drag. The ratio is written live; the workspace is saved when
    // the drag ends.
    bool begin_splitter_drag(const SplitterRect& splitter, float x, float y, PointerCapture* capture = nullptr);
    void update_splitter_drag(float x, float y);
    void end_splitter_drag();
    bool is_splitter_dragging() const { return splitter_drag_ && splitter_drag_->is_dragging(); }

    // ── Liveness ────────────────────────────────────────────────────────

    std::optional<bool> is_running(const ProcessId& id) const { return tracker_.is_running(id); }
    void                refresh_liveness() { tracker_.refresh(); }

    // ── Navigation ──────────────────────────────────────────────────────

    void navigate(NavigationEntry entry) { history_.push(std::move(entry)); }
    bool back() { return history_.back(); }
    bool forward() { return history_.forward(); }
    // Hides the "not found" bar left by a failed detail lookup.
    void dismiss_hydration_message();

    // ── Accessors ───────────────────────────────────────────────────────

    const PanelStore&             store() const { return store_; }
    const LayoutEngine&           layout_engine() const { return engine_; }
    const ProcessLivenessTracker& liveness() const { return tracker_; }
    NavigationHistory&            history() { return history_; }
    const NavigationHistory&      history() const { return history_; }
    const ResizeController&       pinned_width() const { return pinned_width_; }

    bool save_workspace() const;

    void set_on_change(ChangeCallback cb) { on_change_ = std::move(cb); }

   private:
    Options          options_;
    ProcessBackend&  backend_;
    CatalogService&  catalog_;
    PreferenceStore& prefs_;

    std::shared_ptr<CommandQueue> queue_;
    QueuedProcessBackend          queued_backend_;
    QueuedCatalogService          queued_catalog_;

    PanelStore             store_;
    LayoutEngine           engine_;
    ProcessLivenessTracker tracker_;
    NavigationHistory      history_;
    ResizeController       pinned_width_;

    std::unique_ptr<ResizeController> splitter_drag_;
    LayoutNode::NodeId                splitter_node_ = 0;

    std::optional<PanelId> persisted_active_;
    bool                   mounted_ = false;

    ChangeCallback on_change_;

    ProcessBackend& effective_backend();
    CatalogService& effective_catalog();

    void on_processes_released(const std::vector<ProcessId>& ids);
    void persist_active_panel();
    void commit();
    void notify();
};

}   // namespace termdeck
