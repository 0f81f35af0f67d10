#include "workspace_controller.hpp"

#include <termdeck/logger.hpp>

#include <algorithm>
#include <exception>

namespace termdeck
{

namespace
{

ResizeConfig pinned_width_config()
{
    ResizeConfig cfg;
    cfg.direction     = SplitDirection::Horizontal;
    cfg.mode          = ResizeMode::Absolute;
    cfg.default_value = LayoutEngine::PINNED_DEFAULT_WIDTH;
    cfg.min_value     = LayoutEngine::PINNED_MIN_WIDTH;
    cfg.max_value     = LayoutEngine::PINNED_MAX_WIDTH;
    cfg.storage_key   = std::string(pref_keys::PINNED_ZONE_WIDTH);
    return cfg;
}

}   // namespace

WorkspaceController::WorkspaceController(ProcessBackend&  backend,
                                         CatalogService&  catalog,
                                         PreferenceStore& prefs)
    : WorkspaceController(backend, catalog, prefs, Options{})
{
}

WorkspaceController::WorkspaceController(ProcessBackend&  backend,
                                         CatalogService&  catalog,
                                         PreferenceStore& prefs,
                                         Options          options)
    : options_(std::move(options)),
      backend_(backend),
      catalog_(catalog),
      prefs_(prefs),
      queue_(std::make_shared<CommandQueue>(options_.queue_capacity)),
      queued_backend_(backend, queue_),
      queued_catalog_(catalog, queue_),
      store_(options_.store),
      tracker_(effective_backend()),
      history_(std::string_view(options_.initial_location)),
      pinned_width_(pinned_width_config(), &prefs)
{
    store_.set_on_processes_released([this](const std::vector<ProcessId>& ids)
                                     { on_processes_released(ids); });
    tracker_.set_on_change([this](const ProcessLivenessTracker::LivenessMap&) { notify(); });
    history_.set_on_change([this]() { notify(); });
    pinned_width_.set_on_change(
        [this](float width)
        {
            engine_.set_pinned_zone_width(width);
            notify();
        });
    engine_.set_pinned_zone_width(pinned_width_.value());
}

WorkspaceController::~WorkspaceController()
{
    unmount();
    // Collaborators may still hold the queue and report later.
    if (const size_t released = queue_->close())
        TERMDECK_LOG_DEBUG("app", "Released {} undelivered completions", released);
}

ProcessBackend& WorkspaceController::effective_backend()
{
    if (options_.marshal_completions)
        return queued_backend_;
    return backend_;
}

CatalogService& WorkspaceController::effective_catalog()
{
    if (options_.marshal_completions)
        return queued_catalog_;
    return catalog_;
}

// ─── Lifecycle ───────────────────────────────────────────────────────────────

void WorkspaceController::mount()
{
    if (mounted_)
        return;
    mounted_ = true;

    if (!options_.workspace_path.empty())
    {
        WorkspaceData data;
        if (WorkspaceFile::load(options_.workspace_path, data))
            store_.restore(data);
        else
            TERMDECK_LOG_DEBUG("app", "No usable workspace at {}, starting fresh", options_.workspace_path);
    }

    engine_.attach_preferences(&prefs_);
    store_.set_default_direction(engine_.layout_mode());

    if (auto active = prefs_.get_string(pref_keys::ACTIVE_PANEL_ID))
    {
        if (store_.find_panel(*active))
            store_.focus_panel(*active);
    }

    tracker_.start();
    commit();

    history_.hydrate(parse_location(options_.initial_location), effective_catalog());
    TERMDECK_LOG_INFO("app",
                      "Workspace mounted: {} grid, {} pinned",
                      store_.grid_panel_count(),
                      store_.pinned_panel_count());
}

void WorkspaceController::unmount()
{
    if (!mounted_)
        return;
    mounted_ = false;

    pinned_width_.end_gesture();
    if (splitter_drag_)
        splitter_drag_->end_gesture();
    splitter_drag_.reset();

    tracker_.stop();
    save_workspace();
    TERMDECK_LOG_DEBUG("app", "Workspace unmounted");
}

size_t WorkspaceController::pump()
{
    return queue_->drain();
}

// ─── Commit ──────────────────────────────────────────────────────────────────

bool WorkspaceController::save_workspace() const
{
    if (options_.workspace_path.empty())
        return true;
    if (WorkspaceFile::save(options_.workspace_path, store_.capture()))
        return true;
    TERMDECK_LOG_WARN("app", "Failed to save workspace to {}", options_.workspace_path);
    return false;
}

void WorkspaceController::persist_active_panel()
{
    const auto& active = store_.active_panel_id();
    if (active == persisted_active_)
        return;
    persisted_active_ = active;
    if (active)
        prefs_.set_string(pref_keys::ACTIVE_PANEL_ID, *active);
    else
        prefs_.remove(pref_keys::ACTIVE_PANEL_ID);
}

void WorkspaceController::commit()
{
    engine_.sync(store_);
    tracker_.set_tracked(store_.process_ids());
    persist_active_panel();
    if (mounted_)
        save_workspace();
    notify();
}

void WorkspaceController::notify()
{
    if (on_change_)
        on_change_();
}

void WorkspaceController::on_processes_released(const std::vector<ProcessId>& ids)
{
    for (const auto& id : ids)
    {
        try
        {
            backend_.terminate(id);
            backend_.purge_scrollback(id);
        }
        catch (const std::exception& e)
        {
            TERMDECK_LOG_WARN("app", "Teardown of process {} failed: {}", id, e.what());
        }
    }
}

// ─── Panels ──────────────────────────────────────────────────────────────────

PanelId WorkspaceController::add_panel(std::optional<std::string> command)
{
    PanelId id = store_.add_panel(engine_.layout_mode(), std::move(command));
    commit();
    return id;
}

std::optional<PanelId> WorkspaceController::split_panel(const PanelId&             target,
                                                        SplitDirection             direction,
                                                        std::optional<std::string> command)
{
    auto id = store_.split_panel(target, direction, std::move(command));
    if (id)
        commit();
    return id;
}

bool WorkspaceController::close_panel(const PanelId& panel_id)
{
    if (!store_.close_panel(panel_id))
        return false;
    commit();
    return true;
}

bool WorkspaceController::toggle_shared(const PanelId& panel_id)
{
    if (!store_.toggle_shared(panel_id))
        return false;
    commit();
    return true;
}

bool WorkspaceController::focus_panel(const PanelId& panel_id)
{
    if (!store_.focus_panel(panel_id))
        return false;
    commit();
    return true;
}

std::optional<ProcessId> WorkspaceController::reload_panel(const PanelId& panel_id)
{
    auto pid = store_.reload_panel(panel_id);
    if (pid)
        commit();
    return pid;
}

// ─── Sessions ────────────────────────────────────────────────────────────────

std::optional<SessionId> WorkspaceController::add_session(const PanelId& panel_id)
{
    auto id = store_.add_session(panel_id);
    if (id)
        commit();
    return id;
}

bool WorkspaceController::close_session(const PanelId& panel_id, const SessionId& session_id)
{
    if (!store_.close_session(panel_id, session_id))
        return false;
    commit();
    return true;
}

bool WorkspaceController::select_session(const PanelId& panel_id, const SessionId& session_id)
{
    if (!store_.select_session(panel_id, session_id))
        return false;
    commit();
    return true;
}

bool WorkspaceController::rename_session(const PanelId&   panel_id,
                                         const SessionId& session_id,
                                         std::string      title)
{
    if (!store_.rename_session(panel_id, session_id, std::move(title)))
        return false;
    commit();
    return true;
}

// ─── Layout ──────────────────────────────────────────────────────────────────

LayoutSnapshot WorkspaceController::layout(float window_width, float window_height)
{
    const float room = window_width - LayoutNode::MIN_PANE_SIZE - LayoutEngine::RESIZE_HANDLE_WIDTH;
    pinned_width_.set_bounds(LayoutEngine::PINNED_MIN_WIDTH,
                             std::clamp(room, LayoutEngine::PINNED_MIN_WIDTH, LayoutEngine::PINNED_MAX_WIDTH));
    return engine_.compute(store_, window_width, window_height, history_.hydration_message());
}

void WorkspaceController::dismiss_hydration_message()
{
    if (history_.hydration_message().empty())
        return;
    history_.clear_hydration_message();
    notify();
}

void WorkspaceController::set_layout_mode(SplitDirection mode)
{
    engine_.set_layout_mode(mode);
    store_.set_default_direction(mode);
    notify();
}

void WorkspaceController::toggle_pinned_collapsed()
{
    engine_.toggle_pinned_collapsed();
    notify();
}

bool WorkspaceController::toggle_panel_expanded(const PanelId& panel_id)
{
    if (!engine_.toggle_panel_expanded(panel_id))
        return false;
    notify();
    return true;
}

void WorkspaceController::begin_pinned_resize(float x, float y, PointerCapture* capture)
{
    pinned_width_.begin_gesture(x, y, capture);
}

void WorkspaceController::update_pinned_resize(float x, float y)
{
    pinned_width_.update_gesture(x, y);
}

void WorkspaceController::end_pinned_resize()
{
    pinned_width_.end_gesture();
}

bool WorkspaceController::begin_splitter_drag(const SplitterRect& splitter,
                                              float               x,
                                              float               y,
                                              PointerCapture*     capture)
{
    auto current = store_.grid_layout().ratio(splitter.node_id);
    if (!current)
    {
        TERMDECK_LOG_DEBUG("app", "Splitter drag on unknown node {}", splitter.node_id);
        return false;
    }

    end_splitter_drag();

    const float extent =
        splitter.direction == SplitDirection::Horizontal ? splitter.container.w : splitter.container.h;
    float lo = LayoutNode::MIN_RATIO;
    float hi = LayoutNode::MAX_RATIO;
    LayoutTree::ratio_bounds(extent, lo, hi);

    ResizeConfig cfg;
    cfg.direction     = splitter.direction;
    cfg.mode          = ResizeMode::Ratio;
    cfg.default_value = splitter.ratio;
    cfg.min_value     = lo;
    cfg.max_value     = hi;

    splitter_node_ = splitter.node_id;
    splitter_drag_ = std::make_unique<ResizeController>(cfg);
    splitter_drag_->set_on_change(
        [this](float ratio)
        {
            store_.set_split_ratio(splitter_node_, ratio);
            notify();
        });
    splitter_drag_->set_on_end([this]() { save_workspace(); });

    // The drag starts from the ratio on screen, which may differ from the
    // stored one when the size floor is in effect.
    if (*current != splitter.ratio)
        store_.set_split_ratio(splitter_node_, splitter_drag_->value());

    splitter_drag_->begin_gesture(x, y, capture, extent);
    return true;
}

void WorkspaceController::update_splitter_drag(float x, float y)
{
    if (splitter_drag_)
        splitter_drag_->update_gesture(x, y);
}

void WorkspaceController::end_splitter_drag()
{
    if (splitter_drag_)
        splitter_drag_->end_gesture();
}

}   // namespace termdeck
