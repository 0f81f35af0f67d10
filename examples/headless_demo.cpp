// Drives a workspace without a window: builds a layout, pins a panel, kills a
// process and opens a skill detail, printing the state after each step.
//
// Usage: headless_demo [location]   (default "/skills/code-review")

#include <termdeck/termdeck.hpp>

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <thread>

#include "app/workspace_controller.hpp"
#include "config/preference_store.hpp"
#include "simulated_backend.hpp"

using namespace termdeck;

static void print_state(WorkspaceController& ws, const char* step)
{
    std::printf("\n== %s ==\n", step);
    for (const Panel* p : ws.store().grid_panels())
    {
        const Session* s     = p->active_session();
        auto           alive = s ? ws.is_running(s->process_id) : std::nullopt;
        std::printf("  grid   %-10s %-12s %s\n",
                    p->id.c_str(),
                    s ? s->title.c_str() : "-",
                    !alive ? "checking" : (*alive ? "running" : "exited"));
    }
    for (const Panel* p : ws.store().pinned_panels())
    {
        std::printf("  pinned %-10s %-12s expanded=%s\n",
                    p->id.c_str(),
                    p->active_session() ? p->active_session()->title.c_str() : "-",
                    ws.layout_engine().is_panel_expanded(p->id) ? "yes" : "no");
    }

    const LayoutSnapshot snap = ws.layout(1280.0f, 800.0f);
    std::printf("  zone: %s  grid x=%.0f w=%.0f  splitters=%zu\n",
                snap.pinned_title.empty() ? "(hidden)" : snap.pinned_title.c_str(),
                snap.grid.x,
                snap.grid.w,
                snap.splitters.size());
    std::printf("  view: %s (%d/%zu)\n",
                entry_title(ws.history().current()).c_str(),
                ws.history().index() + 1,
                ws.history().size());
}

// Pump completions for a while, as a frame loop would.
static void run_frames(WorkspaceController& ws, int frames)
{
    for (int i = 0; i < frames; ++i)
    {
        ws.pump();
        std::this_thread::sleep_for(std::chrono::milliseconds(16));
    }
}

int main(int argc, char** argv)
{
    Logger::instance().set_level(LogLevel::Info);
    Logger::instance().add_sink(sinks::console_sink());

    const auto dir = std::filesystem::temp_directory_path() / "termdeck_demo";

    demo::SimulatedProcessBackend backend;
    demo::SimulatedCatalog        catalog;
    FilePreferenceStore           prefs((dir / "preferences.json").string());
    if (!prefs.load())
        TERMDECK_LOG_WARN("demo", "Preferences were unreadable, starting from defaults");

    WorkspaceController::Options opts;
    opts.workspace_path   = (dir / "workspace.json").string();
    opts.initial_location = argc > 1 ? argv[1] : "/skills/code-review";

    WorkspaceController ws(backend, catalog, prefs, opts);
    ws.mount();
    run_frames(ws, 10);
    print_state(ws, "mounted");

    PanelId claude = ws.add_panel(std::string("claude"));
    auto    logs   = ws.split_panel(claude, SplitDirection::Vertical, std::string("tail -f app.log"));
    run_frames(ws, 10);
    print_state(ws, "three panels");

    if (logs)
    {
        ws.toggle_shared(*logs);
        run_frames(ws, 10);
        print_state(ws, "logs pinned");
    }

    if (const Panel* p = ws.store().find_panel(claude); p && p->active_session())
    {
        backend.kill(p->active_session()->process_id);
        run_frames(ws, 10);
        print_state(ws, "claude exited");

        ws.reload_panel(claude);
        run_frames(ws, 10);
        print_state(ws, "claude reloaded");
    }

    if (!ws.history().hydration_message().empty())
        std::printf("\nnotice: %s\n", ws.history().hydration_message().c_str());

    ws.unmount();
    TERMDECK_LOG_INFO("demo", "Workspace saved to {}", opts.workspace_path);
    return 0;
}
