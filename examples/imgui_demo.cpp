// Interactive workspace window: GLFW + OpenGL 3 + Dear ImGui.
//
// Keys: Ctrl+N new panel, Ctrl+P toggle pinned zone, Ctrl+L flip layout mode,
//       Alt+Left / Alt+Right history.

#include <termdeck/termdeck.hpp>

#include <GLFW/glfw3.h>
#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_opengl3.h>

#include "app/workspace_controller.hpp"
#include "config/preference_store.hpp"
#include "simulated_backend.hpp"
#include "ui/glfw_adapter.hpp"
#include "ui/imgui/workspace_renderer.hpp"

using namespace termdeck;

int main()
{
    Logger::instance().set_level(LogLevel::Info);
    Logger::instance().add_sink(sinks::console_sink());

    GlfwAdapter window;
    if (!window.init(1440, 900, "termdeck"))
    {
        TERMDECK_LOG_CRITICAL("demo", "Could not open a window");
        return 1;
    }

    demo::SimulatedProcessBackend backend;
    demo::SimulatedCatalog        catalog;
    FilePreferenceStore           prefs;
    if (!prefs.load())
        TERMDECK_LOG_WARN("demo", "Preferences at {} were unreadable, using defaults", prefs.path());

    WorkspaceController ws(backend, catalog, prefs);
    ws.mount();

    InputCallbacks callbacks;
    callbacks.on_key = [&ws](int key, int action, int mods)
    {
        if (action != GLFW_PRESS)
            return;
        const bool ctrl = (mods & GLFW_MOD_CONTROL) != 0;
        const bool alt  = (mods & GLFW_MOD_ALT) != 0;
        if (ctrl && key == GLFW_KEY_N)
            ws.add_panel();
        else if (ctrl && key == GLFW_KEY_P)
            ws.toggle_pinned_collapsed();
        else if (ctrl && key == GLFW_KEY_L)
            ws.set_layout_mode(ws.layout_mode() == SplitDirection::Horizontal ? SplitDirection::Vertical
                                                                               : SplitDirection::Horizontal);
        else if (alt && key == GLFW_KEY_LEFT)
            ws.back();
        else if (alt && key == GLFW_KEY_RIGHT)
            ws.forward();
    };
    // Installed before ImGui so its backend chains to these.
    window.set_callbacks(callbacks);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::GetIO().IniFilename = nullptr;
    ImGui::StyleColorsDark();
    ImGui_ImplGlfw_InitForOpenGL(window.window(), true);
    ImGui_ImplOpenGL3_Init("#version 330");

    WorkspaceRenderer renderer(ws, &window);

    while (!window.should_close())
    {
        window.poll_events();
        ws.pump();

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        int w = 0, h = 0;
        window.window_size(w, h);
        renderer.draw(static_cast<float>(w), static_cast<float>(h));

        ImGui::Render();
        uint32_t fb_w = 0, fb_h = 0;
        window.framebuffer_size(fb_w, fb_h);
        glViewport(0, 0, static_cast<int>(fb_w), static_cast<int>(fb_h));
        glClearColor(0.08f, 0.08f, 0.10f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

        window.swap_buffers();
    }

    ws.unmount();

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();
    window.shutdown();
    return 0;
}
