#pragma once

#ifdef TERMDECK_USE_GLFW

    #include <cstdint>
    #include <functional>
    #include <string>

    #include "ui/pointer_capture.hpp"

struct GLFWwindow;
struct GLFWcursor;

namespace termdeck
{

// Callback types for input events
struct InputCallbacks
{
    std::function<void(double x, double y)>                                   on_mouse_move;
    std::function<void(int button, int action, int mods, double x, double y)> on_mouse_button;
    std::function<void(int width, int height)>                                on_resize;
    std::function<void(int key, int action, int mods)>                        on_key;
};

// GLFW window with an OpenGL context, plus the window-level pointer grab
// used by resize drags.
//
// While a capture is active, cursor moves go to the capture instead of
// on_mouse_move, and a left-button release, the cursor leaving the window or
// the window losing focus ends it.
class GlfwAdapter : public PointerCapture
{
   public:
    GlfwAdapter() = default;
    ~GlfwAdapter() override;

    GlfwAdapter(const GlfwAdapter&)            = delete;
    GlfwAdapter& operator=(const GlfwAdapter&) = delete;

    // Initialize GLFW and create a window
    bool init(uint32_t width, uint32_t height, const std::string& title);

    // Destroy the window and terminate GLFW
    void shutdown();

    // Poll events (call once per frame)
    void poll_events();

    bool should_close() const;
    void swap_buffers();

    GLFWwindow* window() const { return window_; }

    void framebuffer_size(uint32_t& width, uint32_t& height) const;
    void window_size(int& width, int& height) const;
    void mouse_position(double& x, double& y) const;

    void set_callbacks(const InputCallbacks& callbacks);

    // ── PointerCapture ──────────────────────────────────────────────────

    Token begin_capture(SplitDirection axis, MoveHandler on_move, ReleaseHandler on_release) override;
    void  end_capture(Token token) override;

    bool is_capturing() const { return capture_token_ != 0; }

   private:
    GLFWwindow*    window_ = nullptr;
    InputCallbacks callbacks_;

    GLFWcursor* h_resize_cursor_ = nullptr;
    GLFWcursor* v_resize_cursor_ = nullptr;

    Token          capture_token_ = 0;
    Token          next_token_    = 1;
    MoveHandler    capture_move_;
    ReleaseHandler capture_release_;

    // Ends the active capture from this side; the release handler runs once.
    void force_release(const char* reason);

    // Static callback trampolines (GLFW uses C callbacks)
    static void cursor_pos_callback(GLFWwindow* window, double x, double y);
    static void mouse_button_callback(GLFWwindow* window, int button, int action, int mods);
    static void cursor_enter_callback(GLFWwindow* window, int entered);
    static void window_focus_callback(GLFWwindow* window, int focused);
    static void framebuffer_size_callback(GLFWwindow* window, int width, int height);
    static void key_callback(GLFWwindow* window, int key, int scancode, int action, int mods);
};

}   // namespace termdeck

#endif   // TERMDECK_USE_GLFW
