#ifdef TERMDECK_USE_GLFW

    #include "glfw_adapter.hpp"

    #include <termdeck/logger.hpp>

    #define GLFW_INCLUDE_NONE
    #include <GLFW/glfw3.h>

namespace termdeck
{

GlfwAdapter::~GlfwAdapter()
{
    shutdown();
}

bool GlfwAdapter::init(uint32_t width, uint32_t height, const std::string& title)
{
    if (!glfwInit())
    {
        TERMDECK_LOG_ERROR("glfw", "Failed to initialize GLFW");
        return false;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);

    window_ = glfwCreateWindow(
        static_cast<int>(width), static_cast<int>(height), title.c_str(), nullptr, nullptr);

    if (!window_)
    {
        TERMDECK_LOG_ERROR("glfw", "Failed to create GLFW window");
        glfwTerminate();
        return false;
    }

    glfwMakeContextCurrent(window_);
    glfwSwapInterval(1);

    h_resize_cursor_ = glfwCreateStandardCursor(GLFW_HRESIZE_CURSOR);
    v_resize_cursor_ = glfwCreateStandardCursor(GLFW_VRESIZE_CURSOR);

    // Store this pointer for static callbacks
    glfwSetWindowUserPointer(window_, this);

    glfwSetCursorPosCallback(window_, cursor_pos_callback);
    glfwSetMouseButtonCallback(window_, mouse_button_callback);
    glfwSetCursorEnterCallback(window_, cursor_enter_callback);
    glfwSetWindowFocusCallback(window_, window_focus_callback);
    glfwSetFramebufferSizeCallback(window_, framebuffer_size_callback);
    glfwSetKeyCallback(window_, key_callback);

    TERMDECK_LOG_INFO("glfw", "Window created ({}x{})", width, height);
    return true;
}

void GlfwAdapter::shutdown()
{
    if (!window_)
        return;

    if (is_capturing())
        force_release("shutdown");

    if (h_resize_cursor_)
        glfwDestroyCursor(h_resize_cursor_);
    if (v_resize_cursor_)
        glfwDestroyCursor(v_resize_cursor_);
    h_resize_cursor_ = nullptr;
    v_resize_cursor_ = nullptr;

    glfwDestroyWindow(window_);
    window_ = nullptr;
    glfwTerminate();
}

void GlfwAdapter::poll_events()
{
    glfwPollEvents();
}

bool GlfwAdapter::should_close() const
{
    return window_ ? glfwWindowShouldClose(window_) : true;
}

void GlfwAdapter::swap_buffers()
{
    if (window_)
        glfwSwapBuffers(window_);
}

void GlfwAdapter::framebuffer_size(uint32_t& width, uint32_t& height) const
{
    width  = 0;
    height = 0;
    if (window_)
    {
        int w = 0, h = 0;
        glfwGetFramebufferSize(window_, &w, &h);
        width  = static_cast<uint32_t>(w);
        height = static_cast<uint32_t>(h);
    }
}

void GlfwAdapter::window_size(int& width, int& height) const
{
    width  = 0;
    height = 0;
    if (window_)
        glfwGetWindowSize(window_, &width, &height);
}

void GlfwAdapter::mouse_position(double& x, double& y) const
{
    x = 0.0;
    y = 0.0;
    if (window_)
        glfwGetCursorPos(window_, &x, &y);
}

void GlfwAdapter::set_callbacks(const InputCallbacks& callbacks)
{
    callbacks_ = callbacks;
}

// ─── PointerCapture ──────────────────────────────────────────────────────────

PointerCapture::Token GlfwAdapter::begin_capture(SplitDirection axis,
                                                 MoveHandler    on_move,
                                                 ReleaseHandler on_release)
{
    if (is_capturing())
        force_release("superseded");

    capture_token_   = next_token_++;
    capture_move_    = std::move(on_move);
    capture_release_ = std::move(on_release);

    if (window_)
        glfwSetCursor(window_, axis == SplitDirection::Horizontal ? h_resize_cursor_ : v_resize_cursor_);
    return capture_token_;
}

void GlfwAdapter::end_capture(Token token)
{
    if (token == 0 || token != capture_token_)
        return;

    capture_token_ = 0;
    capture_move_  = nullptr;
    capture_release_ = nullptr;
    if (window_)
        glfwSetCursor(window_, nullptr);
}

void GlfwAdapter::force_release(const char* reason)
{
    TERMDECK_LOG_DEBUG("glfw", "Pointer capture released: {}", reason);
    ReleaseHandler release = std::move(capture_release_);
    end_capture(capture_token_);
    if (release)
        release();
}

// ─── Static callback trampolines ─────────────────────────────────────────────

void GlfwAdapter::cursor_pos_callback(GLFWwindow* window, double x, double y)
{
    auto* adapter = static_cast<GlfwAdapter*>(glfwGetWindowUserPointer(window));
    if (!adapter)
        return;
    if (adapter->is_capturing())
    {
        // Copy: the handler may end the capture.
        MoveHandler move = adapter->capture_move_;
        if (move)
            move(static_cast<float>(x), static_cast<float>(y));
        return;
    }
    if (adapter->callbacks_.on_mouse_move)
        adapter->callbacks_.on_mouse_move(x, y);
}

void GlfwAdapter::mouse_button_callback(GLFWwindow* window, int button, int action, int mods)
{
    auto* adapter = static_cast<GlfwAdapter*>(glfwGetWindowUserPointer(window));
    if (!adapter)
        return;
    if (adapter->is_capturing() && button == GLFW_MOUSE_BUTTON_LEFT && action == GLFW_RELEASE)
    {
        adapter->force_release("button up");
        return;
    }
    if (adapter->callbacks_.on_mouse_button)
    {
        double x, y;
        glfwGetCursorPos(window, &x, &y);
        adapter->callbacks_.on_mouse_button(button, action, mods, x, y);
    }
}

void GlfwAdapter::cursor_enter_callback(GLFWwindow* window, int entered)
{
    auto* adapter = static_cast<GlfwAdapter*>(glfwGetWindowUserPointer(window));
    if (adapter && !entered && adapter->is_capturing())
        adapter->force_release("cursor left window");
}

void GlfwAdapter::window_focus_callback(GLFWwindow* window, int focused)
{
    auto* adapter = static_cast<GlfwAdapter*>(glfwGetWindowUserPointer(window));
    if (adapter && !focused && adapter->is_capturing())
        adapter->force_release("focus lost");
}

void GlfwAdapter::framebuffer_size_callback(GLFWwindow* window, int width, int height)
{
    auto* adapter = static_cast<GlfwAdapter*>(glfwGetWindowUserPointer(window));
    if (adapter && adapter->callbacks_.on_resize)
        adapter->callbacks_.on_resize(width, height);
}

void GlfwAdapter::key_callback(GLFWwindow* window, int key, int /*scancode*/, int action, int mods)
{
    auto* adapter = static_cast<GlfwAdapter*>(glfwGetWindowUserPointer(window));
    if (adapter && adapter->callbacks_.on_key)
        adapter->callbacks_.on_key(key, action, mods);
}

}   // namespace termdeck

#endif   // TERMDECK_USE_GLFW
