#pragma once

#include <glint/native_window.hpp>

#include <common/extent.hpp>

#include <functional>
#include <string_view>

struct GLFWwindow;

namespace glint
{
struct WindowDescriptor
{
    Extent2i         windowSize;
    std::string_view title;
};

using RedrawCallback = std::function<void()>;
using ResizeCallback = std::function<void(Extent2u)>;

class GlfwWindow final : public NativeWindow
{
public:
    explicit GlfwWindow(const WindowDescriptor&);
    ~GlfwWindow() override;

    GlfwWindow(const GlfwWindow&) = delete;
    GlfwWindow& operator=(const GlfwWindow&) = delete;

    GlfwWindow(GlfwWindow&&) = delete;
    GlfwWindow& operator=(GlfwWindow&&) = delete;

    // Size accessors

    // Returns the size of the window in pixels.
    Extent2u innerSize() const override;

    void prePresentNotify() override {}

    // Run loop

    // Blocks on window events until the window is closed. The resize callback is invoked whenever
    // the framebuffer size changes; a redraw follows the first frame, every resize and every
    // refresh request from the window system.
    void run(RedrawCallback&&, ResizeCallback&&);

    void requestRedraw() { mRedrawRequested = true; }

    // Raw access

    GLFWwindow* ptr() const override { return mWindow; }

private:
    GLFWwindow* mWindow;
    bool        mRedrawRequested;

    static int glfwRefCount;
};
} // namespace glint
