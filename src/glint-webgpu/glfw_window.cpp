#include "glfw_window.hpp"

#include <GLFW/glfw3.h>
#include <spdlog/spdlog.h>

#include <stdexcept>

namespace glint
{
int GlfwWindow::glfwRefCount = 0;

GlfwWindow::GlfwWindow(const WindowDescriptor& windowDesc)
    : mWindow(nullptr),
      mRedrawRequested(false)
{
    if (glfwRefCount++ == 0)
    {
        if (!glfwInit())
        {
            --glfwRefCount;
            throw std::runtime_error("Failed to initialize GLFW.");
        }
        // NOTE: with this hint in place, GLFW assumes that we will manage the API and we can skip
        // calling glfwSwapBuffers.
        glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    }

    mWindow = glfwCreateWindow(
        windowDesc.windowSize.x,
        windowDesc.windowSize.y,
        windowDesc.title.data(),
        nullptr,
        nullptr);

    if (!mWindow)
    {
        if (--glfwRefCount == 0)
        {
            glfwTerminate();
        }
        throw std::runtime_error("Failed to create GLFW window.");
    }

    glfwSetWindowUserPointer(mWindow, this);
    glfwSetWindowRefreshCallback(mWindow, [](GLFWwindow* const window) -> void {
        static_cast<GlfwWindow*>(glfwGetWindowUserPointer(window))->requestRedraw();
    });
}

GlfwWindow::~GlfwWindow()
{
    if (mWindow)
    {
        glfwDestroyWindow(mWindow);
        mWindow = nullptr;
    }

    if (--glfwRefCount == 0)
    {
        glfwTerminate();
    }
}

Extent2u GlfwWindow::innerSize() const
{
    Extent2i result;
    glfwGetFramebufferSize(mWindow, &result.x, &result.y);
    return Extent2u(result);
}

void GlfwWindow::run(RedrawCallback&& redrawCallback, ResizeCallback&& resizeCallback)
{
    Extent2u currentFramebufferSize = innerSize();
    mRedrawRequested = true;

    while (!glfwWindowShouldClose(mWindow))
    {
        // Resize
        {
            const Extent2u newFramebufferSize = innerSize();
            if (newFramebufferSize != currentFramebufferSize)
            {
                currentFramebufferSize = newFramebufferSize;
                resizeCallback(newFramebufferSize);
                mRedrawRequested = true;
            }
        }

        if (mRedrawRequested)
        {
            mRedrawRequested = false;
            spdlog::debug("Redraw requested");
            redrawCallback();
        }

        // Sleep until the window system has something for us.
        glfwWaitEvents();

        if (glfwGetKey(mWindow, GLFW_KEY_ESCAPE) == GLFW_PRESS)
        {
            glfwSetWindowShouldClose(mWindow, GLFW_TRUE);
        }
    }

    spdlog::info("Close requested");
}
} // namespace glint
