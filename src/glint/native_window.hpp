#pragma once

#include <common/extent.hpp>

struct GLFWwindow;

namespace glint
{
// The window the renderer presents to. The host owns it and shares it with the renderer, and it
// must stay alive for as long as any surface created from it.
class NativeWindow
{
public:
    virtual ~NativeWindow() = default;

    // Returns the size of the window's drawable area in pixels. Either component is zero while the
    // window is minimized.
    virtual Extent2u innerSize() const = 0;

    // Called after a frame has been submitted, immediately before it is presented.
    virtual void prePresentNotify() = 0;

    // Raw access

    virtual GLFWwindow* ptr() const = 0;
};
} // namespace glint
