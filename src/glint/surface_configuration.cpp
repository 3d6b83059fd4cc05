#include "surface_configuration.hpp"

#include <common/assert.hpp>

namespace glint
{
SurfaceConfiguration makeSurfaceConfiguration(
    const SurfaceCapabilities& capabilities,
    const Extent2u&            framebufferSize)
{
    GLINT_ASSERT(!isEmpty(framebufferSize));

    const TextureFormat format = findSurfaceFormat(capabilities.formats);
    const CompositeAlphaMode alphaMode = findAlphaMode(capabilities.alphaModes);

    return SurfaceConfiguration{
        .format = format,
        .width = framebufferSize.x,
        .height = framebufferSize.y,
        .usage = TextureUsages{TextureUsage::RenderAttachment},
        .presentMode = findPresentMode(capabilities.presentModes),
        .desiredMaximumFrameLatency = DESIRED_MAXIMUM_FRAME_LATENCY,
        .alphaMode = alphaMode,
        .viewFormats = {srgbVariant(format)},
    };
}
} // namespace glint
