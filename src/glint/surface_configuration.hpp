#pragma once

#include "gpu_types.hpp"
#include "surface_capabilities.hpp"

#include <common/extent.hpp>

#include <cstdint>
#include <vector>

namespace glint
{
inline constexpr std::uint32_t DESIRED_MAXIMUM_FRAME_LATENCY = 2;

struct SurfaceConfiguration
{
    TextureFormat              format = TextureFormat::Undefined;
    std::uint32_t              width = 0;
    std::uint32_t              height = 0;
    TextureUsages              usage = TextureUsages::none();
    PresentMode                presentMode = PresentMode::Fifo;
    std::uint32_t              desiredMaximumFrameLatency = DESIRED_MAXIMUM_FRAME_LATENCY;
    CompositeAlphaMode         alphaMode = CompositeAlphaMode::Auto;
    std::vector<TextureFormat> viewFormats;

    bool operator==(const SurfaceConfiguration&) const = default;
};

// Picks format, present mode and alpha mode from the reported capabilities and sizes the surface
// to `framebufferSize`, which must not be empty. The sRGB variant of the format is listed as a
// view format, as frames are rendered through sRGB views.
SurfaceConfiguration makeSurfaceConfiguration(
    const SurfaceCapabilities& capabilities,
    const Extent2u&            framebufferSize);
} // namespace glint
