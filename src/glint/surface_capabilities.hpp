#pragma once

#include "gpu_types.hpp"

#include <span>
#include <vector>

namespace glint
{
struct SurfaceCapabilities
{
    std::vector<TextureFormat>      formats;
    std::vector<PresentMode>        presentModes;
    std::vector<CompositeAlphaMode> alphaModes;
};

// Returns the first reported format, which backends list in order of preference. Throws
// CapabilityMissingError if no formats are reported.
TextureFormat findSurfaceFormat(std::span<const TextureFormat> formats);

// Returns the best ranked alpha mode: Inherit, then PreMultiplied, PostMultiplied, Opaque and
// anything else. Ties resolve to the first occurrence. Throws CapabilityMissingError if no alpha
// modes are reported.
CompositeAlphaMode findAlphaMode(std::span<const CompositeAlphaMode> alphaModes);

// Adaptive vsync: tear-free presentation that tolerates late frames when the surface supports it,
// plain Fifo otherwise.
PresentMode findPresentMode(std::span<const PresentMode> presentModes) noexcept;

// The gamma-encoded view format of a linear color format. Formats which are already sRGB, or which
// have no sRGB counterpart, are returned unchanged.
TextureFormat srgbVariant(TextureFormat format) noexcept;
} // namespace glint
