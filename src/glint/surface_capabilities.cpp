#include "renderer_error.hpp"
#include "surface_capabilities.hpp"

#include <algorithm>

namespace glint
{
namespace
{
int alphaModeRank(const CompositeAlphaMode mode) noexcept
{
    switch (mode)
    {
    case CompositeAlphaMode::Inherit:
        return 1;
    case CompositeAlphaMode::PreMultiplied:
        return 2;
    case CompositeAlphaMode::PostMultiplied:
        return 3;
    case CompositeAlphaMode::Opaque:
        return 4;
    default:
        return 5;
    }
}
} // namespace

TextureFormat findSurfaceFormat(const std::span<const TextureFormat> formats)
{
    if (formats.empty())
    {
        throw CapabilityMissingError("texture formats");
    }
    return formats.front();
}

CompositeAlphaMode findAlphaMode(const std::span<const CompositeAlphaMode> alphaModes)
{
    if (alphaModes.empty())
    {
        throw CapabilityMissingError("composite alpha modes");
    }
    // min_element returns the first of several equally ranked elements.
    return *std::min_element(
        alphaModes.begin(),
        alphaModes.end(),
        [](const CompositeAlphaMode lhs, const CompositeAlphaMode rhs) -> bool {
            return alphaModeRank(lhs) < alphaModeRank(rhs);
        });
}

PresentMode findPresentMode(const std::span<const PresentMode> presentModes) noexcept
{
    const bool supportsRelaxed =
        std::find(presentModes.begin(), presentModes.end(), PresentMode::FifoRelaxed) !=
        presentModes.end();
    return supportsRelaxed ? PresentMode::FifoRelaxed : PresentMode::Fifo;
}

TextureFormat srgbVariant(const TextureFormat format) noexcept
{
    switch (format)
    {
    case TextureFormat::RGBA8Unorm:
        return TextureFormat::RGBA8UnormSrgb;
    case TextureFormat::BGRA8Unorm:
        return TextureFormat::BGRA8UnormSrgb;
    default:
        return format;
    }
}
} // namespace glint
