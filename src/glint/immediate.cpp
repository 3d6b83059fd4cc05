#include "immediate.hpp"

#include <common/assert.hpp>

namespace glint
{
glm::vec2 normalizedAspectRatio(const std::uint32_t width, const std::uint32_t height) noexcept
{
    GLINT_ASSERT(width > 0 && height > 0);
    const float w = static_cast<float>(width);
    const float h = static_cast<float>(height);
    if (width < height)
    {
        return glm::vec2(1.0f, h / w);
    }
    return glm::vec2(w / h, 1.0f);
}

Immediate::Immediate(const std::uint32_t width, const std::uint32_t height) noexcept
    : windowSize(width, height),
      aspectRatio(normalizedAspectRatio(width, height))
{
}

void Immediate::updateWindowSize(const std::uint32_t width, const std::uint32_t height) noexcept
{
    windowSize = glm::uvec2(width, height);
    aspectRatio = normalizedAspectRatio(width, height);
}
} // namespace glint
