#pragma once

#include <glm/glm.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <type_traits>

namespace glint
{
// Per-draw constants pushed into the render pass as raw bytes. The layout must match the
// `Immediate` struct in shaders/immediate.wgsl.
struct Immediate
{
    glm::uvec2 windowSize;  // offset: 0, size: 8
    glm::vec2  aspectRatio; // offset: 8, size: 8

    Immediate(std::uint32_t width, std::uint32_t height) noexcept;

    void updateWindowSize(std::uint32_t width, std::uint32_t height) noexcept;

    std::span<const std::byte> bytes() const noexcept
    {
        return std::as_bytes(std::span<const Immediate, 1>(this, 1));
    }

    bool operator==(const Immediate&) const noexcept = default;
};

static_assert(sizeof(Immediate) == 16);
static_assert(offsetof(Immediate, windowSize) == 0);
static_assert(offsetof(Immediate, aspectRatio) == 8);
static_assert(std::is_trivially_copyable_v<Immediate>);
static_assert(std::is_standard_layout_v<Immediate>);

// The window aspect ratio scaled so that the smaller axis is 1. Shaders multiply normalized device
// coordinates by it to get undistorted coordinates in either orientation.
glm::vec2 normalizedAspectRatio(std::uint32_t width, std::uint32_t height) noexcept;
} // namespace glint
