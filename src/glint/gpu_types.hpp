#pragma once

#include <common/bit_flags.hpp>

#include <cstdint>
#include <string_view>

namespace glint
{
// Backend-agnostic mirrors of the graphics API enums the renderer negotiates with. Backends
// translate these into their own types.

enum class TextureFormat : std::uint32_t
{
    Undefined = 0,
    RGBA8Unorm,
    RGBA8UnormSrgb,
    BGRA8Unorm,
    BGRA8UnormSrgb,
    RGB10A2Unorm,
    RGBA16Float,
};

enum class CompositeAlphaMode : std::uint32_t
{
    Auto = 0,
    Opaque,
    PreMultiplied,
    PostMultiplied,
    Inherit,
};

enum class PresentMode : std::uint32_t
{
    Fifo = 0,
    FifoRelaxed,
    Immediate,
    Mailbox,
};

enum class TextureUsage : std::uint32_t
{
    CopySrc = 1 << 0,
    CopyDst = 1 << 1,
    TextureBinding = 1 << 2,
    StorageBinding = 1 << 3,
    RenderAttachment = 1 << 4,
};
using TextureUsages = BitFlags<TextureUsage>;

enum class ShaderStage : std::uint32_t
{
    Vertex = 1 << 0,
    Fragment = 1 << 1,
    Compute = 1 << 2,
};
using ShaderStages = BitFlags<ShaderStage>;

enum class BackendType : std::uint32_t
{
    Null = 0,
    D3D11,
    D3D12,
    Metal,
    Vulkan,
    OpenGL,
    OpenGLES,
};

enum class PowerPreference : std::uint32_t
{
    None = 0,
    LowPower,
    HighPerformance,
};

enum class MemoryHints : std::uint32_t
{
    Performance = 0,
    MemoryUsage,
};

enum class SurfaceTextureStatus : std::uint32_t
{
    Success = 0,
    Suboptimal,
    Timeout,
    Outdated,
    Lost,
    OutOfMemory,
    DeviceLost,
    Error,
};

std::string_view toString(TextureFormat) noexcept;
std::string_view toString(CompositeAlphaMode) noexcept;
std::string_view toString(PresentMode) noexcept;
std::string_view toString(BackendType) noexcept;
std::string_view toString(PowerPreference) noexcept;
std::string_view toString(SurfaceTextureStatus) noexcept;
} // namespace glint
