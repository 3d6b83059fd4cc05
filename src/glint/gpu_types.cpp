#include "gpu_types.hpp"

namespace glint
{
std::string_view toString(const TextureFormat format) noexcept
{
    switch (format)
    {
    case TextureFormat::Undefined:
        return "Undefined";
    case TextureFormat::RGBA8Unorm:
        return "RGBA8Unorm";
    case TextureFormat::RGBA8UnormSrgb:
        return "RGBA8UnormSrgb";
    case TextureFormat::BGRA8Unorm:
        return "BGRA8Unorm";
    case TextureFormat::BGRA8UnormSrgb:
        return "BGRA8UnormSrgb";
    case TextureFormat::RGB10A2Unorm:
        return "RGB10A2Unorm";
    case TextureFormat::RGBA16Float:
        return "RGBA16Float";
    }
    return "Unknown";
}

std::string_view toString(const CompositeAlphaMode mode) noexcept
{
    switch (mode)
    {
    case CompositeAlphaMode::Auto:
        return "Auto";
    case CompositeAlphaMode::Opaque:
        return "Opaque";
    case CompositeAlphaMode::PreMultiplied:
        return "PreMultiplied";
    case CompositeAlphaMode::PostMultiplied:
        return "PostMultiplied";
    case CompositeAlphaMode::Inherit:
        return "Inherit";
    }
    return "Unknown";
}

std::string_view toString(const PresentMode mode) noexcept
{
    switch (mode)
    {
    case PresentMode::Fifo:
        return "Fifo";
    case PresentMode::FifoRelaxed:
        return "FifoRelaxed";
    case PresentMode::Immediate:
        return "Immediate";
    case PresentMode::Mailbox:
        return "Mailbox";
    }
    return "Unknown";
}

std::string_view toString(const BackendType backend) noexcept
{
    switch (backend)
    {
    case BackendType::Null:
        return "Null";
    case BackendType::D3D11:
        return "D3D11";
    case BackendType::D3D12:
        return "D3D12";
    case BackendType::Metal:
        return "Metal";
    case BackendType::Vulkan:
        return "Vulkan";
    case BackendType::OpenGL:
        return "OpenGL";
    case BackendType::OpenGLES:
        return "OpenGLES";
    }
    return "Unknown";
}

std::string_view toString(const PowerPreference preference) noexcept
{
    switch (preference)
    {
    case PowerPreference::None:
        return "None";
    case PowerPreference::LowPower:
        return "LowPower";
    case PowerPreference::HighPerformance:
        return "HighPerformance";
    }
    return "Unknown";
}

std::string_view toString(const SurfaceTextureStatus status) noexcept
{
    switch (status)
    {
    case SurfaceTextureStatus::Success:
        return "Success";
    case SurfaceTextureStatus::Suboptimal:
        return "Suboptimal";
    case SurfaceTextureStatus::Timeout:
        return "Timeout";
    case SurfaceTextureStatus::Outdated:
        return "Outdated";
    case SurfaceTextureStatus::Lost:
        return "Lost";
    case SurfaceTextureStatus::OutOfMemory:
        return "OutOfMemory";
    case SurfaceTextureStatus::DeviceLost:
        return "DeviceLost";
    case SurfaceTextureStatus::Error:
        return "Error";
    }
    return "Unknown";
}
} // namespace glint
