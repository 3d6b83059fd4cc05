#include "webgpu_conversions.hpp"

namespace glint
{
WGPUTextureFormat toWgpu(const TextureFormat format) noexcept
{
    switch (format)
    {
    case TextureFormat::RGBA8Unorm:
        return WGPUTextureFormat_RGBA8Unorm;
    case TextureFormat::RGBA8UnormSrgb:
        return WGPUTextureFormat_RGBA8UnormSrgb;
    case TextureFormat::BGRA8Unorm:
        return WGPUTextureFormat_BGRA8Unorm;
    case TextureFormat::BGRA8UnormSrgb:
        return WGPUTextureFormat_BGRA8UnormSrgb;
    case TextureFormat::RGB10A2Unorm:
        return WGPUTextureFormat_RGB10A2Unorm;
    case TextureFormat::RGBA16Float:
        return WGPUTextureFormat_RGBA16Float;
    case TextureFormat::Undefined:
        break;
    }
    return WGPUTextureFormat_Undefined;
}

std::optional<TextureFormat> fromWgpu(const WGPUTextureFormat format) noexcept
{
    switch (format)
    {
    case WGPUTextureFormat_RGBA8Unorm:
        return TextureFormat::RGBA8Unorm;
    case WGPUTextureFormat_RGBA8UnormSrgb:
        return TextureFormat::RGBA8UnormSrgb;
    case WGPUTextureFormat_BGRA8Unorm:
        return TextureFormat::BGRA8Unorm;
    case WGPUTextureFormat_BGRA8UnormSrgb:
        return TextureFormat::BGRA8UnormSrgb;
    case WGPUTextureFormat_RGB10A2Unorm:
        return TextureFormat::RGB10A2Unorm;
    case WGPUTextureFormat_RGBA16Float:
        return TextureFormat::RGBA16Float;
    default:
        return std::nullopt;
    }
}

WGPUCompositeAlphaMode toWgpu(const CompositeAlphaMode mode) noexcept
{
    switch (mode)
    {
    case CompositeAlphaMode::Auto:
        return WGPUCompositeAlphaMode_Auto;
    case CompositeAlphaMode::Opaque:
        return WGPUCompositeAlphaMode_Opaque;
    case CompositeAlphaMode::PreMultiplied:
        return WGPUCompositeAlphaMode_Premultiplied;
    case CompositeAlphaMode::PostMultiplied:
        return WGPUCompositeAlphaMode_Unpremultiplied;
    case CompositeAlphaMode::Inherit:
        return WGPUCompositeAlphaMode_Inherit;
    }
    return WGPUCompositeAlphaMode_Auto;
}

std::optional<CompositeAlphaMode> fromWgpu(const WGPUCompositeAlphaMode mode) noexcept
{
    switch (mode)
    {
    case WGPUCompositeAlphaMode_Auto:
        return CompositeAlphaMode::Auto;
    case WGPUCompositeAlphaMode_Opaque:
        return CompositeAlphaMode::Opaque;
    case WGPUCompositeAlphaMode_Premultiplied:
        return CompositeAlphaMode::PreMultiplied;
    case WGPUCompositeAlphaMode_Unpremultiplied:
        return CompositeAlphaMode::PostMultiplied;
    case WGPUCompositeAlphaMode_Inherit:
        return CompositeAlphaMode::Inherit;
    default:
        return std::nullopt;
    }
}

WGPUPresentMode toWgpu(const PresentMode mode) noexcept
{
    switch (mode)
    {
    case PresentMode::Fifo:
        return WGPUPresentMode_Fifo;
    case PresentMode::FifoRelaxed:
        return WGPUPresentMode_FifoRelaxed;
    case PresentMode::Immediate:
        return WGPUPresentMode_Immediate;
    case PresentMode::Mailbox:
        return WGPUPresentMode_Mailbox;
    }
    return WGPUPresentMode_Fifo;
}

std::optional<PresentMode> fromWgpu(const WGPUPresentMode mode) noexcept
{
    switch (mode)
    {
    case WGPUPresentMode_Fifo:
        return PresentMode::Fifo;
    case WGPUPresentMode_FifoRelaxed:
        return PresentMode::FifoRelaxed;
    case WGPUPresentMode_Immediate:
        return PresentMode::Immediate;
    case WGPUPresentMode_Mailbox:
        return PresentMode::Mailbox;
    default:
        return std::nullopt;
    }
}

WGPUBackendType toWgpu(const BackendType backend) noexcept
{
    switch (backend)
    {
    case BackendType::Null:
        return WGPUBackendType_Null;
    case BackendType::D3D11:
        return WGPUBackendType_D3D11;
    case BackendType::D3D12:
        return WGPUBackendType_D3D12;
    case BackendType::Metal:
        return WGPUBackendType_Metal;
    case BackendType::Vulkan:
        return WGPUBackendType_Vulkan;
    case BackendType::OpenGL:
        return WGPUBackendType_OpenGL;
    case BackendType::OpenGLES:
        return WGPUBackendType_OpenGLES;
    }
    return WGPUBackendType_Undefined;
}

std::optional<BackendType> fromWgpu(const WGPUBackendType backend) noexcept
{
    switch (backend)
    {
    case WGPUBackendType_Null:
        return BackendType::Null;
    case WGPUBackendType_D3D11:
        return BackendType::D3D11;
    case WGPUBackendType_D3D12:
        return BackendType::D3D12;
    case WGPUBackendType_Metal:
        return BackendType::Metal;
    case WGPUBackendType_Vulkan:
        return BackendType::Vulkan;
    case WGPUBackendType_OpenGL:
        return BackendType::OpenGL;
    case WGPUBackendType_OpenGLES:
        return BackendType::OpenGLES;
    default:
        return std::nullopt;
    }
}

WGPUPowerPreference toWgpu(const PowerPreference preference) noexcept
{
    switch (preference)
    {
    case PowerPreference::None:
        return WGPUPowerPreference_Undefined;
    case PowerPreference::LowPower:
        return WGPUPowerPreference_LowPower;
    case PowerPreference::HighPerformance:
        return WGPUPowerPreference_HighPerformance;
    }
    return WGPUPowerPreference_Undefined;
}

SurfaceTextureStatus fromWgpu(const WGPUSurfaceGetCurrentTextureStatus status) noexcept
{
    switch (status)
    {
    case WGPUSurfaceGetCurrentTextureStatus_SuccessOptimal:
        return SurfaceTextureStatus::Success;
    case WGPUSurfaceGetCurrentTextureStatus_SuccessSuboptimal:
        return SurfaceTextureStatus::Suboptimal;
    case WGPUSurfaceGetCurrentTextureStatus_Timeout:
        return SurfaceTextureStatus::Timeout;
    case WGPUSurfaceGetCurrentTextureStatus_Outdated:
        return SurfaceTextureStatus::Outdated;
    case WGPUSurfaceGetCurrentTextureStatus_Lost:
        return SurfaceTextureStatus::Lost;
    default:
        return SurfaceTextureStatus::Error;
    }
}

WGPUTextureUsage toWgpuTextureUsage(const TextureUsages usages) noexcept
{
    WGPUTextureUsage result = WGPUTextureUsage_None;
    if (usages.has(TextureUsage::CopySrc))
    {
        result |= WGPUTextureUsage_CopySrc;
    }
    if (usages.has(TextureUsage::CopyDst))
    {
        result |= WGPUTextureUsage_CopyDst;
    }
    if (usages.has(TextureUsage::TextureBinding))
    {
        result |= WGPUTextureUsage_TextureBinding;
    }
    if (usages.has(TextureUsage::StorageBinding))
    {
        result |= WGPUTextureUsage_StorageBinding;
    }
    if (usages.has(TextureUsage::RenderAttachment))
    {
        result |= WGPUTextureUsage_RenderAttachment;
    }
    return result;
}

WGPUBlendFactor toWgpu(const BlendFactor factor) noexcept
{
    switch (factor)
    {
    case BlendFactor::Zero:
        return WGPUBlendFactor_Zero;
    case BlendFactor::One:
        return WGPUBlendFactor_One;
    case BlendFactor::SrcAlpha:
        return WGPUBlendFactor_SrcAlpha;
    case BlendFactor::OneMinusSrcAlpha:
        return WGPUBlendFactor_OneMinusSrcAlpha;
    }
    return WGPUBlendFactor_One;
}

WGPUBlendOperation toWgpu(const BlendOperation operation) noexcept
{
    switch (operation)
    {
    case BlendOperation::Add:
        return WGPUBlendOperation_Add;
    case BlendOperation::Subtract:
        return WGPUBlendOperation_Subtract;
    }
    return WGPUBlendOperation_Add;
}

WGPUPrimitiveTopology toWgpu(const PrimitiveTopology topology) noexcept
{
    switch (topology)
    {
    case PrimitiveTopology::PointList:
        return WGPUPrimitiveTopology_PointList;
    case PrimitiveTopology::LineList:
        return WGPUPrimitiveTopology_LineList;
    case PrimitiveTopology::LineStrip:
        return WGPUPrimitiveTopology_LineStrip;
    case PrimitiveTopology::TriangleList:
        return WGPUPrimitiveTopology_TriangleList;
    case PrimitiveTopology::TriangleStrip:
        return WGPUPrimitiveTopology_TriangleStrip;
    }
    return WGPUPrimitiveTopology_TriangleList;
}

WGPUFrontFace toWgpu(const FrontFace frontFace) noexcept
{
    return frontFace == FrontFace::CW ? WGPUFrontFace_CW : WGPUFrontFace_CCW;
}

WGPUCullMode toWgpu(const CullMode cullMode) noexcept
{
    switch (cullMode)
    {
    case CullMode::None:
        return WGPUCullMode_None;
    case CullMode::Front:
        return WGPUCullMode_Front;
    case CullMode::Back:
        return WGPUCullMode_Back;
    }
    return WGPUCullMode_None;
}

const char* WGPUDeviceLostReasonToStr(const WGPUDeviceLostReason reason) noexcept
{
    switch (reason)
    {
    case WGPUDeviceLostReason_Unknown:
        return "Unknown";
    case WGPUDeviceLostReason_Destroyed:
        return "Destroyed";
    case WGPUDeviceLostReason_CallbackCancelled:
        return "CallbackCancelled";
    case WGPUDeviceLostReason_FailedCreation:
        return "FailedCreation";
    default:
        return "Unrecognized";
    }
}

const char* WGPUErrorTypeToStr(const WGPUErrorType type) noexcept
{
    switch (type)
    {
    case WGPUErrorType_NoError:
        return "NoError";
    case WGPUErrorType_Validation:
        return "Validation";
    case WGPUErrorType_OutOfMemory:
        return "OutOfMemory";
    case WGPUErrorType_Internal:
        return "Internal";
    case WGPUErrorType_Unknown:
        return "Unknown";
    default:
        return "Unrecognized";
    }
}
} // namespace glint
