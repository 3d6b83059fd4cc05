#pragma once

#include <glint/gpu_types.hpp>
#include <glint/render_pipeline.hpp>

#include <webgpu/webgpu.h>

#include <optional>

namespace glint
{
WGPUTextureFormat            toWgpu(TextureFormat) noexcept;
std::optional<TextureFormat> fromWgpu(WGPUTextureFormat) noexcept;

WGPUCompositeAlphaMode            toWgpu(CompositeAlphaMode) noexcept;
std::optional<CompositeAlphaMode> fromWgpu(WGPUCompositeAlphaMode) noexcept;

WGPUPresentMode            toWgpu(PresentMode) noexcept;
std::optional<PresentMode> fromWgpu(WGPUPresentMode) noexcept;

WGPUBackendType            toWgpu(BackendType) noexcept;
std::optional<BackendType> fromWgpu(WGPUBackendType) noexcept;

WGPUPowerPreference toWgpu(PowerPreference) noexcept;

SurfaceTextureStatus fromWgpu(WGPUSurfaceGetCurrentTextureStatus) noexcept;

// WGPUTextureUsage is a typedef of the shared WGPUFlags integer type, so it can't be a toWgpu
// overload.
WGPUTextureUsage toWgpuTextureUsage(TextureUsages) noexcept;

WGPUBlendFactor       toWgpu(BlendFactor) noexcept;
WGPUBlendOperation    toWgpu(BlendOperation) noexcept;
WGPUPrimitiveTopology toWgpu(PrimitiveTopology) noexcept;
WGPUFrontFace         toWgpu(FrontFace) noexcept;
WGPUCullMode          toWgpu(CullMode) noexcept;

const char* WGPUDeviceLostReasonToStr(WGPUDeviceLostReason) noexcept;
const char* WGPUErrorTypeToStr(WGPUErrorType) noexcept;
} // namespace glint
