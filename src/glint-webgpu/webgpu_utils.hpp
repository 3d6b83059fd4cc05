#pragma once

#include <webgpu/webgpu.h>

#include <string_view>

namespace glint
{
inline WGPUStringView label(const char* const str) noexcept
{
    return WGPUStringView{.data = str, .length = WGPU_STRLEN};
}

inline WGPUStringView stringView(const std::string_view str) noexcept
{
    return WGPUStringView{.data = str.data(), .length = str.size()};
}

inline std::string_view toStringView(const WGPUStringView str) noexcept
{
    if (str.data == nullptr)
    {
        return {};
    }
    if (str.length == WGPU_STRLEN)
    {
        return std::string_view(str.data);
    }
    return std::string_view(str.data, str.length);
}

inline void instanceSafeRelease(const WGPUInstance instance) noexcept
{
    if (instance)
    {
        wgpuInstanceRelease(instance);
    }
}

inline void surfaceSafeRelease(const WGPUSurface surface) noexcept
{
    if (surface)
    {
        wgpuSurfaceRelease(surface);
    }
}

inline void adapterSafeRelease(const WGPUAdapter adapter) noexcept
{
    if (adapter)
    {
        wgpuAdapterRelease(adapter);
    }
}

inline void deviceSafeRelease(const WGPUDevice device) noexcept
{
    if (device)
    {
        wgpuDeviceRelease(device);
    }
}

inline void queueSafeRelease(const WGPUQueue queue) noexcept
{
    if (queue)
    {
        wgpuQueueRelease(queue);
    }
}

inline void shaderModuleSafeRelease(const WGPUShaderModule shaderModule) noexcept
{
    if (shaderModule)
    {
        wgpuShaderModuleRelease(shaderModule);
    }
}

inline void pipelineLayoutSafeRelease(const WGPUPipelineLayout pipelineLayout) noexcept
{
    if (pipelineLayout)
    {
        wgpuPipelineLayoutRelease(pipelineLayout);
    }
}

inline void renderPipelineSafeRelease(const WGPURenderPipeline pipeline) noexcept
{
    if (pipeline)
    {
        wgpuRenderPipelineRelease(pipeline);
    }
}

// Surface textures are owned by the surface; they are released but never destroyed.
inline void surfaceTextureSafeRelease(const WGPUTexture texture) noexcept
{
    if (texture)
    {
        wgpuTextureRelease(texture);
    }
}

inline void textureViewSafeRelease(const WGPUTextureView textureView) noexcept
{
    if (textureView)
    {
        wgpuTextureViewRelease(textureView);
    }
}

inline void commandEncoderSafeRelease(const WGPUCommandEncoder encoder) noexcept
{
    if (encoder)
    {
        wgpuCommandEncoderRelease(encoder);
    }
}

inline void renderPassEncoderSafeRelease(const WGPURenderPassEncoder encoder) noexcept
{
    if (encoder)
    {
        wgpuRenderPassEncoderRelease(encoder);
    }
}

inline void commandBufferSafeRelease(const WGPUCommandBuffer commandBuffer) noexcept
{
    if (commandBuffer)
    {
        wgpuCommandBufferRelease(commandBuffer);
    }
}
} // namespace glint
