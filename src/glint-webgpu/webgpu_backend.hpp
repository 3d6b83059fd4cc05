#pragma once

#include <glint/gpu_backend.hpp>

#include <webgpu/webgpu.h>

namespace glint
{
// GpuBackend implemented with Dawn's WebGPU. The surface is created from a GLFW window.
class WebGpuBackend final : public GpuBackend
{
public:
    WebGpuBackend();
    ~WebGpuBackend() override;

    WebGpuBackend(const WebGpuBackend&) = delete;
    WebGpuBackend& operator=(const WebGpuBackend&) = delete;

    WebGpuBackend(WebGpuBackend&&) = delete;
    WebGpuBackend& operator=(WebGpuBackend&&) = delete;

    // Acquisition

    bool                             createInstance() override;
    bool                             createSurface(NativeWindow&) override;
    std::optional<AdapterProperties> requestAdapter(const AdapterOptions&) override;
    bool                             requestDevice(const DeviceDescriptor&) override;

    // Surface

    SurfaceCapabilities surfaceCapabilities() const override;
    void                configureSurface(const SurfaceConfiguration&) override;

    // Pipeline

    void createRenderPipeline(const RenderPipelineDescriptor&) override;

    // Frame

    SurfaceTextureStatus acquireSurfaceTexture() override;
    bool submitRenderPass(const RenderPassDescriptor&, const DrawCommand&) override;
    void presentSurfaceTexture() override;
    void releaseSurfaceTexture() override;

private:
    WGPUInstance       mInstance;
    WGPUSurface        mSurface;
    WGPUAdapter        mAdapter;
    WGPUDevice         mDevice;
    WGPUQueue          mQueue;
    WGPURenderPipeline mPipeline;
    WGPUTexture        mSurfaceTexture;
    bool               mSurfaceConfigured;
};
} // namespace glint
