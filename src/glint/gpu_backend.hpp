#pragma once

#include "gpu_types.hpp"
#include "render_pipeline.hpp"
#include "surface_capabilities.hpp"
#include "surface_configuration.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace glint
{
class NativeWindow;

struct AdapterOptions
{
    PowerPreference            powerPreference = PowerPreference::HighPerformance;
    std::optional<BackendType> backend;
    bool                       forceFallbackAdapter = false;
};

struct AdapterProperties
{
    std::string   name;
    BackendType   backend = BackendType::Null;
    bool          supportsImmediates = false;
    std::uint32_t maxImmediateSize = 0;
};

struct DeviceDescriptor
{
    bool          requireImmediates = true;
    std::uint32_t maxImmediateSize = 0;
    MemoryHints   memoryHints = MemoryHints::Performance;
};

struct Color
{
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;
    double a = 1.0;
};

struct RenderPassDescriptor
{
    // The format the acquired surface texture is viewed as. Must be one of the configured view
    // formats.
    TextureFormat viewFormat = TextureFormat::Undefined;
    Color         clearValue;
};

struct DrawCommand
{
    std::span<const std::byte> immediates;
    std::uint32_t              vertexCount = 0;
    std::uint32_t              instanceCount = 0;
    std::uint32_t              firstVertex = 0;
    std::uint32_t              firstInstance = 0;
};

// The graphics API as seen by the renderer. An implementation owns the instance, surface, adapter,
// device, queue and pipeline and releases them in reverse order of creation.
//
// Acquisition is performed exactly once, in order: createInstance, createSurface, requestAdapter,
// requestDevice. A failed step returns false or an empty optional.
class GpuBackend
{
public:
    virtual ~GpuBackend() = default;

    // Acquisition

    virtual bool createInstance() = 0;
    virtual bool createSurface(NativeWindow&) = 0;
    virtual std::optional<AdapterProperties> requestAdapter(const AdapterOptions&) = 0;
    virtual bool requestDevice(const DeviceDescriptor&) = 0;

    // Surface

    virtual SurfaceCapabilities surfaceCapabilities() const = 0;
    virtual void configureSurface(const SurfaceConfiguration&) = 0;

    // Pipeline

    virtual void createRenderPipeline(const RenderPipelineDescriptor&) = 0;

    // Frame
    //
    // A texture acquired with a successful status is held by the backend until it is either
    // presented or released.

    virtual SurfaceTextureStatus acquireSurfaceTexture() = 0;
    // Records a single render pass which clears the acquired texture and issues one draw with the
    // pipeline, then submits it. Returns false without submitting anything if the pass could not
    // be recorded.
    virtual bool submitRenderPass(const RenderPassDescriptor&, const DrawCommand&) = 0;
    virtual void presentSurfaceTexture() = 0;
    virtual void releaseSurfaceTexture() = 0;
};
} // namespace glint
