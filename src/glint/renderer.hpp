#pragma once

#include "gpu_backend.hpp"
#include "gpu_environment.hpp"
#include "immediate.hpp"
#include "surface_configuration.hpp"

#include <memory>
#include <string_view>

namespace glint
{
class NativeWindow;

struct RendererDescriptor
{
    // Finalized WGSL text containing the `vs_main` and `fs_main` entry points.
    std::string_view vertexShaderSource;
    std::string_view fragmentShaderSource;
    GpuEnvironment   environment;
};

// Draws a full-screen triangle into the window's surface every frame, passing the window size and
// aspect ratio to the shaders as immediate constants.
//
// The constructor acquires the GPU through `backend` and throws AcquisitionError,
// CapabilityMissingError or ImmediateLimitError if that fails. After construction, resize() and
// render() never throw on account of the surface: frames which cannot be drawn are skipped.
class Renderer
{
public:
    Renderer(
        std::shared_ptr<NativeWindow> window,
        std::unique_ptr<GpuBackend>   backend,
        const RendererDescriptor&     descriptor);
    ~Renderer();

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    Renderer(Renderer&&) = delete;
    Renderer& operator=(Renderer&&) = delete;

    // Reconfigures the surface to the window's current size. Does nothing while the window is
    // minimized.
    void resize();

    // Draws and presents one frame. An outdated or lost surface is reconfigured and the frame is
    // skipped; other acquisition errors are logged and the frame is skipped.
    void render();

    // Accessors

    const SurfaceConfiguration& surfaceConfiguration() const noexcept { return mSurfaceConfig; }
    const Immediate&            immediate() const noexcept { return mImmediate; }
    const AdapterProperties&    adapterProperties() const noexcept { return mAdapterProperties; }

private:
    // The window is declared before the backend so that the surface is released before the
    // renderer lets go of the window.
    std::shared_ptr<NativeWindow> mWindow;
    std::unique_ptr<GpuBackend>   mBackend;
    AdapterProperties             mAdapterProperties;
    SurfaceConfiguration          mSurfaceConfig;
    Immediate                     mImmediate;
};
} // namespace glint
