#include "native_window.hpp"
#include "renderer.hpp"
#include "renderer_error.hpp"

#include <common/assert.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace glint
{
namespace
{
AdapterProperties acquireDevice(
    GpuBackend&           backend,
    NativeWindow&         window,
    const GpuEnvironment& environment)
{
    if (!backend.createInstance())
    {
        throw AcquisitionError(AcquisitionStage::Instance);
    }

    if (!backend.createSurface(window))
    {
        throw AcquisitionError(AcquisitionStage::Surface);
    }

    const AdapterOptions adapterOptions{
        .powerPreference = environment.powerPreference,
        .backend = environment.backend,
        .forceFallbackAdapter = false,
    };
    std::optional<AdapterProperties> adapter = backend.requestAdapter(adapterOptions);
    if (!adapter)
    {
        throw AcquisitionError(AcquisitionStage::Adapter);
    }

    spdlog::info(
        "Using adapter \"{}\" ({} backend, {} bytes of immediate data)",
        adapter->name,
        toString(adapter->backend),
        adapter->maxImmediateSize);

    if (!adapter->supportsImmediates)
    {
        throw ImmediateLimitError(sizeof(Immediate), 0);
    }
    if (adapter->maxImmediateSize < sizeof(Immediate))
    {
        throw ImmediateLimitError(sizeof(Immediate), adapter->maxImmediateSize);
    }

    const DeviceDescriptor deviceDesc{
        .requireImmediates = true,
        .maxImmediateSize = static_cast<std::uint32_t>(sizeof(Immediate)),
        .memoryHints = MemoryHints::Performance,
    };
    if (!backend.requestDevice(deviceDesc))
    {
        throw AcquisitionError(AcquisitionStage::Device);
    }

    return std::move(*adapter);
}
} // namespace

Renderer::Renderer(
    std::shared_ptr<NativeWindow> window,
    std::unique_ptr<GpuBackend>   backend,
    const RendererDescriptor&     desc)
    : mWindow(std::move(window)),
      mBackend(std::move(backend)),
      mAdapterProperties(),
      mSurfaceConfig(),
      mImmediate(1, 1)
{
    GLINT_ASSERT(mWindow != nullptr);
    GLINT_ASSERT(mBackend != nullptr);

    mAdapterProperties = acquireDevice(*mBackend, *mWindow, desc.environment);

    // A surface can't be configured with a zero extent, so a window which starts out minimized
    // gets a 1x1 surface until its first resize.
    const Extent2u framebufferSize = atLeastOne(mWindow->innerSize());

    mSurfaceConfig = makeSurfaceConfiguration(mBackend->surfaceCapabilities(), framebufferSize);
    mBackend->configureSurface(mSurfaceConfig);
    mImmediate.updateWindowSize(framebufferSize.x, framebufferSize.y);

    spdlog::info(
        "Surface configured: {}x{}, format {}, view format {}, {} present mode, {} alpha",
        mSurfaceConfig.width,
        mSurfaceConfig.height,
        toString(mSurfaceConfig.format),
        toString(mSurfaceConfig.viewFormats.front()),
        toString(mSurfaceConfig.presentMode),
        toString(mSurfaceConfig.alphaMode));

    mBackend->createRenderPipeline(makeRenderPipelineDescriptor(
        mSurfaceConfig.format, desc.vertexShaderSource, desc.fragmentShaderSource));
}

Renderer::~Renderer()
{
    // GPU objects go first, while the window they were created from is guaranteed to be alive.
    mBackend.reset();
    mWindow.reset();
}

void Renderer::resize()
{
    const Extent2u size = mWindow->innerSize();
    if (isEmpty(size))
    {
        spdlog::debug("Skipping surface reconfiguration for empty window {}x{}", size.x, size.y);
        return;
    }

    mSurfaceConfig.width = size.x;
    mSurfaceConfig.height = size.y;
    mBackend->configureSurface(mSurfaceConfig);
    mImmediate.updateWindowSize(size.x, size.y);

    spdlog::debug("Surface reconfigured to {}x{}", size.x, size.y);
}

void Renderer::render()
{
    const SurfaceTextureStatus status = mBackend->acquireSurfaceTexture();
    switch (status)
    {
    case SurfaceTextureStatus::Success:
    case SurfaceTextureStatus::Suboptimal:
        break;
    case SurfaceTextureStatus::Outdated:
    case SurfaceTextureStatus::Lost:
        // The next redraw is expected to succeed against the reconfigured surface.
        spdlog::debug("Surface texture {}, reconfiguring", toString(status));
        resize();
        return;
    default:
        spdlog::error("Failed to acquire next surface texture: {}", toString(status));
        return;
    }

    GLINT_ASSERT(!mSurfaceConfig.viewFormats.empty());

    const RenderPassDescriptor renderPassDesc{
        .viewFormat = mSurfaceConfig.viewFormats.front(),
        .clearValue = Color{0.0, 0.0, 0.0, 1.0},
    };
    const DrawCommand drawCommand{
        .immediates = mImmediate.bytes(),
        .vertexCount = 3,
        .instanceCount = 1,
        .firstVertex = 0,
        .firstInstance = 0,
    };

    if (!mBackend->submitRenderPass(renderPassDesc, drawCommand))
    {
        spdlog::error("Failed to record frame, dropping it");
        mBackend->releaseSurfaceTexture();
        return;
    }

    mWindow->prePresentNotify();
    mBackend->presentSurfaceTexture();
}
} // namespace glint
