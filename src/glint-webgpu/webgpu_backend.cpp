#include "webgpu_backend.hpp"
#include "webgpu_conversions.hpp"
#include "webgpu_utils.hpp"

#include <glint/native_window.hpp>

#include <common/assert.hpp>

#include <GLFW/glfw3.h>
#include <glfw3webgpu.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <iterator>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace glint
{
namespace
{
// Immediates are an experimental Dawn feature, which is why the instance enables unsafe APIs.
constexpr WGPUFeatureName IMMEDIATES_FEATURE = WGPUFeatureName_ChromiumExperimentalImmediate;

void onDeviceLost(
    const WGPUDevice* /*device*/,
    const WGPUDeviceLostReason reason,
    const WGPUStringView       message,
    void* /*userdata1*/,
    void* /*userdata2*/)
{
    if (reason == WGPUDeviceLostReason_Destroyed ||
        reason == WGPUDeviceLostReason_CallbackCancelled)
    {
        spdlog::debug("Device released: {}", WGPUDeviceLostReasonToStr(reason));
        return;
    }
    spdlog::error(
        "Device lost reason: {}: {}", WGPUDeviceLostReasonToStr(reason), toStringView(message));
}

void onDeviceError(
    const WGPUDevice* /*device*/,
    const WGPUErrorType  type,
    const WGPUStringView message,
    void* /*userdata1*/,
    void* /*userdata2*/)
{
    spdlog::error("Uncaptured device error: {}: {}", WGPUErrorTypeToStr(type), toStringView(message));
}

// Blocks until the future's callback has run. There is no timeout: if the platform stalls, so do
// we.
bool waitForFuture(const WGPUInstance instance, const WGPUFuture future)
{
    WGPUFutureWaitInfo waitInfo{.future = future, .completed = false};
    for (;;)
    {
        const WGPUWaitStatus status = wgpuInstanceWaitAny(instance, 1, &waitInfo, 0);
        if (status == WGPUWaitStatus_Success)
        {
            return true;
        }
        if (status != WGPUWaitStatus_TimedOut)
        {
            spdlog::error("Waiting on instance future failed with status {}", static_cast<int>(status));
            return false;
        }
        wgpuInstanceProcessEvents(instance);
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

WGPUShaderModule createShaderModule(
    const WGPUDevice             device,
    const char* const            moduleLabel,
    const ShaderStageDescriptor& stage)
{
    WGPUShaderSourceWGSL wgslDesc{
        .chain =
            WGPUChainedStruct{
                .next = nullptr,
                .sType = WGPUSType_ShaderSourceWGSL,
            },
        .code = stringView(stage.source),
    };

    const WGPUShaderModuleDescriptor moduleDesc{
        .nextInChain = &wgslDesc.chain,
        .label = label(moduleLabel),
    };
    return wgpuDeviceCreateShaderModule(device, &moduleDesc);
}
} // namespace

WebGpuBackend::WebGpuBackend()
    : mInstance(nullptr),
      mSurface(nullptr),
      mAdapter(nullptr),
      mDevice(nullptr),
      mQueue(nullptr),
      mPipeline(nullptr),
      mSurfaceTexture(nullptr),
      mSurfaceConfigured(false)
{
}

WebGpuBackend::~WebGpuBackend()
{
    surfaceTextureSafeRelease(mSurfaceTexture);
    mSurfaceTexture = nullptr;
    renderPipelineSafeRelease(mPipeline);
    mPipeline = nullptr;
    if (mSurfaceConfigured)
    {
        wgpuSurfaceUnconfigure(mSurface);
        mSurfaceConfigured = false;
    }
    queueSafeRelease(mQueue);
    mQueue = nullptr;
    deviceSafeRelease(mDevice);
    mDevice = nullptr;
    adapterSafeRelease(mAdapter);
    mAdapter = nullptr;
    surfaceSafeRelease(mSurface);
    mSurface = nullptr;
    instanceSafeRelease(mInstance);
    mInstance = nullptr;
}

bool WebGpuBackend::createInstance()
{
    GLINT_ASSERT(mInstance == nullptr);

    // Experimental features, such as immediates, are unsafe APIs and are disabled by default.
    const char*               allowUnsafeApisToggle = "allow_unsafe_apis";
    WGPUDawnTogglesDescriptor instanceToggles{
        .chain =
            WGPUChainedStruct{
                .next = nullptr,
                .sType = WGPUSType_DawnTogglesDescriptor,
            },
        .enabledToggleCount = 1,
        .enabledToggles = &allowUnsafeApisToggle,
        .disabledToggleCount = 0,
        .disabledToggles = nullptr,
    };

    WGPUInstanceDescriptor instanceDesc = WGPU_INSTANCE_DESCRIPTOR_INIT;
    instanceDesc.nextInChain = &instanceToggles.chain;

    mInstance = wgpuCreateInstance(&instanceDesc);
    return mInstance != nullptr;
}

bool WebGpuBackend::createSurface(NativeWindow& window)
{
    GLINT_ASSERT(mInstance != nullptr);
    GLINT_ASSERT(window.ptr() != nullptr);

    mSurface = glfwCreateWindowWGPUSurface(mInstance, window.ptr());
    return mSurface != nullptr;
}

std::optional<AdapterProperties> WebGpuBackend::requestAdapter(const AdapterOptions& options)
{
    GLINT_ASSERT(mSurface != nullptr);

    const WGPURequestAdapterOptions adapterOptions{
        .nextInChain = nullptr,
        .featureLevel = WGPUFeatureLevel_Core,
        .powerPreference = toWgpu(options.powerPreference),
        .forceFallbackAdapter = options.forceFallbackAdapter,
        .backendType = options.backend ? toWgpu(*options.backend) : WGPUBackendType_Undefined,
        .compatibleSurface = mSurface,
    };

    auto onAdapterResponse = [](const WGPURequestAdapterStatus status,
                                const WGPUAdapter              adapterResponse,
                                const WGPUStringView           message,
                                void* const                    userdata1,
                                void* /*userdata2*/) -> void {
        WGPUAdapter* const adapter = static_cast<WGPUAdapter*>(userdata1);
        if (status == WGPURequestAdapterStatus_Success)
        {
            *adapter = adapterResponse;
        }
        else
        {
            spdlog::error("Failed to request adapter: {}", toStringView(message));
        }
    };

    const WGPURequestAdapterCallbackInfo callbackInfo{
        .nextInChain = nullptr,
        .mode = WGPUCallbackMode_WaitAnyOnly,
        .callback = onAdapterResponse,
        .userdata1 = &mAdapter,
        .userdata2 = nullptr,
    };

    const WGPUFuture future = wgpuInstanceRequestAdapter(mInstance, &adapterOptions, callbackInfo);
    if (!waitForFuture(mInstance, future) || !mAdapter)
    {
        return std::nullopt;
    }

    AdapterProperties properties;

    WGPUAdapterInfo info = WGPU_ADAPTER_INFO_INIT;
    if (wgpuAdapterGetInfo(mAdapter, &info) == WGPUStatus_Success)
    {
        properties.name = std::string(toStringView(info.device));
        if (properties.name.empty())
        {
            properties.name = std::string(toStringView(info.description));
        }
        properties.backend = fromWgpu(info.backendType).value_or(BackendType::Null);
        wgpuAdapterInfoFreeMembers(info);
    }
    else
    {
        spdlog::warn("Failed to query adapter info");
    }

    properties.supportsImmediates = wgpuAdapterHasFeature(mAdapter, IMMEDIATES_FEATURE);

    WGPULimits limits = WGPU_LIMITS_INIT;
    if (wgpuAdapterGetLimits(mAdapter, &limits) == WGPUStatus_Success)
    {
        properties.maxImmediateSize = limits.maxImmediateSize;
    }
    else
    {
        spdlog::warn("Failed to query adapter limits");
    }

    return properties;
}

bool WebGpuBackend::requestDevice(const DeviceDescriptor& desc)
{
    GLINT_ASSERT(mAdapter != nullptr);

    const std::array<WGPUFeatureName, 1> requiredFeatures{
        IMMEDIATES_FEATURE,
    };

    // Unset limits resolve to the WebGPU defaults.
    WGPULimits requiredLimits = WGPU_LIMITS_INIT;
    requiredLimits.maxImmediateSize = desc.maxImmediateSize;

    // NOTE: Dawn takes no memory allocation hints, its allocator already favours performance. API
    // tracing is not enabled.
    const WGPUDeviceDescriptor deviceDesc{
        .nextInChain = nullptr,
        .label = label("Device"),
        .requiredFeatureCount = desc.requireImmediates ? requiredFeatures.size() : 0,
        .requiredFeatures = requiredFeatures.data(),
        .requiredLimits = &requiredLimits,
        .defaultQueue = WGPUQueueDescriptor{.nextInChain = nullptr, .label = label("Default queue")},
        .deviceLostCallbackInfo =
            WGPUDeviceLostCallbackInfo{
                .nextInChain = nullptr,
                .mode = WGPUCallbackMode_AllowSpontaneous,
                .callback = onDeviceLost,
                .userdata1 = nullptr,
                .userdata2 = nullptr,
            },
        .uncapturedErrorCallbackInfo =
            WGPUUncapturedErrorCallbackInfo{
                .nextInChain = nullptr,
                .callback = onDeviceError,
                .userdata1 = nullptr,
                .userdata2 = nullptr,
            },
    };

    auto onDeviceResponse = [](const WGPURequestDeviceStatus status,
                               const WGPUDevice              maybeDevice,
                               const WGPUStringView          message,
                               void* const                   userdata1,
                               void* /*userdata2*/) -> void {
        WGPUDevice* const device = static_cast<WGPUDevice*>(userdata1);
        if (status == WGPURequestDeviceStatus_Success)
        {
            *device = maybeDevice;
        }
        else
        {
            spdlog::error("Failed to request device: {}", toStringView(message));
        }
    };

    const WGPURequestDeviceCallbackInfo callbackInfo{
        .nextInChain = nullptr,
        .mode = WGPUCallbackMode_WaitAnyOnly,
        .callback = onDeviceResponse,
        .userdata1 = &mDevice,
        .userdata2 = nullptr,
    };

    const WGPUFuture future = wgpuAdapterRequestDevice(mAdapter, &deviceDesc, callbackInfo);
    if (!waitForFuture(mInstance, future) || !mDevice)
    {
        return false;
    }

    mQueue = wgpuDeviceGetQueue(mDevice);
    return mQueue != nullptr;
}

SurfaceCapabilities WebGpuBackend::surfaceCapabilities() const
{
    GLINT_ASSERT(mSurface != nullptr);
    GLINT_ASSERT(mAdapter != nullptr);

    SurfaceCapabilities capabilities;

    WGPUSurfaceCapabilities caps = WGPU_SURFACE_CAPABILITIES_INIT;
    if (wgpuSurfaceGetCapabilities(mSurface, mAdapter, &caps) != WGPUStatus_Success)
    {
        spdlog::error("Failed to query surface capabilities");
        return capabilities;
    }

    // Formats the renderer has no name for are left out, so that whatever gets selected is both
    // supported and known.
    for (std::size_t i = 0; i < caps.formatCount; ++i)
    {
        if (const auto format = fromWgpu(caps.formats[i]))
        {
            capabilities.formats.push_back(*format);
        }
        else
        {
            spdlog::debug("Skipping surface format {}", static_cast<int>(caps.formats[i]));
        }
    }
    for (std::size_t i = 0; i < caps.presentModeCount; ++i)
    {
        if (const auto mode = fromWgpu(caps.presentModes[i]))
        {
            capabilities.presentModes.push_back(*mode);
        }
    }
    for (std::size_t i = 0; i < caps.alphaModeCount; ++i)
    {
        if (const auto mode = fromWgpu(caps.alphaModes[i]))
        {
            capabilities.alphaModes.push_back(*mode);
        }
    }

    wgpuSurfaceCapabilitiesFreeMembers(caps);

    return capabilities;
}

void WebGpuBackend::configureSurface(const SurfaceConfiguration& config)
{
    GLINT_ASSERT(mDevice != nullptr);
    GLINT_ASSERT(config.width > 0 && config.height > 0);

    // A frame texture can't outlive the configuration it was acquired from.
    releaseSurfaceTexture();

    std::vector<WGPUTextureFormat> viewFormats;
    viewFormats.reserve(config.viewFormats.size());
    std::transform(
        config.viewFormats.begin(),
        config.viewFormats.end(),
        std::back_inserter(viewFormats),
        [](const TextureFormat format) -> WGPUTextureFormat { return toWgpu(format); });

    // NOTE: WebGPU has no control over the maximum frame latency; config.desiredMaximumFrameLatency
    // is left to Dawn's default swap chain depth.
    const WGPUSurfaceConfiguration surfaceConfig{
        .nextInChain = nullptr,
        .device = mDevice,
        .format = toWgpu(config.format),
        .usage = toWgpuTextureUsage(config.usage),
        .width = config.width,
        .height = config.height,
        .viewFormatCount = viewFormats.size(),
        .viewFormats = viewFormats.data(),
        .alphaMode = toWgpu(config.alphaMode),
        .presentMode = toWgpu(config.presentMode),
    };
    wgpuSurfaceConfigure(mSurface, &surfaceConfig);
    mSurfaceConfigured = true;
}

void WebGpuBackend::createRenderPipeline(const RenderPipelineDescriptor& desc)
{
    GLINT_ASSERT(mDevice != nullptr);
    GLINT_ASSERT(mPipeline == nullptr);
    // WebGPU rasterizes filled polygons only.
    GLINT_ASSERT(desc.primitive.polygonMode == PolygonMode::Fill);

    const WGPUShaderModule vertexModule =
        createShaderModule(mDevice, "Vertex shader", desc.vertex);
    const WGPUShaderModule fragmentModule =
        createShaderModule(mDevice, "Fragment shader", desc.fragment);
    if (!vertexModule || !fragmentModule)
    {
        shaderModuleSafeRelease(vertexModule);
        shaderModuleSafeRelease(fragmentModule);
        throw std::runtime_error("Failed to create shader modules.");
    }

    // NOTE: WebGPU immediates are visible to every stage of the pipeline, which covers
    // desc.immediateVisibility.
    const WGPUPipelineLayoutDescriptor pipelineLayoutDesc{
        .nextInChain = nullptr,
        .label = label("Pipeline layout"),
        .bindGroupLayoutCount = 0,
        .bindGroupLayouts = nullptr,
        .immediateSize = desc.immediateSize,
    };
    const WGPUPipelineLayout pipelineLayout =
        wgpuDeviceCreatePipelineLayout(mDevice, &pipelineLayoutDesc);

    const WGPUBlendState blendState{
        .color =
            WGPUBlendComponent{
                .operation = toWgpu(desc.colorTarget.colorBlend.operation),
                .srcFactor = toWgpu(desc.colorTarget.colorBlend.srcFactor),
                .dstFactor = toWgpu(desc.colorTarget.colorBlend.dstFactor),
            },
        .alpha =
            WGPUBlendComponent{
                .operation = toWgpu(desc.colorTarget.alphaBlend.operation),
                .srcFactor = toWgpu(desc.colorTarget.alphaBlend.srcFactor),
                .dstFactor = toWgpu(desc.colorTarget.alphaBlend.dstFactor),
            },
    };

    const WGPUColorTargetState colorTarget{
        .nextInChain = nullptr,
        .format = toWgpu(desc.colorTarget.format),
        .blend = &blendState,
        .writeMask =
            desc.colorTarget.writeAllChannels ? WGPUColorWriteMask_All : WGPUColorWriteMask_None,
    };

    const WGPUFragmentState fragmentState{
        .nextInChain = nullptr,
        .module = fragmentModule,
        .entryPoint = stringView(desc.fragment.entryPoint),
        .constantCount = 0,
        .constants = nullptr,
        .targetCount = 1,
        .targets = &colorTarget,
    };

    const WGPURenderPipelineDescriptor pipelineDesc{
        .nextInChain = nullptr,
        .label = label("Render pipeline"),
        .layout = pipelineLayout,
        // NOTE: no vertex buffers, the vertex shader generates positions from the vertex index.
        .vertex =
            WGPUVertexState{
                .nextInChain = nullptr,
                .module = vertexModule,
                .entryPoint = stringView(desc.vertex.entryPoint),
                .constantCount = 0,
                .constants = nullptr,
                .bufferCount = 0,
                .buffers = nullptr,
            },
        .primitive =
            WGPUPrimitiveState{
                .nextInChain = nullptr,
                .topology = toWgpu(desc.primitive.topology),
                .stripIndexFormat = WGPUIndexFormat_Undefined,
                .frontFace = toWgpu(desc.primitive.frontFace),
                .cullMode = toWgpu(desc.primitive.cullMode),
                .unclippedDepth = desc.primitive.unclippedDepth,
            },
        .depthStencil = nullptr,
        .multisample =
            WGPUMultisampleState{
                .nextInChain = nullptr,
                .count = desc.multisample.count,
                .mask = desc.multisample.mask,
                .alphaToCoverageEnabled = desc.multisample.alphaToCoverageEnabled,
            },
        .fragment = &fragmentState,
    };

    mPipeline = wgpuDeviceCreateRenderPipeline(mDevice, &pipelineDesc);

    pipelineLayoutSafeRelease(pipelineLayout);
    shaderModuleSafeRelease(fragmentModule);
    shaderModuleSafeRelease(vertexModule);

    if (!mPipeline)
    {
        throw std::runtime_error("Failed to create render pipeline.");
    }
}

SurfaceTextureStatus WebGpuBackend::acquireSurfaceTexture()
{
    GLINT_ASSERT(mSurfaceConfigured);

    // Ensure that Dawn ticks pending async operations, so that device callbacks get to run.
    wgpuInstanceProcessEvents(mInstance);

    releaseSurfaceTexture();

    WGPUSurfaceTexture surfaceTexture = WGPU_SURFACE_TEXTURE_INIT;
    wgpuSurfaceGetCurrentTexture(mSurface, &surfaceTexture);

    const SurfaceTextureStatus status = fromWgpu(surfaceTexture.status);
    if (status == SurfaceTextureStatus::Success || status == SurfaceTextureStatus::Suboptimal)
    {
        mSurfaceTexture = surfaceTexture.texture;
    }
    else
    {
        surfaceTextureSafeRelease(surfaceTexture.texture);
    }
    return status;
}

bool WebGpuBackend::submitRenderPass(const RenderPassDescriptor& pass, const DrawCommand& draw)
{
    GLINT_ASSERT(mSurfaceTexture != nullptr);
    GLINT_ASSERT(mPipeline != nullptr);

    const WGPUTextureView textureView = [this, &pass]() -> WGPUTextureView {
        WGPUTextureViewDescriptor viewDesc = WGPU_TEXTURE_VIEW_DESCRIPTOR_INIT;
        viewDesc.label = label("Surface texture view");
        viewDesc.format = toWgpu(pass.viewFormat);
        viewDesc.dimension = WGPUTextureViewDimension_2D;
        viewDesc.baseMipLevel = 0;
        viewDesc.mipLevelCount = 1;
        viewDesc.baseArrayLayer = 0;
        viewDesc.arrayLayerCount = 1;
        viewDesc.aspect = WGPUTextureAspect_All;
        return wgpuTextureCreateView(mSurfaceTexture, &viewDesc);
    }();
    if (!textureView)
    {
        spdlog::error("Failed to create surface texture view as {}", toString(pass.viewFormat));
        return false;
    }

    const WGPUCommandEncoder encoder = [this]() -> WGPUCommandEncoder {
        const WGPUCommandEncoderDescriptor cmdEncoderDesc{
            .nextInChain = nullptr,
            .label = label("Command encoder"),
        };
        return wgpuDeviceCreateCommandEncoder(mDevice, &cmdEncoderDesc);
    }();
    if (!encoder)
    {
        textureViewSafeRelease(textureView);
        return false;
    }

    const WGPURenderPassEncoder renderPassEncoder =
        [encoder, textureView, &pass]() -> WGPURenderPassEncoder {
        const WGPURenderPassColorAttachment colorAttachment{
            .nextInChain = nullptr,
            .view = textureView,
            .depthSlice = WGPU_DEPTH_SLICE_UNDEFINED, // depthSlice must be initialized with
                                                      // 'undefined' value for 2d color attachments.
            .resolveTarget = nullptr,
            .loadOp = WGPULoadOp_Clear,
            .storeOp = WGPUStoreOp_Store,
            .clearValue =
                WGPUColor{pass.clearValue.r, pass.clearValue.g, pass.clearValue.b, pass.clearValue.a},
        };

        const WGPURenderPassDescriptor renderPassDesc{
            .nextInChain = nullptr,
            .label = label("Render pass"),
            .colorAttachmentCount = 1,
            .colorAttachments = &colorAttachment,
            .depthStencilAttachment = nullptr,
            .occlusionQuerySet = nullptr,
            .timestampWrites = nullptr,
        };

        return wgpuCommandEncoderBeginRenderPass(encoder, &renderPassDesc);
    }();
    if (!renderPassEncoder)
    {
        commandEncoderSafeRelease(encoder);
        textureViewSafeRelease(textureView);
        return false;
    }

    {
        wgpuRenderPassEncoderSetPipeline(renderPassEncoder, mPipeline);
        wgpuRenderPassEncoderSetImmediates(
            renderPassEncoder, 0, draw.immediates.data(), draw.immediates.size());
        wgpuRenderPassEncoderDraw(
            renderPassEncoder,
            draw.vertexCount,
            draw.instanceCount,
            draw.firstVertex,
            draw.firstInstance);
    }

    wgpuRenderPassEncoderEnd(renderPassEncoder);

    const WGPUCommandBuffer cmdBuffer = [encoder]() -> WGPUCommandBuffer {
        const WGPUCommandBufferDescriptor cmdBufferDesc{
            .nextInChain = nullptr,
            .label = label("Frame command buffer"),
        };
        return wgpuCommandEncoderFinish(encoder, &cmdBufferDesc);
    }();

    const bool recorded = cmdBuffer != nullptr;
    if (recorded)
    {
        wgpuQueueSubmit(mQueue, 1, &cmdBuffer);
    }

    commandBufferSafeRelease(cmdBuffer);
    renderPassEncoderSafeRelease(renderPassEncoder);
    commandEncoderSafeRelease(encoder);
    textureViewSafeRelease(textureView);

    return recorded;
}

void WebGpuBackend::presentSurfaceTexture()
{
    GLINT_ASSERT(mSurfaceTexture != nullptr);

    if (wgpuSurfacePresent(mSurface) != WGPUStatus_Success)
    {
        spdlog::error("Failed to present surface texture");
    }
    releaseSurfaceTexture();
}

void WebGpuBackend::releaseSurfaceTexture()
{
    surfaceTextureSafeRelease(mSurfaceTexture);
    mSurfaceTexture = nullptr;
}
} // namespace glint
