#pragma once

#include <glint/gpu_backend.hpp>
#include <glint/native_window.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace glint::test
{
// Every call made through the fakes, in order, shared between the backend and the window.
using CallLog = std::vector<std::string>;

class FakeWindow final : public NativeWindow
{
public:
    FakeWindow(std::shared_ptr<CallLog> log, const Extent2u size)
        : mLog(std::move(log)),
          mSize(size)
    {
    }

    Extent2u innerSize() const override { return mSize; }
    void     prePresentNotify() override { mLog->push_back("prePresentNotify"); }

    GLFWwindow* ptr() const override { return nullptr; }

    void setInnerSize(const Extent2u size) { mSize = size; }

private:
    std::shared_ptr<CallLog> mLog;
    Extent2u                 mSize;
};

struct FakeBackendState
{
    // Failure injection
    bool failInstance = false;
    bool failSurface = false;
    bool failAdapter = false;
    bool failDevice = false;
    bool failSubmit = false;

    AdapterProperties adapter{
        .name = "Fake adapter",
        .backend = BackendType::Null,
        .supportsImmediates = true,
        .maxImmediateSize = 64,
    };
    SurfaceCapabilities capabilities{
        .formats = {TextureFormat::BGRA8Unorm, TextureFormat::RGBA8Unorm},
        .presentModes = {PresentMode::Fifo},
        .alphaModes = {CompositeAlphaMode::Opaque},
    };

    // Statuses returned by successive acquires; Success once exhausted.
    std::deque<SurfaceTextureStatus> acquireStatuses;

    // Recorded arguments
    std::optional<AdapterOptions>           adapterOptions;
    std::optional<DeviceDescriptor>         deviceDescriptor;
    std::vector<SurfaceConfiguration>       configurations;
    std::optional<RenderPipelineDescriptor> pipeline;
    std::vector<RenderPassDescriptor>       renderPasses;
    std::vector<std::vector<std::byte>>     immediates;
    std::vector<std::uint32_t>              vertexCounts;
    std::vector<std::uint32_t>              instanceCounts;

    int  presentCount = 0;
    int  releaseCount = 0;
    bool destroyed = false;
    bool textureHeld = false;
};

// Implements the backend seam without a GPU. The state outlives the backend, which is owned by the
// renderer, so that tests can inspect it after the renderer is gone.
class FakeBackend final : public GpuBackend
{
public:
    FakeBackend(std::shared_ptr<CallLog> log, std::shared_ptr<FakeBackendState> state)
        : mLog(std::move(log)),
          mState(std::move(state))
    {
    }

    ~FakeBackend() override
    {
        mLog->push_back("destroy");
        mState->destroyed = true;
    }

    bool createInstance() override
    {
        mLog->push_back("createInstance");
        return !mState->failInstance;
    }

    bool createSurface(NativeWindow&) override
    {
        mLog->push_back("createSurface");
        return !mState->failSurface;
    }

    std::optional<AdapterProperties> requestAdapter(const AdapterOptions& options) override
    {
        mLog->push_back("requestAdapter");
        mState->adapterOptions = options;
        if (mState->failAdapter)
        {
            return std::nullopt;
        }
        return mState->adapter;
    }

    bool requestDevice(const DeviceDescriptor& desc) override
    {
        mLog->push_back("requestDevice");
        mState->deviceDescriptor = desc;
        return !mState->failDevice;
    }

    SurfaceCapabilities surfaceCapabilities() const override
    {
        mLog->push_back("surfaceCapabilities");
        return mState->capabilities;
    }

    void configureSurface(const SurfaceConfiguration& config) override
    {
        mLog->push_back("configureSurface");
        mState->configurations.push_back(config);
        mState->textureHeld = false;
    }

    void createRenderPipeline(const RenderPipelineDescriptor& desc) override
    {
        mLog->push_back("createRenderPipeline");
        mState->pipeline = desc;
    }

    SurfaceTextureStatus acquireSurfaceTexture() override
    {
        mLog->push_back("acquireSurfaceTexture");
        SurfaceTextureStatus status = SurfaceTextureStatus::Success;
        if (!mState->acquireStatuses.empty())
        {
            status = mState->acquireStatuses.front();
            mState->acquireStatuses.pop_front();
        }
        mState->textureHeld =
            status == SurfaceTextureStatus::Success || status == SurfaceTextureStatus::Suboptimal;
        return status;
    }

    bool submitRenderPass(const RenderPassDescriptor& pass, const DrawCommand& draw) override
    {
        mLog->push_back("submitRenderPass");
        if (mState->failSubmit)
        {
            return false;
        }
        mState->renderPasses.push_back(pass);
        mState->immediates.emplace_back(draw.immediates.begin(), draw.immediates.end());
        mState->vertexCounts.push_back(draw.vertexCount);
        mState->instanceCounts.push_back(draw.instanceCount);
        return true;
    }

    void presentSurfaceTexture() override
    {
        mLog->push_back("presentSurfaceTexture");
        ++mState->presentCount;
        mState->textureHeld = false;
    }

    void releaseSurfaceTexture() override
    {
        mLog->push_back("releaseSurfaceTexture");
        ++mState->releaseCount;
        mState->textureHeld = false;
    }

    // Counts the recorded calls with the given name.
    static std::size_t count(const CallLog& log, const std::string& call)
    {
        std::size_t n = 0;
        for (const auto& entry : log)
        {
            n += entry == call ? 1 : 0;
        }
        return n;
    }

private:
    std::shared_ptr<CallLog>          mLog;
    std::shared_ptr<FakeBackendState> mState;
};
} // namespace glint::test
