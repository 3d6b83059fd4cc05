#include "fake_gpu_backend.hpp"

#include <glint/renderer.hpp>
#include <glint/renderer_error.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_predicate.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

using namespace glint;
using namespace glint::test;

namespace
{
constexpr std::string_view VERTEX_SOURCE = "@vertex fn vs_main() {}";
constexpr std::string_view FRAGMENT_SOURCE = "@fragment fn fs_main() {}";

struct RendererFixture
{
    std::shared_ptr<CallLog>          log = std::make_shared<CallLog>();
    std::shared_ptr<FakeBackendState> state = std::make_shared<FakeBackendState>();
    std::shared_ptr<FakeWindow>       window;
    GpuEnvironment                    environment;

    explicit RendererFixture(const Extent2u windowSize)
        : window(std::make_shared<FakeWindow>(log, windowSize))
    {
    }

    Renderer makeRenderer()
    {
        return Renderer{
            window,
            std::make_unique<FakeBackend>(log, state),
            RendererDescriptor{
                .vertexShaderSource = VERTEX_SOURCE,
                .fragmentShaderSource = FRAGMENT_SOURCE,
                .environment = environment,
            }};
    }

    std::size_t count(const std::string& call) const { return FakeBackend::count(*log, call); }
};

auto failsAtStage(const AcquisitionStage stage)
{
    return Catch::Matchers::Predicate<AcquisitionError>(
        [stage](const AcquisitionError& e) -> bool { return e.stage() == stage; },
        "fails at the expected acquisition stage");
}
} // namespace

TEST_CASE("Construct with a single format and mixed alpha modes", "[renderer]")
{
    RendererFixture fixture{Extent2u{800, 600}};
    fixture.state->capabilities.formats = {TextureFormat::RGBA8Unorm};
    fixture.state->capabilities.alphaModes = {
        CompositeAlphaMode::Opaque, CompositeAlphaMode::Inherit};

    const Renderer renderer = fixture.makeRenderer();

    const SurfaceConfiguration& config = renderer.surfaceConfiguration();
    REQUIRE(config.format == TextureFormat::RGBA8Unorm);
    REQUIRE(config.alphaMode == CompositeAlphaMode::Inherit);
    REQUIRE(config.width == 800);
    REQUIRE(config.height == 600);
    REQUIRE(config.viewFormats == std::vector<TextureFormat>{TextureFormat::RGBA8UnormSrgb});

    REQUIRE(fixture.state->configurations.size() == 1);
    REQUIRE(fixture.state->configurations.front() == config);

    REQUIRE(renderer.immediate().windowSize == glm::uvec2(800, 600));
    REQUIRE(renderer.immediate().aspectRatio.x == Catch::Approx(800.0f / 600.0f));
    REQUIRE(renderer.immediate().aspectRatio.y == 1.0f);
}

TEST_CASE("Construct with a portrait window", "[renderer]")
{
    RendererFixture fixture{Extent2u{400, 800}};

    const Renderer renderer = fixture.makeRenderer();

    REQUIRE(renderer.immediate().aspectRatio.x == 1.0f);
    REQUIRE(renderer.immediate().aspectRatio.y == Catch::Approx(2.0f));
}

TEST_CASE("Construct selects premultiplied alpha", "[renderer]")
{
    RendererFixture fixture{Extent2u{800, 600}};
    fixture.state->capabilities.alphaModes = {
        CompositeAlphaMode::PostMultiplied,
        CompositeAlphaMode::PreMultiplied,
        CompositeAlphaMode::Opaque};

    const Renderer renderer = fixture.makeRenderer();

    REQUIRE(renderer.surfaceConfiguration().alphaMode == CompositeAlphaMode::PreMultiplied);
}

TEST_CASE("Construct without alpha modes fails", "[renderer]")
{
    RendererFixture fixture{Extent2u{800, 600}};
    fixture.state->capabilities.alphaModes.clear();

    REQUIRE_THROWS_AS(fixture.makeRenderer(), CapabilityMissingError);
    REQUIRE(fixture.state->configurations.empty());
    REQUIRE(fixture.state->destroyed);
}

TEST_CASE("Construct without formats fails", "[renderer]")
{
    RendererFixture fixture{Extent2u{800, 600}};
    fixture.state->capabilities.formats.clear();

    REQUIRE_THROWS_AS(fixture.makeRenderer(), CapabilityMissingError);
}

TEST_CASE("Construction acquires the device in order", "[renderer]")
{
    RendererFixture fixture{Extent2u{800, 600}};

    const Renderer renderer = fixture.makeRenderer();

    const CallLog expected{
        "createInstance",
        "createSurface",
        "requestAdapter",
        "requestDevice",
        "surfaceCapabilities",
        "configureSurface",
        "createRenderPipeline",
    };
    REQUIRE(*fixture.log == expected);

    REQUIRE(fixture.state->adapterOptions.has_value());
    REQUIRE(fixture.state->adapterOptions->powerPreference == PowerPreference::HighPerformance);
    REQUIRE_FALSE(fixture.state->adapterOptions->backend.has_value());
    REQUIRE_FALSE(fixture.state->adapterOptions->forceFallbackAdapter);

    REQUIRE(fixture.state->deviceDescriptor.has_value());
    REQUIRE(fixture.state->deviceDescriptor->requireImmediates);
    REQUIRE(fixture.state->deviceDescriptor->maxImmediateSize == sizeof(Immediate));
    REQUIRE(fixture.state->deviceDescriptor->memoryHints == MemoryHints::Performance);

    REQUIRE(renderer.adapterProperties().name == "Fake adapter");
}

TEST_CASE("Environment overrides reach the adapter request", "[renderer]")
{
    RendererFixture fixture{Extent2u{800, 600}};
    fixture.environment = GpuEnvironment{
        .backend = BackendType::Vulkan,
        .powerPreference = PowerPreference::LowPower,
    };

    const Renderer renderer = fixture.makeRenderer();

    REQUIRE(fixture.state->adapterOptions->backend == BackendType::Vulkan);
    REQUIRE(fixture.state->adapterOptions->powerPreference == PowerPreference::LowPower);
}

TEST_CASE("Pipeline is created for the surface format", "[renderer]")
{
    RendererFixture fixture{Extent2u{800, 600}};
    fixture.state->capabilities.formats = {TextureFormat::RGBA16Float, TextureFormat::BGRA8Unorm};

    const Renderer renderer = fixture.makeRenderer();

    REQUIRE(fixture.state->pipeline.has_value());
    const RenderPipelineDescriptor& pipeline = *fixture.state->pipeline;
    REQUIRE(pipeline.colorTarget.format == TextureFormat::RGBA16Float);
    REQUIRE(pipeline.vertex.source == VERTEX_SOURCE);
    REQUIRE(pipeline.vertex.entryPoint == "vs_main");
    REQUIRE(pipeline.fragment.source == FRAGMENT_SOURCE);
    REQUIRE(pipeline.fragment.entryPoint == "fs_main");
    REQUIRE(pipeline.immediateSize == sizeof(Immediate));
}

TEST_CASE("Acquisition failures report their stage", "[renderer]")
{
    RendererFixture fixture{Extent2u{800, 600}};

    SECTION("Instance")
    {
        fixture.state->failInstance = true;
        REQUIRE_THROWS_MATCHES(
            fixture.makeRenderer(), AcquisitionError, failsAtStage(AcquisitionStage::Instance));
        REQUIRE(fixture.count("createSurface") == 0);
    }

    SECTION("Surface")
    {
        fixture.state->failSurface = true;
        REQUIRE_THROWS_MATCHES(
            fixture.makeRenderer(), AcquisitionError, failsAtStage(AcquisitionStage::Surface));
        REQUIRE(fixture.count("requestAdapter") == 0);
    }

    SECTION("Adapter")
    {
        fixture.state->failAdapter = true;
        REQUIRE_THROWS_MATCHES(
            fixture.makeRenderer(), AcquisitionError, failsAtStage(AcquisitionStage::Adapter));
        REQUIRE(fixture.count("requestDevice") == 0);
    }

    SECTION("Device")
    {
        fixture.state->failDevice = true;
        REQUIRE_THROWS_MATCHES(
            fixture.makeRenderer(), AcquisitionError, failsAtStage(AcquisitionStage::Device));
        REQUIRE(fixture.count("configureSurface") == 0);
    }

    REQUIRE(fixture.state->destroyed);
}

TEST_CASE("Missing adapter and immediate limit are distinguishable", "[renderer]")
{
    RendererFixture fixture{Extent2u{800, 600}};

    SECTION("No adapter")
    {
        fixture.state->failAdapter = true;
        REQUIRE_THROWS_AS(fixture.makeRenderer(), AcquisitionError);
    }

    SECTION("Immediates unsupported")
    {
        fixture.state->adapter.supportsImmediates = false;
        REQUIRE_THROWS_MATCHES(
            fixture.makeRenderer(),
            ImmediateLimitError,
            Catch::Matchers::Predicate<ImmediateLimitError>(
                [](const ImmediateLimitError& e) -> bool {
                    return e.required() == sizeof(Immediate) && e.supported() == 0;
                },
                "reports no immediate support"));
        REQUIRE(fixture.count("requestDevice") == 0);
    }

    SECTION("Immediate limit too low")
    {
        fixture.state->adapter.maxImmediateSize = 8;
        REQUIRE_THROWS_MATCHES(
            fixture.makeRenderer(),
            ImmediateLimitError,
            Catch::Matchers::Predicate<ImmediateLimitError>(
                [](const ImmediateLimitError& e) -> bool {
                    return e.required() == 16 && e.supported() == 8;
                },
                "reports the adapter limit"));
        REQUIRE(fixture.count("requestDevice") == 0);
    }

    SECTION("Immediate limit exactly met")
    {
        fixture.state->adapter.maxImmediateSize = 16;
        REQUIRE_NOTHROW(fixture.makeRenderer());
    }
}

TEST_CASE("Minimized window at construction gets a 1x1 surface", "[renderer]")
{
    RendererFixture fixture{Extent2u{0, 0}};

    const Renderer renderer = fixture.makeRenderer();

    REQUIRE(renderer.surfaceConfiguration().width == 1);
    REQUIRE(renderer.surfaceConfiguration().height == 1);
    REQUIRE(renderer.immediate() == Immediate{1, 1});
}

TEST_CASE("Resize reconfigures the surface", "[renderer]")
{
    RendererFixture fixture{Extent2u{800, 600}};
    Renderer        renderer = fixture.makeRenderer();

    const std::array<Extent2u, 5> sizes{
        Extent2u{1024, 768},
        Extent2u{1, 1},
        Extent2u{300, 1200},
        Extent2u{3840, 2160},
        Extent2u{800, 600},
    };
    for (const Extent2u& size : sizes)
    {
        fixture.window->setInnerSize(size);
        renderer.resize();

        REQUIRE(renderer.surfaceConfiguration().width == size.x);
        REQUIRE(renderer.surfaceConfiguration().height == size.y);
        REQUIRE(fixture.state->configurations.back() == renderer.surfaceConfiguration());
        REQUIRE(renderer.immediate().windowSize == glm::uvec2(size.x, size.y));
        REQUIRE(
            std::min(renderer.immediate().aspectRatio.x, renderer.immediate().aspectRatio.y) ==
            1.0f);
    }
    REQUIRE(fixture.state->configurations.size() == sizes.size() + 1);
}

TEST_CASE("Resize keeps the surface format", "[renderer]")
{
    RendererFixture fixture{Extent2u{800, 600}};
    Renderer        renderer = fixture.makeRenderer();
    const SurfaceConfiguration initial = renderer.surfaceConfiguration();

    fixture.window->setInnerSize(Extent2u{640, 480});
    renderer.resize();

    const SurfaceConfiguration& resized = renderer.surfaceConfiguration();
    REQUIRE(resized.format == initial.format);
    REQUIRE(resized.viewFormats == initial.viewFormats);
    REQUIRE(resized.presentMode == initial.presentMode);
    REQUIRE(resized.alphaMode == initial.alphaMode);
    REQUIRE(fixture.count("createRenderPipeline") == 1);
}

TEST_CASE("Resize to an empty window is a no-op", "[renderer]")
{
    RendererFixture fixture{Extent2u{800, 600}};
    Renderer        renderer = fixture.makeRenderer();

    const SurfaceConfiguration configBefore = renderer.surfaceConfiguration();
    const Immediate            immediateBefore = renderer.immediate();

    SECTION("Zero width") { fixture.window->setInnerSize(Extent2u{0, 600}); }
    SECTION("Zero height") { fixture.window->setInnerSize(Extent2u{800, 0}); }
    SECTION("Zero width and height") { fixture.window->setInnerSize(Extent2u{0, 0}); }

    renderer.resize();

    REQUIRE(renderer.surfaceConfiguration() == configBefore);
    REQUIRE(renderer.surfaceConfiguration().width == 800);
    REQUIRE(renderer.surfaceConfiguration().height == 600);
    REQUIRE(renderer.immediate() == immediateBefore);
    REQUIRE(fixture.state->configurations.size() == 1);
}

TEST_CASE("Repeated resize is idempotent", "[renderer]")
{
    RendererFixture fixture{Extent2u{800, 600}};
    Renderer        renderer = fixture.makeRenderer();

    fixture.window->setInnerSize(Extent2u{1280, 720});
    renderer.resize();
    const SurfaceConfiguration firstConfig = renderer.surfaceConfiguration();
    const Immediate            firstImmediate = renderer.immediate();

    renderer.resize();

    REQUIRE(renderer.surfaceConfiguration() == firstConfig);
    REQUIRE(renderer.immediate() == firstImmediate);
}

TEST_CASE("Render submits and presents one frame", "[renderer]")
{
    RendererFixture fixture{Extent2u{800, 600}};
    Renderer        renderer = fixture.makeRenderer();
    fixture.log->clear();

    renderer.render();

    const CallLog expected{
        "acquireSurfaceTexture",
        "submitRenderPass",
        "prePresentNotify",
        "presentSurfaceTexture",
    };
    REQUIRE(*fixture.log == expected);

    REQUIRE(fixture.state->renderPasses.size() == 1);
    const RenderPassDescriptor& pass = fixture.state->renderPasses.front();
    REQUIRE(pass.viewFormat == TextureFormat::BGRA8UnormSrgb);
    REQUIRE(pass.clearValue.r == 0.0);
    REQUIRE(pass.clearValue.g == 0.0);
    REQUIRE(pass.clearValue.b == 0.0);
    REQUIRE(pass.clearValue.a == 1.0);

    REQUIRE(fixture.state->vertexCounts.front() == 3);
    REQUIRE(fixture.state->instanceCounts.front() == 1);

    const auto expectedBytes = renderer.immediate().bytes();
    REQUIRE(
        fixture.state->immediates.front() ==
        std::vector<std::byte>(expectedBytes.begin(), expectedBytes.end()));
    REQUIRE(fixture.state->presentCount == 1);
    REQUIRE_FALSE(fixture.state->textureHeld);
}

TEST_CASE("Render pushes the resized window dimensions", "[renderer]")
{
    RendererFixture fixture{Extent2u{800, 600}};
    Renderer        renderer = fixture.makeRenderer();

    fixture.window->setInnerSize(Extent2u{200, 100});
    renderer.resize();
    renderer.render();

    REQUIRE(fixture.state->immediates.size() == 1);
    REQUIRE(fixture.state->immediates.front().size() == sizeof(Immediate));

    const Immediate expected{200, 100};
    const auto      expectedBytes = expected.bytes();
    REQUIRE(
        fixture.state->immediates.front() ==
        std::vector<std::byte>(expectedBytes.begin(), expectedBytes.end()));
}

TEST_CASE("Outdated surface is reconfigured and the frame dropped", "[renderer]")
{
    RendererFixture fixture{Extent2u{800, 600}};
    fixture.state->acquireStatuses = {SurfaceTextureStatus::Outdated};
    Renderer renderer = fixture.makeRenderer();

    renderer.render();

    REQUIRE(fixture.count("configureSurface") == 2);
    REQUIRE(fixture.count("submitRenderPass") == 0);
    REQUIRE(fixture.count("presentSurfaceTexture") == 0);

    renderer.render();

    REQUIRE(fixture.count("configureSurface") == 2);
    REQUIRE(fixture.count("submitRenderPass") == 1);
    REQUIRE(fixture.state->presentCount == 1);
}

TEST_CASE("Lost surface is reconfigured to the current window size", "[renderer]")
{
    RendererFixture fixture{Extent2u{800, 600}};
    fixture.state->acquireStatuses = {SurfaceTextureStatus::Lost};
    Renderer renderer = fixture.makeRenderer();

    fixture.window->setInnerSize(Extent2u{1000, 500});
    renderer.render();

    REQUIRE(fixture.count("submitRenderPass") == 0);
    REQUIRE(renderer.surfaceConfiguration().width == 1000);
    REQUIRE(renderer.surfaceConfiguration().height == 500);
    REQUIRE(renderer.immediate().windowSize == glm::uvec2(1000, 500));
}

TEST_CASE("Other acquire failures drop the frame", "[renderer]")
{
    const std::array<SurfaceTextureStatus, 4> statuses{
        SurfaceTextureStatus::Timeout,
        SurfaceTextureStatus::OutOfMemory,
        SurfaceTextureStatus::DeviceLost,
        SurfaceTextureStatus::Error,
    };
    for (const SurfaceTextureStatus status : statuses)
    {
        RendererFixture fixture{Extent2u{800, 600}};
        fixture.state->acquireStatuses = {status};
        Renderer renderer = fixture.makeRenderer();

        REQUIRE_NOTHROW(renderer.render());

        REQUIRE(fixture.count("configureSurface") == 1);
        REQUIRE(fixture.count("submitRenderPass") == 0);
        REQUIRE(fixture.count("presentSurfaceTexture") == 0);

        renderer.render();
        REQUIRE(fixture.state->presentCount == 1);
    }
}

TEST_CASE("Suboptimal surface texture is still presented", "[renderer]")
{
    RendererFixture fixture{Extent2u{800, 600}};
    fixture.state->acquireStatuses = {SurfaceTextureStatus::Suboptimal};
    Renderer renderer = fixture.makeRenderer();

    renderer.render();

    REQUIRE(fixture.count("submitRenderPass") == 1);
    REQUIRE(fixture.state->presentCount == 1);
}

TEST_CASE("Failed recording releases the surface texture", "[renderer]")
{
    RendererFixture fixture{Extent2u{800, 600}};
    fixture.state->failSubmit = true;
    Renderer renderer = fixture.makeRenderer();

    renderer.render();

    REQUIRE(fixture.state->releaseCount == 1);
    REQUIRE(fixture.state->presentCount == 0);
    REQUIRE(fixture.count("prePresentNotify") == 0);
    REQUIRE_FALSE(fixture.state->textureHeld);
}

TEST_CASE("Renderer releases the backend before the window", "[renderer]")
{
    RendererFixture fixture{Extent2u{800, 600}};
    {
        const Renderer renderer = fixture.makeRenderer();
        REQUIRE(fixture.window.use_count() == 2);
        REQUIRE_FALSE(fixture.state->destroyed);
    }
    REQUIRE(fixture.state->destroyed);
    REQUIRE(fixture.window.use_count() == 1);
    REQUIRE(fixture.log->back() == "destroy");
}
