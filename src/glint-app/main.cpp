#include <glint-webgpu/glfw_window.hpp>
#include <glint-webgpu/shader_source.hpp>
#include <glint-webgpu/webgpu_backend.hpp>
#include <glint/gpu_environment.hpp>
#include <glint/renderer.hpp>

#include <fmt/core.h>
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <memory>
#include <optional>
#include <string_view>
#include <system_error>

inline constexpr int defaultWindowWidth = 800;
inline constexpr int defaultWindowHeight = 600;

void printHelp()
{
    fmt::print(
        "Usage:\n\tglint [<width> <height>]\n\n"
        "Opens a {}x{} window by default.\n\n"
        "Environment:\n"
        "\tWGPU_BACKEND     vulkan, metal, dx12, dx11, gl, gles or null\n"
        "\tWGPU_POWER_PREF  low, high or none\n"
        "\tSPDLOG_LEVEL     trace, debug, info, warn, error, critical or off\n",
        defaultWindowWidth,
        defaultWindowHeight);
}

std::optional<int> parseDimension(const std::string_view arg)
{
    int value = 0;
    const auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), value);
    if (ec != std::errc() || ptr != arg.data() + arg.size() || value <= 0)
    {
        return std::nullopt;
    }
    return value;
}

int main(int argc, char** argv)
try
{
    spdlog::cfg::load_env_levels();

    glint::Extent2i windowSize{defaultWindowWidth, defaultWindowHeight};
    if (argc == 2 && (std::string_view(argv[1]) == "--help" || std::string_view(argv[1]) == "-h"))
    {
        printHelp();
        return 0;
    }
    if (argc == 3)
    {
        const std::optional<int> width = parseDimension(argv[1]);
        const std::optional<int> height = parseDimension(argv[2]);
        if (!width || !height)
        {
            fmt::print(stderr, "Invalid window size {} {}\n", argv[1], argv[2]);
            printHelp();
            return 1;
        }
        windowSize = glint::Extent2i{*width, *height};
    }
    else if (argc != 1)
    {
        printHelp();
        return 1;
    }

    auto window = std::make_shared<glint::GlfwWindow>(glint::WindowDescriptor{
        .windowSize = windowSize,
        .title = "glint",
    });
    spdlog::info("Window created");

    glint::Renderer renderer{
        window,
        std::make_unique<glint::WebGpuBackend>(),
        glint::RendererDescriptor{
            .vertexShaderSource = glint::VERTEX_SHADER_SOURCE,
            .fragmentShaderSource = glint::FRAGMENT_SHADER_SOURCE,
            .environment = glint::gpuEnvironmentFromEnv(),
        }};
    spdlog::info("Renderer initialized");

    window->run(
        [&renderer]() -> void { renderer.render(); },
        [&renderer](const glint::Extent2u newSize) -> void {
            spdlog::debug("Framebuffer resized to {}x{}", newSize.x, newSize.y);
            renderer.resize();
        });

    return 0;
}
catch (const std::exception& e)
{
    spdlog::critical("Exiting: {}", e.what());
    return 1;
}
