#include "gpu_environment.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace glint
{
namespace
{
std::string toLower(const std::string_view str)
{
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(), [](const unsigned char c) -> char {
        return static_cast<char>(std::tolower(c));
    });
    return result;
}
} // namespace

std::optional<BackendType> parseBackendType(const std::string_view str)
{
    const std::string name = toLower(str);
    if (name == "vulkan" || name == "vk")
    {
        return BackendType::Vulkan;
    }
    if (name == "metal" || name == "mtl")
    {
        return BackendType::Metal;
    }
    if (name == "dx12" || name == "d3d12")
    {
        return BackendType::D3D12;
    }
    if (name == "dx11" || name == "d3d11")
    {
        return BackendType::D3D11;
    }
    if (name == "gl" || name == "opengl")
    {
        return BackendType::OpenGL;
    }
    if (name == "gles" || name == "opengles")
    {
        return BackendType::OpenGLES;
    }
    if (name == "null")
    {
        return BackendType::Null;
    }
    return std::nullopt;
}

std::optional<PowerPreference> parsePowerPreference(const std::string_view str)
{
    const std::string name = toLower(str);
    if (name == "low")
    {
        return PowerPreference::LowPower;
    }
    if (name == "high")
    {
        return PowerPreference::HighPerformance;
    }
    if (name == "none")
    {
        return PowerPreference::None;
    }
    return std::nullopt;
}

GpuEnvironment gpuEnvironmentFromEnv()
{
    GpuEnvironment environment;

    if (const char* const value = std::getenv("WGPU_BACKEND"))
    {
        environment.backend = parseBackendType(value);
        if (!environment.backend)
        {
            spdlog::warn("Ignoring unrecognized WGPU_BACKEND value \"{}\".", value);
        }
    }

    if (const char* const value = std::getenv("WGPU_POWER_PREF"))
    {
        if (const auto preference = parsePowerPreference(value))
        {
            environment.powerPreference = *preference;
        }
        else
        {
            spdlog::warn("Ignoring unrecognized WGPU_POWER_PREF value \"{}\".", value);
        }
    }

    return environment;
}
} // namespace glint
