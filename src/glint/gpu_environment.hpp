#pragma once

#include "gpu_types.hpp"

#include <optional>
#include <string_view>

namespace glint
{
// Adapter selection overrides taken from the process environment:
//   WGPU_BACKEND     vulkan | metal | dx12 | dx11 | gl | opengl | gles | null
//   WGPU_POWER_PREF  low | high | none
struct GpuEnvironment
{
    // Any backend when empty.
    std::optional<BackendType> backend;
    PowerPreference            powerPreference = PowerPreference::HighPerformance;
};

std::optional<BackendType>     parseBackendType(std::string_view);
std::optional<PowerPreference> parsePowerPreference(std::string_view);

// Unrecognized values are logged and ignored.
GpuEnvironment gpuEnvironmentFromEnv();
} // namespace glint
