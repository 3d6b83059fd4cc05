#include "renderer_error.hpp"

#include <fmt/core.h>

namespace glint
{
std::string_view toString(const AcquisitionStage stage) noexcept
{
    switch (stage)
    {
    case AcquisitionStage::Instance:
        return "instance";
    case AcquisitionStage::Surface:
        return "surface";
    case AcquisitionStage::Adapter:
        return "adapter";
    case AcquisitionStage::Device:
        return "device";
    }
    return "unknown";
}

AcquisitionError::AcquisitionError(const AcquisitionStage stage)
    : std::runtime_error(fmt::format("Failed to acquire GPU {}.", toString(stage))),
      mStage(stage)
{
}

CapabilityMissingError::CapabilityMissingError(const std::string_view capability)
    : std::runtime_error(fmt::format("Surface reported no supported {}.", capability)),
      mCapability(capability)
{
}

ImmediateLimitError::ImmediateLimitError(const std::size_t required, const std::size_t supported)
    : std::runtime_error(fmt::format(
          "Adapter supports {} bytes of immediate data, {} bytes are required.",
          supported,
          required)),
      mRequired(required),
      mSupported(supported)
{
}
} // namespace glint
