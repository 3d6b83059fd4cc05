#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace glint
{
enum class AcquisitionStage
{
    Instance,
    Surface,
    Adapter,
    Device,
};

std::string_view toString(AcquisitionStage) noexcept;

// One of the instance -> surface -> adapter -> device steps failed while constructing the
// renderer.
class AcquisitionError : public std::runtime_error
{
public:
    explicit AcquisitionError(AcquisitionStage stage);

    AcquisitionStage stage() const noexcept { return mStage; }

private:
    AcquisitionStage mStage;
};

// The surface reported an empty capability list.
class CapabilityMissingError : public std::runtime_error
{
public:
    explicit CapabilityMissingError(std::string_view capability);

    const std::string& capability() const noexcept { return mCapability; }

private:
    std::string mCapability;
};

// The adapter cannot push immediate constants of the required size.
class ImmediateLimitError : public std::runtime_error
{
public:
    ImmediateLimitError(std::size_t required, std::size_t supported);

    std::size_t required() const noexcept { return mRequired; }
    std::size_t supported() const noexcept { return mSupported; }

private:
    std::size_t mRequired;
    std::size_t mSupported;
};
} // namespace glint
