#pragma once

#include <type_traits>

namespace glint
{
template<typename T>
concept Enum = std::is_enum_v<T>;

// A wrapper for scoped enums providing bitwise ops. Initialize like BitFlags<T>{T::Value1,
// T::Value2, ...}.
template<Enum T>
class BitFlags
{
public:
    using U = std::underlying_type_t<T>;

    constexpr BitFlags() noexcept = default;
    constexpr explicit BitFlags(T flag) noexcept
        : mFlags(static_cast<U>(flag))
    {
    }
    template<typename... Enums>
    constexpr BitFlags(Enums... flags) noexcept
    {
        (add(flags), ...);
    }

    static constexpr BitFlags none() noexcept { return BitFlags{static_cast<U>(0)}; }

    constexpr bool operator==(const BitFlags&) const noexcept = default;

    constexpr bool has(const T flag) const noexcept
    {
        // NOTE: prefer to return a boolean rather than returning mFlags & static_cast<U>(flag), as
        // that value may not be represented in the scoped enum that is being wrapped.
        return (mFlags & static_cast<U>(flag)) == static_cast<U>(flag);
    }

    constexpr bool empty() const noexcept { return mFlags == static_cast<U>(0); }

    // Raw bits, for translating into a graphics API's own flag type.
    constexpr U bits() const noexcept { return mFlags; }

    // Modifiers

    constexpr void add(const T flag) noexcept { mFlags |= static_cast<U>(flag); }

private:
    U mFlags = static_cast<U>(0);

    constexpr BitFlags(const U flags) noexcept
        : mFlags(flags)
    {
    }
};
} // namespace glint
