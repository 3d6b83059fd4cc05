#pragma once

#include <cstdint>

namespace glint
{
template<typename T>
struct Extent2
{
    T x = T(0);
    T y = T(0);

    constexpr Extent2() noexcept = default;

    constexpr Extent2(T xx, T yy) noexcept
        : x(xx),
          y(yy)
    {
    }

    template<typename U>
    constexpr explicit Extent2(const Extent2<U>& other) noexcept
        : x(static_cast<T>(other.x)),
          y(static_cast<T>(other.y))
    {
    }

    constexpr bool operator==(const Extent2& rhs) const noexcept = default;
};

using Extent2i = Extent2<std::int32_t>;
using Extent2u = Extent2<std::uint32_t>;

// A framebuffer is empty when the window is minimized.
template<typename T>
constexpr bool isEmpty(const Extent2<T>& extent) noexcept
{
    return extent.x == T(0) || extent.y == T(0);
}

template<typename T>
constexpr Extent2<T> atLeastOne(const Extent2<T>& extent) noexcept
{
    return Extent2<T>(extent.x > T(0) ? extent.x : T(1), extent.y > T(0) ? extent.y : T(1));
}
} // namespace glint
