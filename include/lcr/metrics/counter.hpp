#pragma once

#include <type_traits>
#include <cstdint>

namespace lcr {
namespace metrics {

// ---------------------------------------------------------------------------
// counter - monotonically increasing cumulative metric
// ---------------------------------------------------------------------------
//
// Plain value, no atomics. Owned by a single-threaded component and copied
// or moved together with it; readers take a copy.
// ---------------------------------------------------------------------------
template<typename T = uint64_t>
struct counter {
    static_assert(std::is_unsigned_v<T>, "counter requires an unsigned type");

    constexpr counter() noexcept = default;
    constexpr explicit counter(T initial) noexcept : value_(initial) {}

    [[nodiscard]] inline constexpr T load() const noexcept { return value_; }

    inline constexpr void inc(T n = 1) noexcept { value_ += n; }

    inline constexpr void reset() noexcept { value_ = 0; }

private:
    T value_{0};
};

using counter32 = counter<uint32_t>;
using counter64 = counter<uint64_t>;
static_assert(std::is_trivially_copyable_v<counter64>);

} // namespace metrics
} // namespace lcr
