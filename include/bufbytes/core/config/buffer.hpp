#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace bufbytes::core::config {

/*
===============================================================================
 Buffer configuration
===============================================================================

A single tuning knob (chunk capacity) plus the empty-source policy.

EmptySourcePolicy
-----------------
Strict  - the first fill returning zero bytes fails construction with
          Error::EmptySource. No instance is produced. (default)
Lenient - construction succeeds; the instance starts Exhausted and the
          first next_byte() reports end-of-sequence.
===============================================================================
*/

// Chunk size used when the caller does not pick one.
inline constexpr std::size_t DEFAULT_CAPACITY = 8192;

enum class EmptySourcePolicy : uint8_t {
    Strict,
    Lenient
};

[[nodiscard]]
inline constexpr std::string_view to_string(EmptySourcePolicy p) noexcept {
    switch (p) {
        case EmptySourcePolicy::Strict:  return "Strict";
        case EmptySourcePolicy::Lenient: return "Lenient";
        default:                         return "Unknown";
    }
}

struct Buffered {
    std::size_t capacity = DEFAULT_CAPACITY;
    EmptySourcePolicy empty_source = EmptySourcePolicy::Strict;
};

} // namespace bufbytes::core::config
