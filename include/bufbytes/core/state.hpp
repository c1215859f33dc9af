#pragma once

#include <cstdint>
#include <string_view>

namespace bufbytes::core {

// ===============================================================
// BUFFERED BYTE SOURCE STATE
// ===============================================================
//
//   Ready ──(cursor reaches valid length)──> NeedsRefill
//   NeedsRefill ──(fill > 0)──> Ready
//   NeedsRefill ──(fill == 0)──> Exhausted   (terminal)
//   NeedsRefill ──(fill error)──> Failed     (terminal)
//
enum class State : uint8_t {
    Ready,        // cursor < valid_length
    NeedsRefill,  // cursor == valid_length, source not yet drained
    Exhausted,    // source returned zero bytes
    Failed        // source reported an error, see last_error()
};

[[nodiscard]]
inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
        case State::Ready:       return "Ready";
        case State::NeedsRefill: return "NeedsRefill";
        case State::Exhausted:   return "Exhausted";
        case State::Failed:      return "Failed";
        default:                 return "Unknown";
    }
}

[[nodiscard]]
inline constexpr bool is_terminal(State s) noexcept {
    return s == State::Exhausted || s == State::Failed;
}

} // namespace bufbytes::core
