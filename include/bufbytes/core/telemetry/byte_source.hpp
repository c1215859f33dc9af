#pragma once

#include "lcr/metrics/counter.hpp"

namespace bufbytes::core::telemetry {

// ============================================================================
// ByteSource Telemetry
//
// Mechanical facts about one BufferedByteSource. Counters are only updated
// when the matching BB_TL* level is compiled in; otherwise they stay at zero.
// ============================================================================

struct ByteSource final {
    // Calls to Source::read(), including the construction fill
    lcr::metrics::counter64 fill_calls_total;

    // Fills issued after construction (cursor reached valid length)
    lcr::metrics::counter64 refills_total;

    // Bytes written into the buffer by successful fills
    lcr::metrics::counter64 bytes_filled_total;

    // Fills that returned zero bytes
    lcr::metrics::counter64 exhausted_total;

    // Fills that reported an error
    lcr::metrics::counter64 read_failures_total;

    // Bytes handed out through next_byte() (L2)
    lcr::metrics::counter64 bytes_yielded_total;
};

} // namespace bufbytes::core::telemetry
