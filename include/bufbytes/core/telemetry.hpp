#pragma once

// -----------------------------------------------------------------------------
// Telemetry level configuration
// -----------------------------------------------------------------------------
//
// L1: per-fill counters (one update per refill, never per byte)
// L2: per-byte counters (hot path; benchmarking only)

#if defined(BUFBYTES_ENABLE_TELEMETRY_L1)
    #define BB_TL1(expr) expr
#else
    #define BB_TL1(expr) ((void)0)
#endif

#if defined(BUFBYTES_ENABLE_TELEMETRY_L2)
    #define BB_TL2(expr) expr
#else
    #define BB_TL2(expr) ((void)0)
#endif
