/*
===============================================================================
ByteSourceConcept (Pull-Based, Caller-Owned Buffer)
===============================================================================

Defines the minimal contract required by BufferedByteSource.

A byte source:

  • Writes up to dst.size() bytes into dst, starting at dst[0]
  • Reports the number of bytes written through `n`
  • Returns Error::None on success, any other code on failure
  • Signals permanent end-of-data by succeeding with n == 0
  • Blocks for as long as the underlying medium blocks

Never assumed:

  - seeking, rewinding or peeking
  - length queries
  - that a short read means end-of-data (only n == 0 does)

The source is moved into BufferedByteSource and exclusively owned by it.

No callbacks.
No dynamic dispatch.
===============================================================================
*/
#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>

#include "bufbytes/core/error.hpp"


namespace bufbytes::core::source {

template<class S>
concept ByteSourceConcept =
    std::movable<S> &&
    requires(S src, std::span<std::uint8_t> dst, std::size_t& n)
{
    { src.read(dst, n) } noexcept -> std::same_as<IoError>;
};

} // namespace bufbytes::core::source
