#pragma once

/*
================================================================================
bufbytes Core
================================================================================

Entry point for the buffered byte iterator:

    bufbytes::core::BufferedByteSource<Source>

plus the sources shipped with the library:

    bufbytes::core::source::FileSource     (POSIX descriptor)
    bufbytes::core::source::MemorySource   (owned bytes)

Any type modelling source::ByteSourceConcept can be plugged in instead.

-------------------------------------------------------------------------------
Execution Model
-------------------------------------------------------------------------------

Single thread, synchronous, blocking. Every next_byte() call that crosses a
chunk boundary performs one Source::read() on the caller's thread and blocks
for as long as that read blocks. There is no background thread, no timeout
and no cancellation.

-------------------------------------------------------------------------------
Usage
-------------------------------------------------------------------------------

    using namespace bufbytes::core;

    source::FileSource file;
    if (auto err = source::FileSource::open("data.bin", file); !err.ok()) { ... }

    std::optional<BufferedByteSource<source::FileSource>> bytes;
    if (auto err = BufferedByteSource<source::FileSource>::create(std::move(file), bytes); !err.ok()) { ... }

    std::size_t count = 0;
    IoError err = bytes->run_checked([](auto& b) {
        std::size_t n = 0;
        for (std::uint8_t c : b) { (void)c; ++n; }
        return n;
    }, count);

================================================================================
*/

#include "bufbytes/core/error.hpp"
#include "bufbytes/core/state.hpp"
#include "bufbytes/core/config/buffer.hpp"
#include "bufbytes/core/source/concept.hpp"
#include "bufbytes/core/source/file_source.hpp"
#include "bufbytes/core/source/memory_source.hpp"
#include "bufbytes/core/buffered_byte_source.hpp"


namespace bufbytes::core {

using FileByteSource   = BufferedByteSource<source::FileSource>;
using MemoryByteSource = BufferedByteSource<source::MemorySource>;

} // namespace bufbytes::core
