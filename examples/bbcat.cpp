/*
===============================================================================
bbcat - print a file through BufferedByteSource
===============================================================================

Opens a file (or stdin with "-"), wraps it in a BufferedByteSource and pulls
it byte by byte. Depending on the flags the bytes are:

  - written to stdout unchanged (default)
  - counted            (--count)
  - hashed with XXH64  (--hash)

Count and hash passes run inside run_checked(): a read failure part way
through is reported instead of a truncated result.

Exit codes:
  0  success
  1  open or construction failure
  2  read failure during the pass
===============================================================================
*/

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <new>
#include <optional>
#include <string>
#include <unistd.h>

#include <xxhash.h>

#include "bufbytes/core.hpp"
#include "common/cli/bbcat_params.hpp"


using namespace bufbytes::core;
using bufbytes::examples::cli::bbcat::Mode;

namespace {

// Streams the bytes to stdout through a small staging block.
void print_all(FileByteSource& bytes) {
    std::array<char, 4096> out{};
    std::size_t n = 0;
    for (std::uint8_t b : bytes) {
        out[n++] = static_cast<char>(b);
        if (n == out.size()) {
            std::fwrite(out.data(), 1, n, stdout);
            n = 0;
        }
    }
    if (n > 0) {
        std::fwrite(out.data(), 1, n, stdout);
    }
    std::fflush(stdout);
}

std::size_t count_all(FileByteSource& bytes) {
    std::size_t n = 0;
    std::uint8_t b;
    while (bytes.next_byte(b)) {
        ++n;
    }
    return n;
}

XXH64_hash_t hash_all(FileByteSource& bytes) {
    XXH64_state_t* state = XXH64_createState();
    if (state == nullptr) {
        throw std::bad_alloc{};
    }
    XXH64_reset(state, 0);
    std::array<std::uint8_t, 4096> block{};
    std::size_t n = 0;
    for (std::uint8_t b : bytes) {
        block[n++] = b;
        if (n == block.size()) {
            XXH64_update(state, block.data(), n);
            n = 0;
        }
    }
    XXH64_update(state, block.data(), n);
    const XXH64_hash_t digest = XXH64_digest(state);
    XXH64_freeState(state);
    return digest;
}

} // namespace


int main(int argc, char** argv) {
    const auto params = bufbytes::examples::cli::bbcat::configure(argc, argv, "bbcat - buffered byte reader");
    params.dump("=== bbcat parameters ===", std::cerr);

    // -------------------------------------------------------------------------
    // Source
    // -------------------------------------------------------------------------
    source::FileSource file;
    if (params.path == "-") {
        file = source::FileSource::adopt(STDIN_FILENO, false);
    }
    else if (const IoError err = source::FileSource::open(params.path, file); !err.ok()) {
        BB_ERROR("[bbcat] cannot open " << params.path << ": " << to_string(err));
        return 1;
    }

    // -------------------------------------------------------------------------
    // Iterator
    // -------------------------------------------------------------------------
    std::optional<FileByteSource> bytes;
    if (const IoError err = FileByteSource::create(std::move(file), bytes, params.buffer_config()); !err.ok()) {
        BB_ERROR("[bbcat] cannot read " << params.path << ": " << to_string(err));
        return 1;
    }

    // -------------------------------------------------------------------------
    // Pass
    // -------------------------------------------------------------------------
    switch (params.mode()) {
        case Mode::Print: {
            const IoError err = bytes->run_checked(print_all);
            if (!err.ok()) {
                BB_ERROR("[bbcat] read failed after partial output: " << to_string(err));
                return 2;
            }
            break;
        }
        case Mode::Count: {
            std::size_t count = 0;
            const IoError err = bytes->run_checked(count_all, count);
            if (!err.ok()) {
                BB_ERROR("[bbcat] read failed: " << to_string(err));
                return 2;
            }
            std::cout << count << std::endl;
            break;
        }
        case Mode::Hash: {
            XXH64_hash_t digest = 0;
            const IoError err = bytes->run_checked(hash_all, digest);
            if (!err.ok()) {
                BB_ERROR("[bbcat] read failed: " << to_string(err));
                return 2;
            }
            std::cout << std::hex << digest << std::dec << std::endl;
            break;
        }
    }

#if defined(BUFBYTES_ENABLE_TELEMETRY_L1)
    const auto& tm = bytes->metrics();
    BB_INFO("[bbcat] fills: " << tm.fill_calls_total.load()
            << " refills: " << tm.refills_total.load()
            << " bytes: " << tm.bytes_filled_total.load());
#endif
    return 0;
}
