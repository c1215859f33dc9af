#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include "bufbytes/core/source/concept.hpp"


namespace bufbytes::core::source {

// ============================================================================
//  MemorySource
// ----------------------------------------------------------------------------
// Serves an owned byte vector front to back.
//
// `max_chunk` caps the number of bytes handed out per read() (0 = no cap),
// which makes it possible to reproduce the short reads of pipes and sockets
// without touching the OS.
// ============================================================================
class MemorySource {
public:
    explicit MemorySource(std::vector<std::uint8_t> data, std::size_t max_chunk = 0) noexcept
        : data_(std::move(data))
        , max_chunk_(max_chunk)
    {}

    explicit MemorySource(std::string_view text, std::size_t max_chunk = 0)
        : data_(text.begin(), text.end())
        , max_chunk_(max_chunk)
    {}

    [[nodiscard]]
    inline IoError read(std::span<std::uint8_t> dst, std::size_t& n) noexcept {
        const std::size_t remaining = data_.size() - offset_;
        n = std::min(dst.size(), remaining);
        if (max_chunk_ != 0) {
            n = std::min(n, max_chunk_);
        }
        if (n > 0) {
            std::memcpy(dst.data(), data_.data() + offset_, n);
            offset_ += n;
        }
        return no_error;
    }

    [[nodiscard]] inline std::size_t size() const noexcept { return data_.size(); }
    [[nodiscard]] inline std::size_t offset() const noexcept { return offset_; }

private:
    std::vector<std::uint8_t> data_;
    std::size_t offset_ = 0;
    std::size_t max_chunk_ = 0;
};
static_assert(ByteSourceConcept<MemorySource>);

} // namespace bufbytes::core::source
