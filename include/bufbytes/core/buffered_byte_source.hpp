#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <optional>
#include <type_traits>
#include <utility>

#include "bufbytes/core/config/buffer.hpp"
#include "bufbytes/core/error.hpp"
#include "bufbytes/core/source/concept.hpp"
#include "bufbytes/core/state.hpp"
#include "bufbytes/core/telemetry.hpp"
#include "bufbytes/core/telemetry/byte_source.hpp"
#include "lcr/local/raw_buffer.hpp"
#include "lcr/log/logger.hpp"


namespace bufbytes::core {

/*
===============================================================================
 bufbytes::core::BufferedByteSource
===============================================================================

Byte-at-a-time pull iterator over a source conforming to
source::ByteSourceConcept.

The source is read in chunks of `capacity` bytes into a buffer that is
allocated once at construction and overwritten in place by every refill.
Bytes are then handed out one by one from that buffer.

-------------------------------------------------------------------------------
 Buffer model
-------------------------------------------------------------------------------
    0                 cursor            valid_length         capacity
    |----- consumed ----|---- unread -----|------ stale --------|

- cursor <= valid_length <= capacity at all times
- only indices < valid_length are ever yielded
- a refill happens exactly when cursor == valid_length

-------------------------------------------------------------------------------
 Termination & errors
-------------------------------------------------------------------------------
- A fill returning zero bytes moves the instance to Exhausted.
- A fill reporting an error moves it to Failed and records the error.
- Both are terminal: next_byte() keeps returning false and the source is
  never read again.
- next_byte() alone cannot tell the two apart. Callers that care inspect
  last_error() afterwards, or wrap a whole consumption pass in
  run_checked().
- Errors from the construction fill are returned by create() and are never
  stored.

-------------------------------------------------------------------------------
 Design Guarantees
-------------------------------------------------------------------------------
- No inheritance and no virtual functions (concept-based source)
- Header-only
- No exceptions on the per-byte path
- No allocation after construction
- Not thread-safe: one consumer drives cursor and refills

===============================================================================
*/

template <source::ByteSourceConcept Source>
class BufferedByteSource {
public:
    using source_type = Source;

    // -------------------------------------------------------------------------
    // BufferedByteSource::iterator
    // -------------------------------------------------------------------------
    // Single-pass input iterator. Holds one byte of lookahead fetched on
    // construction and on every increment; equals std::default_sentinel once
    // next_byte() returns false.
    // -------------------------------------------------------------------------
    class iterator {
    public:
        using iterator_concept = std::input_iterator_tag;
        using value_type       = std::uint8_t;
        using difference_type  = std::ptrdiff_t;

        iterator() noexcept = default;

        explicit iterator(BufferedByteSource& owner) noexcept
            : owner_(&owner)
        {
            advance_();
        }

        [[nodiscard]] inline value_type operator*() const noexcept { return current_; }

        inline iterator& operator++() noexcept {
            advance_();
            return *this;
        }

        inline void operator++(int) noexcept { advance_(); }

        [[nodiscard]]
        friend bool operator==(const iterator& it, std::default_sentinel_t) noexcept {
            return it.owner_ == nullptr;
        }

    private:
        inline void advance_() noexcept {
            if (owner_ && !owner_->next_byte(current_)) {
                owner_ = nullptr;
            }
        }

        BufferedByteSource* owner_ = nullptr;
        std::uint8_t current_ = 0;
    };

    // -------------------------------------------------------------------------
    // Construction
    // -------------------------------------------------------------------------

    // Builds an instance over `source` and performs the first fill.
    // On success `out` holds an instance positioned at the first byte.
    // On failure `out` is left empty and the error is returned:
    //   - InvalidCapacity  cfg.capacity == 0
    //   - EmptySource      first fill returned no data (Strict policy)
    //   - any source error from the first fill
    [[nodiscard]]
    static IoError create(Source source, std::optional<BufferedByteSource>& out,
                          const config::Buffered& cfg = {}) {
        out.reset();
        if (cfg.capacity == 0) {
            BB_DEBUG("[BBS] rejected capacity 0");
            return make_error(Error::InvalidCapacity);
        }
        BufferedByteSource bbs{std::move(source), cfg.capacity};
        const IoError err = bbs.fill_();
        if (!err.ok()) {
            BB_DEBUG("[BBS] first fill failed: " << to_string(err));
            return err;
        }
        if (bbs.buffer_.size() == 0) {
            BB_TL1( bbs.telemetry_.exhausted_total.inc() );
            if (cfg.empty_source == config::EmptySourcePolicy::Strict) {
                BB_DEBUG("[BBS] first fill returned no data (policy: Strict)");
                return make_error(Error::EmptySource);
            }
            BB_DEBUG("[BBS] first fill returned no data (policy: Lenient)");
            bbs.state_ = State::Exhausted;
        }
        BB_DEBUG("[BBS] created (capacity: " << cfg.capacity
                 << ", first fill: " << bbs.buffer_.size() << " bytes)");
        out.emplace(std::move(bbs));
        return no_error;
    }

    [[nodiscard]]
    static IoError create_with_capacity(Source source, std::size_t capacity,
                                        std::optional<BufferedByteSource>& out) {
        return create(std::move(source), out, config::Buffered{capacity, config::EmptySourcePolicy::Strict});
    }

    BufferedByteSource(const BufferedByteSource&) = delete;
    BufferedByteSource& operator=(const BufferedByteSource&) = delete;

    // A moved-from instance is Exhausted and never touches its (moved) source.
    BufferedByteSource(BufferedByteSource&& other) noexcept
        : source_(std::move(other.source_))
        , buffer_(std::move(other.buffer_))
        , cursor_(std::exchange(other.cursor_, 0))
        , state_(std::exchange(other.state_, State::Exhausted))
        , last_error_(std::exchange(other.last_error_, no_error))
        , telemetry_(other.telemetry_)
    {}

    BufferedByteSource& operator=(BufferedByteSource&& other) noexcept {
        if (this != &other) {
            source_     = std::move(other.source_);
            buffer_     = std::move(other.buffer_);
            cursor_     = std::exchange(other.cursor_, 0);
            state_      = std::exchange(other.state_, State::Exhausted);
            last_error_ = std::exchange(other.last_error_, no_error);
            telemetry_  = other.telemetry_;
        }
        return *this;
    }

    ~BufferedByteSource() = default;

    // -------------------------------------------------------------------------
    // Consumption
    // -------------------------------------------------------------------------

    // Writes the next byte to `out` and returns true, or returns false once
    // the source is exhausted or has failed (and on every call after that).
    [[nodiscard]]
    inline bool next_byte(std::uint8_t& out) noexcept {
        if (cursor_ == buffer_.size()) [[unlikely]] {
            if (!refill_()) {
                return false;
            }
        }
        out = buffer_.data()[cursor_++];
        BB_TL2( telemetry_.bytes_yielded_total.inc() );
        return true;
    }

    [[nodiscard]] inline iterator begin() noexcept { return iterator{*this}; }
    [[nodiscard]] inline std::default_sentinel_t end() const noexcept { return {}; }

    // -------------------------------------------------------------------------
    // Error inspection
    // -------------------------------------------------------------------------

    // Error recorded by a failed refill, nullptr if none.
    // The pointer is valid until the instance is mutated or destroyed.
    [[nodiscard]]
    inline const IoError* last_error() const noexcept {
        return last_error_.ok() ? nullptr : &last_error_;
    }

    // Runs `fn(*this)` and then checks the sticky error.
    // Success: the result of fn is assigned to `out`, Error::None returned.
    // Failure: the result of fn is discarded, `out` is untouched and the
    //          recorded error is returned.
    template <class Fn, class T>
        requires std::invocable<Fn&, BufferedByteSource&> &&
                 std::assignable_from<T&, std::invoke_result_t<Fn&, BufferedByteSource&>>
    [[nodiscard]]
    IoError run_checked(Fn&& fn, T& out) {
        auto result = std::invoke(fn, *this);
        if (!last_error_.ok()) {
            return last_error_;
        }
        out = std::move(result);
        return no_error;
    }

    // Variant for passes that produce no value.
    template <class Fn>
        requires std::invocable<Fn&, BufferedByteSource&>
    [[nodiscard]]
    IoError run_checked(Fn&& fn) {
        std::invoke(fn, *this);
        return last_error_;
    }

    // -------------------------------------------------------------------------
    // Observers
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline State state() const noexcept {
        if (is_terminal(state_)) {
            return state_;
        }
        return cursor_ < buffer_.size() ? State::Ready : State::NeedsRefill;
    }

    [[nodiscard]] inline std::size_t capacity() const noexcept { return buffer_.capacity(); }
    [[nodiscard]] inline std::size_t valid_length() const noexcept { return buffer_.size(); }
    [[nodiscard]] inline std::size_t cursor() const noexcept { return cursor_; }

    // Address of the internal buffer; stable for the lifetime of the instance.
    [[nodiscard]] inline const std::uint8_t* buffer_data() const noexcept { return buffer_.data(); }

    [[nodiscard]] inline const Source& source() const noexcept { return source_; }
    [[nodiscard]] inline const telemetry::ByteSource& metrics() const noexcept { return telemetry_; }

private:
    BufferedByteSource(Source&& source, std::size_t capacity)
        : source_(std::move(source))
        , buffer_(capacity)
    {}

    // One read into the buffer from offset 0. Resets cursor; valid length is
    // the byte count on success and 0 on failure.
    [[nodiscard]]
    inline IoError fill_() noexcept {
        BB_TL1( telemetry_.fill_calls_total.inc() );
        std::size_t n = 0;
        IoError err = source_.read(buffer_.writable(), n);
        cursor_ = 0;
        if (err.ok() && n > buffer_.capacity()) [[unlikely]] {
            err = make_error(Error::SourceContract);
        }
        if (!err.ok()) {
            buffer_.clear();
            BB_TL1( telemetry_.read_failures_total.inc() );
            return err;
        }
        buffer_.set_size(n);
        BB_TL1( telemetry_.bytes_filled_total.inc(n) );
        return no_error;
    }

    // Returns true when fresh bytes are available.
    [[nodiscard]]
    inline bool refill_() noexcept {
        if (is_terminal(state_)) {
            return false;
        }
        BB_TL1( telemetry_.refills_total.inc() );
        const IoError err = fill_();
        if (!err.ok()) {
            last_error_ = err;
            state_ = State::Failed;
            BB_WARN("[BBS] refill failed: " << to_string(err));
            return false;
        }
        if (buffer_.size() == 0) {
            state_ = State::Exhausted;
            BB_TL1( telemetry_.exhausted_total.inc() );
            BB_DEBUG("[BBS] source exhausted");
            return false;
        }
        BB_TRACE("[BBS] refilled " << buffer_.size() << " bytes");
        return true;
    }

private:
    Source source_;
    lcr::local::raw_buffer buffer_;  // size() is the valid length
    std::size_t cursor_ = 0;
    State state_ = State::Ready;     // only terminal values are stored
    IoError last_error_{};
    telemetry::ByteSource telemetry_{};
};


} // namespace bufbytes::core
