// ============================================================================
// raw_buffer
// ----------------------------------------------------------------------------
// Fixed-capacity, reusable, single-thread raw byte buffer.
//
// The capacity is chosen at construction and never changes: the storage is
// allocated exactly once and reused in place for the lifetime of the object.
// Writers fill data()[0..capacity()) and publish the number of valid bytes
// with set_size().
//
// Properties:
//   • Runtime fixed capacity (> 0)
//   • Single allocation, zero-initialized
//   • No growth, no implicit resizing
//   • Move-only (ownership of the storage travels with the object)
//   • No synchronization (NOT thread-safe)
//
// Example:
//
//   lcr::local::raw_buffer buffer{8192};
//
//   std::size_t n = fill(buffer.data(), buffer.capacity());
//   buffer.set_size(n);
//
//   consume(buffer.view());
//
// ============================================================================
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <utility>

namespace lcr::local {

class raw_buffer {
public:
    explicit raw_buffer(std::size_t capacity)
        : storage_(std::make_unique<std::uint8_t[]>(capacity))
        , capacity_(capacity)
    {}

    raw_buffer(const raw_buffer&) = delete;
    raw_buffer& operator=(const raw_buffer&) = delete;

    raw_buffer(raw_buffer&& other) noexcept
        : storage_(std::move(other.storage_))
        , capacity_(std::exchange(other.capacity_, 0))
        , size_(std::exchange(other.size_, 0))
    {}

    raw_buffer& operator=(raw_buffer&& other) noexcept {
        if (this != &other) {
            storage_  = std::move(other.storage_);
            capacity_ = std::exchange(other.capacity_, 0);
            size_     = std::exchange(other.size_, 0);
        }
        return *this;
    }

    // ------------------------------------------------------------------------
    // Raw access
    // ------------------------------------------------------------------------

    [[nodiscard]] inline std::uint8_t* data() noexcept {
        return storage_.get();
    }

    [[nodiscard]] inline const std::uint8_t* data() const noexcept {
        return storage_.get();
    }

    // Whole storage, for writers.
    [[nodiscard]] inline std::span<std::uint8_t> writable() noexcept {
        return {storage_.get(), capacity_};
    }

    // Valid bytes only, for readers.
    [[nodiscard]] inline std::span<const std::uint8_t> view() const noexcept {
        return {storage_.get(), size_};
    }

    // ------------------------------------------------------------------------
    // Capacity / size
    // ------------------------------------------------------------------------

    [[nodiscard]] inline std::size_t capacity() const noexcept {
        return capacity_;
    }

    [[nodiscard]] inline std::size_t size() const noexcept {
        return size_;
    }

    // Sizes above capacity are clamped; bytes past capacity do not exist.
    inline void set_size(std::size_t s) noexcept {
        size_ = s <= capacity_ ? s : capacity_;
    }

    inline void clear() noexcept {
        size_ = 0;
    }

private:
    std::unique_ptr<std::uint8_t[]> storage_;
    std::size_t capacity_ = 0;
    std::size_t size_ = 0;
};

} // namespace lcr::local
