#pragma once

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <fcntl.h>
#include <unistd.h>

#include "bufbytes/core/source/concept.hpp"
#include "lcr/log/logger.hpp"


namespace bufbytes::core::source {

// ============================================================================
//  FileSource
// ----------------------------------------------------------------------------
// POSIX file-descriptor byte source (regular files, pipes, sockets, stdin).
//
// Ownership:
//   - open() creates an owned descriptor, closed on destruction
//   - adopt() wraps an existing descriptor, optionally taking ownership
//   - move-only; a moved-from FileSource holds no descriptor
//
// read() retries on EINTR and forwards any other failure as
// Error::ReadFailed with the errno value.
// ============================================================================
class FileSource {
public:
    FileSource() noexcept = default;

    ~FileSource() {
        if (close() != no_error) {
            BB_WARN("[FileSource] close failed on destruction");
        }
    }

    FileSource(const FileSource&) = delete;
    FileSource& operator=(const FileSource&) = delete;

    FileSource(FileSource&& other) noexcept
        : fd_(std::exchange(other.fd_, -1))
        , owns_(std::exchange(other.owns_, false))
    {}

    FileSource& operator=(FileSource&& other) noexcept {
        if (this != &other) {
            if (close() != no_error) {
                BB_WARN("[FileSource] close failed on move-assignment");
            }
            fd_   = std::exchange(other.fd_, -1);
            owns_ = std::exchange(other.owns_, false);
        }
        return *this;
    }

    // Opens `path` read-only.
    [[nodiscard]]
    static IoError open(const std::string& path, FileSource& out) noexcept {
        int fd;
        do {
            fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        } while (fd < 0 && errno == EINTR);
        if (fd < 0) {
            const int err = errno;
            BB_DEBUG("[FileSource] open failed: " << path << " (errno " << err << ")");
            return make_error(Error::OpenFailed, err);
        }
        BB_TRACE("[FileSource] opened " << path << " (fd " << fd << ")");
        out = adopt(fd, true);
        return no_error;
    }

    // Wraps an already open descriptor.
    [[nodiscard]]
    static FileSource adopt(int fd, bool owns) noexcept {
        FileSource src;
        src.fd_ = fd;
        src.owns_ = owns;
        return src;
    }

    [[nodiscard]]
    inline IoError read(std::span<std::uint8_t> dst, std::size_t& n) noexcept {
        n = 0;
        if (fd_ < 0) {
            return make_error(Error::ReadFailed, EBADF);
        }
        ssize_t rc;
        do {
            rc = ::read(fd_, dst.data(), dst.size());
        } while (rc < 0 && errno == EINTR);
        if (rc < 0) {
            return make_error(Error::ReadFailed, errno);
        }
        n = static_cast<std::size_t>(rc);
        return no_error;
    }

    // Releases the descriptor (closing it when owned). Idempotent.
    [[nodiscard]]
    inline IoError close() noexcept {
        const int fd = std::exchange(fd_, -1);
        const bool owns = std::exchange(owns_, false);
        if (fd < 0 || !owns) {
            return no_error;
        }
        if (::close(fd) != 0) {
            return make_error(Error::CloseFailed, errno);
        }
        return no_error;
    }

    [[nodiscard]] inline bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] inline int fd() const noexcept { return fd_; }

private:
    int fd_ = -1;
    bool owns_ = false;
};
static_assert(ByteSourceConcept<FileSource>);

} // namespace bufbytes::core::source
