#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

namespace bufbytes::core {

/*
===============================================================================
 core::Error
===============================================================================

Byte-source error classification.

Semantic failures, abstracted away from the concrete source (POSIX file
descriptor, in-memory reader, test double). When the failure originates in
the operating system, the errno value travels next to the code in IoError.

Error values are stable: new codes may be appended, existing ones never
change meaning.
===============================================================================
*/

enum class Error : uint8_t {
    None = 0,

    // --- Construction / contract errors (caller responsibility) -------------
    InvalidCapacity,  // Buffer capacity of zero requested
    EmptySource,      // First fill returned no data (strict empty-source policy)

    // --- Source failures ----------------------------------------------------
    OpenFailed,       // Source could not be opened (missing file, permissions)
    ReadFailed,       // Source reported an I/O failure while filling
    CloseFailed,      // Owned descriptor could not be closed cleanly
    SourceContract,   // Source claimed to write more bytes than requested
};

[[nodiscard]]
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:             return "None";
    case Error::InvalidCapacity:  return "InvalidCapacity";
    case Error::EmptySource:      return "EmptySource";
    case Error::OpenFailed:       return "OpenFailed";
    case Error::ReadFailed:       return "ReadFailed";
    case Error::CloseFailed:      return "CloseFailed";
    case Error::SourceContract:   return "SourceContract";
    default:                      return "Unknown";
    }
}


// -----------------------------------------------------------------------------
// IoError
// -----------------------------------------------------------------------------
// Error code plus the originating errno (0 when not OS related).
// -----------------------------------------------------------------------------
struct IoError {
    Error code = Error::None;
    int sys_errno = 0;

    [[nodiscard]] inline constexpr bool ok() const noexcept {
        return code == Error::None;
    }

    friend constexpr bool operator==(const IoError&, const IoError&) noexcept = default;
};

[[nodiscard]]
inline constexpr IoError make_error(Error code, int sys_errno = 0) noexcept {
    return IoError{code, sys_errno};
}

inline constexpr IoError no_error{};

// "ReadFailed (errno 5: Input/output error)"
[[nodiscard]]
inline std::string to_string(const IoError& err) {
    std::string out{to_string(err.code)};
    if (err.sys_errno != 0) {
        out += " (errno ";
        out += std::to_string(err.sys_errno);
        out += ": ";
        out += std::strerror(err.sys_errno);
        out += ")";
    }
    return out;
}

} // namespace bufbytes::core
