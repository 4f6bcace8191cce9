#pragma once

#include "xfer/core/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace xfer {

enum class ErrorKind {
    FrameError,          ///< Malformed or truncated wire frame
    ConnectionClosed,    ///< Peer went away mid-transfer
    IncompleteTransfer,  ///< Sequence numbers missing after end-of-transmission
    ChecksumMismatch,    ///< Reassembled bytes do not hash to the declared checksum
    RetriesExhausted,    ///< Attempt budget spent without a verified transfer
    InvalidArgument,
    InvalidState,
    Io
};

const char* to_string(ErrorKind kind) noexcept;
std::optional<ErrorKind> error_kind_from_string(const std::string& text) noexcept;

/**
 * @brief Failure description carried by protocol and transfer results
 *
 * missing is filled for IncompleteTransfer, the two checksum fields for
 * ChecksumMismatch. RetriesExhausted keeps the last attempt's detail in
 * these fields as well.
 */
struct TransferError {
    ErrorKind kind = ErrorKind::Io;
    std::string message;
    std::vector<std::uint32_t> missing;
    std::string expected_checksum;
    std::string actual_checksum;

    TransferError() = default;
    TransferError(ErrorKind k, std::string msg)
        : kind(k), message(std::move(msg)) {}

    [[nodiscard]] bool retryable() const noexcept;

    /// One-line description for logs, e.g. "IncompleteTransfer: ... missing=[3]".
    [[nodiscard]] std::string describe() const;
};

template<typename T>
using TransferResult = Result<T, TransferError>;

inline TransferError make_error(ErrorKind kind, std::string message) {
    return TransferError(kind, std::move(message));
}

template<typename T>
TransferResult<T> Fail(ErrorKind kind, std::string message) {
    return Err<T>(TransferError(kind, std::move(message)));
}

} // namespace xfer
