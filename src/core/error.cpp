#include "xfer/core/error.hpp"

#include <sstream>

namespace xfer {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::FrameError: return "FrameError";
        case ErrorKind::ConnectionClosed: return "ConnectionClosed";
        case ErrorKind::IncompleteTransfer: return "IncompleteTransfer";
        case ErrorKind::ChecksumMismatch: return "ChecksumMismatch";
        case ErrorKind::RetriesExhausted: return "RetriesExhausted";
        case ErrorKind::InvalidArgument: return "InvalidArgument";
        case ErrorKind::InvalidState: return "InvalidState";
        case ErrorKind::Io: return "Io";
    }
    return "Unknown";
}

std::optional<ErrorKind> error_kind_from_string(const std::string& text) noexcept {
    for (auto kind : {ErrorKind::FrameError, ErrorKind::ConnectionClosed, ErrorKind::IncompleteTransfer,
                      ErrorKind::ChecksumMismatch, ErrorKind::RetriesExhausted, ErrorKind::InvalidArgument,
                      ErrorKind::InvalidState, ErrorKind::Io}) {
        if (text == to_string(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

bool TransferError::retryable() const noexcept {
    return kind == ErrorKind::ConnectionClosed ||
           kind == ErrorKind::IncompleteTransfer ||
           kind == ErrorKind::ChecksumMismatch;
}

std::string TransferError::describe() const {
    std::ostringstream oss;
    oss << to_string(kind) << ": " << message;
    if (!missing.empty()) {
        oss << " missing=[";
        for (std::size_t i = 0; i < missing.size(); ++i) {
            if (i > 0) {
                oss << ',';
            }
            oss << missing[i];
        }
        oss << ']';
    }
    if (!expected_checksum.empty() || !actual_checksum.empty()) {
        oss << " expected=" << expected_checksum << " actual=" << actual_checksum;
    }
    return oss.str();
}

} // namespace xfer
