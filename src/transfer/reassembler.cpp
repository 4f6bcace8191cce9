#include "xfer/transfer/reassembler.hpp"
#include "xfer/transfer/checksum.hpp"

#include <spdlog/spdlog.h>

namespace xfer::transfer {

std::vector<std::uint32_t> Reassembler::missing(const FileMetadata& expected, const ReceiveBuffer& buffer) {
    std::vector<std::uint32_t> gaps;
    auto it = buffer.begin();
    for (std::uint32_t seq = 0; seq < expected.total_chunks; ++seq) {
        while (it != buffer.end() && it->first < seq) {
            ++it;
        }
        if (it == buffer.end() || it->first != seq) {
            gaps.push_back(seq);
        }
    }
    return gaps;
}

TransferResult<std::vector<std::uint8_t>> Reassembler::verify(const FileMetadata& expected,
                                                              const ReceiveBuffer& buffer) {
    auto gaps = missing(expected, buffer);
    if (!gaps.empty()) {
        TransferError error(ErrorKind::IncompleteTransfer,
                            "received " + std::to_string(expected.total_chunks - gaps.size()) + " of " +
                            std::to_string(expected.total_chunks) + " chunks");
        error.missing = std::move(gaps);
        return Err<std::vector<std::uint8_t>>(std::move(error));
    }

    // Sized from what arrived; total_size is only a claim made by the peer.
    std::size_t received = 0;
    for (const auto& entry : buffer) {
        received += entry.second.size();
    }
    std::vector<std::uint8_t> rebuilt;
    rebuilt.reserve(received);
    Sha256 hasher;
    for (std::uint32_t seq = 0; seq < expected.total_chunks; ++seq) {
        const auto& payload = buffer.at(seq);
        hasher.update(payload);
        rebuilt.insert(rebuilt.end(), payload.begin(), payload.end());
    }

    auto digest = hasher.finish();
    if (digest.is_error()) {
        return Fail<std::vector<std::uint8_t>>(ErrorKind::Io, digest.error());
    }

    if (digest.value() != expected.checksum || rebuilt.size() != expected.total_size) {
        TransferError error(ErrorKind::ChecksumMismatch,
                            "reassembled " + std::to_string(rebuilt.size()) + " bytes do not match the declared checksum");
        error.expected_checksum = expected.checksum;
        error.actual_checksum = digest.take_value();
        return Err<std::vector<std::uint8_t>>(std::move(error));
    }

    spdlog::debug("Reassembled {} bytes from {} chunks, checksum {}", rebuilt.size(), expected.total_chunks,
                  expected.checksum);
    return OkAs<std::vector<std::uint8_t>, TransferError>(std::move(rebuilt));
}

} // namespace xfer::transfer
