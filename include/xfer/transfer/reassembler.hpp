#pragma once

#include "xfer/core/error.hpp"
#include "xfer/transfer/chunker.hpp"

#include <cstdint>
#include <map>
#include <vector>

namespace xfer::transfer {

/// seq -> payload. Keys, not arrival order, decide the reconstructed layout.
using ReceiveBuffer = std::map<std::uint32_t, std::vector<std::uint8_t>>;

class Reassembler {
public:
    /**
     * @brief Checks completeness and integrity, then rebuilds the buffer
     *
     * IncompleteTransfer lists the missing sequence numbers in ascending
     * order. ChecksumMismatch reports both digests. On success the payloads
     * are concatenated strictly by sequence number.
     */
    static TransferResult<std::vector<std::uint8_t>> verify(const FileMetadata& expected,
                                                            const ReceiveBuffer& buffer);

    static std::vector<std::uint32_t> missing(const FileMetadata& expected, const ReceiveBuffer& buffer);
};

} // namespace xfer::transfer
