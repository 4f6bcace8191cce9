#pragma once

#include "xfer/core/config.hpp"
#include "xfer/core/error.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace xfer::transfer {

/**
 * @brief Fixed-size slice of the original buffer
 *
 * Every record is chunk_size bytes long except possibly the last one.
 */
struct ChunkRecord {
    std::uint32_t seq = 0;
    std::vector<std::uint8_t> data;
};

/**
 * @brief What the receiver needs to know to verify one attempt
 */
struct FileMetadata {
    std::string filename;
    std::uint64_t total_size = 0;
    std::string checksum;
    std::uint32_t chunk_size = 0;
    std::uint32_t total_chunks = 0;
};

struct ChunkedBuffer {
    std::string checksum; ///< Computed over the unsplit buffer
    std::vector<ChunkRecord> chunks;
};

/**
 * @brief Splits buffers into chunks and bounds what a transfer may declare
 *
 * The receiver holds a whole transfer in memory, so the limits below apply
 * to both sides: split() refuses to produce a transfer outside them and the
 * receiving side refuses metadata that declares one.
 */
class Chunker {
public:
    static constexpr std::size_t kMaxChunkSize = TransferConfig::kMaxChunkSize;
    static constexpr std::uint64_t kMaxTotalSize = 4ull * 1024u * 1024u * 1024u;
    /// Enough for kMaxTotalSize at the default chunk size.
    static constexpr std::uint32_t kMaxChunks = 4u * 1024u * 1024u;

    /// InvalidArgument when a transfer of this shape exceeds the limits above.
    static TransferResult<void> check_limits(std::uint64_t total_size, std::size_t chunk_size,
                                             std::uint64_t total_chunks);

    /// Splits left to right into seq 0..n-1. chunk_size must be in (0, kMaxChunkSize].
    static TransferResult<ChunkedBuffer> split(const std::vector<std::uint8_t>& buffer,
                                               std::size_t chunk_size);

    static TransferResult<FileMetadata> make_metadata(const std::string& filename,
                                                      const std::vector<std::uint8_t>& buffer,
                                                      const ChunkedBuffer& chunked,
                                                      std::size_t chunk_size);

    static std::uint32_t chunk_count(std::uint64_t total_size, std::size_t chunk_size) noexcept;
};

/// Whole file contents; transfers are in-memory end to end.
TransferResult<std::vector<std::uint8_t>> read_file(const std::filesystem::path& path);

/// Writes via a temporary sibling and renames it into place.
TransferResult<void> write_file(const std::filesystem::path& path, const std::vector<std::uint8_t>& data);

} // namespace xfer::transfer
