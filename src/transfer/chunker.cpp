#include "xfer/transfer/chunker.hpp"
#include "xfer/transfer/checksum.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <iterator>

namespace xfer::transfer {
namespace fs = std::filesystem;

std::uint32_t Chunker::chunk_count(std::uint64_t total_size, std::size_t chunk_size) noexcept {
    if (chunk_size == 0) {
        return 0;
    }
    return static_cast<std::uint32_t>((total_size + chunk_size - 1) / chunk_size);
}

TransferResult<void> Chunker::check_limits(std::uint64_t total_size, std::size_t chunk_size,
                                          std::uint64_t total_chunks) {
    if (chunk_size == 0 || chunk_size > kMaxChunkSize) {
        return Fail<void>(ErrorKind::InvalidArgument,
                          "chunk_size must be within 1.." + std::to_string(kMaxChunkSize));
    }
    if (total_size > kMaxTotalSize) {
        return Fail<void>(ErrorKind::InvalidArgument, std::to_string(total_size) + " bytes exceeds the " +
                                                          std::to_string(kMaxTotalSize) + " byte transfer limit");
    }
    if (total_chunks > kMaxChunks) {
        return Fail<void>(ErrorKind::InvalidArgument, std::to_string(total_chunks) + " chunks exceeds the " +
                                                          std::to_string(kMaxChunks) + " chunk limit");
    }
    return {};
}

TransferResult<ChunkedBuffer> Chunker::split(const std::vector<std::uint8_t>& buffer,
                                             std::size_t chunk_size) {
    if (chunk_size == 0) {
        return Fail<ChunkedBuffer>(ErrorKind::InvalidArgument, "chunk_size must be > 0");
    }
    const std::uint64_t needed = (static_cast<std::uint64_t>(buffer.size()) + chunk_size - 1) / chunk_size;
    if (auto limits = check_limits(buffer.size(), chunk_size, needed); limits.is_error()) {
        return Err<ChunkedBuffer>(limits.error());
    }

    ChunkedBuffer result;

    // Digest of the original buffer, never recomputed from the pieces on this side.
    auto checksum = sha256_hex(buffer);
    if (checksum.is_error()) {
        return Fail<ChunkedBuffer>(ErrorKind::Io, checksum.error());
    }
    result.checksum = checksum.take_value();

    result.chunks.reserve(chunk_count(buffer.size(), chunk_size));
    std::uint32_t seq = 0;
    for (std::size_t offset = 0; offset < buffer.size(); offset += chunk_size) {
        const std::size_t length = std::min(chunk_size, buffer.size() - offset);
        ChunkRecord record;
        record.seq = seq++;
        record.data.assign(buffer.begin() + static_cast<std::ptrdiff_t>(offset),
                           buffer.begin() + static_cast<std::ptrdiff_t>(offset + length));
        result.chunks.push_back(std::move(record));
    }

    spdlog::debug("Split {} bytes into {} chunks of up to {} bytes", buffer.size(), result.chunks.size(), chunk_size);
    return OkAs<ChunkedBuffer, TransferError>(std::move(result));
}

TransferResult<FileMetadata> Chunker::make_metadata(const std::string& filename,
                                                    const std::vector<std::uint8_t>& buffer,
                                                    const ChunkedBuffer& chunked,
                                                    std::size_t chunk_size) {
    if (chunk_size == 0 || chunk_size > kMaxChunkSize) {
        return Fail<FileMetadata>(ErrorKind::InvalidArgument, "chunk_size out of range");
    }

    FileMetadata metadata;
    metadata.filename = filename;
    metadata.total_size = buffer.size();
    metadata.checksum = chunked.checksum;
    metadata.chunk_size = static_cast<std::uint32_t>(chunk_size);
    metadata.total_chunks = static_cast<std::uint32_t>(chunked.chunks.size());
    return OkAs<FileMetadata, TransferError>(std::move(metadata));
}

TransferResult<std::vector<std::uint8_t>> read_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Fail<std::vector<std::uint8_t>>(ErrorKind::Io, "File not found: " + path.string());
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Fail<std::vector<std::uint8_t>>(ErrorKind::Io, "Failed to open file: " + path.string());
    }

    std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (input.bad()) {
        return Fail<std::vector<std::uint8_t>>(ErrorKind::Io, "Failed to read file: " + path.string());
    }
    return OkAs<std::vector<std::uint8_t>, TransferError>(std::move(data));
}

TransferResult<void> write_file(const fs::path& path, const std::vector<std::uint8_t>& data) {
    std::error_code ec;
    const auto parent = path.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec && !fs::exists(parent)) {
            return Fail<void>(ErrorKind::Io, "Failed to create directory: " + parent.string());
        }
    }

    fs::path staging = path;
    staging += ".part";
    {
        std::ofstream out(staging, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Fail<void>(ErrorKind::Io, "Failed to open staging file: " + staging.string());
        }
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!out) {
            return Fail<void>(ErrorKind::Io, "Failed to write staging file: " + staging.string());
        }
    }

    fs::rename(staging, path, ec);
    if (ec) {
        fs::remove(staging, ec);
        return Fail<void>(ErrorKind::Io, "Failed to move staging file to " + path.string());
    }
    return {};
}

} // namespace xfer::transfer
