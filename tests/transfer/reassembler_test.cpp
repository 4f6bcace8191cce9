#include "xfer/transfer/checksum.hpp"
#include "xfer/transfer/chunker.hpp"
#include "xfer/transfer/reassembler.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace xfer::transfer;
using xfer::ErrorKind;

namespace {

struct Fixture {
    std::vector<std::uint8_t> data;
    FileMetadata metadata;
    std::vector<ChunkRecord> chunks;
};

Fixture make_fixture(std::size_t size, std::size_t chunk_size = 1024) {
    Fixture f;
    f.data.resize(size);
    for (std::size_t i = 0; i < size; ++i) {
        f.data[i] = static_cast<std::uint8_t>(i % 251);
    }
    auto chunked = Chunker::split(f.data, chunk_size);
    f.metadata = Chunker::make_metadata("file.bin", f.data, chunked.value(), chunk_size).value();
    f.chunks = chunked.value().chunks;
    return f;
}

ReceiveBuffer fill(const std::vector<ChunkRecord>& chunks) {
    ReceiveBuffer buffer;
    for (const auto& chunk : chunks) {
        buffer.emplace(chunk.seq, chunk.data);
    }
    return buffer;
}

} // namespace

TEST(Reassembler, CompleteBufferRebuildsOriginal) {
    auto f = make_fixture(10 * 1024);
    auto result = Reassembler::verify(f.metadata, fill(f.chunks));
    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    EXPECT_EQ(result.value(), f.data);
}

TEST(Reassembler, ArrivalOrderDoesNotMatter) {
    auto f = make_fixture(5000);
    std::vector<ChunkRecord> reversed(f.chunks.rbegin(), f.chunks.rend());

    auto result = Reassembler::verify(f.metadata, fill(reversed));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), f.data);
}

TEST(Reassembler, SingleGapReported) {
    auto f = make_fixture(10 * 1024);
    auto buffer = fill(f.chunks);
    buffer.erase(3);

    auto result = Reassembler::verify(f.metadata, buffer);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::IncompleteTransfer);
    EXPECT_EQ(result.error().missing, std::vector<std::uint32_t>{3});
}

TEST(Reassembler, GapsSortedAscending) {
    auto f = make_fixture(10 * 1024);
    auto buffer = fill(f.chunks);
    buffer.erase(9);
    buffer.erase(0);
    buffer.erase(5);

    EXPECT_EQ(Reassembler::missing(f.metadata, buffer), (std::vector<std::uint32_t>{0, 5, 9}));

    auto result = Reassembler::verify(f.metadata, buffer);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().missing, (std::vector<std::uint32_t>{0, 5, 9}));
}

TEST(Reassembler, CorruptedPayloadIsChecksumMismatch) {
    auto f = make_fixture(4096);
    auto buffer = fill(f.chunks);
    buffer[2][17] ^= 0x01;

    auto result = Reassembler::verify(f.metadata, buffer);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::ChecksumMismatch);
    EXPECT_EQ(result.error().expected_checksum, f.metadata.checksum);
    EXPECT_EQ(result.error().actual_checksum.size(), 64u);
    EXPECT_NE(result.error().actual_checksum, f.metadata.checksum);
}

TEST(Reassembler, OverstatedTotalSizeIsChecksumMismatch) {
    const std::vector<std::uint8_t> bytes = {0x61, 0x62};

    FileMetadata claimed;
    claimed.filename = "claimed.bin";
    claimed.total_size = 1ull << 40;
    claimed.chunk_size = 1;
    claimed.total_chunks = 2;
    claimed.checksum = sha256_hex(bytes).value();

    ReceiveBuffer buffer;
    buffer.emplace(0u, std::vector<std::uint8_t>{0x61});
    buffer.emplace(1u, std::vector<std::uint8_t>{0x62});

    auto result = Reassembler::verify(claimed, buffer);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::ChecksumMismatch);
}

TEST(Reassembler, EmptyFileVerifies) {
    auto f = make_fixture(0);
    EXPECT_EQ(f.metadata.total_chunks, 0u);

    auto result = Reassembler::verify(f.metadata, ReceiveBuffer{});
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().empty());
}
