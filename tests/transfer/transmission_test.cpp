#include "xfer/network/pipe_stream.hpp"
#include "xfer/protocol/codec.hpp"
#include "xfer/transfer/chunker.hpp"
#include "xfer/transfer/fault_injector.hpp"
#include "xfer/transfer/transmission.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace xfer::transfer;
using xfer::ErrorKind;
using xfer::network::PipeStream;
using xfer::protocol::ChunkMessage;
using xfer::protocol::EndOfTransmission;
using xfer::protocol::MessageCodec;
using xfer::protocol::ResultMessage;

namespace {

struct Payload {
    std::vector<std::uint8_t> data;
    FileMetadata metadata;
    std::vector<ChunkRecord> chunks;
};

Payload make_payload(std::size_t size, std::size_t chunk_size = 1024) {
    Payload p;
    p.data.resize(size);
    for (std::size_t i = 0; i < size; ++i) {
        p.data[i] = static_cast<std::uint8_t>((i * 13) ^ (i >> 8));
    }
    auto chunked = Chunker::split(p.data, chunk_size);
    p.metadata = Chunker::make_metadata("payload.bin", p.data, chunked.value(), chunk_size).value();
    p.chunks = chunked.value().chunks;
    return p;
}

void write_raw(xfer::network::ByteStream& stream, const std::string& body) {
    const auto n = static_cast<std::uint32_t>(body.size());
    std::vector<std::uint8_t> frame = {
        static_cast<std::uint8_t>(n >> 24), static_cast<std::uint8_t>(n >> 16),
        static_cast<std::uint8_t>(n >> 8), static_cast<std::uint8_t>(n)};
    frame.insert(frame.end(), body.begin(), body.end());
    ASSERT_TRUE(stream.write_all(frame).is_ok());
}

} // namespace

// Pipe buffers are unbounded, so each side can run to completion in turn on one thread.

TEST(Transmission, CleanTransferSucceedsOnBothSides) {
    auto payload = make_payload(10 * 1024);
    auto [sender_end, receiver_end] = PipeStream::create_pair();

    TransferSession send_session("tx", SessionRole::Sender);
    ChunkSender sender(*sender_end);
    auto sent = sender.send(send_session, payload.metadata, payload.chunks);
    ASSERT_TRUE(sent.is_ok()) << sent.error().describe();
    EXPECT_EQ(sent.value().chunks_sent, 10u);
    EXPECT_EQ(sent.value().bytes_sent, payload.data.size());
    EXPECT_EQ(send_session.state(), SessionState::Verifying);

    TransferSession recv_session("rx", SessionRole::Receiver);
    ChunkReceiver receiver(*receiver_end);
    auto received = receiver.receive(recv_session);
    ASSERT_TRUE(received.is_ok()) << received.error().describe();
    EXPECT_EQ(received.value().data, payload.data);
    EXPECT_EQ(received.value().chunks_received, 10u);
    EXPECT_EQ(recv_session.state(), SessionState::Success);

    ASSERT_TRUE(receiver.report(received).is_ok());
    auto verdict = sender.await_verdict(send_session);
    ASSERT_TRUE(verdict.is_ok());
    EXPECT_TRUE(verdict.value().success);
    EXPECT_EQ(verdict.value().checksum, payload.metadata.checksum);
    EXPECT_EQ(send_session.state(), SessionState::Success);
}

TEST(Transmission, ReorderedStreamStillVerifies) {
    auto payload = make_payload(8000, 512);
    auto [sender_end, receiver_end] = PipeStream::create_pair();

    FaultPolicy policy;
    policy.reorder = true;
    policy.seed = 11;
    FaultInjector injector(policy);

    TransferSession send_session("tx", SessionRole::Sender);
    ASSERT_TRUE(ChunkSender(*sender_end).send(send_session, payload.metadata, payload.chunks, &injector).is_ok());

    TransferSession recv_session("rx", SessionRole::Receiver);
    auto received = ChunkReceiver(*receiver_end).receive(recv_session);
    ASSERT_TRUE(received.is_ok());
    EXPECT_EQ(received.value().data, payload.data);
}

TEST(Transmission, DroppedChunkReportedBackToSender) {
    auto payload = make_payload(10 * 1024);
    auto [sender_end, receiver_end] = PipeStream::create_pair();

    FaultPolicy policy;
    policy.forced_drops = {3};
    FaultInjector injector(policy);

    TransferSession send_session("tx", SessionRole::Sender);
    ChunkSender sender(*sender_end);
    auto sent = sender.send(send_session, payload.metadata, payload.chunks, &injector);
    ASSERT_TRUE(sent.is_ok());
    EXPECT_EQ(sent.value().chunks_sent, 9u);
    EXPECT_EQ(sent.value().faults.dropped, std::vector<std::uint32_t>{3});

    TransferSession recv_session("rx", SessionRole::Receiver);
    ChunkReceiver receiver(*receiver_end);
    auto received = receiver.receive(recv_session);
    ASSERT_TRUE(received.is_error());
    EXPECT_EQ(received.error().kind, ErrorKind::IncompleteTransfer);
    EXPECT_EQ(received.error().missing, std::vector<std::uint32_t>{3});
    EXPECT_EQ(recv_session.state(), SessionState::Failed);

    ASSERT_TRUE(receiver.report(received).is_ok());
    auto verdict = sender.await_verdict(send_session);
    ASSERT_TRUE(verdict.is_error());
    EXPECT_EQ(verdict.error().kind, ErrorKind::IncompleteTransfer);
    EXPECT_EQ(verdict.error().missing, std::vector<std::uint32_t>{3});
    EXPECT_TRUE(verdict.error().retryable());
    EXPECT_EQ(send_session.state(), SessionState::Failed);
}

TEST(Transmission, CorruptedChunkIsChecksumMismatch) {
    auto payload = make_payload(4096);
    auto [sender_end, receiver_end] = PipeStream::create_pair();

    FaultPolicy policy;
    policy.forced_corruptions = {1};
    FaultInjector injector(policy);

    TransferSession send_session("tx", SessionRole::Sender);
    ChunkSender sender(*sender_end);
    ASSERT_TRUE(sender.send(send_session, payload.metadata, payload.chunks, &injector).is_ok());

    TransferSession recv_session("rx", SessionRole::Receiver);
    ChunkReceiver receiver(*receiver_end);
    auto received = receiver.receive(recv_session);
    ASSERT_TRUE(received.is_error());
    EXPECT_EQ(received.error().kind, ErrorKind::ChecksumMismatch);

    ASSERT_TRUE(receiver.report(received).is_ok());
    auto verdict = sender.await_verdict(send_session);
    ASSERT_TRUE(verdict.is_error());
    EXPECT_EQ(verdict.error().kind, ErrorKind::ChecksumMismatch);
    EXPECT_EQ(verdict.error().expected_checksum, payload.metadata.checksum);
    EXPECT_EQ(verdict.error().actual_checksum, received.error().actual_checksum);
}

TEST(Transmission, MalformedMessageMidStreamIsSkipped) {
    auto payload = make_payload(2048);
    auto [sender_end, receiver_end] = PipeStream::create_pair();

    ASSERT_TRUE(MessageCodec::write_message(*sender_end, to_message(payload.metadata)).is_ok());
    ASSERT_TRUE(MessageCodec::write_message(*sender_end, ChunkMessage{0, payload.chunks[0].data}).is_ok());
    write_raw(*sender_end, R"({"type":"chunk","seq":1,"data":"zz"})");
    write_raw(*sender_end, R"({"type":"gossip"})");
    ASSERT_TRUE(MessageCodec::write_message(*sender_end, ChunkMessage{1, payload.chunks[1].data}).is_ok());
    ASSERT_TRUE(MessageCodec::write_message(*sender_end, EndOfTransmission{}).is_ok());

    TransferSession session("rx", SessionRole::Receiver);
    auto received = ChunkReceiver(*receiver_end).receive(session);
    ASSERT_TRUE(received.is_ok()) << received.error().describe();
    EXPECT_EQ(received.value().data, payload.data);
    EXPECT_EQ(received.value().messages_skipped, 2u);
}

TEST(Transmission, DuplicateChunkKeepsFirstCopy) {
    auto payload = make_payload(2048);
    auto [sender_end, receiver_end] = PipeStream::create_pair();

    std::vector<std::uint8_t> bogus(payload.chunks[0].data.size(), 0xee);
    ASSERT_TRUE(MessageCodec::write_message(*sender_end, to_message(payload.metadata)).is_ok());
    ASSERT_TRUE(MessageCodec::write_message(*sender_end, ChunkMessage{0, payload.chunks[0].data}).is_ok());
    ASSERT_TRUE(MessageCodec::write_message(*sender_end, ChunkMessage{0, bogus}).is_ok());
    ASSERT_TRUE(MessageCodec::write_message(*sender_end, ChunkMessage{1, payload.chunks[1].data}).is_ok());
    ASSERT_TRUE(MessageCodec::write_message(*sender_end, EndOfTransmission{}).is_ok());

    TransferSession session("rx", SessionRole::Receiver);
    auto received = ChunkReceiver(*receiver_end).receive(session);
    ASSERT_TRUE(received.is_ok());
    EXPECT_EQ(received.value().data, payload.data);
}

TEST(Transmission, FirstMessageMustBeMetadata) {
    auto [sender_end, receiver_end] = PipeStream::create_pair();
    ASSERT_TRUE(MessageCodec::write_message(*sender_end, ChunkMessage{0, {1, 2}}).is_ok());

    TransferSession session("rx", SessionRole::Receiver);
    auto received = ChunkReceiver(*receiver_end).receive(session);
    ASSERT_TRUE(received.is_error());
    EXPECT_EQ(received.error().kind, ErrorKind::FrameError);
    EXPECT_EQ(session.state(), SessionState::Failed);
}

TEST(Transmission, RefusalInsteadOfMetadata) {
    auto [sender_end, receiver_end] = PipeStream::create_pair();
    ResultMessage refusal;
    refusal.success = false;
    refusal.error = "Io";
    refusal.detail = "file not found: missing.bin";
    ASSERT_TRUE(MessageCodec::write_message(*sender_end, refusal).is_ok());

    TransferSession session("rx", SessionRole::Receiver);
    auto received = ChunkReceiver(*receiver_end).receive(session);
    ASSERT_TRUE(received.is_error());
    EXPECT_EQ(received.error().kind, ErrorKind::Io);
    EXPECT_NE(received.error().message.find("file not found"), std::string::npos);
    EXPECT_FALSE(session.metadata().has_value());
}

TEST(Transmission, PeerClosingMidStreamIsConnectionClosed) {
    auto payload = make_payload(4096);
    auto [sender_end, receiver_end] = PipeStream::create_pair();
    ASSERT_TRUE(MessageCodec::write_message(*sender_end, to_message(payload.metadata)).is_ok());
    ASSERT_TRUE(MessageCodec::write_message(*sender_end, ChunkMessage{0, payload.chunks[0].data}).is_ok());
    sender_end->close_write();

    TransferSession session("rx", SessionRole::Receiver);
    auto received = ChunkReceiver(*receiver_end).receive(session);
    ASSERT_TRUE(received.is_error());
    EXPECT_EQ(received.error().kind, ErrorKind::ConnectionClosed);
    EXPECT_TRUE(received.error().retryable());
}

TEST(Transmission, MetadataBeyondLimitsIsRefused) {
    const std::vector<std::string> bodies = {
        // Consistent with itself, but 400 TB in chunks far above the chunk size limit.
        R"({"type":"metadata","filename":"huge.bin","total":429496729500000,"chunk_size":4294967295,)"
        R"("total_chunks":100000,"checksum":"00"})",
        R"({"type":"metadata","filename":"huge.bin","total":4294967297,"chunk_size":16777216,)"
        R"("total_chunks":257,"checksum":"00"})",
        R"({"type":"metadata","filename":"huge.bin","total":4194305,"chunk_size":1,)"
        R"("total_chunks":4194305,"checksum":"00"})",
    };

    for (const auto& body : bodies) {
        auto [sender_end, receiver_end] = PipeStream::create_pair();
        write_raw(*sender_end, body);
        for (std::uint32_t seq = 0; seq < 8; ++seq) {
            ASSERT_TRUE(MessageCodec::write_message(*sender_end, ChunkMessage{seq, {0x01}}).is_ok());
        }
        ASSERT_TRUE(MessageCodec::write_message(*sender_end, EndOfTransmission{}).is_ok());

        TransferSession session("rx", SessionRole::Receiver);
        auto received = ChunkReceiver(*receiver_end).receive(session);
        ASSERT_TRUE(received.is_error()) << body;
        EXPECT_EQ(received.error().kind, ErrorKind::InvalidArgument) << body;
        EXPECT_FALSE(received.error().retryable());
        EXPECT_FALSE(session.metadata().has_value());
        EXPECT_EQ(session.state(), SessionState::Failed);
    }
}

TEST(Transmission, LongMissingListStillFitsOneVerdict) {
    FileMetadata declared;
    declared.filename = "sparse.bin";
    declared.total_size = Chunker::kMaxChunks;
    declared.chunk_size = 1;
    declared.total_chunks = Chunker::kMaxChunks;
    declared.checksum = std::string(64, '0');

    auto [sender_end, receiver_end] = PipeStream::create_pair();
    ASSERT_TRUE(MessageCodec::write_message(*sender_end, to_message(declared)).is_ok());
    ASSERT_TRUE(MessageCodec::write_message(*sender_end, EndOfTransmission{}).is_ok());

    TransferSession session("rx", SessionRole::Receiver);
    ChunkReceiver receiver(*receiver_end);
    auto received = receiver.receive(session);
    ASSERT_TRUE(received.is_error());
    EXPECT_EQ(received.error().kind, ErrorKind::IncompleteTransfer);
    EXPECT_EQ(received.error().missing.size(), Chunker::kMaxChunks);

    ASSERT_TRUE(receiver.report(received).is_ok());
    auto reply = MessageCodec::read_message(*sender_end);
    ASSERT_TRUE(reply.is_ok()) << reply.error().describe();

    const auto* verdict = std::get_if<ResultMessage>(&reply.value());
    ASSERT_NE(verdict, nullptr);
    EXPECT_FALSE(verdict->success);
    EXPECT_EQ(verdict->error, "IncompleteTransfer");
    ASSERT_EQ(verdict->missing.size(), kMaxReportedMissing);
    EXPECT_EQ(verdict->missing.front(), 0u);
    EXPECT_EQ(verdict->missing.back(), kMaxReportedMissing - 1);
    EXPECT_NE(verdict->detail.find(std::to_string(Chunker::kMaxChunks) + " missing"), std::string::npos);
}

TEST(Transmission, VerdictConversion) {
    xfer::TransferError error(ErrorKind::IncompleteTransfer, "received 8 of 10 chunks");
    error.missing = {2, 6};
    auto verdict = make_verdict(xfer::Err<ReceivedTransfer>(error));

    EXPECT_FALSE(verdict.success);
    EXPECT_EQ(verdict.error, "IncompleteTransfer");
    EXPECT_EQ(verdict.missing, (std::vector<std::uint32_t>{2, 6}));

    auto back = verdict_error(verdict);
    EXPECT_EQ(back.kind, ErrorKind::IncompleteTransfer);
    EXPECT_EQ(back.message, "received 8 of 10 chunks");
    EXPECT_EQ(back.missing, error.missing);
}
