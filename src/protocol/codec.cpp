#include "xfer/protocol/codec.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <array>
#include <limits>
#include <type_traits>

namespace xfer::protocol {

using json = nlohmann::json;

namespace {

template<typename>
inline constexpr bool kAlwaysFalse = false;

TransferError frame_error(std::string message) {
    return TransferError(ErrorKind::FrameError, std::move(message));
}

json to_envelope(const Message& message) {
    json j;
    j["type"] = type_name(message);

    std::visit([&j](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, MetadataMessage>) {
            j["filename"] = m.filename;
            j["total"] = m.total_size;
            j["chunk_size"] = m.chunk_size;
            j["total_chunks"] = m.total_chunks;
            j["checksum"] = m.checksum;
        } else if constexpr (std::is_same_v<T, ChunkMessage>) {
            j["seq"] = m.seq;
            j["data"] = hex_encode(m.data);
        } else if constexpr (std::is_same_v<T, EndOfTransmission>) {
            // discriminant only
        } else if constexpr (std::is_same_v<T, ResultMessage>) {
            j["success"] = m.success;
            j["checksum"] = m.checksum;
            if (!m.error.empty()) {
                j["error"] = m.error;
            }
            if (!m.detail.empty()) {
                j["detail"] = m.detail;
            }
            if (!m.missing.empty()) {
                j["missing"] = m.missing;
            }
        } else if constexpr (std::is_same_v<T, RequestMessage>) {
            j["command"] = to_string(m.command);
            j["filename"] = m.filename;
            j["attempt"] = m.attempt;
        } else {
            static_assert(kAlwaysFalse<T>, "unhandled message type");
        }
    }, message);

    return j;
}

// Field accessors: each reports the offending key so a rejected frame can be diagnosed from the log.

TransferResult<std::uint64_t> require_unsigned(const json& j, const char* key,
                                               std::uint64_t max = std::numeric_limits<std::uint64_t>::max()) {
    const auto it = j.find(key);
    if (it == j.end()) {
        return Err<std::uint64_t>(frame_error(std::string("missing field '") + key + "'"));
    }
    if (!it->is_number_unsigned() && !(it->is_number_integer() && it->get<std::int64_t>() >= 0)) {
        return Err<std::uint64_t>(frame_error(std::string("field '") + key + "' must be an unsigned integer"));
    }
    const auto value = it->get<std::uint64_t>();
    if (value > max) {
        return Err<std::uint64_t>(frame_error(std::string("field '") + key + "' out of range"));
    }
    return OkAs<std::uint64_t, TransferError>(value);
}

TransferResult<std::string> require_string(const json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end()) {
        return Err<std::string>(frame_error(std::string("missing field '") + key + "'"));
    }
    if (!it->is_string()) {
        return Err<std::string>(frame_error(std::string("field '") + key + "' must be a string"));
    }
    return OkAs<std::string, TransferError>(it->get<std::string>());
}

TransferResult<bool> require_bool(const json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || !it->is_boolean()) {
        return Err<bool>(frame_error(std::string("field '") + key + "' must be a boolean"));
    }
    return OkAs<bool, TransferError>(it->get<bool>());
}

constexpr std::uint64_t kMaxU32 = std::numeric_limits<std::uint32_t>::max();

TransferResult<Message> parse_metadata(const json& j) {
    auto filename = require_string(j, "filename");
    if (filename.is_error()) return Err<Message>(filename.error());
    auto total = require_unsigned(j, "total");
    if (total.is_error()) return Err<Message>(total.error());
    auto chunk_size = require_unsigned(j, "chunk_size", kMaxU32);
    if (chunk_size.is_error()) return Err<Message>(chunk_size.error());
    auto total_chunks = require_unsigned(j, "total_chunks", kMaxU32);
    if (total_chunks.is_error()) return Err<Message>(total_chunks.error());
    auto checksum = require_string(j, "checksum");
    if (checksum.is_error()) return Err<Message>(checksum.error());

    if (chunk_size.value() == 0) {
        return Err<Message>(frame_error("metadata chunk_size must be > 0"));
    }
    const std::uint64_t expected_chunks = total.value() / chunk_size.value() +
                                          (total.value() % chunk_size.value() != 0 ? 1 : 0);
    if (expected_chunks != total_chunks.value()) {
        return Err<Message>(frame_error("metadata total_chunks does not match total/chunk_size"));
    }

    MetadataMessage m;
    m.filename = filename.take_value();
    m.total_size = total.value();
    m.chunk_size = static_cast<std::uint32_t>(chunk_size.value());
    m.total_chunks = static_cast<std::uint32_t>(total_chunks.value());
    m.checksum = checksum.take_value();
    return OkAs<Message, TransferError>(std::move(m));
}

TransferResult<Message> parse_chunk(const json& j) {
    auto seq = require_unsigned(j, "seq", kMaxU32);
    if (seq.is_error()) return Err<Message>(seq.error());
    auto data_hex = require_string(j, "data");
    if (data_hex.is_error()) return Err<Message>(data_hex.error());

    auto data = hex_decode(data_hex.value());
    if (!data) {
        return Err<Message>(frame_error("chunk " + std::to_string(seq.value()) + " carries invalid hex data"));
    }

    ChunkMessage m;
    m.seq = static_cast<std::uint32_t>(seq.value());
    m.data = std::move(*data);
    return OkAs<Message, TransferError>(std::move(m));
}

TransferResult<Message> parse_result(const json& j) {
    auto success = require_bool(j, "success");
    if (success.is_error()) return Err<Message>(success.error());
    auto checksum = require_string(j, "checksum");
    if (checksum.is_error()) return Err<Message>(checksum.error());

    ResultMessage m;
    m.success = success.value();
    m.checksum = checksum.take_value();

    if (const auto it = j.find("error"); it != j.end()) {
        if (!it->is_string()) {
            return Err<Message>(frame_error("field 'error' must be a string"));
        }
        m.error = it->get<std::string>();
    }
    if (const auto it = j.find("detail"); it != j.end()) {
        if (!it->is_string()) {
            return Err<Message>(frame_error("field 'detail' must be a string"));
        }
        m.detail = it->get<std::string>();
    }
    if (const auto it = j.find("missing"); it != j.end()) {
        if (!it->is_array()) {
            return Err<Message>(frame_error("field 'missing' must be an array"));
        }
        for (const auto& entry : *it) {
            if (!entry.is_number_unsigned() || entry.get<std::uint64_t>() > kMaxU32) {
                return Err<Message>(frame_error("field 'missing' must hold sequence numbers"));
            }
            m.missing.push_back(entry.get<std::uint32_t>());
        }
    }
    return OkAs<Message, TransferError>(std::move(m));
}

TransferResult<Message> parse_request(const json& j) {
    auto command_text = require_string(j, "command");
    if (command_text.is_error()) return Err<Message>(command_text.error());
    auto command = command_from_string(command_text.value());
    if (!command) {
        return Err<Message>(frame_error("unknown command '" + command_text.value() + "'"));
    }
    auto filename = require_string(j, "filename");
    if (filename.is_error()) return Err<Message>(filename.error());
    auto attempt = require_unsigned(j, "attempt", kMaxU32);
    if (attempt.is_error()) return Err<Message>(attempt.error());

    RequestMessage m;
    m.command = *command;
    m.filename = filename.take_value();
    m.attempt = static_cast<std::uint32_t>(attempt.value());
    return OkAs<Message, TransferError>(std::move(m));
}

} // namespace

TransferResult<std::vector<std::uint8_t>> MessageCodec::encode(const Message& message) {
    const std::string body = to_envelope(message).dump(-1, ' ', false, json::error_handler_t::replace);
    if (body.size() > kMaxFrameSize) {
        return Err<std::vector<std::uint8_t>>(frame_error(std::string(type_name(message)) + " envelope of " +
                                                          std::to_string(body.size()) + " bytes exceeds " +
                                                          std::to_string(kMaxFrameSize)));
    }
    const auto length = static_cast<std::uint32_t>(body.size());

    std::vector<std::uint8_t> frame;
    frame.reserve(kPrefixSize + body.size());
    frame.push_back(static_cast<std::uint8_t>((length >> 24) & 0xff));
    frame.push_back(static_cast<std::uint8_t>((length >> 16) & 0xff));
    frame.push_back(static_cast<std::uint8_t>((length >> 8) & 0xff));
    frame.push_back(static_cast<std::uint8_t>(length & 0xff));
    frame.insert(frame.end(), body.begin(), body.end());
    return OkAs<std::vector<std::uint8_t>, TransferError>(std::move(frame));
}

TransferResult<Message> MessageCodec::decode_envelope(const std::vector<std::uint8_t>& envelope) {
    auto j = json::parse(envelope.begin(), envelope.end(), nullptr, false);
    if (j.is_discarded()) {
        return Err<Message>(frame_error("envelope is not valid JSON"));
    }
    if (!j.is_object()) {
        return Err<Message>(frame_error("envelope must be a JSON object"));
    }

    auto type = require_string(j, "type");
    if (type.is_error()) {
        return Err<Message>(type.error());
    }

    const auto& name = type.value();
    if (name == "metadata") {
        return parse_metadata(j);
    }
    if (name == "chunk") {
        return parse_chunk(j);
    }
    if (name == "eot") {
        return OkAs<Message, TransferError>(EndOfTransmission{});
    }
    if (name == "result") {
        return parse_result(j);
    }
    if (name == "request") {
        return parse_request(j);
    }
    return Err<Message>(frame_error("unknown message type '" + name + "'"));
}

TransferResult<Message> MessageCodec::decode(const std::vector<std::uint8_t>& frame) {
    if (frame.size() < kPrefixSize) {
        return Err<Message>(frame_error("frame shorter than its length prefix"));
    }
    const std::uint32_t length = (static_cast<std::uint32_t>(frame[0]) << 24) |
                                 (static_cast<std::uint32_t>(frame[1]) << 16) |
                                 (static_cast<std::uint32_t>(frame[2]) << 8) |
                                 static_cast<std::uint32_t>(frame[3]);
    if (frame.size() - kPrefixSize != length) {
        return Err<Message>(frame_error("declared length " + std::to_string(length) + " but frame carries " +
                                        std::to_string(frame.size() - kPrefixSize) + " bytes"));
    }
    return decode_envelope(std::vector<std::uint8_t>(frame.begin() + kPrefixSize, frame.end()));
}

TransferResult<std::vector<std::uint8_t>> MessageCodec::read_frame(network::ByteStream& stream) {
    std::array<std::uint8_t, kPrefixSize> prefix{};
    auto prefix_read = stream.read_exact(prefix.data(), prefix.size());
    if (prefix_read.is_error()) {
        return Err<std::vector<std::uint8_t>>(
            TransferError(ErrorKind::ConnectionClosed, "read failed: " + prefix_read.error()));
    }
    if (prefix_read.value() == 0) {
        return Err<std::vector<std::uint8_t>>(
            TransferError(ErrorKind::ConnectionClosed, "connection closed by peer"));
    }
    if (prefix_read.value() < prefix.size()) {
        return Err<std::vector<std::uint8_t>>(frame_error("connection closed inside length prefix"));
    }

    const std::uint32_t length = (static_cast<std::uint32_t>(prefix[0]) << 24) |
                                 (static_cast<std::uint32_t>(prefix[1]) << 16) |
                                 (static_cast<std::uint32_t>(prefix[2]) << 8) |
                                 static_cast<std::uint32_t>(prefix[3]);
    if (length == 0 || length > kMaxFrameSize) {
        return Err<std::vector<std::uint8_t>>(frame_error("unusable frame length " + std::to_string(length)));
    }

    std::vector<std::uint8_t> payload(length);
    auto payload_read = stream.read_exact(payload.data(), payload.size());
    if (payload_read.is_error()) {
        return Err<std::vector<std::uint8_t>>(frame_error("read failed inside frame: " + payload_read.error()));
    }
    if (payload_read.value() < length) {
        return Err<std::vector<std::uint8_t>>(frame_error("connection closed after " +
                                                          std::to_string(payload_read.value()) + " of " +
                                                          std::to_string(length) + " frame bytes"));
    }

    spdlog::trace("Read frame of {} bytes", length);
    return OkAs<std::vector<std::uint8_t>, TransferError>(std::move(payload));
}

TransferResult<Message> MessageCodec::read_message(network::ByteStream& stream) {
    auto frame = read_frame(stream);
    if (frame.is_error()) {
        return Err<Message>(frame.error());
    }
    return decode_envelope(frame.value());
}

TransferResult<void> MessageCodec::write_message(network::ByteStream& stream, const Message& message) {
    auto frame = encode(message);
    if (frame.is_error()) {
        return Err<void>(frame.error());
    }
    auto written = stream.write_all(frame.value());
    if (written.is_error()) {
        return Err<void>(TransferError(ErrorKind::ConnectionClosed,
                                       std::string("failed to send ") + type_name(message) + ": " +
                                       written.error()));
    }
    return {};
}

} // namespace xfer::protocol
