#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace xfer::protocol {

/**
 * @brief Announces one attempt: what follows and how to verify it
 */
struct MetadataMessage {
    std::string filename;
    std::uint64_t total_size = 0;
    std::uint32_t chunk_size = 0;
    std::uint32_t total_chunks = 0;
    std::string checksum; ///< SHA-256 hex of the original, unsplit buffer

    bool operator==(const MetadataMessage& other) const;
};

struct ChunkMessage {
    std::uint32_t seq = 0;
    std::vector<std::uint8_t> data;

    bool operator==(const ChunkMessage& other) const;
};

/// No further chunks will be sent in this attempt.
struct EndOfTransmission {
    bool operator==(const EndOfTransmission&) const { return true; }
};

/**
 * @brief Verdict of the receiving side after verification
 */
struct ResultMessage {
    bool success = false;
    std::string checksum; ///< Digest the receiver computed, empty if none
    std::string error;    ///< ErrorKind name on failure
    std::string detail;
    std::vector<std::uint32_t> missing;

    bool operator==(const ResultMessage& other) const;
};

enum class Command {
    Upload,
    Download,
    Disconnect
};

const char* to_string(Command command) noexcept;
std::optional<Command> command_from_string(const std::string& text) noexcept;

/**
 * @brief Client request opening a transfer attempt or ending the connection
 */
struct RequestMessage {
    Command command = Command::Upload;
    std::string filename;
    std::uint32_t attempt = 1;

    bool operator==(const RequestMessage& other) const;
};

using Message = std::variant<MetadataMessage,
                             ChunkMessage,
                             EndOfTransmission,
                             ResultMessage,
                             RequestMessage>;

/// Wire name of the message discriminant ("metadata", "chunk", "eot", "result", "request").
const char* type_name(const Message& message) noexcept;

std::string hex_encode(const std::vector<std::uint8_t>& data);

/// Empty optional on odd length or a non-hex digit.
std::optional<std::vector<std::uint8_t>> hex_decode(const std::string& hex);

} // namespace xfer::protocol
