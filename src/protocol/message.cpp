#include "xfer/protocol/message.hpp"

namespace xfer::protocol {
namespace {

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

} // namespace

bool MetadataMessage::operator==(const MetadataMessage& other) const {
    return filename == other.filename &&
           total_size == other.total_size &&
           chunk_size == other.chunk_size &&
           total_chunks == other.total_chunks &&
           checksum == other.checksum;
}

bool ChunkMessage::operator==(const ChunkMessage& other) const {
    return seq == other.seq && data == other.data;
}

bool ResultMessage::operator==(const ResultMessage& other) const {
    return success == other.success &&
           checksum == other.checksum &&
           error == other.error &&
           detail == other.detail &&
           missing == other.missing;
}

bool RequestMessage::operator==(const RequestMessage& other) const {
    return command == other.command && filename == other.filename && attempt == other.attempt;
}

const char* to_string(Command command) noexcept {
    switch (command) {
        case Command::Upload: return "upload";
        case Command::Download: return "download";
        case Command::Disconnect: return "disconnect";
    }
    return "unknown";
}

std::optional<Command> command_from_string(const std::string& text) noexcept {
    if (text == "upload") {
        return Command::Upload;
    }
    if (text == "download") {
        return Command::Download;
    }
    if (text == "disconnect") {
        return Command::Disconnect;
    }
    return std::nullopt;
}

const char* type_name(const Message& message) noexcept {
    switch (message.index()) {
        case 0: return "metadata";
        case 1: return "chunk";
        case 2: return "eot";
        case 3: return "result";
        case 4: return "request";
        default: return "unknown";
    }
}

std::string hex_encode(const std::vector<std::uint8_t>& data) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (auto byte : data) {
        out.push_back(kDigits[byte >> 4]);
        out.push_back(kDigits[byte & 0x0f]);
    }
    return out;
}

std::optional<std::vector<std::uint8_t>> hex_decode(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }
    std::vector<std::uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        const int high = hex_value(hex[i]);
        const int low = hex_value(hex[i + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        bytes.push_back(static_cast<std::uint8_t>((high << 4) | low));
    }
    return bytes;
}

} // namespace xfer::protocol
