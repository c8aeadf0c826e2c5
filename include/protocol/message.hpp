#pragma once

#include <string>
#include <cstdint>
#include <vector>
#include <optional>
#include "protocol/packet.hpp"
#include "protocol/file_meta.hpp"

namespace protocol {

constexpr std::size_t CHUNK_SIZE = 16384;

// Plain text reply the receiver sends once the file is assembled
constexpr const char* RECEIVED_ACK = "FILE_RECEIVED_SUCCESSFULLY";

struct Message {
    CommandType type = CommandType::TEXT;

    FileMetadata metadata;                    // FILE_METADATA
    std::optional<std::vector<uint8_t>> data; // FILE_CHUNK, absent when the sender dropped it
    uint32_t chunk_index = 0;
    uint32_t total_chunks = 0;
    std::string text;                         // TEXT

    static Message file_metadata(const FileMetadata& meta);
    static Message file_chunk(std::vector<uint8_t> payload, uint32_t index, uint32_t total);
    static Message file_complete();
    static Message text_message(const std::string& text);
    static Message received_ack() { return text_message(RECEIVED_ACK); }

    bool is_received_ack() const;
};

const char* command_name(CommandType type);

// Number of chunks needed for a file of the given size
uint32_t chunk_count(uint64_t size);

// Header followed by payload
std::vector<uint8_t> encode(const Message& message);

// Throws errors::ProtocolError on an unknown command or malformed payload
Message decode(const PacketHeader& header, const std::vector<uint8_t>& payload);

} // namespace protocol
