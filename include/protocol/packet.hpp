#pragma once

#include <cstdint>
#include <array>

namespace protocol {

enum class CommandType : uint32_t {
    FILE_METADATA = 1,
    FILE_CHUNK = 2,
    FILE_COMPLETE = 3,
    TEXT = 4
};

constexpr std::size_t HEADER_SIZE = 16;
constexpr uint32_t MAX_PAYLOAD_SIZE = 1024 * 1024;

// Fixed 16-byte header
struct PacketHeader {
    uint32_t command;      // 4 bytes
    uint32_t payload_size; // 4 bytes
    uint32_t chunk_index;  // 4 bytes
    uint32_t total_chunks; // 4 bytes
};

std::array<uint8_t, HEADER_SIZE> serialize_header(const PacketHeader& header);
PacketHeader deserialize_header(const std::array<uint8_t, HEADER_SIZE>& buffer);

} // namespace protocol
