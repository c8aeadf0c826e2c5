#include "protocol/packet.hpp"
#include <arpa/inet.h>
#include <cstring>

namespace protocol {

std::array<uint8_t, HEADER_SIZE> serialize_header(const PacketHeader& header) {
    std::array<uint8_t, HEADER_SIZE> buffer;
    uint32_t cmd = htonl(header.command);
    uint32_t payload = htonl(header.payload_size);
    uint32_t index = htonl(header.chunk_index);
    uint32_t total = htonl(header.total_chunks);

    std::memcpy(buffer.data(), &cmd, 4);
    std::memcpy(buffer.data() + 4, &payload, 4);
    std::memcpy(buffer.data() + 8, &index, 4);
    std::memcpy(buffer.data() + 12, &total, 4);

    return buffer;
}

PacketHeader deserialize_header(const std::array<uint8_t, HEADER_SIZE>& buffer) {
    PacketHeader header;
    uint32_t cmd, payload, index, total;

    std::memcpy(&cmd, buffer.data(), 4);
    std::memcpy(&payload, buffer.data() + 4, 4);
    std::memcpy(&index, buffer.data() + 8, 4);
    std::memcpy(&total, buffer.data() + 12, 4);

    header.command = ntohl(cmd);
    header.payload_size = ntohl(payload);
    header.chunk_index = ntohl(index);
    header.total_chunks = ntohl(total);

    return header;
}

} // namespace protocol
