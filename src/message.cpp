#include "protocol/message.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace protocol {

void to_json(json& j, const FileMetadata& meta) {
    j = json{{"name", meta.name}, {"size", meta.size}, {"fileType", meta.mime_type}};
}

void from_json(const json& j, FileMetadata& meta) {
    meta.name = j.value("name", std::string("unknown"));
    meta.size = 0;
    if (j.contains("size")) {
        if (!j.at("size").is_number_unsigned()) {
            throw errors::ProtocolError("Bad metadata: size must be a non-negative integer");
        }
        meta.size = j.at("size").get<uint64_t>();
    }
    meta.mime_type = j.value("fileType", std::string());
}

Message Message::file_metadata(const FileMetadata& meta) {
    Message msg;
    msg.type = CommandType::FILE_METADATA;
    msg.metadata = meta;
    return msg;
}

Message Message::file_chunk(std::vector<uint8_t> payload, uint32_t index, uint32_t total) {
    Message msg;
    msg.type = CommandType::FILE_CHUNK;
    msg.data = std::move(payload);
    msg.chunk_index = index;
    msg.total_chunks = total;
    return msg;
}

Message Message::file_complete() {
    Message msg;
    msg.type = CommandType::FILE_COMPLETE;
    return msg;
}

Message Message::text_message(const std::string& text) {
    Message msg;
    msg.type = CommandType::TEXT;
    msg.text = text;
    return msg;
}

bool Message::is_received_ack() const {
    return type == CommandType::TEXT && text == RECEIVED_ACK;
}

const char* command_name(CommandType type) {
    switch (type) {
        case CommandType::FILE_METADATA: return "FILE_METADATA";
        case CommandType::FILE_CHUNK: return "FILE_CHUNK";
        case CommandType::FILE_COMPLETE: return "FILE_COMPLETE";
        case CommandType::TEXT: return "TEXT";
    }
    return "UNKNOWN";
}

uint32_t chunk_count(uint64_t size) {
    return static_cast<uint32_t>((size + CHUNK_SIZE - 1) / CHUNK_SIZE);
}

std::vector<uint8_t> encode(const Message& message) {
    std::string body;
    PacketHeader header{static_cast<uint32_t>(message.type), 0, 0, 0};

    switch (message.type) {
        case CommandType::FILE_METADATA:
            body = json(message.metadata).dump();
            break;
        case CommandType::FILE_CHUNK:
            header.chunk_index = message.chunk_index;
            header.total_chunks = message.total_chunks;
            if (message.data) {
                body.assign(message.data->begin(), message.data->end());
            }
            break;
        case CommandType::FILE_COMPLETE:
            break;
        case CommandType::TEXT:
            body = message.text;
            break;
    }

    if (body.size() > MAX_PAYLOAD_SIZE) {
        throw errors::ProtocolError("Payload too large: " + std::to_string(body.size()) + " bytes");
    }
    header.payload_size = static_cast<uint32_t>(body.size());

    auto head = serialize_header(header);
    std::vector<uint8_t> frame(head.begin(), head.end());
    frame.insert(frame.end(), body.begin(), body.end());
    return frame;
}

Message decode(const PacketHeader& header, const std::vector<uint8_t>& payload) {
    if (header.payload_size != payload.size()) {
        throw errors::ProtocolError("Payload length does not match header");
    }

    Message msg;
    switch (static_cast<CommandType>(header.command)) {
        case CommandType::FILE_METADATA:
            msg.type = CommandType::FILE_METADATA;
            try {
                msg.metadata = json::parse(payload.begin(), payload.end()).get<FileMetadata>();
            } catch (json::exception& e) {
                throw errors::ProtocolError(std::string("Bad metadata: ") + e.what());
            }
            break;
        case CommandType::FILE_CHUNK:
            msg.type = CommandType::FILE_CHUNK;
            msg.chunk_index = header.chunk_index;
            msg.total_chunks = header.total_chunks;
            if (!payload.empty()) {
                msg.data = payload;
            }
            break;
        case CommandType::FILE_COMPLETE:
            msg.type = CommandType::FILE_COMPLETE;
            break;
        case CommandType::TEXT:
            msg.type = CommandType::TEXT;
            msg.text.assign(payload.begin(), payload.end());
            break;
        default:
            throw errors::ProtocolError("Unknown command: " + std::to_string(header.command));
    }
    return msg;
}

} // namespace protocol
