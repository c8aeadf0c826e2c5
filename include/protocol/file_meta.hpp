#pragma once

#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace protocol {

struct FileMetadata {
    std::string name;
    uint64_t size = 0;
    std::string mime_type;
};

// Wire keys are name/size/fileType; missing keys fall back to defaults
void to_json(nlohmann::json& j, const FileMetadata& meta);
void from_json(const nlohmann::json& j, FileMetadata& meta);

} // namespace protocol
