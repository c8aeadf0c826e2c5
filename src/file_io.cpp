#include "file_io.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <map>

namespace fs = std::filesystem;

namespace transfer {

DiskFileSource::DiskFileSource(boost::asio::io_context& io_context, const std::string& filepath)
    : io_context_(io_context), file_(filepath, std::ios::binary) {
    if (!file_.is_open()) {
        throw errors::TransferError("Could not open file for reading: " + filepath);
    }

    std::error_code ec;
    auto fsize = fs::file_size(filepath, ec);
    if (ec) {
        throw errors::TransferError("Could not stat file: " + filepath + " (" + ec.message() + ")");
    }

    fs::path p(filepath);
    meta_.name = p.filename().string();
    meta_.size = fsize;
    meta_.mime_type = guess_mime_type(meta_.name);
}

void DiskFileSource::async_read(uint64_t offset, std::size_t length, ReadHandler handler) {
    boost::asio::post(io_context_, [self = shared_from_this(), offset, length, handler = std::move(handler)]() {
        std::ifstream& file = self->file_;
        std::vector<uint8_t> buffer(length);
        file.clear();
        file.seekg(static_cast<std::streamoff>(offset));
        file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(length));
        std::streamsize bytes_read = file.gcount();

        if (file.bad() || (bytes_read == 0 && length > 0)) {
            handler(boost::asio::error::make_error_code(boost::asio::error::eof), {});
            return;
        }
        buffer.resize(static_cast<std::size_t>(bytes_read));
        handler(boost::system::error_code(), std::move(buffer));
    });
}

std::string DirectorySink::deliver(const protocol::FileMetadata& meta, const std::vector<uint8_t>& bytes) {
    try {
        if (!save_dir_.empty()) {
            fs::create_directories(save_dir_);
        }
        fs::path target = fs::path(save_dir_.empty() ? "." : save_dir_) / safe_filename(meta.name);
        std::string part_file = target.string() + ".part";

        std::ofstream file(part_file, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw errors::TransferError("Could not open file for writing: " + part_file);
        }
        file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        file.close();
        if (!file) {
            fs::remove(part_file);
            throw errors::TransferError("Failed to write: " + part_file);
        }

        // Rename .part to final filename
        fs::rename(part_file, target);
        return target.string();
    } catch (fs::filesystem_error& e) {
        throw errors::TransferError(std::string("Failed to save file: ") + e.what());
    }
}

std::string guess_mime_type(const std::string& filename) {
    static const std::map<std::string, std::string> types = {
        {".txt", "text/plain"},
        {".html", "text/html"},
        {".css", "text/css"},
        {".csv", "text/csv"},
        {".json", "application/json"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".svg", "image/svg+xml"},
        {".mp3", "audio/mpeg"},
        {".mp4", "video/mp4"},
        {".mkv", "video/x-matroska"},
    };

    std::string ext = fs::path(filename).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = types.find(ext);
    return it != types.end() ? it->second : "application/octet-stream";
}

std::string safe_filename(const std::string& name) {
    std::string base = name;
    auto slash = base.find_last_of("/\\");
    if (slash != std::string::npos) {
        base = base.substr(slash + 1);
    }
    if (base.empty() || base == "." || base == "..") {
        return "downloaded_file";
    }
    return base;
}

} // namespace transfer
