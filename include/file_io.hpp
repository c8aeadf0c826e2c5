#pragma once

#include <cstdint>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include "protocol/file_meta.hpp"

namespace transfer {

using ReadHandler = std::function<void(const boost::system::error_code&, std::vector<uint8_t>)>;

// Byte source for one outgoing file. Reads complete asynchronously.
class FileSource {
public:
    virtual ~FileSource() = default;

    virtual const protocol::FileMetadata& metadata() const = 0;

    // Delivers up to length bytes starting at offset. The handler is never
    // invoked inline.
    virtual void async_read(uint64_t offset, std::size_t length, ReadHandler handler) = 0;
};

class DiskFileSource : public FileSource, public std::enable_shared_from_this<DiskFileSource> {
public:
    // Must be owned by a shared_ptr. Throws errors::TransferError if the file cannot be opened
    DiskFileSource(boost::asio::io_context& io_context, const std::string& filepath);

    const protocol::FileMetadata& metadata() const override { return meta_; }
    void async_read(uint64_t offset, std::size_t length, ReadHandler handler) override;

private:
    boost::asio::io_context& io_context_;
    std::ifstream file_;
    protocol::FileMetadata meta_;
};

// Receives a fully assembled file
class FileSink {
public:
    virtual ~FileSink() = default;

    // Returns where the file ended up. Throws errors::TransferError.
    virtual std::string deliver(const protocol::FileMetadata& meta, const std::vector<uint8_t>& bytes) = 0;
};

class DirectorySink : public FileSink {
public:
    explicit DirectorySink(std::string save_dir) : save_dir_(std::move(save_dir)) {}

    std::string deliver(const protocol::FileMetadata& meta, const std::vector<uint8_t>& bytes) override;

private:
    std::string save_dir_;
};

std::string guess_mime_type(const std::string& filename);

// Drops directory components so a peer cannot write outside the save directory
std::string safe_filename(const std::string& name);

} // namespace transfer
