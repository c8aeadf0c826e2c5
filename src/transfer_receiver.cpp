#include "transfer.hpp"
#include "errors.hpp"
#include <iostream>

namespace transfer {

namespace {

const protocol::FileMetadata& empty_metadata() {
    static const protocol::FileMetadata meta;
    return meta;
}

} // namespace

TransferReceiver::TransferReceiver(boost::asio::io_context& io_context, const config::Config& cfg,
                                   std::shared_ptr<FileSink> sink, TransferCallbacks callbacks)
    : cfg_(cfg), sink_(std::move(sink)), callbacks_(std::move(callbacks)),
      watchdog_(io_context) {}

TransferReceiver::~TransferReceiver() {
    current_.reset();
    watchdog_.cancel();
}

const protocol::FileMetadata& TransferReceiver::metadata() const {
    if (current_ && current_->meta) {
        return *current_->meta;
    }
    return empty_metadata();
}

std::size_t TransferReceiver::received_count() const {
    return current_ ? current_->received : 0;
}

uint32_t TransferReceiver::total_chunks() const {
    return current_ ? current_->total_chunks : 0;
}

void TransferReceiver::on_message(const protocol::Message& message) {
    switch (message.type) {
        case protocol::CommandType::FILE_METADATA:
            on_metadata(message.metadata);
            break;
        case protocol::CommandType::FILE_CHUNK:
            on_chunk(message);
            break;
        case protocol::CommandType::FILE_COMPLETE:
            if (current_ && current_->closed) {
                std::cerr << "TransferReceiver: Ignoring FILE_COMPLETE for a finished transfer.\n";
                return;
            }
            assemble_and_finalize();
            break;
        default:
            std::cerr << "TransferReceiver: Unexpected message " << protocol::command_name(message.type) << "\n";
            break;
    }
}

void TransferReceiver::on_metadata(const protocol::FileMetadata& meta) {
    // Reset for new file
    watchdog_.cancel();
    current_ = std::make_shared<Accumulation>();
    current_->meta = meta;
    saved_path_.clear();

    set_state(Phase::RECEIVING, 0);
    if (callbacks_.on_status) {
        callbacks_.on_status("Receiving file: " + meta.name + " (" + format_size(meta.size) + ")");
    }
}

void TransferReceiver::on_chunk(const protocol::Message& message) {
    if (!message.data) {
        std::cerr << "TransferReceiver: Received chunk without data\n";
        return;
    }

    if (!current_) {
        std::cerr << "TransferReceiver: Chunk arrived before metadata\n";
        current_ = std::make_shared<Accumulation>();
        set_state(Phase::RECEIVING, 0);
    }
    Accumulation& acc = *current_;
    if (acc.closed) {
        std::cerr << "TransferReceiver: Dropping chunk " << message.chunk_index
                  << " for a finished transfer\n";
        return;
    }

    if (acc.total_chunks == 0) {
        if (message.total_chunks == 0) {
            fail("Chunk announces zero total chunks");
            return;
        }
        acc.total_chunks = message.total_chunks;
        acc.chunks.resize(acc.total_chunks);
    } else if (message.total_chunks != acc.total_chunks) {
        fail("Chunk count changed mid-transfer: " + std::to_string(message.total_chunks) +
             " != " + std::to_string(acc.total_chunks));
        return;
    }

    if (message.chunk_index >= acc.total_chunks) {
        fail("Chunk index " + std::to_string(message.chunk_index) + " out of range");
        return;
    }

    auto& slot = acc.chunks[message.chunk_index];
    if (slot) {
        std::cerr << "TransferReceiver: Duplicate chunk " << message.chunk_index << " ignored\n";
        return;
    }
    slot = *message.data;
    acc.received++;

    set_state(Phase::RECEIVING, percent_of(acc.received, acc.total_chunks));

    if (acc.received == acc.total_chunks) {
        arm_watchdog();
    }
}

void TransferReceiver::arm_watchdog() {
    std::weak_ptr<Accumulation> weak_acc = current_;
    watchdog_.expires_after(cfg_.finalize_watchdog);
    watchdog_.async_wait([this, weak_acc](const boost::system::error_code& ec) {
        if (ec) return;
        auto acc = weak_acc.lock();
        // A reset or new metadata replaced the accumulation
        if (!acc || acc != current_ || acc->closed) return;
        std::cerr << "TransferReceiver: No FILE_COMPLETE received, finalizing anyway\n";
        assemble_and_finalize();
    });
}

void TransferReceiver::assemble_and_finalize() {
    watchdog_.cancel();

    if (!current_ || current_->received == 0) {
        fail("Error downloading file: No data received");
        return;
    }
    Accumulation& acc = *current_;

    if (acc.received != acc.total_chunks) {
        fail("Error downloading file: Missing chunks (" + std::to_string(acc.received) + " of " +
             std::to_string(acc.total_chunks) + " received)");
        return;
    }

    std::size_t file_size = 0;
    for (const auto& chunk : acc.chunks) {
        file_size += chunk->size();
    }
    if (file_size == 0) {
        fail("Error downloading file: Empty file");
        return;
    }
    if (acc.meta && acc.meta->size != file_size) {
        fail("Error downloading file: Size mismatch (expected " + std::to_string(acc.meta->size) +
             " bytes, assembled " + std::to_string(file_size) + ")");
        return;
    }

    std::vector<uint8_t> file_data;
    file_data.reserve(file_size);
    for (const auto& chunk : acc.chunks) {
        file_data.insert(file_data.end(), chunk->begin(), chunk->end());
    }

    protocol::FileMetadata meta = acc.meta.value_or(protocol::FileMetadata{"downloaded_file", file_size, ""});
    if (meta.mime_type.empty()) {
        meta.mime_type = "application/octet-stream";
    }

    try {
        saved_path_ = sink_ ? sink_->deliver(meta, file_data) : std::string();
    } catch (errors::TransferError& e) {
        fail(e.what());
        return;
    }

    acc.closed = true;
    acc.chunks.clear();
    set_state(Phase::COMPLETED, 100);
    if (callbacks_.on_status) {
        callbacks_.on_status("File downloaded successfully!" + (saved_path_.empty() ? "" : " Saved to " + saved_path_));
    }

    // Notify sender that file was received
    if (channel_ && channel_->is_open()) {
        try {
            channel_->send(protocol::Message::received_ack());
        } catch (errors::ConnectionError& e) {
            std::cerr << "TransferReceiver: Could not acknowledge: " << e.what() << "\n";
        }
    }
}

void TransferReceiver::abort(bool interrupted) {
    bool was_in_flight = in_flight();
    watchdog_.cancel();
    current_.reset();
    if (interrupted && was_in_flight) {
        fail("Transfer interrupted: connection lost.");
    }
}

void TransferReceiver::reset() {
    watchdog_.cancel();
    current_.reset();
    channel_.reset();
    saved_path_.clear();
    set_state(Phase::IDLE, 0);
}

void TransferReceiver::fail(const std::string& reason) {
    watchdog_.cancel();
    if (current_) {
        current_->closed = true;
        current_->chunks.clear();
    }
    std::cerr << "TransferReceiver: " << reason << "\n";
    set_state(Phase::FAILED, state_.progress_percent);
    if (callbacks_.on_error) {
        callbacks_.on_error(errors::TransferError(reason));
    }
}

void TransferReceiver::set_state(Phase phase, int progress) {
    state_.phase = phase;
    state_.progress_percent = progress;
    if (callbacks_.on_state) {
        callbacks_.on_state(state_);
    }
}

} // namespace transfer
