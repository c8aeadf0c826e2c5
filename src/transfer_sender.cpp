#include "transfer.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cstdio>
#include <iostream>
#include <limits>

namespace transfer {

struct TransferSender::Job {
    std::shared_ptr<channel::Channel> channel;
    std::shared_ptr<FileSource> source;
    uint64_t size = 0;
    uint32_t total_chunks = 0;
    uint32_t next_index = 0;
    boost::asio::steady_timer grace;

    explicit Job(boost::asio::io_context& io_context) : grace(io_context) {}

    std::size_t chunk_length(uint32_t index) const {
        uint64_t offset = static_cast<uint64_t>(index) * protocol::CHUNK_SIZE;
        return static_cast<std::size_t>(std::min<uint64_t>(protocol::CHUNK_SIZE, size - offset));
    }
};

const char* phase_name(Phase phase) {
    switch (phase) {
        case Phase::IDLE: return "idle";
        case Phase::PREPARING: return "preparing";
        case Phase::SENDING: return "sending";
        case Phase::SENT: return "sent";
        case Phase::RECEIVING: return "receiving";
        case Phase::COMPLETED: return "completed";
        case Phase::FAILED: return "error";
    }
    return "unknown";
}

std::string phase_text(const TransferState& state) {
    switch (state.phase) {
        case Phase::IDLE: return "";
        case Phase::PREPARING: return "Preparing file...";
        case Phase::SENDING: return "Sending... " + std::to_string(state.progress_percent) + "%";
        case Phase::SENT: return "File sent! Waiting for receiver to download...";
        case Phase::RECEIVING: return "Receiving... " + std::to_string(state.progress_percent) + "%";
        case Phase::COMPLETED: return "File transfer complete!";
        case Phase::FAILED: return "Transfer failed. Please try again.";
    }
    return "";
}

int percent_of(uint64_t done, uint64_t total) {
    if (total == 0) {
        return 0;
    }
    return static_cast<int>((done * 200 + total) / (total * 2));
}

std::string format_size(uint64_t bytes) {
    double size = static_cast<double>(bytes);
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int i = 0;
    while (size >= 1024 && i < 4) {
        size /= 1024;
        i++;
    }
    char buf[32];
    snprintf(buf, sizeof(buf), "%.1f%s", size, units[i]);
    return std::string(buf);
}

TransferSender::TransferSender(boost::asio::io_context& io_context, const config::Config& cfg,
                               TransferCallbacks callbacks)
    : io_context_(io_context), cfg_(cfg), callbacks_(std::move(callbacks)) {}

TransferSender::~TransferSender() = default;

bool TransferSender::in_flight() const {
    return job_ && (state_.phase == Phase::PREPARING || state_.phase == Phase::SENDING);
}

void TransferSender::start(std::shared_ptr<channel::Channel> channel, std::shared_ptr<FileSource> source) {
    if (!channel || !channel->is_open()) {
        throw errors::TransferError("No active connection. Please wait for the receiver to connect.");
    }
    if (!source) {
        throw errors::ValidationError("No file selected.");
    }

    const protocol::FileMetadata& meta = source->metadata();
    if (meta.size == 0) {
        throw errors::ValidationError("Cannot send an empty file: " + meta.name);
    }
    if (meta.size > static_cast<uint64_t>(std::numeric_limits<uint32_t>::max()) * protocol::CHUNK_SIZE) {
        throw errors::ValidationError("File too large: " + meta.name);
    }

    if (job_) {
        std::cerr << "TransferSender: New file supersedes the transfer in progress.\n";
        job_.reset();
    }

    auto job = std::make_shared<Job>(io_context_);
    job->channel = std::move(channel);
    job->source = std::move(source);
    job->size = meta.size;
    job->total_chunks = protocol::chunk_count(meta.size);
    job_ = job;

    set_state(Phase::PREPARING, 0);

    try {
        job->channel->send(protocol::Message::file_metadata(meta));
    } catch (std::runtime_error& e) {
        fail(std::string("Failed to send file metadata: ") + e.what());
        return;
    }

    if (callbacks_.on_status) {
        callbacks_.on_status("Sending: " + meta.name + " (" + format_size(meta.size) + ")");
    }
    read_next(job);
}

void TransferSender::read_next(const std::shared_ptr<Job>& job) {
    if (job->next_index == job->total_chunks) {
        std::weak_ptr<Job> weak_job = job;
        job->grace.expires_after(cfg_.complete_grace);
        job->grace.async_wait([this, weak_job](const boost::system::error_code& ec) {
            auto job = weak_job.lock();
            if (!job || ec) return;
            send_complete(job);
        });
        return;
    }

    uint64_t offset = static_cast<uint64_t>(job->next_index) * protocol::CHUNK_SIZE;
    std::weak_ptr<Job> weak_job = job;
    job->source->async_read(offset, job->chunk_length(job->next_index),
        [this, weak_job](const boost::system::error_code& ec, std::vector<uint8_t> bytes) {
            // An expired job means the sender dropped it, possibly by being destroyed
            if (weak_job.expired()) return;
            on_chunk_read(weak_job, ec, std::move(bytes));
        });
}

void TransferSender::on_chunk_read(const std::weak_ptr<Job>& weak_job, const boost::system::error_code& ec,
                                   std::vector<uint8_t> bytes) {
    auto job = weak_job.lock();
    if (!job || job != job_) return;

    if (ec) {
        fail("Error reading file: " + ec.message());
        return;
    }

    uint32_t index = job->next_index;
    std::size_t expected = job->chunk_length(index);
    if (bytes.size() != expected) {
        fail("Short read on chunk " + std::to_string(index) + ": got " + std::to_string(bytes.size()) +
             " of " + std::to_string(expected) + " bytes");
        return;
    }

    std::weak_ptr<Job> sent_job = job;
    try {
        job->channel->send(protocol::Message::file_chunk(std::move(bytes), index, job->total_chunks),
            [this, sent_job]() {
                if (sent_job.expired()) return;
                on_chunk_sent(sent_job);
            });
    } catch (std::runtime_error& e) {
        fail(std::string("Error sending file chunk: ") + e.what());
    }
}

void TransferSender::on_chunk_sent(const std::weak_ptr<Job>& weak_job) {
    auto job = weak_job.lock();
    if (!job || job != job_) return;

    job->next_index++;
    set_state(Phase::SENDING, percent_of(job->next_index, job->total_chunks));

    // The state callback may have reset us
    if (job != job_) return;
    read_next(job);
}

void TransferSender::send_complete(const std::shared_ptr<Job>& job) {
    if (job != job_) return;

    try {
        job->channel->send(protocol::Message::file_complete());
    } catch (std::runtime_error& e) {
        fail(std::string("Failed to send completion marker: ") + e.what());
        return;
    }

    set_state(Phase::SENT, 100);
    if (callbacks_.on_status) {
        callbacks_.on_status("File sent! Waiting for receiver to download...");
    }
}

void TransferSender::on_ack() {
    // A receiver whose watchdog fired acks before FILE_COMPLETE goes out
    bool all_chunks_sent = job_ && job_->next_index == job_->total_chunks;
    if (state_.phase != Phase::SENT && !all_chunks_sent) {
        std::cerr << "TransferSender: Ignoring acknowledgement in phase " << phase_name(state_.phase) << "\n";
        return;
    }
    job_.reset();
    set_state(Phase::COMPLETED, 100);
    if (callbacks_.on_status) {
        callbacks_.on_status("File successfully received by the receiver!");
    }
}

void TransferSender::abort(bool interrupted) {
    bool was_in_flight = in_flight();
    job_.reset();
    if (interrupted && was_in_flight) {
        fail("Transfer interrupted: connection lost.");
    }
}

void TransferSender::reset() {
    job_.reset();
    set_state(Phase::IDLE, 0);
}

void TransferSender::fail(const std::string& reason) {
    job_.reset();
    std::cerr << "TransferSender: " << reason << "\n";
    set_state(Phase::FAILED, state_.progress_percent);
    if (callbacks_.on_error) {
        callbacks_.on_error(errors::TransferError(reason));
    }
}

void TransferSender::set_state(Phase phase, int progress) {
    state_.phase = phase;
    state_.progress_percent = progress;
    if (callbacks_.on_state) {
        callbacks_.on_state(state_);
    }
}

} // namespace transfer
