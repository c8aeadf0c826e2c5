#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include "channel.hpp"
#include "config.hpp"
#include "file_io.hpp"
#include "protocol/message.hpp"

namespace transfer {

enum class Phase {
    IDLE,
    PREPARING,
    SENDING,
    SENT,
    RECEIVING,
    COMPLETED,
    FAILED
};

struct TransferState {
    Phase phase = Phase::IDLE;
    int progress_percent = 0;
};

const char* phase_name(Phase phase);

// Status line shown next to the progress bar
std::string phase_text(const TransferState& state);

// round(done / total * 100), half rounded up
int percent_of(uint64_t done, uint64_t total);

std::string format_size(uint64_t bytes);

struct TransferCallbacks {
    std::function<void(const TransferState&)> on_state;
    std::function<void(const std::string&)> on_status;
    std::function<void(const std::runtime_error&)> on_error;
};

/**
 * Streams one file over a channel: FILE_METADATA, then FILE_CHUNK for every
 * chunk in order, then FILE_COMPLETE. Exactly one chunk is read and sent at a
 * time; the next read is issued only after the channel reports the previous
 * chunk as written.
 */
class TransferSender {
public:
    TransferSender(boost::asio::io_context& io_context, const config::Config& cfg, TransferCallbacks callbacks);
    ~TransferSender();

    // Supersedes any transfer in progress.
    // Throws errors::TransferError if the channel is not open and
    // errors::ValidationError for an empty file.
    void start(std::shared_ptr<channel::Channel> channel, std::shared_ptr<FileSource> source);

    // FILE_RECEIVED_SUCCESSFULLY from the peer. Completes the transfer once
    // every chunk has been written, even if FILE_COMPLETE is still pending.
    void on_ack();

    // Drops the current job. Pending reads and timers become no-ops.
    // An in-flight transfer is reported as failed when interrupted is set.
    void abort(bool interrupted);

    void reset();

    const TransferState& state() const { return state_; }
    bool in_flight() const;

private:
    struct Job;

    boost::asio::io_context& io_context_;
    const config::Config& cfg_;
    TransferCallbacks callbacks_;
    TransferState state_;
    std::shared_ptr<Job> job_;

    void read_next(const std::shared_ptr<Job>& job);
    void on_chunk_read(const std::weak_ptr<Job>& weak_job, const boost::system::error_code& ec,
                       std::vector<uint8_t> bytes);
    void on_chunk_sent(const std::weak_ptr<Job>& weak_job);
    void send_complete(const std::shared_ptr<Job>& job);
    void fail(const std::string& reason);
    void set_state(Phase phase, int progress);
};

/**
 * Reassembles an incoming file from FILE_METADATA / FILE_CHUNK / FILE_COMPLETE
 * and hands it to the sink.
 */
class TransferReceiver {
public:
    TransferReceiver(boost::asio::io_context& io_context, const config::Config& cfg,
                     std::shared_ptr<FileSink> sink, TransferCallbacks callbacks);
    ~TransferReceiver();

    // Channel used for the completion acknowledgement
    void attach(std::shared_ptr<channel::Channel> channel) { channel_ = std::move(channel); }

    void on_message(const protocol::Message& message);

    // Discards the accumulation. An in-flight transfer is reported as failed
    // when interrupted is set.
    void abort(bool interrupted);

    void reset();

    const TransferState& state() const { return state_; }
    bool in_flight() const { return state_.phase == Phase::RECEIVING; }

    const protocol::FileMetadata& metadata() const;
    std::size_t received_count() const;
    uint32_t total_chunks() const;
    const std::string& saved_path() const { return saved_path_; }

private:
    struct Accumulation {
        std::optional<protocol::FileMetadata> meta;
        std::vector<std::optional<std::vector<uint8_t>>> chunks;
        uint32_t total_chunks = 0;
        std::size_t received = 0;
        bool closed = false; // finalized or failed
    };

    const config::Config& cfg_;
    std::shared_ptr<FileSink> sink_;
    TransferCallbacks callbacks_;
    std::shared_ptr<channel::Channel> channel_;
    TransferState state_;
    std::shared_ptr<Accumulation> current_;
    boost::asio::steady_timer watchdog_;
    std::string saved_path_;

    void on_metadata(const protocol::FileMetadata& meta);
    void on_chunk(const protocol::Message& message);
    void arm_watchdog();
    void assemble_and_finalize();
    void fail(const std::string& reason);
    void set_state(Phase phase, int progress);
};

} // namespace transfer
