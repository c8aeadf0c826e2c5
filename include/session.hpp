#pragma once

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <boost/asio.hpp>
#include "channel.hpp"
#include "config.hpp"
#include "file_io.hpp"
#include "transfer.hpp"

namespace session {

enum class Role {
    INITIATOR,
    RESPONDER
};

enum class ConnectionStatus {
    DISCONNECTED,
    WAITING,
    CONNECTING,
    CONNECTED,
    FAILED
};

const char* role_name(Role role);
const char* status_name(ConnectionStatus status);

// Human readable status line, e.g. "Waiting for receiver..."
std::string status_text(ConnectionStatus status);

struct Session {
    Role role = Role::INITIATOR;
    std::string token;
    ConnectionStatus status = ConnectionStatus::DISCONNECTED;
};

struct SessionCallbacks {
    std::function<void(ConnectionStatus)> on_status_change;
    std::function<void(const transfer::TransferState&)> on_transfer;
    std::function<void(const std::string&)> on_notice;
    std::function<void(const std::runtime_error&)> on_error;
};

/**
 * Owns the one active session: its adapter, its channel, and the sender and
 * receiver bound to it.
 *
 * Every handler given to the adapter or channel is tied to the current
 * session generation. Replacing or tearing down the session starts a new
 * generation, so events from the old channel are dropped instead of touching
 * the new session.
 */
class SessionController {
public:
    SessionController(boost::asio::io_context& io_context, config::Config cfg,
                      channel::AdapterFactory adapter_factory,
                      std::shared_ptr<transfer::FileSink> sink,
                      SessionCallbacks callbacks);
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // Initiator. Returns the room code to share.
    // Throws errors::ConnectionError if the adapter cannot listen.
    const std::string& create_session();

    // Responder. Throws errors::ValidationError for a blank code and
    // errors::ConnectionError if the adapter cannot be opened.
    void join_session(const std::string& token);

    // Queues a file; sends it right away when connected
    void select_file(std::shared_ptr<transfer::FileSource> source);

    // Sends the queued file. Throws errors::TransferError when not connected.
    void send_file();

    // Forgets the queued file and resets the transfer progress
    void clear_file();

    void switch_role();

    // Tears the session down without changing role
    void close();

    const Session& session() const { return session_; }
    Role role() const { return session_.role; }
    ConnectionStatus status() const { return session_.status; }
    const transfer::TransferState& transfer_state() const { return transfer_state_; }
    const transfer::TransferReceiver& receiver() const { return receiver_; }
    bool has_queued_file() const { return static_cast<bool>(queued_file_); }

private:
    struct Generation {};

    config::Config cfg_;
    channel::AdapterFactory adapter_factory_;
    SessionCallbacks callbacks_;

    Session session_;
    bool torn_down_ = false;
    std::shared_ptr<Generation> generation_;
    std::unique_ptr<channel::Adapter> adapter_;
    std::shared_ptr<channel::Channel> channel_;
    std::shared_ptr<transfer::FileSource> queued_file_;
    transfer::TransferState transfer_state_;

    transfer::TransferSender sender_;
    transfer::TransferReceiver receiver_;

    template <typename Handler>
    auto guarded(Handler handler);

    transfer::TransferCallbacks transfer_callbacks();
    void open_adapter();
    void attach_channel(std::shared_ptr<channel::Channel> channel);

    void on_adapter_ready();
    void on_incoming_connection(std::shared_ptr<channel::Channel> channel);
    void on_adapter_error(const errors::ConnectionError& error);
    void on_channel_open();
    void on_channel_data(const protocol::Message& message);
    void on_channel_close();
    void on_channel_error(const errors::ConnectionError& error);

    bool transition(ConnectionStatus to);
    void teardown();
    void abort_transfers();
    void notice(const std::string& text);
    void report_error(const std::runtime_error& error);
};

} // namespace session
