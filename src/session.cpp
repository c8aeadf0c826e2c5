#include "session.hpp"
#include "errors.hpp"
#include "security.hpp"
#include <iostream>
#include <utility>

namespace session {

const char* role_name(Role role) {
    return role == Role::INITIATOR ? "initiator" : "responder";
}

const char* status_name(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::DISCONNECTED: return "disconnected";
        case ConnectionStatus::WAITING: return "waiting";
        case ConnectionStatus::CONNECTING: return "connecting";
        case ConnectionStatus::CONNECTED: return "connected";
        case ConnectionStatus::FAILED: return "error";
    }
    return "unknown";
}

std::string status_text(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::CONNECTED: return "Connected";
        case ConnectionStatus::CONNECTING: return "Connecting...";
        case ConnectionStatus::WAITING: return "Waiting for receiver...";
        case ConnectionStatus::FAILED: return "Connection error";
        case ConnectionStatus::DISCONNECTED: return "Disconnected";
    }
    return "Disconnected";
}

SessionController::SessionController(boost::asio::io_context& io_context, config::Config cfg,
                                     channel::AdapterFactory adapter_factory,
                                     std::shared_ptr<transfer::FileSink> sink,
                                     SessionCallbacks callbacks)
    : cfg_(std::move(cfg)),
      adapter_factory_(std::move(adapter_factory)),
      callbacks_(std::move(callbacks)),
      generation_(std::make_shared<Generation>()),
      sender_(io_context, cfg_, transfer_callbacks()),
      receiver_(io_context, cfg_, std::move(sink), transfer_callbacks()) {}

SessionController::~SessionController() {
    generation_.reset();
    if (channel_) {
        channel_->set_handlers({});
        channel_->close();
    }
    if (adapter_) {
        adapter_->destroy();
    }
}

// Wraps a handler so it becomes a no-op once the session generation it was
// created for has been replaced.
template <typename Handler>
auto SessionController::guarded(Handler handler) {
    std::weak_ptr<Generation> weak_generation = generation_;
    return [weak_generation, handler](auto&&... args) {
        if (weak_generation.expired()) return;
        handler(std::forward<decltype(args)>(args)...);
    };
}

transfer::TransferCallbacks SessionController::transfer_callbacks() {
    transfer::TransferCallbacks cb;
    cb.on_state = [this](const transfer::TransferState& state) {
        transfer_state_ = state;
        if (callbacks_.on_transfer) callbacks_.on_transfer(state);
    };
    cb.on_status = [this](const std::string& text) { notice(text); };
    cb.on_error = [this](const std::runtime_error& error) { report_error(error); };
    return cb;
}

const std::string& SessionController::create_session() {
    teardown();
    session_ = Session{Role::INITIATOR, security::generate_session_token(), ConnectionStatus::DISCONNECTED};
    torn_down_ = false;

    try {
        open_adapter();
        adapter_->listen(session_.token);
    } catch (errors::ConnectionError& e) {
        std::cerr << "SessionController: Failed to create room: " << e.what() << "\n";
        transition(ConnectionStatus::FAILED);
        throw;
    }
    return session_.token;
}

void SessionController::join_session(const std::string& token) {
    std::string room = security::normalize_token(token);
    if (room.empty()) {
        throw errors::ValidationError("Please enter a valid room code");
    }

    teardown();
    session_ = Session{Role::RESPONDER, room, ConnectionStatus::DISCONNECTED};
    torn_down_ = false;

    try {
        open_adapter();
        transition(ConnectionStatus::CONNECTING);
        attach_channel(adapter_->connect(room));
    } catch (errors::ConnectionError& e) {
        std::cerr << "SessionController: Failed to join room " << room << ": " << e.what() << "\n";
        transition(ConnectionStatus::FAILED);
        throw;
    }
}

void SessionController::select_file(std::shared_ptr<transfer::FileSource> source) {
    if (!source) {
        throw errors::ValidationError("No file selected.");
    }
    if (session_.status == ConnectionStatus::CONNECTED) {
        sender_.start(channel_, source);
        queued_file_ = std::move(source);
    } else {
        queued_file_ = std::move(source);
        notice("File selected. It will be sent when the receiver connects.");
    }
}

void SessionController::send_file() {
    if (session_.status != ConnectionStatus::CONNECTED) {
        throw errors::TransferError("No active connection. Please wait for the receiver to connect.");
    }
    if (!queued_file_) {
        throw errors::ValidationError("No file selected.");
    }
    sender_.start(channel_, queued_file_);
}

void SessionController::clear_file() {
    queued_file_.reset();
    sender_.reset();
}

void SessionController::switch_role() {
    teardown();
    queued_file_.reset();

    Role next = session_.role == Role::INITIATOR ? Role::RESPONDER : Role::INITIATOR;
    bool status_changed = session_.status != ConnectionStatus::DISCONNECTED;
    session_ = Session{};
    session_.role = next;
    torn_down_ = false;

    if (status_changed && callbacks_.on_status_change) {
        callbacks_.on_status_change(session_.status);
    }
}

void SessionController::close() {
    teardown();
    queued_file_.reset();

    bool status_changed = session_.status != ConnectionStatus::DISCONNECTED;
    session_.status = ConnectionStatus::DISCONNECTED;
    torn_down_ = true;

    if (status_changed && callbacks_.on_status_change) {
        callbacks_.on_status_change(session_.status);
    }
}

void SessionController::open_adapter() {
    adapter_ = adapter_factory_();
    if (!adapter_) {
        throw errors::ConnectionError("Failed to initialize connection adapter");
    }

    channel::AdapterHandlers handlers;
    handlers.on_ready = guarded([this]() { on_adapter_ready(); });
    handlers.on_connection = guarded([this](std::shared_ptr<channel::Channel> channel) {
        on_incoming_connection(std::move(channel));
    });
    handlers.on_error = guarded([this](const errors::ConnectionError& error) { on_adapter_error(error); });
    adapter_->set_handlers(std::move(handlers));
}

void SessionController::attach_channel(std::shared_ptr<channel::Channel> channel) {
    channel_ = std::move(channel);
    receiver_.attach(channel_);

    channel::ChannelHandlers handlers;
    handlers.on_open = guarded([this]() { on_channel_open(); });
    handlers.on_data = guarded([this](const protocol::Message& message) { on_channel_data(message); });
    handlers.on_close = guarded([this]() { on_channel_close(); });
    handlers.on_error = guarded([this](const errors::ConnectionError& error) { on_channel_error(error); });
    channel_->set_handlers(std::move(handlers));
}

void SessionController::on_adapter_ready() {
    if (transition(ConnectionStatus::WAITING)) {
        notice("Room created! Share the room code with the receiver.");
    }
}

void SessionController::on_incoming_connection(std::shared_ptr<channel::Channel> channel) {
    if (channel_ || session_.role != Role::INITIATOR) {
        std::cerr << "SessionController: Rejecting extra connection, a peer is already attached\n";
        channel->close();
        return;
    }
    if (!transition(ConnectionStatus::CONNECTING)) {
        channel->close();
        return;
    }
    attach_channel(std::move(channel));
}

void SessionController::on_adapter_error(const errors::ConnectionError& error) {
    std::cerr << "SessionController: Peer error: " << error.what() << "\n";
    if (!transition(ConnectionStatus::FAILED)) return;
    abort_transfers();
    report_error(error);
}

void SessionController::on_channel_open() {
    if (!transition(ConnectionStatus::CONNECTED)) return;

    if (session_.role == Role::INITIATOR) {
        notice("Receiver connected! You can now send files.");
        if (queued_file_) {
            try {
                sender_.start(channel_, queued_file_);
            } catch (std::runtime_error& e) {
                report_error(e);
            }
        }
    } else {
        notice("Connected to sender! Waiting for files...");
    }
}

void SessionController::on_channel_data(const protocol::Message& message) {
    if (message.is_received_ack()) {
        sender_.on_ack();
    } else if (message.type == protocol::CommandType::TEXT) {
        std::cerr << "SessionController: Ignoring text message: " << message.text << "\n";
    } else {
        receiver_.on_message(message);
    }
}

void SessionController::on_channel_close() {
    if (!transition(ConnectionStatus::DISCONNECTED)) return;
    abort_transfers();
    notice("Connection closed");
}

void SessionController::on_channel_error(const errors::ConnectionError& error) {
    std::cerr << "SessionController: Connection error: " << error.what() << "\n";
    if (!transition(ConnectionStatus::FAILED)) return;
    abort_transfers();
    report_error(errors::ConnectionError(std::string("Connection error: ") + error.what()));
}

bool SessionController::transition(ConnectionStatus to) {
    ConnectionStatus from = session_.status;
    bool initiator = session_.role == Role::INITIATOR;
    bool allowed = false;

    // FAILED and a torn down DISCONNECTED are terminal for this session
    if (from != ConnectionStatus::FAILED && !(from == ConnectionStatus::DISCONNECTED && torn_down_)) {
        switch (to) {
            case ConnectionStatus::WAITING:
                allowed = initiator && from == ConnectionStatus::DISCONNECTED;
                break;
            case ConnectionStatus::CONNECTING:
                allowed = initiator ? from == ConnectionStatus::WAITING : from == ConnectionStatus::DISCONNECTED;
                break;
            case ConnectionStatus::CONNECTED:
                allowed = from == ConnectionStatus::CONNECTING;
                break;
            case ConnectionStatus::DISCONNECTED:
                allowed = from != ConnectionStatus::DISCONNECTED;
                break;
            case ConnectionStatus::FAILED:
                allowed = true;
                break;
        }
    }

    if (!allowed) {
        std::cerr << "SessionController: Ignoring transition " << status_name(from) << " -> "
                  << status_name(to) << "\n";
        return false;
    }

    session_.status = to;
    if (to == ConnectionStatus::DISCONNECTED) {
        torn_down_ = true;
    }
    if (callbacks_.on_status_change) {
        callbacks_.on_status_change(to);
    }
    return true;
}

void SessionController::teardown() {
    // Everything handed out under the old generation goes quiet
    generation_ = std::make_shared<Generation>();

    if (channel_) {
        channel_->set_handlers({});
        channel_->close();
        channel_.reset();
    }
    if (adapter_) {
        adapter_->destroy();
        adapter_.reset();
    }
    sender_.reset();
    receiver_.reset();
}

void SessionController::abort_transfers() {
    sender_.abort(true);
    receiver_.abort(true);
}

void SessionController::notice(const std::string& text) {
    if (callbacks_.on_notice) {
        callbacks_.on_notice(text);
    }
}

void SessionController::report_error(const std::runtime_error& error) {
    if (callbacks_.on_error) {
        callbacks_.on_error(error);
    }
}

} // namespace session
