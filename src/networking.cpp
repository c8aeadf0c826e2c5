#include "networking.hpp"
#include "errors.hpp"
#include "security.hpp"
#include "protocol/message.hpp"
#include <iostream>
#include <chrono>

using boost::asio::ip::tcp;
using boost::asio::ip::udp;

namespace networking {

std::string format_announcement(const Announcement& announcement) {
    return "PEERDROP|" + announcement.token + "|" + std::to_string(announcement.port) + "|" +
           announcement.instance_id;
}

std::optional<Announcement> parse_announcement(const std::string& message) {
    if (message.find("PEERDROP|") != 0) {
        return std::nullopt;
    }

    // Parse format: PEERDROP|<token>|<port>|<instance_id>
    size_t first_pipe = message.find('|');
    size_t second_pipe = message.find('|', first_pipe + 1);
    if (second_pipe == std::string::npos) {
        return std::nullopt;
    }
    size_t third_pipe = message.find('|', second_pipe + 1);

    Announcement announcement;
    announcement.token = message.substr(first_pipe + 1, second_pipe - first_pipe - 1);
    std::string port_str = third_pipe == std::string::npos
        ? message.substr(second_pipe + 1)
        : message.substr(second_pipe + 1, third_pipe - second_pipe - 1);
    if (third_pipe != std::string::npos) {
        announcement.instance_id = message.substr(third_pipe + 1);
    }

    try {
        int port = std::stoi(port_str);
        if (port <= 0 || port > 65535) {
            return std::nullopt;
        }
        announcement.port = static_cast<unsigned short>(port);
    } catch (std::exception&) {
        return std::nullopt;
    }

    if (announcement.token.empty()) {
        return std::nullopt;
    }
    return announcement;
}

bool is_peer_hangup(const boost::system::error_code& ec) {
    return ec == boost::asio::error::eof || ec == boost::asio::error::connection_reset ||
           ec == boost::asio::error::broken_pipe;
}

// ─── TcpChannel ─────────────────────────────────────────────────────────────

TcpChannel::TcpChannel(boost::asio::io_context& io_context)
    : io_context_(io_context), socket_(io_context) {}

TcpChannel::~TcpChannel() {
    boost::system::error_code ignored;
    socket_.close(ignored);
}

void TcpChannel::set_handlers(channel::ChannelHandlers handlers) {
    handlers_ = std::move(handlers);
}

void TcpChannel::start() {
    boost::asio::post(io_context_, [self = shared_from_this()]() {
        if (self->closing_ || self->closed_) return;
        self->open();
    });
}

void TcpChannel::start_connect(const std::vector<tcp::endpoint>& endpoints) {
    boost::asio::async_connect(socket_, endpoints,
        [self = shared_from_this()](const boost::system::error_code& ec, const tcp::endpoint&) {
            if (self->closing_ || self->closed_) return;
            if (ec) {
                self->on_io_error(ec, "Could not connect to peer");
                return;
            }
            self->open();
        });
}

void TcpChannel::open() {
    boost::system::error_code ec;
    socket_.set_option(tcp::no_delay(true), ec);
    if (ec) {
        std::cerr << "TcpChannel: Could not disable Nagle: " << ec.message() << "\n";
    }

    open_ = true;
    auto on_open = handlers_.on_open;
    if (on_open) on_open();

    // The open handler may have closed us
    if (closing_ || closed_) return;
    read_header();
}

void TcpChannel::read_header() {
    boost::asio::async_read(socket_, boost::asio::buffer(header_buf_),
        [self = shared_from_this()](const boost::system::error_code& ec, std::size_t) {
            if (self->closing_ || self->closed_) return;
            if (ec) {
                self->on_io_error(ec, "Read failed");
                return;
            }

            protocol::PacketHeader header = protocol::deserialize_header(self->header_buf_);
            if (header.payload_size > protocol::MAX_PAYLOAD_SIZE) {
                self->on_io_error(boost::asio::error::message_size,
                                  "Frame of " + std::to_string(header.payload_size) + " bytes exceeds limit");
                return;
            }

            self->payload_buf_.assign(header.payload_size, 0);
            if (header.payload_size == 0) {
                self->dispatch(header);
            } else {
                self->read_payload(header);
            }
        });
}

void TcpChannel::read_payload(const protocol::PacketHeader& header) {
    boost::asio::async_read(socket_, boost::asio::buffer(payload_buf_),
        [self = shared_from_this(), header](const boost::system::error_code& ec, std::size_t) {
            if (self->closing_ || self->closed_) return;
            if (ec) {
                self->on_io_error(ec, "Read failed");
                return;
            }
            self->dispatch(header);
        });
}

void TcpChannel::dispatch(const protocol::PacketHeader& header) {
    try {
        protocol::Message message = protocol::decode(header, payload_buf_);
        auto on_data = handlers_.on_data;
        if (on_data) on_data(message);
    } catch (errors::ProtocolError& e) {
        std::cerr << "TcpChannel: Dropping frame: " << e.what() << "\n";
    }

    if (closing_ || closed_) return;
    read_header();
}

void TcpChannel::send(const protocol::Message& message, channel::SentHandler on_sent) {
    if (!open_ || closing_) {
        throw errors::ConnectionError("Channel is not open");
    }

    outbox_.push_back({protocol::encode(message), std::move(on_sent)});
    if (outbox_.size() == 1) {
        write_next();
    }
}

void TcpChannel::write_next() {
    boost::asio::async_write(socket_, boost::asio::buffer(outbox_.front().bytes),
        [self = shared_from_this()](const boost::system::error_code& ec, std::size_t) {
            // The buffer in flight is only released here
            if (self->closed_) {
                self->outbox_.clear();
                return;
            }
            if (ec) {
                if (self->closing_) {
                    self->shutdown();
                } else {
                    self->on_io_error(ec, "Write failed");
                }
                return;
            }

            channel::SentHandler on_sent = std::move(self->outbox_.front().on_sent);
            self->outbox_.pop_front();
            if (!self->outbox_.empty()) {
                self->write_next();
            } else if (self->closing_) {
                self->shutdown();
            }

            if (on_sent && !self->closing_ && !self->closed_) on_sent();
        });
}

void TcpChannel::close() {
    if (closing_ || closed_) return;

    handlers_ = channel::ChannelHandlers{};
    open_ = false;
    closing_ = true;

    // Let queued frames drain before the socket goes away
    if (outbox_.empty()) {
        shutdown();
    }
}

void TcpChannel::on_io_error(const boost::system::error_code& ec, const std::string& what) {
    bool was_open = open_;
    shutdown();

    channel::ChannelHandlers handlers = std::move(handlers_);
    handlers_ = channel::ChannelHandlers{};

    if (was_open && is_peer_hangup(ec)) {
        if (handlers.on_close) handlers.on_close();
        return;
    }

    std::cerr << "TcpChannel: " << what << ": " << ec.message() << "\n";
    if (handlers.on_error) handlers.on_error(errors::ConnectionError(what + ": " + ec.message()));
}

void TcpChannel::shutdown() {
    closed_ = true;
    open_ = false;

    boost::system::error_code ignored;
    socket_.shutdown(tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
}

// ─── TcpAdapter ─────────────────────────────────────────────────────────────

class TcpAdapter::Impl : public std::enable_shared_from_this<TcpAdapter::Impl> {
public:
    Impl(boost::asio::io_context& io_context, const config::Config& cfg)
        : io_context_(io_context), cfg_(cfg), acceptor_(io_context),
          broadcast_socket_(io_context), broadcast_timer_(io_context),
          discovery_socket_(io_context), dial_timer_(io_context) {}

    channel::AdapterHandlers handlers;

    void listen(const std::string& token);
    std::shared_ptr<TcpChannel> connect(const std::string& token);
    std::shared_ptr<TcpChannel> connect_endpoint(const std::string& host, unsigned short port);
    void stop();

    unsigned short listen_port() const { return listen_port_; }

private:
    boost::asio::io_context& io_context_;
    config::Config cfg_;
    bool stopped_ = false;

    tcp::acceptor acceptor_;
    unsigned short listen_port_ = 0;
    udp::socket broadcast_socket_;
    boost::asio::steady_timer broadcast_timer_;
    std::string announcement_;

    udp::socket discovery_socket_;
    boost::asio::steady_timer dial_timer_;
    std::array<char, 1024> recv_buf_;
    udp::endpoint sender_endpoint_;
    std::string wanted_token_;
    std::shared_ptr<TcpChannel> pending_channel_;

    void accept();
    void broadcast();
    void stop_listening();
    void receive_announcement();
    void stop_discovery();
    void report_error(const errors::ConnectionError& error);
};

void TcpAdapter::Impl::listen(const std::string& token) {
    try {
        tcp::endpoint endpoint(tcp::v4(), 0);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
        listen_port_ = acceptor_.local_endpoint().port();

        broadcast_socket_.open(udp::v4());
        broadcast_socket_.set_option(boost::asio::socket_base::broadcast(true));
    } catch (boost::system::system_error& e) {
        throw errors::ConnectionError(std::string("Failed to open listener: ") + e.what());
    }

    announcement_ = format_announcement({token, listen_port_, security::instance_id()});
    std::cout << "Listening on port " << listen_port_ << std::endl;

    accept();
    broadcast();

    boost::asio::post(io_context_, [self = shared_from_this()]() {
        if (self->stopped_) return;
        auto on_ready = self->handlers.on_ready;
        if (on_ready) on_ready();
    });
}

void TcpAdapter::Impl::accept() {
    auto channel = std::make_shared<TcpChannel>(io_context_);
    acceptor_.async_accept(channel->socket(),
        [self = shared_from_this(), channel](const boost::system::error_code& ec) {
            if (self->stopped_ || !self->acceptor_.is_open()) return;
            if (ec) {
                self->report_error(errors::ConnectionError("Accept failed: " + ec.message()));
                return;
            }

            // One peer per room
            self->stop_listening();

            auto on_connection = self->handlers.on_connection;
            if (on_connection) on_connection(channel);
            channel->start();
        });
}

void TcpAdapter::Impl::broadcast() {
    boost::system::error_code ec;
    broadcast_socket_.send_to(boost::asio::buffer(announcement_),
        udp::endpoint(boost::asio::ip::address_v4::broadcast(), cfg_.discovery_port), 0, ec);
    if (ec) {
        std::cerr << "TcpAdapter: Broadcast failed: " << ec.message() << "\n";
    }
    // Peers on this host do not always see our own broadcasts
    broadcast_socket_.send_to(boost::asio::buffer(announcement_),
        udp::endpoint(boost::asio::ip::address_v4::loopback(), cfg_.discovery_port), 0, ec);

    broadcast_timer_.expires_after(std::chrono::seconds(1));
    broadcast_timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
        if (ec || self->stopped_ || !self->broadcast_socket_.is_open()) return;
        self->broadcast();
    });
}

void TcpAdapter::Impl::stop_listening() {
    boost::system::error_code ignored;
    acceptor_.close(ignored);
    broadcast_timer_.cancel();
    broadcast_socket_.close(ignored);
}

std::shared_ptr<TcpChannel> TcpAdapter::Impl::connect(const std::string& token) {
    if (!cfg_.direct_host.empty()) {
        return connect_endpoint(cfg_.direct_host, cfg_.direct_port);
    }

    try {
        discovery_socket_.open(udp::v4());
        discovery_socket_.set_option(boost::asio::socket_base::reuse_address(true));
        discovery_socket_.bind(udp::endpoint(udp::v4(), cfg_.discovery_port));
    } catch (boost::system::system_error& e) {
        throw errors::ConnectionError(std::string("Failed to open discovery socket: ") + e.what());
    }

    auto channel = std::make_shared<TcpChannel>(io_context_);
    pending_channel_ = channel;
    wanted_token_ = token;
    std::cout << "Scanning for room " << token << " broadcasts...\n";

    dial_timer_.expires_after(cfg_.dial_timeout);
    dial_timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
        if (ec || self->stopped_ || !self->pending_channel_) return;
        self->stop_discovery();
        self->report_error(errors::RoomNotFound());
    });

    receive_announcement();
    return channel;
}

void TcpAdapter::Impl::receive_announcement() {
    discovery_socket_.async_receive_from(boost::asio::buffer(recv_buf_), sender_endpoint_,
        [self = shared_from_this()](const boost::system::error_code& ec, std::size_t len) {
            if (self->stopped_ || !self->pending_channel_) return;
            if (ec) {
                if (ec == boost::asio::error::operation_aborted) return;
                self->stop_discovery();
                self->report_error(errors::ConnectionError("Discovery failed: " + ec.message()));
                return;
            }

            std::string message(self->recv_buf_.data(), len);
            auto announcement = parse_announcement(message);

            // Ignore broadcasts originating from our own instance ID
            if (!announcement || announcement->token != self->wanted_token_ ||
                announcement->instance_id == security::instance_id()) {
                self->receive_announcement();
                return;
            }

            std::cout << "Found host: " << self->sender_endpoint_.address().to_string() << " room "
                      << announcement->token << "\n";
            auto channel = std::move(self->pending_channel_);
            self->stop_discovery();
            channel->start_connect({tcp::endpoint(self->sender_endpoint_.address(), announcement->port)});
        });
}

void TcpAdapter::Impl::stop_discovery() {
    boost::system::error_code ignored;
    pending_channel_.reset();
    dial_timer_.cancel();
    discovery_socket_.close(ignored);
}

std::shared_ptr<TcpChannel> TcpAdapter::Impl::connect_endpoint(const std::string& host, unsigned short port) {
    std::vector<tcp::endpoint> endpoints;
    try {
        tcp::resolver resolver(io_context_);
        for (const auto& entry : resolver.resolve(host, std::to_string(port))) {
            endpoints.push_back(entry.endpoint());
        }
    } catch (boost::system::system_error& e) {
        throw errors::ConnectionError("Could not resolve " + host + ": " + e.what());
    }

    auto channel = std::make_shared<TcpChannel>(io_context_);
    channel->start_connect(endpoints);
    return channel;
}

void TcpAdapter::Impl::stop() {
    stopped_ = true;
    stop_listening();
    stop_discovery();
}

void TcpAdapter::Impl::report_error(const errors::ConnectionError& error) {
    auto on_error = handlers.on_error;
    if (on_error) on_error(error);
}

TcpAdapter::TcpAdapter(boost::asio::io_context& io_context, const config::Config& cfg)
    : impl_(std::make_shared<Impl>(io_context, cfg)) {}

TcpAdapter::~TcpAdapter() {
    destroy();
}

void TcpAdapter::set_handlers(channel::AdapterHandlers handlers) {
    impl_->handlers = std::move(handlers);
}

void TcpAdapter::listen(const std::string& token) {
    impl_->listen(token);
}

std::shared_ptr<channel::Channel> TcpAdapter::connect(const std::string& token) {
    return impl_->connect(token);
}

std::shared_ptr<channel::Channel> TcpAdapter::connect_endpoint(const std::string& host, unsigned short port) {
    return impl_->connect_endpoint(host, port);
}

void TcpAdapter::destroy() {
    impl_->stop();
}

unsigned short TcpAdapter::listen_port() const {
    return impl_->listen_port();
}

} // namespace networking
