#pragma once

#include <array>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include "channel.hpp"
#include "config.hpp"
#include "protocol/packet.hpp"

namespace networking {

// "PEERDROP|<token>|<port>|<instance id>", broadcast once a second by a listener
struct Announcement {
    std::string token;
    unsigned short port = 0;
    std::string instance_id;
};

std::string format_announcement(const Announcement& announcement);
std::optional<Announcement> parse_announcement(const std::string& message);

// True for the errors a socket reports when the peer hung up
bool is_peer_hangup(const boost::system::error_code& ec);

/**
 * Framed message channel over one TCP connection. Outgoing frames are queued
 * and written one at a time in order, each frame's on_sent firing after its
 * write completes; incoming frames are decoded and
 * delivered through on_data. A frame that fails to decode is logged and
 * dropped.
 */
class TcpChannel : public channel::Channel, public std::enable_shared_from_this<TcpChannel> {
public:
    explicit TcpChannel(boost::asio::io_context& io_context);
    ~TcpChannel() override;

    void set_handlers(channel::ChannelHandlers handlers) override;
    void send(const protocol::Message& message, channel::SentHandler on_sent = channel::SentHandler()) override;
    void close() override;
    bool is_open() const override { return open_; }

    // Socket for the acceptor to fill in before start()
    boost::asio::ip::tcp::socket& socket() { return socket_; }

    // Opens a channel around an accepted socket
    void start();

    // Dials the first reachable endpoint; on_open or on_error follows
    void start_connect(const std::vector<boost::asio::ip::tcp::endpoint>& endpoints);

private:
    boost::asio::io_context& io_context_;
    boost::asio::ip::tcp::socket socket_;
    channel::ChannelHandlers handlers_;
    bool open_ = false;
    bool closing_ = false;
    bool closed_ = false;

    std::array<uint8_t, protocol::HEADER_SIZE> header_buf_;
    std::vector<uint8_t> payload_buf_;
    struct OutgoingFrame {
        std::vector<uint8_t> bytes;
        channel::SentHandler on_sent;
    };
    std::deque<OutgoingFrame> outbox_;

    void open();
    void read_header();
    void read_payload(const protocol::PacketHeader& header);
    void dispatch(const protocol::PacketHeader& header);
    void write_next();
    void on_io_error(const boost::system::error_code& ec, const std::string& what);
    void shutdown();
};

/**
 * LAN adapter. A listener accepts one TCP peer and announces its room code
 * over UDP broadcast; a dialer waits for the announcement carrying its room
 * code, then connects.
 */
class TcpAdapter : public channel::Adapter {
public:
    TcpAdapter(boost::asio::io_context& io_context, const config::Config& cfg);
    ~TcpAdapter() override;

    void set_handlers(channel::AdapterHandlers handlers) override;
    void listen(const std::string& token) override;
    std::shared_ptr<channel::Channel> connect(const std::string& token) override;
    void destroy() override;

    // Dials a known address, skipping discovery.
    // Throws errors::ConnectionError if the host does not resolve.
    std::shared_ptr<channel::Channel> connect_endpoint(const std::string& host, unsigned short port);

    // TCP port the listener is bound to, 0 before listen()
    unsigned short listen_port() const;

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace networking
