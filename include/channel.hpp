#pragma once

#include <functional>
#include <memory>
#include <string>
#include "errors.hpp"
#include "protocol/message.hpp"

namespace channel {

struct ChannelHandlers {
    std::function<void()> on_open;
    std::function<void(const protocol::Message&)> on_data;
    std::function<void()> on_close;
    std::function<void(const errors::ConnectionError&)> on_error;
};

// Fires once the frame has left the channel's outbound buffer
using SentHandler = std::function<void()>;

/**
 * Reliable, ordered, bidirectional message pipe to one peer.
 * Handlers are invoked from the io_context that owns the channel, never inline
 * from send() or close(). Once close() has been called locally no further
 * handlers fire.
 */
class Channel {
public:
    virtual ~Channel() = default;

    virtual void set_handlers(ChannelHandlers handlers) = 0;

    // Enqueues for delivery and returns immediately. on_sent, if given, is
    // invoked from the io_context when the frame has been written out; it
    // never fires once the channel is closed.
    // Throws errors::ConnectionError if the channel is not open.
    virtual void send(const protocol::Message& message, SentHandler on_sent = SentHandler()) = 0;

    virtual void close() = 0;
    virtual bool is_open() const = 0;
};

struct AdapterHandlers {
    // Listening under the token, ready for a peer
    std::function<void()> on_ready;
    // A peer attached to our token; its channel opens later
    std::function<void(std::shared_ptr<Channel>)> on_connection;
    // errors::RoomNotFound when the dialed token has no listener
    std::function<void(const errors::ConnectionError&)> on_error;
};

/**
 * Rendezvous and channel establishment. Signaling, NAT traversal and
 * transport selection all live behind this interface.
 */
class Adapter {
public:
    virtual ~Adapter() = default;

    virtual void set_handlers(AdapterHandlers handlers) = 0;

    // Throws errors::ConnectionError if the adapter cannot be initialized
    virtual void listen(const std::string& token) = 0;
    virtual std::shared_ptr<Channel> connect(const std::string& token) = 0;

    // Stops listening and dialing; channels already handed out stay usable
    virtual void destroy() = 0;
};

using AdapterFactory = std::function<std::unique_ptr<Adapter>()>;

} // namespace channel
