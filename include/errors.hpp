#pragma once

#include <stdexcept>
#include <string>

namespace errors {

// Adapter or channel failure. The session moves to FAILED and must be recreated.
class ConnectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The dialed room code has no listener behind it
class RoomNotFound : public ConnectionError {
public:
    RoomNotFound() : ConnectionError("Room not found. Please check the room code.") {}
};

// Rejected input, thrown before any state is touched
class ValidationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Aborts the current transfer only; the channel stays up
class TransferError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Undecodable frame on the wire
class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace errors
