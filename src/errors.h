#pragma once

/**
 * @file errors.h
 * @brief Error taxonomy for directory transfer sessions
 *
 * Every error raised by the transfer core is fatal for the session it
 * happens in. Nothing is retried internally; the caller decides whether to
 * restart the whole program.
 */

#include <stdexcept>
#include <string>
#include <cstdint>

namespace dirpost {

enum class ErrorKind {
    Connection,     // bind/connect/accept failed
    Walk,           // transfer root missing, not a directory, or unlistable
    Decode,         // malformed or path-escaping frame
    Transport,      // channel I/O failure
    Io,             // local file read/write failure
    Truncated,      // fewer payload bytes than declared
    Config          // invalid configuration
};

/**
 * @brief Name printed to the user for an error kind, e.g. "DecodeError"
 */
const char* error_kind_to_string(ErrorKind kind);

/**
 * @brief Process exit status for an error kind (always non-zero)
 */
int error_kind_exit_code(ErrorKind kind);

/**
 * @brief Base class of all session errors
 */
class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class ConnectionError : public TransferError {
public:
    explicit ConnectionError(const std::string& message)
        : TransferError(ErrorKind::Connection, message) {}
};

class WalkError : public TransferError {
public:
    explicit WalkError(const std::string& message)
        : TransferError(ErrorKind::Walk, message) {}
};

class DecodeError : public TransferError {
public:
    explicit DecodeError(const std::string& message)
        : TransferError(ErrorKind::Decode, message) {}
};

class TransportError : public TransferError {
public:
    explicit TransportError(const std::string& message)
        : TransferError(ErrorKind::Transport, message) {}
};

/**
 * @brief The peer closed the channel cleanly in the middle of a read
 */
class ChannelClosedError : public TransportError {
public:
    ChannelClosedError(const std::string& message, size_t bytes_received)
        : TransportError(message), bytes_received_(bytes_received) {}

    // Bytes of the interrupted request that did arrive
    size_t bytes_received() const { return bytes_received_; }

private:
    size_t bytes_received_;
};

class IoError : public TransferError {
public:
    explicit IoError(const std::string& message)
        : TransferError(ErrorKind::Io, message) {}
};

class TruncatedTransferError : public TransferError {
public:
    TruncatedTransferError(const std::string& path, uint64_t expected, uint64_t received);

    uint64_t expected_bytes() const { return expected_; }
    uint64_t received_bytes() const { return received_; }

private:
    uint64_t expected_;
    uint64_t received_;
};

class ConfigError : public TransferError {
public:
    explicit ConfigError(const std::string& message)
        : TransferError(ErrorKind::Config, message) {}
};

/**
 * @brief Format errno as "<what>: <strerror> (errno N)"
 */
std::string errno_message(const std::string& what, int err);

} // namespace dirpost
