#include "errors.h"
#include <cstring>

namespace dirpost {

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Connection: return "ConnectionError";
        case ErrorKind::Walk: return "WalkError";
        case ErrorKind::Decode: return "DecodeError";
        case ErrorKind::Transport: return "TransportError";
        case ErrorKind::Io: return "IoError";
        case ErrorKind::Truncated: return "TruncatedTransferError";
        case ErrorKind::Config: return "ConfigError";
        default: return "UnknownError";
    }
}

int error_kind_exit_code(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Connection: return 2;
        case ErrorKind::Walk: return 3;
        case ErrorKind::Decode: return 4;
        case ErrorKind::Transport: return 5;
        case ErrorKind::Io: return 6;
        case ErrorKind::Truncated: return 7;
        case ErrorKind::Config: return 8;
        default: return 1;
    }
}

TruncatedTransferError::TruncatedTransferError(const std::string& path, uint64_t expected, uint64_t received)
    : TransferError(ErrorKind::Truncated,
                    "transfer of '" + path + "' truncated: expected " + std::to_string(expected) +
                    " bytes, received " + std::to_string(received)),
      expected_(expected), received_(received) {}

std::string errno_message(const std::string& what, int err) {
    return what + ": " + std::strerror(err) + " (errno " + std::to_string(err) + ")";
}

} // namespace dirpost
