#include "session.h"
#include "errors.h"
#include "fs.h"
#include "logger.h"
#include "tree_walker.h"
#include <cerrno>

#define LOG_SESSION_DEBUG(message) LOG_DEBUG("session", message)
#define LOG_SESSION_INFO(message)  LOG_INFO("session", message)

namespace dirpost {

std::string resolve_transfer_root(const std::string& root) {
    validate_transfer_root(root);

    std::string resolved;
    if (!canonical_path(root, resolved)) {
        throw WalkError(errno_message("cannot resolve transfer root '" + root + "'", errno));
    }
    return resolved;
}

SessionNegotiator::SessionNegotiator(const SessionConfig& config)
    : config_(config), listen_socket_(INVALID_SOCKET_VALUE) {}

SessionNegotiator::~SessionNegotiator() {
    close_socket(listen_socket_);
}

const std::string& SessionNegotiator::prepare_root() {
    if (root_.empty()) {
        root_ = resolve_transfer_root(config_.root);
        LOG_SESSION_DEBUG("Transfer root resolved to " << root_);
    }
    return root_;
}

uint16_t SessionNegotiator::bind() {
    prepare_root();

    if (config_.role() != Role::Listener) {
        throw ConnectionError("bind requested for a session that connects to " + config_.host);
    }

    if (!is_valid_socket(listen_socket_)) {
        listen_socket_ = create_tcp_server(config_.port, 1);
        if (!is_valid_socket(listen_socket_)) {
            throw ConnectionError(errno_message("failed to listen on port " + std::to_string(config_.port), errno));
        }
    }
    return static_cast<uint16_t>(get_bound_port(listen_socket_));
}

Session SessionNegotiator::establish() {
    prepare_root();

    socket_t socket = INVALID_SOCKET_VALUE;
    if (config_.role() == Role::Listener) {
        uint16_t port = bind();
        LOG_SESSION_INFO("Waiting for a connection on port " << port);

        socket = accept_client(listen_socket_);
        int err = errno;
        // One connection per session
        close_socket(listen_socket_);
        listen_socket_ = INVALID_SOCKET_VALUE;

        if (!is_valid_socket(socket)) {
            throw ConnectionError(errno_message("failed to accept a connection", err));
        }
    } else {
        socket = create_tcp_client(config_.host, config_.port);
        if (!is_valid_socket(socket)) {
            throw ConnectionError("failed to connect to " + config_.host + ":" + std::to_string(config_.port));
        }
    }

    std::string peer = get_peer_address(socket);
    Session session = from_channel(config_, std::make_unique<SocketChannel>(socket));
    session.peer = peer;

    LOG_SESSION_INFO("Connected to " << (peer.empty() ? "peer" : peer) << ", "
                     << direction_to_string(session.direction) << " " << session.root);
    return session;
}

Session SessionNegotiator::from_channel(const SessionConfig& config, std::unique_ptr<Channel> channel) {
    Session session;
    session.role = config.role();
    session.direction = config.direction();
    session.root = resolve_transfer_root(config.root);
    session.channel = std::move(channel);
    return session;
}

} // namespace dirpost
