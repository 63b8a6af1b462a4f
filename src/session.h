#pragma once

/**
 * @file session.h
 * @brief Establishes the single connection a transfer runs over
 */

#include "channel.h"
#include "config.h"
#include "socket.h"

#include <memory>
#include <string>
#include <cstdint>

namespace dirpost {

/**
 * @brief One transfer over one connection
 *
 * Owns the channel; the channel is closed when the session is destroyed.
 */
struct Session {
    Role role;
    Direction direction;
    std::string root;                   // Canonical transfer root
    std::string peer;                   // Peer address, informational
    std::unique_ptr<Channel> channel;

    Session() : role(Role::Listener), direction(Direction::Receive) {}
};

/**
 * @brief Turns a SessionConfig into a connected Session
 *
 * A Listener binds on all interfaces (dual stack) and accepts exactly one
 * connection. An Initiator resolves the configured host and connects.
 * The transfer root is validated before any network activity.
 */
class SessionNegotiator {
public:
    explicit SessionNegotiator(const SessionConfig& config);
    ~SessionNegotiator();

    SessionNegotiator(const SessionNegotiator&) = delete;
    SessionNegotiator& operator=(const SessionNegotiator&) = delete;

    /**
     * @brief Bind the listening socket ahead of establish()
     *
     * Only meaningful for a Listener. Calling it is optional; establish()
     * binds on its own when needed.
     *
     * @return The bound port, which differs from the configured one when
     *         the configured port is 0
     * @throws WalkError if the transfer root is invalid
     * @throws ConnectionError if the socket cannot be bound
     */
    uint16_t bind();

    /**
     * @brief Connect or accept, then build the session
     * @throws WalkError if the transfer root is invalid
     * @throws ConnectionError if connect or accept fails
     */
    Session establish();

    /**
     * @brief Build a session over an already connected channel
     * @throws WalkError if the transfer root is invalid
     */
    static Session from_channel(const SessionConfig& config, std::unique_ptr<Channel> channel);

    const SessionConfig& config() const { return config_; }

private:
    const std::string& prepare_root();

    SessionConfig config_;
    std::string root_;
    socket_t listen_socket_;
};

/**
 * @brief Validate and canonicalize a transfer root
 * @throws WalkError
 */
std::string resolve_transfer_root(const std::string& root);

} // namespace dirpost
