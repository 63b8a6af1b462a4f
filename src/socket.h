#pragma once

#include "channel.h"

#include <string>
#include <cstdint>
#include <cstddef>
#include <sys/types.h>
#include <sys/socket.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <unistd.h>

typedef int socket_t;
#define INVALID_SOCKET_VALUE -1
#define SOCKET_ERROR_VALUE -1

namespace dirpost {

// TCP Socket Functions
/**
 * Create a TCP client socket and connect to a server
 * Every address getaddrinfo returns for the host (IPv6 and IPv4) is tried in order.
 * @param host The hostname or IP address to connect to
 * @param port The port number to connect to
 * @return Socket handle, or INVALID_SOCKET_VALUE on error
 */
socket_t create_tcp_client(const std::string& host, int port);

/**
 * Create a TCP server socket bound to all interfaces using dual stack
 * (IPv6 with IPv4-mapped addresses), falling back to IPv4 only
 * @param port The port number to bind to (0 for an ephemeral port)
 * @param backlog The maximum number of pending connections
 * @return Socket handle, or INVALID_SOCKET_VALUE on error
 */
socket_t create_tcp_server(int port, int backlog = 1);

/**
 * Accept a client connection on a server socket
 * @param server_socket The server socket handle
 * @return Client socket handle, or INVALID_SOCKET_VALUE on error
 */
socket_t accept_client(socket_t server_socket);

/**
 * Get the peer address (IP:port) from a connected socket
 * @return Peer address string in format "IP:port", or empty string on error
 */
std::string get_peer_address(socket_t socket);

/**
 * Get the local port a socket is bound to
 * @return The port, or 0 on error
 */
int get_bound_port(socket_t socket);

/**
 * Create a connected pair of local stream sockets
 * @return true if successful
 */
bool create_socket_pair(socket_t& first, socket_t& second);

// Common Socket Functions
void close_socket(socket_t socket);
bool is_valid_socket(socket_t socket);

/**
 * @brief Channel over a connected stream socket
 *
 * Owns the socket and closes it on destruction. Writes use MSG_NOSIGNAL so a
 * reset peer surfaces as TransportError instead of SIGPIPE.
 */
class SocketChannel : public Channel {
public:
    explicit SocketChannel(socket_t socket);
    ~SocketChannel() override;

    SocketChannel(const SocketChannel&) = delete;
    SocketChannel& operator=(const SocketChannel&) = delete;

    size_t read(uint8_t* buffer, size_t length) override;
    void write(const uint8_t* data, size_t length) override;
    void shutdown_write() override;
    void close() override;

    socket_t socket() const { return socket_; }

private:
    socket_t socket_;
};

} // namespace dirpost
