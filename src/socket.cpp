#include "socket.h"
#include "errors.h"
#include "logger.h"
#include <cstring>
#include <cerrno>
#include <netdb.h>

// Socket module logging macros
#define LOG_SOCKET_DEBUG(message) LOG_DEBUG("socket", message)
#define LOG_SOCKET_INFO(message)  LOG_INFO("socket", message)
#define LOG_SOCKET_WARN(message)  LOG_WARN("socket", message)
#define LOG_SOCKET_ERROR(message) LOG_ERROR("socket", message)

namespace dirpost {

static std::string format_address(const sockaddr_storage& addr) {
    char ip_str[INET6_ADDRSTRLEN];
    uint16_t port = 0;

    if (addr.ss_family == AF_INET) {
        const sockaddr_in* addr_in = reinterpret_cast<const sockaddr_in*>(&addr);
        inet_ntop(AF_INET, &addr_in->sin_addr, ip_str, sizeof(ip_str));
        port = ntohs(addr_in->sin_port);
        return std::string(ip_str) + ":" + std::to_string(port);
    }
    if (addr.ss_family == AF_INET6) {
        const sockaddr_in6* addr_in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
        inet_ntop(AF_INET6, &addr_in6->sin6_addr, ip_str, sizeof(ip_str));
        port = ntohs(addr_in6->sin6_port);
        return "[" + std::string(ip_str) + "]:" + std::to_string(port);
    }
    if (addr.ss_family == AF_UNIX) {
        return "local";
    }
    return "";
}

// TCP Socket Functions
socket_t create_tcp_client(const std::string& host, int port) {
    LOG_SOCKET_DEBUG("Creating TCP client socket for " << host << ":" << port);

    if (port <= 0 || port > 65535) {
        LOG_SOCKET_ERROR("Invalid port number: " << port << " (must be 1-65535)");
        return INVALID_SOCKET_VALUE;
    }

    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* result = nullptr;
    std::string port_str = std::to_string(port);
    int status = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &result);
    if (status != 0) {
        LOG_SOCKET_ERROR("Failed to resolve hostname " << host << ": " << gai_strerror(status));
        return INVALID_SOCKET_VALUE;
    }

    socket_t client_socket = INVALID_SOCKET_VALUE;
    for (struct addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        client_socket = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (client_socket == INVALID_SOCKET_VALUE) {
            continue;
        }

        sockaddr_storage target;
        memset(&target, 0, sizeof(target));
        memcpy(&target, ai->ai_addr, ai->ai_addrlen);
        LOG_SOCKET_DEBUG("Connecting to " << format_address(target));

        if (connect(client_socket, ai->ai_addr, ai->ai_addrlen) != SOCKET_ERROR_VALUE) {
            LOG_SOCKET_INFO("Successfully connected to " << format_address(target));
            break;
        }

        LOG_SOCKET_DEBUG("Connection to " << format_address(target) << " failed: " << strerror(errno));
        close_socket(client_socket);
        client_socket = INVALID_SOCKET_VALUE;
    }
    freeaddrinfo(result);

    if (client_socket == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_ERROR("Failed to connect to " << host << ":" << port);
    }
    return client_socket;
}

static socket_t create_tcp_server_v4(int port, int backlog) {
    socket_t server_socket = socket(AF_INET, SOCK_STREAM, 0);
    if (server_socket == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_ERROR("Failed to create server socket");
        return INVALID_SOCKET_VALUE;
    }

    int opt = 1;
    if (setsockopt(server_socket, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to set socket options");
        close_socket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    sockaddr_in server_addr;
    memset(&server_addr, 0, sizeof(server_addr));
    server_addr.sin_family = AF_INET;
    server_addr.sin_addr.s_addr = INADDR_ANY;
    server_addr.sin_port = htons(static_cast<uint16_t>(port));

    if (bind(server_socket, reinterpret_cast<sockaddr*>(&server_addr), sizeof(server_addr)) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to bind server socket to port " << port << ": " << strerror(errno));
        close_socket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    if (listen(server_socket, backlog) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to listen on server socket");
        close_socket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    LOG_SOCKET_INFO("Server listening on port " << get_bound_port(server_socket) << " (IPv4)");
    return server_socket;
}

socket_t create_tcp_server(int port, int backlog) {
    LOG_SOCKET_DEBUG("Creating TCP server socket (dual stack) on port " << port);

    if (port < 0 || port > 65535) {
        LOG_SOCKET_ERROR("Invalid port number: " << port << " (must be 0-65535)");
        return INVALID_SOCKET_VALUE;
    }

    socket_t server_socket = socket(AF_INET6, SOCK_STREAM, 0);
    if (server_socket == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_WARN("IPv6 unavailable, falling back to IPv4");
        return create_tcp_server_v4(port, backlog);
    }

    int opt = 1;
    if (setsockopt(server_socket, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to set dual stack socket options");
        close_socket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    // Disable IPv6-only mode to allow IPv4 connections
    int ipv6_only = 0;
    if (setsockopt(server_socket, IPPROTO_IPV6, IPV6_V6ONLY, &ipv6_only, sizeof(ipv6_only)) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_WARN("Failed to disable IPv6-only mode, will be IPv6 only");
    }

    sockaddr_in6 server_addr;
    memset(&server_addr, 0, sizeof(server_addr));
    server_addr.sin6_family = AF_INET6;
    server_addr.sin6_addr = in6addr_any;
    server_addr.sin6_port = htons(static_cast<uint16_t>(port));

    if (bind(server_socket, reinterpret_cast<sockaddr*>(&server_addr), sizeof(server_addr)) == SOCKET_ERROR_VALUE) {
        int err = errno;
        close_socket(server_socket);
        if (err == EAFNOSUPPORT || err == EADDRNOTAVAIL) {
            LOG_SOCKET_WARN("IPv6 bind unavailable, falling back to IPv4");
            return create_tcp_server_v4(port, backlog);
        }
        LOG_SOCKET_ERROR("Failed to bind dual stack server socket to port " << port << ": " << strerror(err));
        return INVALID_SOCKET_VALUE;
    }

    if (listen(server_socket, backlog) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to listen on dual stack server socket");
        close_socket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    LOG_SOCKET_INFO("Dual stack server listening on port " << get_bound_port(server_socket)
                    << " (backlog: " << backlog << ")");
    return server_socket;
}

socket_t accept_client(socket_t server_socket) {
    sockaddr_storage client_addr;
    socklen_t client_addr_len = sizeof(client_addr);

    socket_t client_socket;
    do {
        client_socket = accept(server_socket, reinterpret_cast<sockaddr*>(&client_addr), &client_addr_len);
    } while (client_socket == INVALID_SOCKET_VALUE && errno == EINTR);

    if (client_socket == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_ERROR("Failed to accept client connection: " << strerror(errno));
        return INVALID_SOCKET_VALUE;
    }

    LOG_SOCKET_INFO("Client connected from " << format_address(client_addr));
    return client_socket;
}

std::string get_peer_address(socket_t socket) {
    sockaddr_storage peer_addr;
    socklen_t peer_addr_len = sizeof(peer_addr);

    if (getpeername(socket, reinterpret_cast<sockaddr*>(&peer_addr), &peer_addr_len) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to get peer address for socket " << socket);
        return "";
    }
    return format_address(peer_addr);
}

int get_bound_port(socket_t socket) {
    sockaddr_storage addr;
    socklen_t addr_len = sizeof(addr);

    if (getsockname(socket, reinterpret_cast<sockaddr*>(&addr), &addr_len) == SOCKET_ERROR_VALUE) {
        return 0;
    }
    if (addr.ss_family == AF_INET) {
        return ntohs(reinterpret_cast<sockaddr_in*>(&addr)->sin_port);
    }
    if (addr.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port);
    }
    return 0;
}

bool create_socket_pair(socket_t& first, socket_t& second) {
    int fds[2];
    if (socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) {
        LOG_SOCKET_ERROR("Failed to create socket pair: " << strerror(errno));
        return false;
    }
    first = fds[0];
    second = fds[1];
    return true;
}

// Common Socket Functions
void close_socket(socket_t socket) {
    if (is_valid_socket(socket)) {
        LOG_SOCKET_DEBUG("Closing socket " << socket);
        ::close(socket);
    }
}

bool is_valid_socket(socket_t socket) {
    return socket != INVALID_SOCKET_VALUE;
}

//=============================================================================
// SocketChannel
//=============================================================================

SocketChannel::SocketChannel(socket_t socket) : socket_(socket) {}

SocketChannel::~SocketChannel() {
    close();
}

size_t SocketChannel::read(uint8_t* buffer, size_t length) {
    if (!is_valid_socket(socket_)) {
        throw TransportError("read on closed channel");
    }

    while (true) {
        ssize_t n = recv(socket_, buffer, length, 0);
        if (n >= 0) {
            return static_cast<size_t>(n);
        }
        if (errno == EINTR) {
            continue;
        }
        throw TransportError(errno_message("receive failed", errno));
    }
}

void SocketChannel::write(const uint8_t* data, size_t length) {
    if (!is_valid_socket(socket_)) {
        throw TransportError("write on closed channel");
    }

    size_t sent = 0;
    while (sent < length) {
        ssize_t n = send(socket_, data + sent, length - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw TransportError(errno_message("send failed", errno));
        }
        sent += static_cast<size_t>(n);
    }
}

void SocketChannel::shutdown_write() {
    if (!is_valid_socket(socket_)) {
        return;
    }
    if (shutdown(socket_, SHUT_WR) == SOCKET_ERROR_VALUE && errno != ENOTCONN) {
        throw TransportError(errno_message("shutdown failed", errno));
    }
}

void SocketChannel::close() {
    if (is_valid_socket(socket_)) {
        close_socket(socket_);
        socket_ = INVALID_SOCKET_VALUE;
    }
}

} // namespace dirpost
