#include "socket_util.hpp"
#include <fmt/format.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <chrono>

namespace platform {

void set_nonblocking(socket_t sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
}

void close_socket(socket_t sock) {
    close(sock);
}

Result<socket_t> listen_tcp(const std::string& host, int port, int backlog) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;

    struct addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    int gai = getaddrinfo(host.empty() ? nullptr : host.c_str(), service.c_str(), &hints, &res);
    if (gai != 0) {
        return Result<socket_t>::Err(fmt::format("Cannot resolve listen address {}: {}",
                                                 host, gai_strerror(gai)));
    }

    std::string last_error = "no usable address";
    for (auto* ai = res; ai; ai = ai->ai_next) {
        socket_t fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last_error = fmt::format("socket() failed: {}", strerror(errno));
            continue;
        }

        int reuse = 1;
        setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

        if (bind(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
            last_error = fmt::format("bind() to {}:{} failed: {}", host, port, strerror(errno));
            close(fd);
            continue;
        }
        if (listen(fd, backlog) < 0) {
            last_error = fmt::format("listen() on {}:{} failed: {}", host, port, strerror(errno));
            close(fd);
            continue;
        }

        freeaddrinfo(res);
        return Result<socket_t>::Ok(fd);
    }

    freeaddrinfo(res);
    return Result<socket_t>::Err(last_error);
}

int bound_port(socket_t sock) {
    struct sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(sock, reinterpret_cast<struct sockaddr*>(&addr), &len) < 0) return -1;
    if (addr.ss_family == AF_INET)
        return ntohs(reinterpret_cast<struct sockaddr_in*>(&addr)->sin_port);
    if (addr.ss_family == AF_INET6)
        return ntohs(reinterpret_cast<struct sockaddr_in6*>(&addr)->sin6_port);
    return -1;
}

Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_NUMERICSERV;

    struct addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (gai != 0) {
        return Result<socket_t>::Err(fmt::format("Failed to resolve host {}: {}",
                                                 host, gai_strerror(gai)));
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    std::string last_error = "no usable address";

    for (auto* ai = res; ai; ai = ai->ai_next) {
        socket_t fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last_error = fmt::format("socket() failed: {}", strerror(errno));
            continue;
        }
        set_nonblocking(fd);

        int ret = connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (ret < 0 && errno != EINPROGRESS) {
            last_error = fmt::format("Failed to connect: {}", strerror(errno));
            close(fd);
            continue;
        }

        // Wait for non-blocking connect to complete
        if (ret < 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            int revents = remaining > 0 ? poll_socket(fd, POLLOUT, static_cast<int>(remaining)) : 0;
            if (revents == 0) {
                close(fd);
                freeaddrinfo(res);
                return Result<socket_t>::Err(fmt::format("Connection timed out: {}:{}", host, port));
            }
            int sock_err = 0;
            socklen_t err_len = sizeof(sock_err);
            getsockopt(fd, SOL_SOCKET, SO_ERROR, &sock_err, &err_len);
            if (sock_err != 0) {
                last_error = fmt::format("Connection failed: {}", strerror(sock_err));
                close(fd);
                continue;
            }
        }

        freeaddrinfo(res);
        return Result<socket_t>::Ok(fd);
    }

    freeaddrinfo(res);
    return Result<socket_t>::Err(last_error);
}

bool send_all(socket_t sock, const char* data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        ssize_t w = send(sock, data + sent, len - sent, MSG_NOSIGNAL);
        if (w < 0 && errno == EINTR) continue;
        if (w <= 0) return false;
        sent += static_cast<size_t>(w);
    }
    return true;
}

} // namespace platform
