#pragma once

// POSIX socket helpers shared by the tunnel and the HTTP server.

#include <poll.h>
#include <cstddef>
#include <string>
#include <core/types.hpp>

using socket_t = int;
#define DS_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

// Create a listening TCP socket on host:port (port 0 picks a free port).
Result<socket_t> listen_tcp(const std::string& host, int port, int backlog);

// Local port a bound socket ended up on, or -1.
int bound_port(socket_t sock);

// Resolve host and connect with a deadline. The returned socket is non-blocking.
Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms);

// Write the whole buffer to a blocking socket. False once the peer is gone.
bool send_all(socket_t sock, const char* data, size_t len);

} // namespace platform
