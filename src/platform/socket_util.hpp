#pragma once

// Socket utilities for the libssh2 transport.

#include <poll.h>
#include <string>
#include <core/types.hpp>

using socket_t = int;
#define TETHER_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

// Resolve host and open a non-blocking TCP connection, trying every
// resolved address until one connects or timeout_ms elapses. Name
// resolution counts against the same timeout.
// Errors: HostUnreachable (resolution failed / refused / no route),
// Timeout (no address answered in time).
Outcome<socket_t, ConnectErrorKind> tcp_connect(const std::string& host, int port,
                                                int timeout_ms);

// Turn on TCP keepalive probing for a connected socket.
void enable_tcp_keepalive(socket_t sock);

} // namespace platform
