#pragma once

// POSIX socket utilities.

#include <poll.h>
#include <string>
#include <core/types.hpp>

using socket_t = int;
#define PIPELINE_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking (or back to blocking) mode.
void set_nonblocking(socket_t sock, bool nonblocking = true);

// Poll events on a single socket. Returns revents, 0 on timeout, -1 on error.
// events: POLLIN, POLLOUT, etc. EINTR is retried.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

// Enable SO_KEEPALIVE with short probe intervals.
void enable_keepalive(socket_t sock);

// Resolve host and connect with a timeout. The returned socket is blocking.
Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_secs);

// Bind + listen on host:port (port 0 picks a free one). SO_REUSEADDR is set.
Result<socket_t> listen_tcp(const std::string& host, int port, int backlog = 64);

// Port a bound socket listens on.
int local_port(socket_t sock);

} // namespace platform
