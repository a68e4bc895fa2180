#pragma once

// Cross-platform socket utilities.

#include <string>

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <winsock2.h>
#  include <ws2tcpip.h>
   using socket_t = SOCKET;
#  define VPSX_INVALID_SOCKET INVALID_SOCKET
   // WSAPoll uses the same constants as POSIX poll
#else
#  include <poll.h>
   using socket_t = int;
#  define VPSX_INVALID_SOCKET (-1)
#endif

namespace platform {

// Initialize networking (WSAStartup on Windows, no-op on Unix).
void init_networking();

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

// Resolve host and open a non-blocking TCP connection within timeout_ms.
// On failure returns VPSX_INVALID_SOCKET and fills err.
socket_t connect_tcp(const std::string& host, int port, int timeout_ms, std::string& err);

// Enable TCP keepalive probing on an established socket.
void enable_tcp_keepalive(socket_t sock);

// True if something accepts TCP connections on host:port.
bool is_port_open(int port, const std::string& host = "127.0.0.1");

// True if port can be bound on bind_addr right now.
bool is_port_available(int port, const std::string& bind_addr = "0.0.0.0");

// Primary local IPv4 address (the source address a UDP "connect" toward a
// public address would use; no packets are sent). "127.0.0.1" if unknown.
std::string local_ipv4();

} // namespace platform
