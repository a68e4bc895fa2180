#include "socket_util.hpp"
#include <cstring>
#include <cerrno>

#ifdef _WIN32
#  include <winsock2.h>
#  include <ws2tcpip.h>
#else
#  include <sys/socket.h>
#  include <netinet/in.h>
#  include <netinet/tcp.h>
#  include <arpa/inet.h>
#  include <netdb.h>
#  include <fcntl.h>
#  include <poll.h>
#  include <unistd.h>
#endif

namespace platform {

void init_networking() {
#ifdef _WIN32
    static bool initialized = false;
    if (!initialized) {
        WSADATA wsa;
        WSAStartup(MAKEWORD(2, 2), &wsa);
        initialized = true;
    }
#endif
}

void set_nonblocking(socket_t sock) {
#ifdef _WIN32
    u_long mode = 1;
    ioctlsocket(sock, FIONBIO, &mode);
#else
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
#endif
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
#ifdef _WIN32
    WSAPOLLFD pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = WSAPoll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#else
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#endif
}

void close_socket(socket_t sock) {
#ifdef _WIN32
    closesocket(sock);
#else
    close(sock);
#endif
}

socket_t connect_tcp(const std::string& host, int port, int timeout_ms, std::string& err) {
    init_networking();

    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);

    int gai = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (gai != 0 || !res) {
        err = "Failed to resolve host: " + host;
        return VPSX_INVALID_SOCKET;
    }

    socket_t sock = VPSX_INVALID_SOCKET;
    err = "Connection failed: " + host;
    for (struct addrinfo* ai = res; ai; ai = ai->ai_next) {
        sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock == VPSX_INVALID_SOCKET) continue;

        set_nonblocking(sock);

        int ret = connect(sock, ai->ai_addr, static_cast<socklen_t>(ai->ai_addrlen));
#ifdef _WIN32
        bool pending = ret < 0 && WSAGetLastError() == WSAEWOULDBLOCK;
#else
        bool pending = ret < 0 && errno == EINPROGRESS;
#endif
        if (ret < 0 && !pending) {
            err = "Failed to connect: " + std::string(strerror(errno));
            close_socket(sock);
            sock = VPSX_INVALID_SOCKET;
            continue;
        }

        // Wait for non-blocking connect to complete
        if (pending) {
            int revents = poll_socket(sock, POLLOUT, timeout_ms);
            if (revents == 0) {
                err = "Connection timed out: " + host;
                close_socket(sock);
                sock = VPSX_INVALID_SOCKET;
                continue;
            }
            int sock_err = 0;
            socklen_t err_len = sizeof(sock_err);
            getsockopt(sock, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&sock_err), &err_len);
            if (sock_err != 0) {
                err = "Connection failed: " + std::string(strerror(sock_err));
                close_socket(sock);
                sock = VPSX_INVALID_SOCKET;
                continue;
            }
        }
        break;
    }

    freeaddrinfo(res);
    if (sock != VPSX_INVALID_SOCKET) err.clear();
    return sock;
}

void enable_tcp_keepalive(socket_t sock) {
    int tcp_keepalive = 1;
    setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, reinterpret_cast<const char*>(&tcp_keepalive), sizeof(tcp_keepalive));
    int keepidle = 60;
    int keepintvl = 15;
    int keepcnt = 4;
#ifdef TCP_KEEPIDLE
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPIDLE, reinterpret_cast<const char*>(&keepidle), sizeof(keepidle));
#endif
#ifdef TCP_KEEPINTVL
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPINTVL, reinterpret_cast<const char*>(&keepintvl), sizeof(keepintvl));
#endif
#ifdef TCP_KEEPCNT
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPCNT, reinterpret_cast<const char*>(&keepcnt), sizeof(keepcnt));
#endif
}

bool is_port_open(int port, const std::string& host) {
    init_networking();
    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) return false;
    socket_t sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock == VPSX_INVALID_SOCKET) return false;
    int rc = connect(sock, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    close_socket(sock);
    return rc == 0;
}

bool is_port_available(int port, const std::string& bind_addr) {
    init_networking();
    socket_t sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock == VPSX_INVALID_SOCKET) return false;

    int reuse = 1;
    setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&reuse), sizeof(reuse));

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (inet_pton(AF_INET, bind_addr.c_str(), &addr.sin_addr) != 1) {
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
    }

    bool ok = bind(sock, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0 &&
              listen(sock, 1) == 0;
    close_socket(sock);
    return ok;
}

std::string local_ipv4() {
    init_networking();
    socket_t sock = socket(AF_INET, SOCK_DGRAM, 0);
    if (sock == VPSX_INVALID_SOCKET) return "127.0.0.1";

    struct sockaddr_in remote{};
    remote.sin_family = AF_INET;
    remote.sin_port = htons(80);
    inet_pton(AF_INET, "8.8.8.8", &remote.sin_addr);

    std::string result = "127.0.0.1";
    if (connect(sock, reinterpret_cast<struct sockaddr*>(&remote), sizeof(remote)) == 0) {
        struct sockaddr_in local{};
        socklen_t len = sizeof(local);
        if (getsockname(sock, reinterpret_cast<struct sockaddr*>(&local), &len) == 0) {
            char buf[INET_ADDRSTRLEN] = {0};
            if (inet_ntop(AF_INET, &local.sin_addr, buf, sizeof(buf)) &&
                std::strcmp(buf, "0.0.0.0") != 0) {
                result = buf;
            }
        }
    }
    close_socket(sock);
    return result;
}

} // namespace platform
