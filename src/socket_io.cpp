// ============================================================================
// socket_io.cpp - implementation for socket_io.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file socket_io.cpp
 */

#include "tablestream/socket_io.hpp"

// POSIX socket headers for low-level TCP handling
#include <fcntl.h>         // fcntl O_NONBLOCK toggling around connect
#include <netdb.h>         // getaddrinfo / freeaddrinfo / gai_strerror
#include <netinet/in.h>    // IPPROTO_TCP
#include <netinet/tcp.h>   // TCP_NODELAY
#include <poll.h>          // poll(2) for the bounded connect wait
#include <sys/socket.h>    // socket, connect, send, recv, shutdown
#include <unistd.h>        // close

#include <cerrno>
#include <cstring>         // strerror

namespace tablestream {

// ---------------------------------------------------------------------------
// set_blocking()
// --------------
// Toggle O_NONBLOCK on a descriptor. Returns false if fcntl fails.
// ---------------------------------------------------------------------------
static bool set_blocking(int fd, bool blocking) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    return ::fcntl(fd, F_SETFL, flags) == 0;
}


// ---------------------------------------------------------------------------
// connect_with_timeout()
// ----------------------
// Non-blocking connect, then poll for writability up to timeout_ms and read
// SO_ERROR to learn whether the handshake succeeded.
//
// Returns: 0 on success, otherwise an errno value.
// ---------------------------------------------------------------------------
static int connect_with_timeout(int fd, const sockaddr* addr, socklen_t len, int timeout_ms) {
    if (!set_blocking(fd, false)) return errno;

    if (::connect(fd, addr, len) == 0) return 0;     // immediate (loopback)
    if (errno != EINPROGRESS) return errno;

    pollfd pfd{fd, POLLOUT, 0};
    int pr;
    do {
        pr = ::poll(&pfd, 1, timeout_ms);
    } while (pr < 0 && errno == EINTR);
    if (pr == 0) return ETIMEDOUT;
    if (pr < 0)  return errno;

    int so_err = 0;
    socklen_t so_len = sizeof(so_err);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_err, &so_len) != 0) return errno;
    return so_err;
}


// ---------------------------------------------------------------------------
// open_tcp()
// ----------
// Resolve host, try each address until one connects inside the timeout,
// restore blocking mode, and disable Nagle.
// ---------------------------------------------------------------------------
int open_tcp(const std::string& host, uint16_t port, int connect_timeout_ms, Error& err) {
    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* res = nullptr;
    const std::string port_str = std::to_string(port);
    int gai = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (gai != 0) {
        err.set(ErrorKind::Connection,
                "resolve " + host + ": " + ::gai_strerror(gai));
        return -1;
    }

    int last_errno = 0;
    int fd = -1;
    for (addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) { last_errno = errno; continue; }

        int rc = connect_with_timeout(fd, ai->ai_addr, ai->ai_addrlen, connect_timeout_ms);
        if (rc == 0 && set_blocking(fd, true)) break;   // connected

        last_errno = rc ? rc : errno;
        ::close(fd);
        fd = -1;
    }
    ::freeaddrinfo(res);

    if (fd < 0) {
        err.set(ErrorKind::Connection,
                "connect " + host + ":" + port_str + ": " + std::strerror(last_errno));
        return -1;
    }

    // Small control messages: do not let the kernel coalesce them.
    int one = 1;
    if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) != 0) {
        int e = errno;
        ::close(fd);
        err.set(ErrorKind::Connection, std::string("TCP_NODELAY: ") + std::strerror(e));
        return -1;
    }
    return fd;
}


// ---------------------------------------------------------------------------
// send_all()
// ----------
// Loop until every byte is written. EINTR restarts; anything else is fatal.
// ---------------------------------------------------------------------------
bool send_all(int fd, const void* data, size_t n, Error& err) {
    const char* p = static_cast<const char*>(data);
    while (n > 0) {
        ssize_t w = ::send(fd, p, n, MSG_NOSIGNAL);
        if (w < 0) {
            if (errno == EINTR) continue;
            return err.set(ErrorKind::Connection, std::string("send: ") + std::strerror(errno));
        }
        p += w;
        n -= static_cast<size_t>(w);
    }
    return true;
}


// ---------------------------------------------------------------------------
// recv_some()
// -----------
// One blocking recv. 0 means orderly close by the peer.
// ---------------------------------------------------------------------------
long recv_some(int fd, void* out, size_t cap, Error& err) {
    while (true) {
        ssize_t r = ::recv(fd, out, cap, 0);
        if (r >= 0) return static_cast<long>(r);
        if (errno == EINTR) continue;
        err.set(ErrorKind::Connection, std::string("recv: ") + std::strerror(errno));
        return -1;
    }
}


void shutdown_socket(int fd) {
    if (fd >= 0) ::shutdown(fd, SHUT_RDWR);
}


void close_socket(int fd) {
    if (fd >= 0) ::close(fd);
}

} // namespace tablestream
