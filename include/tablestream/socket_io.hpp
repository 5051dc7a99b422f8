/**
 * @page ts-socket-io tablestream Socket I/O API (Header)
 * @file socket_io.hpp
 * @brief Public API for opening a low-latency TCP connection to the device and moving bytes.
 *
 * @details
 * PURPOSE
 * -------
 * This header declares the minimal surface needed to talk to the instrument
 * over TCP from a Linux host. It pairs with socket_io.cpp for the POSIX work.
 * Both the control channel (text lines, port 8888) and the capture channel
 * (raw words, port 8889) sit on top of these functions.
 *
 * ROLE IN TABLESTREAM
 * -------------------
 * - tablestream::open_tcp: resolve, connect with a bounded timeout, disable Nagle.
 * - tablestream::send_all: write a whole buffer, looping over partial writes.
 * - tablestream::recv_some: block until at least one byte or EOF arrives.
 * - tablestream::shutdown_socket: wake a thread blocked in recv_some.
 * - tablestream::close_socket: close the descriptor cleanly.
 *
 * DESIGN CHOICES
 * --------------
 * - Free functions over a plain int descriptor, no class hierarchy, no hidden threads.
 * - The connect timeout only covers connection establishment. Once connected
 *   the socket is blocking and reads wait as long as the device needs.
 * - TCP_NODELAY is always set: control traffic is small request/response
 *   lines and Nagle's algorithm would add tens of milliseconds per poll.
 *
 * HOW IT FITS TOGETHER
 * --------------------
 *   ControlChannel / CaptureChannel -> open_tcp() -> send_all()/recv_some() -> close_socket()
 *
 * OPERATIONAL NOTES
 * -----------------
 * - A stalled device stalls the reader. The pipeline unblocks stuck readers
 *   on failure with shutdown_socket() from another thread.
 * - SIGPIPE is suppressed per call with MSG_NOSIGNAL so a peer reset shows up
 *   as an error return instead of killing the process.
 *
 * EXAMPLE
 * -------
 * @code
 *   using namespace tablestream;
 *   Error err;
 *   int fd = open_tcp("192.168.1.10", 8888, 3000, err);
 *   if (fd < 0) { // err.kind == ErrorKind::Connection  }
 *
 *   std::string cmd = "*IDN?\n";
 *   send_all(fd, cmd.data(), cmd.size(), err);
 *
 *   char buf[256];
 *   long n = recv_some(fd, buf, sizeof buf, err);  // 0 on orderly close
 *   close_socket(fd);
 * @endcode
 *
 * LIMITATIONS AND TRADE-OFFS
 * --------------------------
 * - IPv4 and IPv6 are both accepted through getaddrinfo; the first address
 *   that connects wins.
 * - Concurrency: do not share a descriptor between threads, except for the
 *   shutdown_socket() wake-up.
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include "tablestream/error.hpp"

namespace tablestream {

/** Default connect timeout for both device ports. */
static constexpr int DEFAULT_CONNECT_TIMEOUT_MS = 3000;

/**
 * @brief Connect to @p host:@p port and return a blocking socket with TCP_NODELAY set.
 *
 * What it does:
 *   - Resolves @p host (name or numeric address).
 *   - Starts a non-blocking connect and waits up to @p connect_timeout_ms for it.
 *   - Switches the socket back to blocking mode for steady-state I/O.
 *   - Disables Nagle's algorithm.
 *
 * @return File descriptor (non-negative) on success, or -1 with @p err set
 *         to ErrorKind::Connection.
 */
int open_tcp(const std::string& host, uint16_t port, int connect_timeout_ms, Error& err);

/**
 * @brief Write all @p n bytes, looping over partial writes and EINTR.
 *
 * @return true when every byte was handed to the kernel; false with @p err
 *         set to ErrorKind::Connection otherwise.
 */
bool send_all(int fd, const void* data, size_t n, Error& err);

/**
 * @brief Block until data or EOF arrives and read at most @p cap bytes.
 *
 * @return Number of bytes read (> 0), 0 when the peer closed the connection,
 *         or -1 with @p err set to ErrorKind::Connection.
 */
long recv_some(int fd, void* out, size_t cap, Error& err);

/**
 * @brief Shut down both directions so a reader blocked in another thread returns.
 *
 * Safe to call on a negative descriptor (no-op). Does not close the descriptor.
 */
void shutdown_socket(int fd);

/**
 * @brief Close a descriptor obtained from open_tcp(). Negative values are a no-op.
 */
void close_socket(int fd);

} // namespace tablestream
