#pragma once
/**
 * @page ts-control-channel tablestream Control Channel
 * @file control_channel.hpp
 * @brief Line framing for the device's textual request/response protocol.
 *
 * @details
 * PURPOSE
 * -------
 * The control port speaks newline-terminated text. Most requests get one
 * response line; list reads (`!`-prefixed) and the `*CHANGES?` snapshot get
 * many lines closed by a line holding only ".". A table write is itself a
 * multi-line request: the open command, one base64 line per chunk, and a
 * blank line.
 *
 * ControlChannel owns exactly one TCP connection and one receive buffer.
 * Bytes that arrive past the end of the current response stay buffered for
 * the next read, so back-to-back responses are never merged or lost.
 *
 * CONTRACT
 * --------
 * - send(lines): every line is written followed by '\n', all lines of one
 *   call in one send. Nothing is batched across calls.
 * - receive_one_line(): bytes up to and including the next '\n'.
 * - receive_until_terminator(): lines up to and including a "." line.
 * - request(): send one command and read one complete response, following
 *   on into the terminator read when the first line starts with '!'.
 *
 * Reads block with no deadline once connected. If the device never answers
 * the caller hangs; shutdown() from another thread is the only way out.
 *
 * EXAMPLE
 * -------
 * @code
 *   tablestream::ControlChannel ch;
 *   tablestream::Error err;
 *   if (!ch.connect("panda", 8888, 3000, err)) { ... }
 *
 *   std::string raw;
 *   ch.request({"SEQ1.TABLE.QUEUED_LINES?"}, raw, err);   // raw == "OK =0\n"
 * @endcode
 */

#include <cstdint>
#include <string>
#include <vector>

#include "tablestream/error.hpp"
#include "tablestream/socket_io.hpp"

namespace tablestream {

/** Default control port of the device. */
static constexpr uint16_t CONTROL_PORT = 8888;

class ControlChannel {
public:
    ControlChannel() = default;
    ~ControlChannel();

    ControlChannel(const ControlChannel&) = delete;
    ControlChannel& operator=(const ControlChannel&) = delete;

    bool connect(const std::string& host, uint16_t port, int connect_timeout_ms, Error& err);
    void close();
    bool is_open() const { return fd_ >= 0; }

    /** Wake a thread blocked in a read on this channel. The channel stays unusable afterwards. */
    void shutdown();

    bool send(const std::vector<std::string>& lines, Error& err);

    /** One line including its '\n'. Connection error if the peer closes first. */
    bool receive_one_line(std::string& out, Error& err);

    /** All lines up to and including the "." terminator line. */
    bool receive_until_terminator(std::string& out, Error& err);

    /** Send @p lines and read one complete response into @p raw. */
    bool request(const std::vector<std::string>& lines, std::string& raw, Error& err);

private:
    bool fill(Error& err);   // one recv into buffer_

    int fd_{-1};
    std::string buffer_;
};

} // namespace tablestream
