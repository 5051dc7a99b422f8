#pragma once
/**
 * @file capture_channel.hpp
 * @brief Reader for the device's raw capture stream.
 *
 * The capture port streams little-endian 32-bit words after the client
 * sends one configuration line. With `ONE_SHOT` the device closes the
 * connection when the acquisition ends, which is how the reader learns the
 * stream is complete.
 *
 * next() hands out buffers one at a time:
 *  - nbytes mode (nbytes > 0): every buffer is exactly nbytes long, possibly
 *    assembled from several socket reads or cut from one large read, so one
 *    buffer is one logical block.
 *  - word-aligned mode (nbytes == 0): after each socket read the 4-byte
 *    aligned part of what has accumulated is flushed and the partial word is
 *    carried over to the next read.
 * When the device closes the connection any leftover bytes are returned
 * once, then next() reports end of stream.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "tablestream/error.hpp"

namespace tablestream {

/** Configuration line selecting unframed raw words with no header, one acquisition. */
static constexpr const char* CAPTURE_RAW_ONE_SHOT = "UNFRAMED RAW NO_HEADER NO_STATUS ONE_SHOT";

class CaptureChannel {
public:
    /** @param nbytes fixed buffer size; 0 selects word-aligned flushing. */
    explicit CaptureChannel(size_t nbytes = 0) : nbytes_(nbytes) {}
    ~CaptureChannel();

    CaptureChannel(const CaptureChannel&) = delete;
    CaptureChannel& operator=(const CaptureChannel&) = delete;

    /** Connect, disable Nagle, and send @p config_line followed by '\n'. */
    bool open(const std::string& host, uint16_t port, int connect_timeout_ms,
              Error& err, const std::string& config_line = CAPTURE_RAW_ONE_SHOT);

    /**
     * @brief Next buffer of the stream.
     *
     * @return true with @p out filled; false at end of stream (err.ok())
     *         or on a socket failure (ErrorKind::Connection).
     */
    bool next(std::vector<uint8_t>& out, Error& err);

    void close();

    /** Wake a thread blocked in next(). */
    void shutdown();

    bool finished() const { return eof_ && pending_.empty(); }
    uint64_t bytes_received() const { return bytes_received_; }

private:
    bool take_ready(std::vector<uint8_t>& out);   // emit from pending_ if a buffer is ready

    int fd_{-1};
    size_t nbytes_;
    bool eof_{false};
    uint64_t bytes_received_{0};
    std::vector<uint8_t> pending_;
    std::vector<uint8_t> recv_buf_;
};

} // namespace tablestream
