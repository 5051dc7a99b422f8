// ============================================================================
// capture_channel.cpp - implementation for capture_channel.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "tablestream/capture_channel.hpp"
#include "tablestream/socket_io.hpp"

namespace tablestream {

// Large reads keep up with the device's sustained rate.
static constexpr size_t RECV_CHUNK = 1 << 17;

CaptureChannel::~CaptureChannel() { close(); }

bool CaptureChannel::open(const std::string& host, uint16_t port, int connect_timeout_ms,
                          Error& err, const std::string& config_line) {
    close();
    fd_ = open_tcp(host, port, connect_timeout_ms, err);
    if (fd_ < 0) return false;

    const std::string line = config_line + "\n";
    if (!send_all(fd_, line.data(), line.size(), err)) {
        close();
        return false;
    }
    eof_ = false;
    bytes_received_ = 0;
    pending_.clear();
    return true;
}

void CaptureChannel::close() {
    close_socket(fd_);
    fd_ = -1;
}

void CaptureChannel::shutdown() { shutdown_socket(fd_); }

bool CaptureChannel::take_ready(std::vector<uint8_t>& out) {
    if (nbytes_ > 0) {
        if (pending_.size() < nbytes_) return false;
        out.assign(pending_.begin(), pending_.begin() + nbytes_);
        pending_.erase(pending_.begin(), pending_.begin() + nbytes_);
        return true;
    }

    const size_t aligned = pending_.size() & ~size_t(3);
    if (aligned == 0) return false;
    out.assign(pending_.begin(), pending_.begin() + aligned);
    pending_.erase(pending_.begin(), pending_.begin() + aligned);
    return true;
}

bool CaptureChannel::next(std::vector<uint8_t>& out, Error& err) {
    out.clear();
    if (recv_buf_.size() != RECV_CHUNK) recv_buf_.resize(RECV_CHUNK);

    while (true) {
        if (take_ready(out)) return true;

        if (eof_) {
            if (pending_.empty()) return false;   // end of stream
            out.swap(pending_);                   // residue, once
            pending_.clear();
            return true;
        }

        if (fd_ < 0) return err.set(ErrorKind::Connection, "capture channel not open");
        long n = recv_some(fd_, recv_buf_.data(), recv_buf_.size(), err);
        if (n < 0) return false;
        if (n == 0) {
            eof_ = true;
            continue;
        }
        bytes_received_ += static_cast<uint64_t>(n);
        pending_.insert(pending_.end(), recv_buf_.begin(), recv_buf_.begin() + n);
    }
}

} // namespace tablestream
