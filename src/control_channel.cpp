// ============================================================================
// control_channel.cpp - implementation for control_channel.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "tablestream/control_channel.hpp"

namespace tablestream {

// Matches the device side receive granularity; responses are usually tiny.
static constexpr size_t RECV_CHUNK = 4096;

ControlChannel::~ControlChannel() { close(); }

bool ControlChannel::connect(const std::string& host, uint16_t port,
                             int connect_timeout_ms, Error& err) {
    close();
    fd_ = open_tcp(host, port, connect_timeout_ms, err);
    return fd_ >= 0;
}

void ControlChannel::close() {
    close_socket(fd_);
    fd_ = -1;
    buffer_.clear();
}

void ControlChannel::shutdown() { shutdown_socket(fd_); }

bool ControlChannel::send(const std::vector<std::string>& lines, Error& err) {
    if (fd_ < 0) return err.set(ErrorKind::Connection, "control channel not connected");

    std::string out;
    size_t total = 0;
    for (const auto& l : lines) total += l.size() + 1;
    out.reserve(total);
    for (const auto& l : lines) {
        out += l;
        out += '\n';
    }
    return send_all(fd_, out.data(), out.size(), err);
}

bool ControlChannel::fill(Error& err) {
    if (fd_ < 0) return err.set(ErrorKind::Connection, "control channel not connected");

    char chunk[RECV_CHUNK];
    long n = recv_some(fd_, chunk, sizeof chunk, err);
    if (n < 0) return false;
    if (n == 0) return err.set(ErrorKind::Connection, "control connection closed by device");
    buffer_.append(chunk, static_cast<size_t>(n));
    return true;
}

bool ControlChannel::receive_one_line(std::string& out, Error& err) {
    size_t nl;
    while ((nl = buffer_.find('\n')) == std::string::npos) {
        if (!fill(err)) return false;
    }
    out = buffer_.substr(0, nl + 1);
    buffer_.erase(0, nl + 1);
    return true;
}

bool ControlChannel::receive_until_terminator(std::string& out, Error& err) {
    out.clear();
    std::string line;
    while (true) {
        if (!receive_one_line(line, err)) return false;
        out += line;
        if (line == ".\n" || line == ".\r\n") return true;
    }
}

bool ControlChannel::request(const std::vector<std::string>& lines, std::string& raw, Error& err) {
    if (!send(lines, err)) return false;
    if (!receive_one_line(raw, err)) return false;

    // A list answer keeps going until the "." line; a lone "." is an empty list.
    if (!raw.empty() && raw[0] == '!') {
        std::string rest;
        if (!receive_until_terminator(rest, err)) return false;
        raw += rest;
    }
    return true;
}

} // namespace tablestream
