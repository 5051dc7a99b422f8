#include <doctest/doctest.h>
#include "tablestream/capture_channel.hpp"
#include "tablestream/socket_io.hpp"
#include "fake_device.hpp"

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <sys/socket.h>

using namespace tablestream;

namespace {

// One-connection server: records the configuration line, then writes each
// chunk with a short pause so the reader sees several socket reads.
class ScriptedStream {
public:
    explicit ScriptedStream(std::vector<std::vector<uint8_t>> chunks) : chunks_(std::move(chunks)) {
        listen_fd_ = testing::listen_loopback(port_);
        thread_ = std::thread([this] { serve(); });
    }

    ~ScriptedStream() {
        if (thread_.joinable()) thread_.join();
        close_socket(listen_fd_);
    }

    uint16_t port() const { return port_; }
    const std::string& config_line() const { return config_; }

    void join() { if (thread_.joinable()) thread_.join(); }

private:
    void serve() {
        int fd = ::accept(listen_fd_, nullptr, nullptr);
        if (fd < 0) return;
        std::string buf;
        testing::read_line(fd, buf, config_);
        for (const auto& c : chunks_) {
            Error err;
            if (!send_all(fd, c.data(), c.size(), err)) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        close_socket(fd);
    }

    std::vector<std::vector<uint8_t>> chunks_;
    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::string config_;
    std::thread thread_;
};

std::vector<uint8_t> bytes(size_t n, uint8_t start) {
    std::vector<uint8_t> v(n);
    for (size_t i = 0; i < n; ++i) v[i] = static_cast<uint8_t>(start + i);
    return v;
}

} // namespace

TEST_CASE("capture channel sends the raw one-shot configuration") {
    ScriptedStream server({});
    CaptureChannel ch;
    Error err;
    REQUIRE(ch.open("127.0.0.1", server.port(), 1000, err));

    std::vector<uint8_t> out;
    CHECK_FALSE(ch.next(out, err));
    CHECK(err.ok());
    CHECK(ch.finished());
    server.join();
    CHECK(server.config_line() == "UNFRAMED RAW NO_HEADER NO_STATUS ONE_SHOT");
}

TEST_CASE("nbytes mode yields fixed buffers across and within reads, then the residue") {
    ScriptedStream server({bytes(3, 0), bytes(9, 3), bytes(4, 12), bytes(2, 16)});
    CaptureChannel ch(8);
    Error err;
    REQUIRE(ch.open("127.0.0.1", server.port(), 1000, err));

    std::vector<std::vector<uint8_t>> got;
    std::vector<uint8_t> out;
    while (ch.next(out, err)) got.push_back(out);
    REQUIRE(err.ok());

    REQUIRE(got.size() == 3);
    CHECK(got[0] == bytes(8, 0));
    CHECK(got[1] == bytes(8, 8));
    CHECK(got[2] == bytes(2, 16));
    CHECK(ch.bytes_received() == 18);
}

TEST_CASE("word-aligned mode flushes whole words and carries the partial word") {
    ScriptedStream server({bytes(6, 0), bytes(7, 6)});
    CaptureChannel ch;
    Error err;
    REQUIRE(ch.open("127.0.0.1", server.port(), 1000, err));

    std::vector<uint8_t> all, out;
    std::vector<size_t> sizes;
    while (ch.next(out, err)) {
        sizes.push_back(out.size());
        all.insert(all.end(), out.begin(), out.end());
    }
    REQUIRE(err.ok());
    CHECK(all == bytes(13, 0));

    REQUIRE(!sizes.empty());
    for (size_t i = 0; i + 1 < sizes.size(); ++i) CHECK(sizes[i] % 4 == 0);
    CHECK(sizes.back() == 1);   // 13 bytes: the odd byte comes out last, alone
}

TEST_CASE("capture channel reports connection failures") {
    uint16_t port = 0;
    int fd = testing::listen_loopback(port);
    REQUIRE(fd >= 0);
    close_socket(fd);   // nothing listens there any more

    CaptureChannel ch;
    Error err;
    CHECK_FALSE(ch.open("127.0.0.1", port, 1000, err));
    CHECK(err.kind == ErrorKind::Connection);

    std::vector<uint8_t> out;
    err.clear();
    CHECK_FALSE(ch.next(out, err));
    CHECK(err.kind == ErrorKind::Connection);
}
