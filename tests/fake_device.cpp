// ============================================================================
// fake_device.cpp - loopback device emulation used by the network tests
// ============================================================================

#include "fake_device.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "tablestream/base64.hpp"
#include "tablestream/error.hpp"
#include "tablestream/socket_io.hpp"
#include "tablestream/table_encoder.hpp"

namespace tablestream {
namespace testing {

int listen_loopback(uint16_t& port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return -1;
    int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    socklen_t len = sizeof(addr);
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
        ::listen(fd, 16) != 0 ||
        ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        ::close(fd);
        return -1;
    }
    port = ntohs(addr.sin_port);
    return fd;
}

bool read_line(int fd, std::string& buf, std::string& line) {
    while (true) {
        size_t nl = buf.find('\n');
        if (nl != std::string::npos) {
            line = buf.substr(0, nl);
            buf.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
        char tmp[4096];
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        buf.append(tmp, static_cast<size_t>(n));
    }
}

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

FakeDevice::FakeDevice(FakeDeviceOptions options) : options_(std::move(options)) {}

FakeDevice::~FakeDevice() { stop(); }

bool FakeDevice::start() {
    control_listen_ = listen_loopback(control_port_);
    capture_listen_ = listen_loopback(capture_port_);
    if (control_listen_ < 0 || capture_listen_ < 0) return false;
    control_thread_ = std::thread(&FakeDevice::accept_control, this);
    capture_thread_ = std::thread(&FakeDevice::accept_capture, this);
    return true;
}

void FakeDevice::stop() {
    if (stopping_.exchange(true)) return;
    {
        std::lock_guard<std::mutex> lock(mtx_);
    }
    cv_.notify_all();

    shutdown_socket(control_listen_);
    shutdown_socket(capture_listen_);
    if (control_thread_.joinable()) control_thread_.join();
    if (capture_thread_.joinable()) capture_thread_.join();

    std::thread runner;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        for (int fd : conn_fds_) shutdown_socket(fd);
        shutdown_socket(capture_fd_);
        runner = std::move(run_thread_);
    }
    if (runner.joinable()) runner.join();
    for (auto& t : conn_threads_) if (t.joinable()) t.join();

    for (int fd : conn_fds_) close_socket(fd);
    close_socket(capture_fd_);
    close_socket(control_listen_);
    close_socket(capture_listen_);
    conn_fds_.clear();
    capture_fd_ = control_listen_ = capture_listen_ = -1;
}

void FakeDevice::populate() {
    std::lock_guard<std::mutex> lock(mtx_);
    fields_["SEQ1.ENABLE"]   = "ZERO";
    fields_["SEQ1.REPEATS"]  = "1";
    fields_["SEQ1.PRESCALE"] = "0";
    fields_["SEQ1.BITA"]     = "ZERO";
    const char* outs[] = {"OUTA", "OUTB", "OUTC", "OUTD", "OUTE", "OUTF"};
    for (int k = 0; k < 6; ++k) {
        fields_[std::string("SEQ1.") + outs[k] + ".OFFSET"] = std::to_string(8 + k);
        fields_[std::string("SEQ1.") + outs[k] + ".CAPTURE_WORD"] = "PCAP.BITS1";
    }
    fields_["PGEN1.ENABLE"]      = "ZERO";
    fields_["PGEN1.REPEATS"]     = "1";
    fields_["PGEN1.OUT.CAPTURE"] = "No";
    fields_["CLOCK1.ENABLE"]     = "ZERO";
    fields_["CLOCK1.PERIOD"]     = "1";
    fields_["PCAP.ENABLE"]       = "ZERO";
    for (int b = 0; b < 4; ++b) fields_["PCAP.BITS" + std::to_string(b) + ".CAPTURE"] = "No";
    fields_["PCAP.TS_TRIG.CAPTURE"] = "No";
}

void FakeDevice::set_field(const std::string& name, const std::string& value) {
    std::lock_guard<std::mutex> lock(mtx_);
    fields_[name] = value;
}

std::string FakeDevice::field(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = fields_.find(name);
    return it == fields_.end() ? std::string() : it->second;
}

bool FakeDevice::has_field(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return fields_.count(name) > 0;
}

std::vector<uint32_t> FakeDevice::table_words(const std::string& table) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = tables_.find(table);
    if (it == tables_.end()) return {};
    return std::vector<uint32_t>(it->second.words.begin(), it->second.words.end());
}

std::vector<std::string> FakeDevice::table_suffixes() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return suffixes_;
}

std::vector<std::string> FakeDevice::enable_writes() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return enables_;
}

std::vector<std::string> FakeDevice::commands() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return commands_;
}

std::string FakeDevice::capture_config() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return capture_config_;
}

// ---------------------------------------------------------------------------
// Connections
// ---------------------------------------------------------------------------

void FakeDevice::accept_control() {
    while (!stopping_) {
        int fd = ::accept(control_listen_, nullptr, nullptr);
        if (fd < 0) {
            if (errno == EINTR) continue;
            return;
        }
        std::lock_guard<std::mutex> lock(mtx_);
        if (stopping_) {
            ::close(fd);
            return;
        }
        conn_fds_.push_back(fd);
        conn_threads_.emplace_back(&FakeDevice::serve, this, fd);
    }
}

void FakeDevice::accept_capture() {
    while (!stopping_) {
        int fd = ::accept(capture_listen_, nullptr, nullptr);
        if (fd < 0) {
            if (errno == EINTR) continue;
            return;
        }
        std::string buf, line;
        if (!read_line(fd, buf, line)) {
            ::close(fd);
            continue;
        }
        std::lock_guard<std::mutex> lock(mtx_);
        close_socket(capture_fd_);
        capture_fd_ = fd;
        capture_config_ = line;
        cv_.notify_all();
    }
}

void FakeDevice::serve(int fd) {
    std::string buf, line;
    while (read_line(fd, buf, line)) {
        const std::string reply = handle(line, fd, buf);
        if (reply.empty()) return;
        Error err;
        if (!send_all(fd, reply.data(), reply.size(), err)) return;
    }
}

std::string FakeDevice::handle(const std::string& line, int fd, std::string& buf) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        commands_.push_back(line);
    }

    if (line == "*CHANGES?") {
        std::lock_guard<std::mutex> lock(mtx_);
        std::string out;
        for (const auto& f : fields_) {
            // attributes are not configuration and never show up in *CHANGES?
            if (ends_with(f.first, ".OFFSET") || ends_with(f.first, ".CAPTURE_WORD")) continue;
            out += "!" + f.first + "=" + f.second + "\n";
        }
        return out + ".\n";
    }
    if (line == "*PCAP.ARM=") {
        ++arms_;
        return "OK\n";
    }
    if (line == "*PCAP.DISARM=") return "OK\n";
    if (line.find('<') != std::string::npos) return handle_table(line, fd, buf);

    if (!line.empty() && line.back() == '?') {
        const std::string name = line.substr(0, line.size() - 1);
        std::lock_guard<std::mutex> lock(mtx_);

        if (ends_with(name, ".QUEUED_LINES")) {
            ++queue_polls_;
            auto it = tables_.find(name.substr(0, name.size() - std::strlen(".QUEUED_LINES")));
            size_t lines = 0;
            if (it != tables_.end()) lines = it->second.words.size() / it->second.words_per_line;
            return "OK =" + std::to_string(lines) + "\n";
        }
        if (ends_with(name, ".ACTIVE")) return std::string("OK =") + (running_ ? "1" : "0") + "\n";

        auto t = tables_.find(name);
        if (t != tables_.end()) {
            std::string out;
            for (uint32_t w : t->second.words) out += "!" + std::to_string(w) + "\n";
            return out + ".\n";
        }
        auto f = fields_.find(name);
        if (f == fields_.end()) return "ERR No such field\n";
        return "OK =" + f->second + "\n";
    }

    const size_t eq = line.find('=');
    if (eq == std::string::npos) return "ERR Unknown command\n";

    const std::string name = line.substr(0, eq);
    const std::string value = line.substr(eq + 1);
    if (options_.reject_writes.count(name)) return "ERR Write rejected\n";

    bool start = false;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        fields_[name] = value;
        if (ends_with(name, ".ENABLE")) {
            enables_.push_back(value);
            const std::string block = name.substr(0, name.size() - std::strlen(".ENABLE"));
            start = value == "ONE" && tables_.count(block + ".TABLE") > 0;
        }
    }
    if (start) start_run(name.substr(0, name.size() - std::strlen(".ENABLE")));
    return "OK\n";
}

std::string FakeDevice::handle_table(const std::string& line, int fd, std::string& buf) {
    const size_t lt = line.find('<');
    const std::string name = line.substr(0, lt);
    std::string suffix = line.substr(lt);
    if (!suffix.empty() && suffix.back() == 'B') suffix.pop_back();

    std::vector<uint32_t> words;
    bool bad = false;
    std::string data;
    while (true) {
        if (!read_line(fd, buf, data)) return std::string();
        if (data.empty()) break;
        std::vector<uint8_t> bytes;
        if (!base64::decode(data, bytes)) bad = true;
        bytes_to_words(bytes.data(), bytes.size(), words);
    }
    if (bad) return "ERR Invalid base64\n";
    if (options_.reject_tables) return "ERR Table write rejected\n";

    std::lock_guard<std::mutex> lock(mtx_);
    Table& t = tables_[name];
    t.words_per_line = name.compare(0, 3, "SEQ") == 0 ? 4 : 1;
    if (suffix == "<") {
        t.words.assign(words.begin(), words.end());
        t.streaming = false;
        t.last_received = true;
    } else if (suffix == "<<" || suffix == "<<|") {
        if (!t.streaming) {
            t.words.clear();
            t.streaming = true;
        }
        t.last_received = suffix == "<<|";
        t.words.insert(t.words.end(), words.begin(), words.end());
    } else {
        return "ERR Unknown table mode " + suffix + "\n";
    }
    suffixes_.push_back(suffix);

    const int64_t queued = static_cast<int64_t>(t.words.size() / t.words_per_line);
    if (queued > peak_queued_) peak_queued_ = queued;
    cv_.notify_all();
    return "OK\n";
}

// ---------------------------------------------------------------------------
// Run
// ---------------------------------------------------------------------------

void FakeDevice::start_run(const std::string& block) {
    std::thread previous;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (running_ || stopping_) return;
        running_ = true;
        previous = std::move(run_thread_);
        run_thread_ = std::thread(&FakeDevice::run, this, block);
    }
    if (previous.joinable()) previous.join();
}

void FakeDevice::run(std::string block) {
    const std::string table = block + ".TABLE";
    const bool seq = block.compare(0, 3, "SEQ") == 0;

    std::vector<unsigned> offsets;
    size_t repeats = 1;
    int fd = -1;
    {
        std::unique_lock<std::mutex> lock(mtx_);
        if (seq) {
            const char* outs[] = {"OUTA", "OUTB", "OUTC", "OUTD", "OUTE", "OUTF"};
            for (const char* o : outs)
                offsets.push_back(static_cast<unsigned>(std::stoul(fields_[block + "." + o + ".OFFSET"])));
        }
        auto r = fields_.find(block + ".REPEATS");
        if (r != fields_.end()) repeats = std::max<size_t>(1, std::stoul(r->second));
        cv_.wait_for(lock, std::chrono::seconds(5), [this] { return capture_fd_ >= 0 || stopping_; });
        fd = capture_fd_;
    }

    std::deque<uint32_t> held;
    uint64_t line_no = 0;
    bool ok = fd >= 0;

    auto capture = [&](const uint32_t* line) {
        uint32_t w = line[0];
        if (seq) {
            const uint32_t v = (line[0] >> 20) & 0x3f;
            w = 0;
            for (size_t k = 0; k < offsets.size(); ++k)
                if (v & (1u << k)) w |= 1u << offsets[k];
        }
        if (static_cast<long>(line_no) == options_.corrupt_line) w ^= seq ? (1u << offsets[0]) : 1u;
        ++line_no;
        held.push_back(w);
    };

    auto flush = [&](size_t keep) {
        std::vector<uint32_t> out;
        while (held.size() > keep) {
            out.push_back(held.front());
            held.pop_front();
        }
        if (out.empty() || !ok) return;
        std::vector<uint8_t> bytes;
        words_to_bytes(out.data(), out.size(), bytes);
        Error err;
        ok = send_all(fd, bytes.data(), bytes.size(), err);
        captured_lines_ += out.size();
    };

    std::vector<uint32_t> single;
    size_t wpl = 1;
    bool streaming = false;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        Table& t = tables_[table];
        wpl = t.words_per_line;
        streaming = t.streaming;
        if (!streaming) single.assign(t.words.begin(), t.words.end());
    }

    if (!streaming) {
        for (size_t r = 0; r < repeats && ok && !stopping_; ++r) {
            for (size_t i = 0; i + wpl <= single.size(); i += wpl) {
                capture(&single[i]);
                if (held.size() >= options_.lines_per_step + options_.drop_tail_lines) {
                    flush(options_.drop_tail_lines);
                    std::this_thread::sleep_for(options_.step_delay);
                }
            }
        }
    } else {
        while (ok && !stopping_) {
            std::vector<uint32_t> step;
            bool done = false;
            {
                std::unique_lock<std::mutex> lock(mtx_);
                Table& t = tables_[table];
                cv_.wait(lock, [&] { return stopping_ || !t.words.empty() || t.last_received; });
                const size_t n = std::min(t.words.size() / wpl, options_.lines_per_step) * wpl;
                step.assign(t.words.begin(), t.words.begin() + static_cast<long>(n));
                t.words.erase(t.words.begin(), t.words.begin() + static_cast<long>(n));
                done = t.words.empty() && t.last_received;
            }
            for (size_t i = 0; i + wpl <= step.size(); i += wpl) capture(&step[i]);
            flush(options_.drop_tail_lines);
            if (done) break;
            std::this_thread::sleep_for(options_.step_delay);
        }
    }

    flush(options_.drop_tail_lines);
    held.clear();   // withheld tail never reaches the capture stream
    for (size_t i = 0; i < options_.extra_lines; ++i) held.push_back(0xffffffffu);
    flush(0);

    running_ = false;
    std::lock_guard<std::mutex> lock(mtx_);
    if (capture_fd_ == fd) {
        close_socket(capture_fd_);
        capture_fd_ = -1;
    }
}

} // namespace testing
} // namespace tablestream
