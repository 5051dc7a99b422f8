// ============================================================================
// pipeline.cpp - implementation for pipeline.hpp
// For the stage diagram and failure model see the matching .hpp.
// ============================================================================

#include "tablestream/pipeline.hpp"

#include <chrono>
#include <iomanip>
#include <memory>
#include <sstream>
#include <thread>
#include <utility>

#include "tablestream/log.hpp"
#include "tablestream/table_encoder.hpp"

namespace tablestream {

static std::string fixed3(double v) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(3) << v;
    return os.str();
}

Pipeline::Pipeline(RunConfig cfg) : cfg_(std::move(cfg)) {}

RunReport run_pipeline(const RunConfig& cfg) {
    Pipeline p(cfg);
    return p.run();
}

ClientOptions Pipeline::client_options() const {
    ClientOptions o;
    o.control_port       = cfg_.control_port;
    o.capture_port       = cfg_.capture_port;
    o.connect_timeout_ms = cfg_.connect_timeout_ms;
    return o;
}

size_t Pipeline::words_per_line() const {
    return cfg_.workload == Workload::Seq ? PATTERN_WORDS_PER_LINE : COUNTER_WORDS_PER_LINE;
}

Block Pipeline::make_block(size_t index, PatternGenerator& gen) const {
    if (cfg_.workload == Workload::Pgen)
        return make_counter_block(index, cfg_.start_number, cfg_.lines_per_block);
    return gen.make(index, cfg_.lines_per_block);
}

// ---------------------------------------------------------------------------
// Failure propagation
// ---------------------------------------------------------------------------

void Pipeline::fail(const std::string& stage, const Error& err) {
    {
        std::lock_guard<std::mutex> lock(fail_mtx_);
        if (failed_) return;
        failed_ = true;
        error_ = err;
        failed_stage_ = stage;

        for (Client* c : clients_) c->shutdown();
        for (CaptureChannel* ch : channels_) ch->shutdown();
    }
    log::error(stage, err);

    block_q_.close();
    expect_q_.close();
    capture_q_.close();
    first_block_ready_.set();
    capture_armed_.set();
}

bool Pipeline::failed() {
    std::lock_guard<std::mutex> lock(fail_mtx_);
    return failed_;
}

bool Pipeline::attach(Client* client) {
    std::lock_guard<std::mutex> lock(fail_mtx_);
    if (failed_) return false;
    clients_.insert(client);
    return true;
}

bool Pipeline::attach(CaptureChannel* channel) {
    std::lock_guard<std::mutex> lock(fail_mtx_);
    if (failed_) return false;
    channels_.insert(channel);
    return true;
}

void Pipeline::detach(Client* client) {
    std::lock_guard<std::mutex> lock(fail_mtx_);
    clients_.erase(client);
}

void Pipeline::detach(CaptureChannel* channel) {
    std::lock_guard<std::mutex> lock(fail_mtx_);
    channels_.erase(channel);
}

// ---------------------------------------------------------------------------
// Stages
// ---------------------------------------------------------------------------

void Pipeline::produce(size_t producer) {
    const size_t n = cfg_.nblocks / cfg_.producer_threads;
    PatternGenerator gen(cfg_.seed + static_cast<uint32_t>(producer),
                         clock_ticks(cfg_.clock_period_us, cfg_.fpga_freq) / 2);

    for (size_t i = 0; i < n; ++i) {
        auto block = std::make_shared<const Block>(make_block(producer * n + i, gen));
        const uint32_t first = block->expected.empty() ? 0 : block->expected.front();
        if (!block_q_.push(std::move(block))) return;
        log::info("producer", "id=" + std::to_string(producer) + " local_block=" +
                              std::to_string(i) + " first=" + std::to_string(first));
    }
}

void Pipeline::inject() {
    const std::string stage = to_string(cfg_.workload);
    Error err;
    Client client(cfg_.host, client_options());
    if (!client.connect(err)) return fail(stage, err);
    if (!attach(&client)) return;

    InjectorOptions opts;
    opts.table             = table_;
    opts.lines_per_block   = cfg_.lines_per_block;
    opts.max_blocks_queued = cfg_.max_blocks_queued;
    opts.poll_interval     = std::chrono::milliseconds(cfg_.poll_interval_ms);
    Injector injector(client, opts);

    const bool correlated = cfg_.ordering == Ordering::CorrelatedQueues;
    const size_t total = cfg_.nblocks;
    uint64_t line = 0;
    BlockPtr block;

    for (size_t i = 0; i < total; ++i) {
        const auto t0 = std::chrono::steady_clock::now();
        if (correlated) {
            if (!block_q_.pop(block)) break;
            if (!expect_q_.push(block)) break;
        } else {
            block = schedule_.at(i);
        }
        const std::chrono::duration<double> waited = std::chrono::steady_clock::now() - t0;

        if (!injector.send(block->content, block->lines(), i, total, err)) {
            fail(stage, err);
            break;
        }
        if (i == 0) first_block_ready_.set();
        log::info(stage, "block=" + std::to_string(i) + " line=" + std::to_string(line) +
                         " mode=" + to_string(mode_for_block(i, total)) +
                         " wait_s=" + fixed3(waited.count()));
        line += block->lines();

        if (!injector.throttle(total, err)) {
            fail(stage, err);
            break;
        }
    }

    // The device replays a single table `repeats` times; each replay is
    // checked against the same expectation.
    if (correlated && block && !failed()) {
        for (size_t r = 1; r < cfg_.repeats; ++r)
            if (!expect_q_.push(block)) break;
    }

    inject_stats_ = injector.stats();
    detach(&client);
}

void Pipeline::capture() {
    const std::string stage = "pcap";
    Error err;
    Client client(cfg_.host, client_options());
    if (!client.connect(err)) return fail(stage, err);
    if (!attach(&client)) return;

    const std::string capture_field =
        cfg_.workload == Workload::Seq
            ? "PCAP.BITS" + std::to_string(seq_map_.bits_word) + ".CAPTURE"
            : instance_ + ".OUT.CAPTURE";

    CaptureChannel channel(cfg_.lines_per_block * 4);
    if (!client.disable_captures(err) ||
        !client.put(FieldPath::parse(capture_field), "Value", err) ||
        !channel.open(cfg_.host, cfg_.capture_port, cfg_.connect_timeout_ms, err)) {
        detach(&client);
        return fail(stage, err);
    }
    if (!attach(&channel)) {
        detach(&client);
        return;
    }
    if (!client.arm(err)) {
        detach(&channel);
        detach(&client);
        return fail(stage, err);
    }
    capture_armed_.set();

    const size_t expected_blocks = cfg_.nblocks * cfg_.repeats;
    std::vector<uint8_t> buf;
    size_t n = 0;
    bool ok = true;
    while (channel.next(buf, err)) {
        if (buf.size() % 4 != 0) {
            err.set(ErrorKind::Verification, "capture stream ended inside a word (" +
                                             std::to_string(buf.size()) + " bytes in block " +
                                             std::to_string(n) + ")");
            ok = false;
            break;
        }
        if (n >= expected_blocks) {
            err.set(ErrorKind::Verification, "device captured more than " +
                                             std::to_string(expected_blocks) + " blocks");
            ok = false;
            break;
        }

        CaptureItem item;
        item.index = n++;
        bytes_to_words(buf.data(), buf.size(), item.words);
        captured_values_ += item.words.size();
        captured_bytes_ += buf.size();
        log::info(stage, "block=" + std::to_string(item.index) + " bytes=" + std::to_string(buf.size()));
        if (!capture_q_.push(std::move(item))) {
            ok = false;
            break;
        }
    }
    detach(&channel);
    detach(&client);

    if (!ok || !err.ok()) {
        if (!err.ok()) fail(stage, err);
        return;
    }

    for (size_t k = 0; k < cfg_.checker_threads; ++k) {
        CaptureItem sentinel;
        sentinel.last = true;
        if (!capture_q_.push(std::move(sentinel))) return;
    }

    const uint64_t expected = expected_values(cfg_);
    if (captured_values_ != expected) {
        err.set(ErrorKind::Verification, "pcap: expected " + std::to_string(expected) +
                                         " values, got " + std::to_string(captured_values_.load()));
        fail(stage, err);
    }
}

void Pipeline::check() {
    const bool correlated = cfg_.ordering == Ordering::CorrelatedQueues;
    while (true) {
        CaptureItem item;
        BlockPtr block;
        {
            std::lock_guard<std::mutex> lock(check_mtx_);
            if (!capture_q_.pop(item) || item.last) return;
            if (correlated && !expect_q_.pop(block)) return;
        }
        if (!correlated) block = schedule_.at(item.index);

        Error err;
        if (!checker_->check(item.index, item.words, block->expected, err)) return fail("check", err);
        log::info("check", "block=" + std::to_string(item.index) +
                           " line=" + std::to_string(item.index * cfg_.lines_per_block) +
                           " first=" + (block->expected.empty() ? std::string("-")
                                                                : std::to_string(block->expected.front())) +
                           " checked=" + std::to_string(checker_->checked_values()));
    }
}

// ---------------------------------------------------------------------------
// Orchestration
// ---------------------------------------------------------------------------

bool Pipeline::setup(Client& control, Error& err) {
    const char* prefix = cfg_.workload == Workload::Seq ? "SEQ" : "PGEN";
    if (!require_instance(control, prefix, instance_, err)) return false;
    table_ = FieldPath::parse(instance_).child("TABLE");

    if (cfg_.workload == Workload::Seq) {
        if (!configure_seq_layout(control, err)) return false;
        if (!read_seq_offsets(control, seq_map_, err)) return false;
        checker_ = std::make_unique<Checker>(bit_extract_decoder(seq_map_.offsets));
    } else {
        if (!configure_pgen_layout(control, err)) return false;
        checker_ = std::make_unique<Checker>(identity_decoder());
    }

    if (!control.put(FieldPath::parse(instance_).child("REPEATS"), std::to_string(cfg_.repeats), err))
        return false;
    if (!set_clock_period(control, cfg_.clock_period_us, cfg_.fpga_freq, err)) return false;

    if (cfg_.ordering == Ordering::SharedPermutation) {
        PatternGenerator gen(cfg_.seed, clock_ticks(cfg_.clock_period_us, cfg_.fpga_freq) / 2);
        std::vector<BlockPtr> pool;
        for (size_t k = 0; k < cfg_.pool_size; ++k)
            pool.push_back(std::make_shared<const Block>(make_block(k, gen)));
        schedule_ = make_schedule(std::move(pool), cfg_.nblocks, cfg_.seed);
    }

    const double bytes_per_line = static_cast<double>(words_per_line() * 4);
    const double mib = 1024.0 * 1024.0;
    log::info("run", std::string("workload=") + to_string(cfg_.workload) +
                     " instance=" + instance_ +
                     " lines_per_block=" + std::to_string(cfg_.lines_per_block) +
                     " nblocks=" + std::to_string(cfg_.nblocks) +
                     " repeats=" + std::to_string(cfg_.repeats) +
                     " clock_period_us=" + fixed3(cfg_.clock_period_us) +
                     " bandwidth_mib_s=" + fixed3(bytes_per_line / (cfg_.clock_period_us * 1e-6) / mib) +
                     " total_mib=" + fixed3(cfg_.lines_per_block * cfg_.nblocks * bytes_per_line / mib));
    return true;
}

bool Pipeline::enable(Client& control, Error& err) {
    const FieldPath en = FieldPath::parse(instance_).child("ENABLE");
    return control.put(en, "ZERO", err) && control.put(en, "ONE", err);
}

bool Pipeline::wait_inactive(Client& control, Error& err) {
    const FieldPath active = FieldPath::parse(instance_).child("ACTIVE");
    while (true) {
        int64_t v = 0;
        if (!control.get_int(active, v, err)) return false;
        if (v == 0) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(cfg_.poll_interval_ms));
    }
}

RunReport Pipeline::run() {
    RunReport report;
    report.expected_values = expected_values(cfg_);

    Error err;
    if (!validate_run_config(cfg_, err)) {
        log::error("config", err);
        report.error = err;
        report.failed_stage = "config";
        return report;
    }

    Client control(cfg_.host, client_options());
    if (!control.connect(err) || !setup(control, err)) {
        log::error("setup", err);
        report.error = err;
        report.failed_stage = "setup";
        return report;
    }
    attach(&control);

    const auto t0 = std::chrono::steady_clock::now();
    std::vector<std::thread> threads;
    threads.emplace_back(&Pipeline::capture, this);
    for (size_t k = 0; k < cfg_.checker_threads; ++k) threads.emplace_back(&Pipeline::check, this);
    threads.emplace_back(&Pipeline::inject, this);
    if (cfg_.ordering == Ordering::CorrelatedQueues)
        for (size_t p = 0; p < cfg_.producer_threads; ++p) threads.emplace_back(&Pipeline::produce, this, p);

    first_block_ready_.wait();
    capture_armed_.wait();
    if (!failed() && !enable(control, err)) fail("enable", err);

    for (auto& t : threads) t.join();

    if (!failed()) {
        const uint64_t checked = checker_->checked_values();
        if (checked != report.expected_values) {
            err.set(ErrorKind::Verification, "checked " + std::to_string(checked) +
                                             " values, expected " + std::to_string(report.expected_values));
            fail("check", err);
        }
    }
    if (!failed() && cfg_.wait_inactive && !wait_inactive(control, err)) fail("run", err);
    detach(&control);

    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - t0;
    {
        std::lock_guard<std::mutex> lock(fail_mtx_);
        report.ok = !failed_;
        report.error = error_;
        report.failed_stage = failed_stage_;
    }
    report.checked_values  = checker_->checked_values();
    report.checked_blocks  = checker_->checked_blocks();
    report.captured_bytes  = captured_bytes_;
    report.blocks_injected = inject_stats_.blocks;
    report.lines_injected  = inject_stats_.lines;
    report.polls           = inject_stats_.polls;
    report.peak_queued     = inject_stats_.peak_queued;
    report.send_seconds    = inject_stats_.send_seconds;
    report.elapsed_seconds = elapsed.count();
    report.values_per_second = checked_rate(report);

    if (report.ok)
        log::info("run", "status=ok checked=" + std::to_string(report.checked_values) +
                         " expected=" + std::to_string(report.expected_values) +
                         " elapsed_s=" + fixed3(report.elapsed_seconds) +
                         " values_per_s=" + fixed3(report.values_per_second) +
                         " mib_s=" + fixed3(report.values_per_second * 4 / (1024.0 * 1024.0)));
    return report;
}

} // namespace tablestream
