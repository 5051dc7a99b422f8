// ============================================================================
// run_config.cpp - implementation for run_config.hpp
// ============================================================================

#include "tablestream/run_config.hpp"

#include <fstream>
#include <limits>
#include <type_traits>

using nlohmann::json;

namespace tablestream {

const char* to_string(Workload w) {
    return w == Workload::Seq ? "seq" : "pgen";
}

const char* to_string(Ordering o) {
    return o == Ordering::CorrelatedQueues ? "correlated" : "permutation";
}

bool parse_ordering(const std::string& text, Ordering& out, Error& err) {
    if (text == "correlated")  { out = Ordering::CorrelatedQueues;  return true; }
    if (text == "permutation") { out = Ordering::SharedPermutation; return true; }
    return err.set(ErrorKind::Config, "unknown ordering: " + text);
}

uint64_t expected_values(const RunConfig& cfg) {
    return static_cast<uint64_t>(cfg.lines_per_block) * cfg.nblocks * cfg.repeats;
}

bool validate_run_config(const RunConfig& cfg, Error& err) {
    if (cfg.host.empty())             return err.set(ErrorKind::Config, "host is empty");
    if (cfg.nblocks < 1)              return err.set(ErrorKind::Config, "nblocks must be >= 1");
    if (cfg.lines_per_block < 1)      return err.set(ErrorKind::Config, "lines_per_block must be >= 1");
    if (cfg.repeats < 1)              return err.set(ErrorKind::Config, "repeats must be >= 1");
    if (cfg.repeats != 1 && cfg.nblocks != 1)
        return err.set(ErrorKind::Config, "repeats and nblocks cannot both be set");
    if (cfg.checker_threads < 1)      return err.set(ErrorKind::Config, "checker_threads must be >= 1");
    if (cfg.producer_threads < 1)     return err.set(ErrorKind::Config, "producer_threads must be >= 1");
    if (cfg.nblocks % cfg.producer_threads != 0)
        return err.set(ErrorKind::Config, "nblocks must be divisible by producer_threads");
    if (cfg.max_blocks_queued < 1)    return err.set(ErrorKind::Config, "max_blocks_queued must be >= 1");
    if (cfg.poll_interval_ms < 0)     return err.set(ErrorKind::Config, "poll_interval_ms must be >= 0");
    if (!(cfg.clock_period_us > 0.0)) return err.set(ErrorKind::Config, "clock_period_us must be > 0");
    if (cfg.fpga_freq == 0)           return err.set(ErrorKind::Config, "fpga_freq must be > 0");
    if (cfg.ordering == Ordering::SharedPermutation && cfg.pool_size < 1)
        return err.set(ErrorKind::Config, "pool_size must be >= 1");
    return true;
}

// Typed read of one optional key. nlohmann throws type_error on mismatch.
template <typename T>
static void read_key(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end()) out = it->get<T>();
}

// Integer keys are range-checked against the member type; nlohmann's own
// conversion would wrap -1 into SIZE_MAX.
template <typename T>
static bool read_int(const json& j, const char* key, T& out, Error& err) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_number_integer())
        return err.set(ErrorKind::Config, std::string(key) + " must be an integer");

    using limits = std::numeric_limits<T>;
    bool in_range = true;
    if (it->is_number_unsigned()) {
        in_range = it->get<uint64_t>() <= static_cast<uint64_t>(limits::max());
    } else {
        const int64_t v = it->get<int64_t>();
        in_range = v >= 0 ? static_cast<uint64_t>(v) <= static_cast<uint64_t>(limits::max())
                          : !std::is_unsigned<T>::value && v >= static_cast<int64_t>(limits::min());
    }
    if (!in_range)
        return err.set(ErrorKind::Config, std::string(key) + " out of range: " + it->dump() + " (" +
                                          std::to_string(limits::min()) + ".." +
                                          std::to_string(limits::max()) + ")");
    out = it->get<T>();
    return true;
}

bool apply_run_config_json(const json& j, RunConfig& cfg, Error& err) {
    if (!j.is_object()) return err.set(ErrorKind::Config, "run config must be a JSON object");

    static const char* const KNOWN[] = {
        "workload", "host", "control_port", "capture_port", "connect_timeout_ms",
        "repeats", "lines_per_block", "clock_period_us", "start_number", "nblocks",
        "fpga_freq", "max_blocks_queued", "checker_threads", "producer_threads",
        "poll_interval_ms", "ordering", "pool_size", "seed", "wait_inactive"};
    for (auto it = j.begin(); it != j.end(); ++it) {
        bool known = false;
        for (const char* k : KNOWN) known = known || it.key() == k;
        if (!known) return err.set(ErrorKind::Config, "unknown run config key: " + it.key());
    }

    try {
        RunConfig c = cfg;
        std::string workload = to_string(c.workload);
        std::string ordering = to_string(c.ordering);
        read_key(j, "workload", workload);
        read_key(j, "host", c.host);
        read_key(j, "clock_period_us", c.clock_period_us);
        read_key(j, "ordering", ordering);
        read_key(j, "wait_inactive", c.wait_inactive);
        if (!read_int(j, "control_port", c.control_port, err) ||
            !read_int(j, "capture_port", c.capture_port, err) ||
            !read_int(j, "connect_timeout_ms", c.connect_timeout_ms, err) ||
            !read_int(j, "repeats", c.repeats, err) ||
            !read_int(j, "lines_per_block", c.lines_per_block, err) ||
            !read_int(j, "start_number", c.start_number, err) ||
            !read_int(j, "nblocks", c.nblocks, err) ||
            !read_int(j, "fpga_freq", c.fpga_freq, err) ||
            !read_int(j, "max_blocks_queued", c.max_blocks_queued, err) ||
            !read_int(j, "checker_threads", c.checker_threads, err) ||
            !read_int(j, "producer_threads", c.producer_threads, err) ||
            !read_int(j, "poll_interval_ms", c.poll_interval_ms, err) ||
            !read_int(j, "pool_size", c.pool_size, err) ||
            !read_int(j, "seed", c.seed, err))
            return false;

        if (workload == "seq")       c.workload = Workload::Seq;
        else if (workload == "pgen") c.workload = Workload::Pgen;
        else return err.set(ErrorKind::Config, "unknown workload: " + workload);
        if (!parse_ordering(ordering, c.ordering, err)) return false;

        cfg = c;
        return true;
    } catch (const json::exception& e) {
        return err.set(ErrorKind::Config, std::string("bad run config value: ") + e.what());
    }
}

bool load_run_config(const std::string& path, RunConfig& cfg, Error& err) {
    std::ifstream in(path);
    if (!in) return err.set(ErrorKind::Config, "cannot open run config: " + path);

    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        return err.set(ErrorKind::Config, path + ": " + e.what());
    }
    return apply_run_config_json(j, cfg, err);
}

json run_config_to_json(const RunConfig& cfg) {
    json j;
    j["workload"]           = to_string(cfg.workload);
    j["host"]               = cfg.host;
    j["control_port"]       = cfg.control_port;
    j["capture_port"]       = cfg.capture_port;
    j["connect_timeout_ms"] = cfg.connect_timeout_ms;
    j["repeats"]            = cfg.repeats;
    j["lines_per_block"]    = cfg.lines_per_block;
    j["clock_period_us"]    = cfg.clock_period_us;
    j["start_number"]       = cfg.start_number;
    j["nblocks"]            = cfg.nblocks;
    j["fpga_freq"]          = cfg.fpga_freq;
    j["max_blocks_queued"]  = cfg.max_blocks_queued;
    j["checker_threads"]    = cfg.checker_threads;
    j["producer_threads"]   = cfg.producer_threads;
    j["poll_interval_ms"]   = cfg.poll_interval_ms;
    j["ordering"]           = to_string(cfg.ordering);
    j["pool_size"]          = cfg.pool_size;
    j["seed"]               = cfg.seed;
    j["wait_inactive"]      = cfg.wait_inactive;
    return j;
}

double checked_rate(const RunReport& r) {
    if (r.elapsed_seconds <= 0.0) return 0.0;
    return static_cast<double>(r.checked_values) / r.elapsed_seconds;
}

json report_to_json(const RunReport& r) {
    json j;
    j["status"]          = r.ok ? "ok" : "error";
    j["expected_values"] = r.expected_values;
    j["checked_values"]  = r.checked_values;
    j["checked_blocks"]  = r.checked_blocks;
    j["captured_bytes"]  = r.captured_bytes;
    j["blocks_injected"] = r.blocks_injected;
    j["lines_injected"]  = r.lines_injected;
    j["polls"]           = r.polls;
    j["peak_queued"]     = r.peak_queued;
    j["send_s"]          = r.send_seconds;
    j["elapsed_s"]       = r.elapsed_seconds;
    j["values_per_s"]    = r.values_per_second;
    if (!r.ok) {
        j["kind"]   = to_string(r.error.kind);
        j["stage"]  = r.failed_stage;
        j["reason"] = r.error.message;
    }
    return j;
}

} // namespace tablestream
