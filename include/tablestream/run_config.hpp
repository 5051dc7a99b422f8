#pragma once
/**
 * @file run_config.hpp
 * @brief Parameters and outcome of one validation run, with JSON I/O.
 *
 * RunConfig is filled from defaults, then optionally from a JSON file (any
 * subset of keys, same names as the struct members), then from the command
 * line. validate_run_config() must pass before the pipeline touches the wire.
 *
 * @code
 *   { "host": "panda", "nblocks": 64, "lines_per_block": 4096,
 *     "checker_threads": 2, "ordering": "permutation" }
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "tablestream/capture_channel.hpp"
#include "tablestream/client.hpp"
#include "tablestream/error.hpp"

namespace tablestream {

enum class Workload { Seq, Pgen };

/** How checker workers learn which block a capture belongs to. */
enum class Ordering {
    CorrelatedQueues,   ///< expectations travel through expect_q in injection order
    SharedPermutation   ///< fixed block pool and a seeded order shared by all stages
};

const char* to_string(Workload w);
const char* to_string(Ordering o);
bool parse_ordering(const std::string& text, Ordering& out, Error& err);

struct RunConfig {
    Workload workload = Workload::Seq;
    std::string host;
    uint16_t control_port      = CONTROL_PORT;
    uint16_t capture_port      = CAPTURE_PORT;
    int      connect_timeout_ms = DEFAULT_CONNECT_TIMEOUT_MS;

    size_t   repeats           = 1;
    size_t   lines_per_block   = 16384;
    double   clock_period_us   = 0.4;
    uint32_t start_number      = 0;
    size_t   nblocks           = 1;
    uint32_t fpga_freq         = 125000000;
    size_t   max_blocks_queued = 7;
    size_t   checker_threads   = 1;
    size_t   producer_threads  = 1;
    int      poll_interval_ms  = 100;

    Ordering ordering  = Ordering::CorrelatedQueues;
    size_t   pool_size = 4;
    uint32_t seed      = 1;

    bool wait_inactive = true;
};

/** lines_per_block * nblocks * repeats */
uint64_t expected_values(const RunConfig& cfg);

bool validate_run_config(const RunConfig& cfg, Error& err);

/** Override fields of @p cfg present in @p j. Unknown keys and wrong types -> Config error. */
bool apply_run_config_json(const nlohmann::json& j, RunConfig& cfg, Error& err);

/** Read a JSON object from @p path and apply it to @p cfg. */
bool load_run_config(const std::string& path, RunConfig& cfg, Error& err);

nlohmann::json run_config_to_json(const RunConfig& cfg);

struct RunReport {
    bool ok = false;
    Error error;
    std::string failed_stage;

    uint64_t expected_values = 0;
    uint64_t checked_values  = 0;
    uint64_t checked_blocks  = 0;
    uint64_t captured_bytes  = 0;

    size_t   blocks_injected = 0;
    uint64_t lines_injected  = 0;
    size_t   polls           = 0;
    int64_t  peak_queued     = 0;
    double   send_seconds    = 0.0;
    double   elapsed_seconds = 0.0;
    double   values_per_second = 0.0;   ///< checked values over elapsed time
};

/** checked_values / elapsed_seconds, 0 before any time has elapsed. */
double checked_rate(const RunReport& report);

nlohmann::json report_to_json(const RunReport& report);

} // namespace tablestream
