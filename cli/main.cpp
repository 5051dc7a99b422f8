/**
 * @file main.cpp
 * @brief tablestream CLI: validation runs and one-off field access against a device.
 *
 * Subcommands:
 *  - seq  <host> [options]   stream random SEQ tables, check captured output bits
 *  - pgen <host> [options]   stream counter PGEN tables, check captured words
 *  - get  <host> <field|pattern>
 *  - put  <host> <field> <value>
 *
 * Run parameters come from defaults, then --config <file.json>, then flags
 * given on the command line (last wins). --format json prints the run report
 * (or field values) as JSON and silences per-stage status lines.
 *
 * Exit status: 0 success, 1 verification failure, 2 bad arguments or config,
 * 3 connection failure, 4 device error, 5 protocol error.
 */

#include <cstdio>
#include <cstdint>
#include <functional>
#include <iomanip>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

#include <unistd.h> // isatty

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "tablestream/client.hpp"
#include "tablestream/log.hpp"
#include "tablestream/pipeline.hpp"
#include "tablestream/run_config.hpp"

using json = nlohmann::json;
using namespace tablestream;

// ---------- small utilities ----------

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

struct Ansi {
  bool enabled{true};
  std::string bold (const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim  (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string red  (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
  std::string green(const std::string& s) const { return enabled ? "\033[32m"+s+"\033[0m" : s; }
};

// A command-line flag that overrides one RunConfig member when given.
struct FieldOverride {
  CLI::Option* opt;
  std::function<void(RunConfig&, const RunConfig&)> apply;
};

template <typename T>
static void add_field(CLI::App* sub, RunConfig& flags, std::vector<FieldOverride>& out,
                      const std::string& name, T RunConfig::*field, const std::string& help) {
  CLI::Option* opt = sub->add_option(name, flags.*field, help);
  out.push_back({opt, [field](RunConfig& dst, const RunConfig& src) { dst.*field = src.*field; }});
}

static json value_to_json(const Value& v) {
  if (auto i = std::get_if<int64_t>(&v)) return *i;
  if (auto d = std::get_if<double>(&v))  return *d;
  if (auto l = std::get_if<IntList>(&v)) return *l;
  return value_to_string(v);
}

static void print_report_pretty(const RunReport& r, const Ansi& ansi) {
  auto row = [](const char* k, const std::string& v) {
    std::cout << "  " << std::left << std::setw(18) << k << v << "\n";
  };
  std::cout << (r.ok ? ansi.green(ansi.bold("PASS")) : ansi.red(ansi.bold("FAIL"))) << "\n";
  row("checked values",  std::to_string(r.checked_values) + " / " + std::to_string(r.expected_values));
  row("checked blocks",  std::to_string(r.checked_blocks));
  row("captured bytes",  std::to_string(r.captured_bytes));
  row("blocks injected", std::to_string(r.blocks_injected));
  row("lines injected",  std::to_string(r.lines_injected));
  row("queue polls",     std::to_string(r.polls));
  row("peak queued",     std::to_string(r.peak_queued));
  row("send time (s)",   std::to_string(r.send_seconds));
  row("elapsed (s)",     std::to_string(r.elapsed_seconds));
  row("values / s",      std::to_string(r.values_per_second));
  if (!r.ok) {
    row("failed stage", r.failed_stage);
    row("error",        std::string(to_string(r.error.kind)) + ": " + r.error.message);
  }
}

static int exit_code(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None:         return 0;
    case ErrorKind::Verification: return 1;
    case ErrorKind::Config:       return 2;
    case ErrorKind::Connection:   return 3;
    case ErrorKind::Device:       return 4;
    case ErrorKind::Protocol:     return 5;
  }
  return 1;
}

static int fail_with(const std::string& stage, const Error& err) {
  log::error(stage, err);
  return exit_code(err.kind);
}

// ---------- subcommands ----------

static int cmd_run(Workload workload, const RunConfig& flags, const std::vector<FieldOverride>& overrides,
                   const std::string& config_path, const std::string& ordering, bool no_wait_inactive,
                   bool json_out, const Ansi& ansi) {
  RunConfig cfg;
  cfg.workload = workload;
  Error err;
  if (!config_path.empty() && !load_run_config(config_path, cfg, err)) return fail_with("config", err);
  cfg.workload = workload;
  for (const auto& o : overrides)
    if (o.opt->count() > 0) o.apply(cfg, flags);
  if (!ordering.empty() && !parse_ordering(ordering, cfg.ordering, err)) return fail_with("config", err);
  if (no_wait_inactive) cfg.wait_inactive = false;
  if (!validate_run_config(cfg, err)) return fail_with("config", err);

  RunReport report = run_pipeline(cfg);
  if (json_out) {
    json j = report_to_json(report);
    j["config"] = run_config_to_json(cfg);
    std::cout << j.dump(2) << "\n";
  } else {
    print_report_pretty(report, ansi);
  }
  return report.ok ? 0 : exit_code(report.error.kind);
}

static int cmd_get(const std::string& host, const std::string& what, bool json_out) {
  Client client(host);
  Error err;
  if (!client.connect(err)) return fail_with("get", err);

  std::vector<std::string> names;
  if (!client.expand_names(what, names, err)) return fail_with("get", err);

  json j = json::object();
  for (const auto& name : names) {
    Value v;
    if (!client.get(FieldPath::parse(name), v, err)) return fail_with("get", err);
    if (json_out) j[name] = value_to_json(v);
    else          std::cout << name << " = " << value_to_string(v) << "\n";
  }
  if (json_out) std::cout << j.dump(2) << "\n";
  return 0;
}

static int cmd_put(const std::string& host, const std::string& field, const std::string& value,
                   bool json_out) {
  Client client(host);
  Error err;
  if (!client.connect(err)) return fail_with("put", err);
  if (!client.put(FieldPath::parse(field), value, err)) return fail_with("put", err);

  if (json_out) std::cout << json{{"status", "ok"}, {"field", field}}.dump() << "\n";
  else          std::cout << "OK\n";
  return 0;
}

// ---------- main ----------

int main(int argc, char** argv) {
  std::string opt_format = "pretty"; // pretty|json
  bool opt_no_color = false;
  bool opt_quiet = false;

  CLI::App app{"tablestream: table streaming client and validation runner"};
  app.require_subcommand(1);
  app.add_option("--format", opt_format, "Output format: pretty|json")->check(CLI::IsMember({"pretty","json"}));
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");
  app.add_flag("-q,--quiet", opt_quiet, "Suppress per-stage status lines");

  // seq / pgen share every run option
  RunConfig flags;
  std::vector<FieldOverride> overrides;
  std::string opt_config;
  std::string opt_ordering;
  bool opt_no_wait_inactive = false;

  auto add_run_options = [&](CLI::App* sub) {
    add_field(sub, flags, overrides, "host", &RunConfig::host, "Device host name or address");
    add_field(sub, flags, overrides, "--control-port", &RunConfig::control_port, "Control port");
    add_field(sub, flags, overrides, "--capture-port", &RunConfig::capture_port, "Capture port");
    add_field(sub, flags, overrides, "--connect-timeout-ms", &RunConfig::connect_timeout_ms, "TCP connect timeout");
    add_field(sub, flags, overrides, "--repeats", &RunConfig::repeats, "Device table repeats (single block only)");
    add_field(sub, flags, overrides, "--lines-per-block", &RunConfig::lines_per_block, "Table lines per block");
    add_field(sub, flags, overrides, "--clock-period-us", &RunConfig::clock_period_us, "Clock period in microseconds");
    add_field(sub, flags, overrides, "--start-number", &RunConfig::start_number, "First counter value (pgen)");
    add_field(sub, flags, overrides, "--nblocks", &RunConfig::nblocks, "Number of blocks to stream");
    add_field(sub, flags, overrides, "--fpga-freq", &RunConfig::fpga_freq, "FPGA clock frequency in Hz");
    add_field(sub, flags, overrides, "--max-blocks-queued", &RunConfig::max_blocks_queued, "Device queue bound in blocks");
    add_field(sub, flags, overrides, "--checker-threads", &RunConfig::checker_threads, "Checker worker threads");
    add_field(sub, flags, overrides, "--producer-threads", &RunConfig::producer_threads, "Producer threads");
    add_field(sub, flags, overrides, "--poll-interval-ms", &RunConfig::poll_interval_ms, "Queue depth poll interval");
    add_field(sub, flags, overrides, "--pool-size", &RunConfig::pool_size, "Block pool size (permutation)");
    add_field(sub, flags, overrides, "--seed", &RunConfig::seed, "Random seed");
    sub->add_option("--ordering", opt_ordering, "Block ordering: correlated|permutation")
        ->check(CLI::IsMember({"correlated","permutation"}));
    sub->add_option("--config", opt_config, "JSON run config file")->check(CLI::ExistingFile);
    sub->add_flag("--no-wait-inactive", opt_no_wait_inactive, "Do not wait for ACTIVE=0 after the run");
  };

  CLI::App* seq  = app.add_subcommand("seq",  "Stream SEQ tables and verify captured output bits");
  CLI::App* pgen = app.add_subcommand("pgen", "Stream PGEN counter tables and verify captured words");
  add_run_options(seq);
  add_run_options(pgen);

  std::string opt_host, opt_field, opt_value;
  CLI::App* get = app.add_subcommand("get", "Read a field, or every field matching a regex");
  get->add_option("host", opt_host, "Device host")->required();
  get->add_option("field", opt_field, "Field path or pattern")->required();

  CLI::App* put = app.add_subcommand("put", "Write a field");
  put->add_option("host", opt_host, "Device host")->required();
  put->add_option("field", opt_field, "Field path")->required();
  put->add_option("value", opt_value, "Value")->required();

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  const bool json_out = opt_format == "json";
  Ansi ansi;
  ansi.enabled = !opt_no_color && is_tty_stdout() && !json_out;
  log::set_quiet(opt_quiet || json_out);

  if (*seq || *pgen) {
    return cmd_run(*seq ? Workload::Seq : Workload::Pgen, flags, overrides, opt_config,
                   opt_ordering, opt_no_wait_inactive, json_out, ansi);
  }
  if (*get) return cmd_get(opt_host, opt_field, json_out);
  if (*put) return cmd_put(opt_host, opt_field, opt_value, json_out);
  return 2;
}
