#pragma once
/**
 * @file log.hpp
 * @brief Line-oriented status output shared by pipeline stages.
 *
 * Output format follows the CLI convention of whitespace separated
 * `key=value` tokens, so the lines stay greppable from shell scripts:
 *
 * @code
 *   stage=seq block=3 lines=16384 wait_s=0.002 send_s=0.041
 *   status=error kind=device_error reason=No such field
 * @endcode
 *
 * Several stages run on their own threads and print concurrently. Every
 * call formats the full line first and writes it under one mutex so lines
 * never interleave.
 */

#include <string>

#include "tablestream/error.hpp"

namespace tablestream {
namespace log {

/** Print `stage=<stage> <fields>` on stdout unless quiet mode is on. */
void info(const std::string& stage, const std::string& fields);

/** Print `status=error stage=<stage> kind=<kind> reason=<message>` on stderr. Never silenced. */
void error(const std::string& stage, const Error& err);

/** Silence info() output. Used by the test binary to keep doctest output readable. */
void set_quiet(bool quiet);

bool quiet();

} // namespace log
} // namespace tablestream
