#pragma once
/**
 * @file injector.hpp
 * @brief Streams table blocks into a device table with queue-depth backpressure.
 *
 * For block i of N the write mode is Single when N == 1, otherwise
 * StreamingFirst / StreamingContinue / StreamingLast. After every streaming
 * send the injector polls `<table>.QUEUED_LINES` until the device has drained
 * to at most max_blocks_queued * lines_per_block lines, so the device never
 * holds more than that plus the block just sent. A single-block upload
 * never polls.
 *
 * send() and throttle() are separate so the caller can signal "block is on
 * the device" between them; inject() does both.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "tablestream/client.hpp"
#include "tablestream/error.hpp"
#include "tablestream/field.hpp"

namespace tablestream {

struct InjectorOptions {
    FieldPath table;                       ///< e.g. SEQ1.TABLE
    size_t lines_per_block   = 16384;
    size_t max_blocks_queued = 7;
    std::chrono::milliseconds poll_interval{100};
};

struct InjectorStats {
    size_t   blocks       = 0;
    uint64_t lines        = 0;
    size_t   polls        = 0;
    int64_t  peak_queued  = 0;
    double   send_seconds = 0.0;
};

class Injector {
public:
    Injector(Client& client, InjectorOptions options) : client_(client), options_(std::move(options)) {}

    /** Table write of block @p index of @p total. Non-OK acknowledgment -> ErrorKind::Device. */
    bool send(const std::vector<uint32_t>& words, size_t lines, size_t index, size_t total, Error& err);

    /** Backpressure wait after a send. No-op when @p total == 1. */
    bool throttle(size_t total, Error& err);

    bool inject(const std::vector<uint32_t>& words, size_t lines, size_t index, size_t total, Error& err) {
        return send(words, lines, index, total, err) && throttle(total, err);
    }

    /** Queue depth (in lines) at or below which the next block may be sent. */
    int64_t threshold() const {
        return static_cast<int64_t>(options_.max_blocks_queued * options_.lines_per_block);
    }

    const InjectorStats& stats() const { return stats_; }
    const InjectorOptions& options() const { return options_; }

private:
    Client& client_;
    InjectorOptions options_;
    InjectorStats stats_;
};

} // namespace tablestream
