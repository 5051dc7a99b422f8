#pragma once
/**
 * @page ts-pipeline tablestream Validation Pipeline
 * @file pipeline.hpp
 * @brief Concurrent producer / injector / capture / checker run against one device.
 *
 * @details
 * STAGES
 * ------
 * Every stage is a thread. Stages that talk to the device open their own
 * Client, so no connection is shared between threads.
 *
 * @code
 *   producers --block_q--> injector --(table writes)--> device
 *                              |                          |
 *                          expect_q                 capture stream
 *                              v                          v
 *                          checkers <----capture_q---- capture reader
 * @endcode
 *
 * All queues hold 16 items. The injector sets `first_block_ready` once the
 * first block is on the device; the capture reader sets `capture_armed`
 * once its stream is open and PCAP is armed. run() waits for both and then
 * pulses `<instance>.ENABLE` ZERO then ONE.
 *
 * ORDERING
 * --------
 * CorrelatedQueues: expectations are queued in injection order, and a
 * checker pops one capture and one expectation while holding the checker
 * mutex, so pairs never cross between workers.
 * SharedPermutation: a pool of pre-built blocks and a seeded order are
 * fixed before start; capture k is checked against pool[order[k]] and
 * expect_q is unused.
 *
 * TERMINATION AND FAILURE
 * -----------------------
 * The capture reader ends when the device closes the stream, pushes one
 * sentinel per checker and compares the captured total to
 * lines_per_block * nblocks * repeats. The first stage to fail records its
 * error; every queue is closed, both signals set, and every attached socket
 * shut down so no stage stays blocked. The report always carries counts.
 */

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "tablestream/block.hpp"
#include "tablestream/bounded_queue.hpp"
#include "tablestream/capture_channel.hpp"
#include "tablestream/checker.hpp"
#include "tablestream/client.hpp"
#include "tablestream/injector.hpp"
#include "tablestream/layout.hpp"
#include "tablestream/run_config.hpp"

namespace tablestream {

class Pipeline {
public:
    explicit Pipeline(RunConfig cfg);

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    /** Configure the device, run all stages to completion, and report. */
    RunReport run();

private:
    struct CaptureItem {
        size_t index = 0;
        std::vector<uint32_t> words;
        bool last = false;   // sentinel, one per checker
    };

    bool setup(Client& control, Error& err);
    bool enable(Client& control, Error& err);
    bool wait_inactive(Client& control, Error& err);

    void produce(size_t producer);
    void inject();
    void capture();
    void check();

    Block make_block(size_t index, PatternGenerator& gen) const;
    ClientOptions client_options() const;
    size_t words_per_line() const;

    void fail(const std::string& stage, const Error& err);
    bool failed();

    /** Register for shutdown on failure. false if the run has already failed. */
    bool attach(Client* client);
    bool attach(CaptureChannel* channel);
    void detach(Client* client);
    void detach(CaptureChannel* channel);

    RunConfig cfg_;
    std::string instance_;     // SEQ1 / PGEN1
    FieldPath table_;
    SeqCaptureMap seq_map_;
    std::unique_ptr<Checker> checker_;
    BlockSchedule schedule_;

    BoundedQueue<BlockPtr> block_q_;
    BoundedQueue<BlockPtr> expect_q_;
    BoundedQueue<CaptureItem> capture_q_;
    OneShotSignal first_block_ready_;
    OneShotSignal capture_armed_;
    std::mutex check_mtx_;

    std::mutex fail_mtx_;
    bool failed_ = false;
    Error error_;
    std::string failed_stage_;
    std::set<Client*> clients_;
    std::set<CaptureChannel*> channels_;

    InjectorStats inject_stats_;
    std::atomic<uint64_t> captured_values_{0};
    std::atomic<uint64_t> captured_bytes_{0};
};

/** Convenience wrapper: Pipeline(cfg).run(). */
RunReport run_pipeline(const RunConfig& cfg);

} // namespace tablestream
