#pragma once
/**
 * @file checker.hpp
 * @brief Comparison of captured words against the values a block should produce.
 *
 * The capture stream carries one 32-bit word per table line. A WordDecoder
 * turns that raw word into the value the line was meant to output:
 *  - identity: PGEN captures its own table words.
 *  - bit extraction: SEQ outputs OUTA..OUTF land at six bit offsets of one
 *    PCAP BITS word; value bit k comes from offset[k].
 *
 * Checker holds the counters shared by all checker workers of a run.
 */

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

#include "tablestream/error.hpp"

namespace tablestream {

using WordDecoder = std::function<uint32_t(uint32_t)>;

/** Number of SEQ outputs (OUTA..OUTF). */
static constexpr size_t SEQ_OUTPUTS = 6;

using SeqOffsets = std::array<unsigned, SEQ_OUTPUTS>;

WordDecoder identity_decoder();

/** Gather bit offsets[k] of the captured word into bit k of the result. */
WordDecoder bit_extract_decoder(const SeqOffsets& offsets);

/**
 * @brief Compare one captured block against its expected values.
 *
 * @param block      block number on the capture stream (for messages)
 * @param captured   raw words as captured
 * @param expected   expected decoded values, one per line
 * @return false with ErrorKind::Verification on a length mismatch or on the
 *         first differing line; the message names block, line and values.
 */
bool check_block(size_t block, const std::vector<uint32_t>& captured,
                 const std::vector<uint32_t>& expected, const WordDecoder& decode,
                 Error& err);

class Checker {
public:
    explicit Checker(WordDecoder decode) : decode_(std::move(decode)) {}

    /** check_block() plus counters. Safe to call from several threads. */
    bool check(size_t block, const std::vector<uint32_t>& captured,
               const std::vector<uint32_t>& expected, Error& err);

    uint64_t checked_values() const { return checked_values_.load(); }
    uint64_t checked_blocks() const { return checked_blocks_.load(); }

private:
    WordDecoder decode_;
    std::atomic<uint64_t> checked_values_{0};
    std::atomic<uint64_t> checked_blocks_{0};
};

} // namespace tablestream
