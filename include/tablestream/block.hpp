#pragma once
/**
 * @file block.hpp
 * @brief Table blocks and the generators that produce them.
 *
 * A Block is one unit of table data plus the value each of its lines should
 * produce on the capture stream. Blocks are built once, shared read-only
 * (BlockPtr) between the injector and the checkers, and never modified.
 *
 * Two workloads:
 *  - Counter (PGEN): one word per line, the captured value is the word
 *    itself. Block i holds start + i*L + j, wrapping at 2^32.
 *  - Pattern (SEQ): four words per line. The first word packs a random 6-bit
 *    output pattern into bits 20..25 together with the line's repeat count
 *    and trigger; the third word holds the line's output time in ticks.
 *    The captured value is the 6-bit pattern.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>
#include <vector>

namespace tablestream {

struct Block {
    size_t index = 0;                ///< position in the producer's own sequence
    std::vector<uint32_t> content;   ///< table words as uploaded
    std::vector<uint32_t> expected;  ///< one expected capture value per table line

    size_t lines() const { return expected.size(); }
    size_t words_per_line() const { return expected.empty() ? 0 : content.size() / expected.size(); }
};

using BlockPtr = std::shared_ptr<const Block>;

/** Words per table line of each workload. */
static constexpr size_t COUNTER_WORDS_PER_LINE = 1;
static constexpr size_t PATTERN_WORDS_PER_LINE = 4;

/** Largest value a pattern line can output (six output bits). */
static constexpr uint32_t PATTERN_MAX_VALUE = 63;

/** floor(period_us * 1e-6 * fpga_freq): clock period in FPGA ticks. */
uint32_t clock_ticks(double period_us, uint32_t fpga_freq);

/** Counter block @p index of @p lines lines, starting at @p start. */
Block make_counter_block(size_t index, uint32_t start, size_t lines);

/** First word of a pattern line carrying output value @p value. */
inline uint32_t pattern_line_word(uint32_t value) { return 0x20001u | (value << 20); }

class PatternGenerator {
public:
    /** @param out_ticks time of each line's output phase, half the clock period. */
    PatternGenerator(uint32_t seed, uint32_t out_ticks) : rng_(seed), out_ticks_(out_ticks) {}

    Block make(size_t index, size_t lines);

private:
    std::mt19937 rng_;
    uint32_t out_ticks_;
};

/**
 * @brief Pre-generated pool of blocks plus a shared injection order.
 *
 * Used for stress runs that reuse a few blocks many times in shuffled
 * order. Injector and checkers both read `pool[order[k]]` for block k, so
 * no per-block hand-off between them is needed.
 */
struct BlockSchedule {
    std::vector<BlockPtr> pool;
    std::vector<size_t> order;

    const BlockPtr& at(size_t k) const { return pool[order[k % order.size()]]; }
    size_t size() const { return order.size(); }
};

/** Shuffle @p nblocks references over @p pool so every pool entry is used when nblocks >= pool size. */
BlockSchedule make_schedule(std::vector<BlockPtr> pool, size_t nblocks, uint32_t seed);

} // namespace tablestream
