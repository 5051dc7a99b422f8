// ============================================================================
// block.cpp - implementation for block.hpp
// ============================================================================

#include "tablestream/block.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace tablestream {

uint32_t clock_ticks(double period_us, uint32_t fpga_freq) {
    return static_cast<uint32_t>(std::floor(period_us * 1e-6 * fpga_freq));
}

Block make_counter_block(size_t index, uint32_t start, size_t lines) {
    Block b;
    b.index = index;
    b.content.resize(lines);
    // uint32_t arithmetic wraps at 2^32 the same way the device counter does
    uint32_t v = start + static_cast<uint32_t>(index * lines);
    for (size_t j = 0; j < lines; ++j) b.content[j] = v++;
    b.expected = b.content;
    return b;
}

Block PatternGenerator::make(size_t index, size_t lines) {
    std::uniform_int_distribution<uint32_t> pick(0, PATTERN_MAX_VALUE);

    Block b;
    b.index = index;
    b.content.assign(lines * PATTERN_WORDS_PER_LINE, 0);
    b.expected.resize(lines);
    for (size_t j = 0; j < lines; ++j) {
        const uint32_t val = pick(rng_);
        b.content[j * 4 + 0] = pattern_line_word(val);
        b.content[j * 4 + 1] = 0;
        b.content[j * 4 + 2] = out_ticks_;
        b.content[j * 4 + 3] = 0;
        b.expected[j] = val;
    }
    return b;
}

BlockSchedule make_schedule(std::vector<BlockPtr> pool, size_t nblocks, uint32_t seed) {
    BlockSchedule s;
    s.pool = std::move(pool);
    if (s.pool.empty()) return s;

    s.order.resize(nblocks);
    for (size_t k = 0; k < nblocks; ++k) s.order[k] = k % s.pool.size();
    std::mt19937 rng(seed);
    std::shuffle(s.order.begin(), s.order.end(), rng);
    return s;
}

} // namespace tablestream
