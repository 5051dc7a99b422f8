// ============================================================================
// injector.cpp - implementation for injector.hpp
// ============================================================================

#include "tablestream/injector.hpp"

#include <algorithm>

namespace tablestream {

bool Injector::send(const std::vector<uint32_t>& words, size_t lines, size_t index,
                    size_t total, Error& err) {
    const TableMode mode = mode_for_block(index, total);
    const auto t0 = std::chrono::steady_clock::now();
    if (!client_.put_table(options_.table, words.data(), words.size(), mode, err)) return false;
    const std::chrono::duration<double> dt = std::chrono::steady_clock::now() - t0;

    stats_.send_seconds += dt.count();
    ++stats_.blocks;
    stats_.lines += lines;
    return true;
}

bool Injector::throttle(size_t total, Error& err) {
    if (total <= 1) return true;

    QueueWait w;
    if (!client_.wait_for_table_room(options_.table, threshold(), options_.poll_interval, w, err))
        return false;
    stats_.polls += w.polls;
    stats_.peak_queued = std::max(stats_.peak_queued, w.peak);
    return true;
}

} // namespace tablestream
