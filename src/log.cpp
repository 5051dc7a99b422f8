// ============================================================================
// log.cpp - implementation for log.hpp
// ============================================================================

#include "tablestream/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace tablestream {
namespace log {

static std::mutex       g_out_mutex;
static std::atomic<bool> g_quiet{false};

void info(const std::string& stage, const std::string& fields) {
    if (g_quiet.load()) return;
    std::string line = "stage=" + stage;
    if (!fields.empty()) line += " " + fields;
    line += "\n";

    std::lock_guard<std::mutex> lock(g_out_mutex);
    std::cout << line << std::flush;
}

void error(const std::string& stage, const Error& err) {
    std::string line = "status=error stage=" + stage +
                       " kind=" + to_string(err.kind) +
                       " reason=" + err.message + "\n";

    std::lock_guard<std::mutex> lock(g_out_mutex);
    std::cerr << line << std::flush;
}

void set_quiet(bool q) { g_quiet.store(q); }

bool quiet() { return g_quiet.load(); }

} // namespace log
} // namespace tablestream
