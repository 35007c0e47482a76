#include "slidewatch/core/logging.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace slidewatch {
namespace log {

namespace {
std::atomic<bool> g_verbose{false};
std::mutex g_stream_mutex;
}

void set_verbose(bool verbose) { g_verbose.store(verbose); }

bool is_verbose() { return g_verbose.load(); }

void info(const std::string& tag, const std::string& message) {
    if (!g_verbose.load()) {
        return;
    }
    std::lock_guard<std::mutex> lock(g_stream_mutex);
    std::cout << "[" << tag << "] " << message << std::endl;
}

void error(const std::string& tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(g_stream_mutex);
    std::cerr << "[" << tag << "] " << message << std::endl;
}

} // namespace log
} // namespace slidewatch
