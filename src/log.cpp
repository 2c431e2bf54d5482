#include "taskgate/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace taskgate {
namespace log {

static std::atomic<bool> g_verbose{false};
static std::mutex g_io;

void set_verbose(bool value) {
    g_verbose.store(value, std::memory_order_relaxed);
}

bool verbose_enabled() {
    return g_verbose.load(std::memory_order_relaxed);
}

void info(const std::string& tag, const std::string& msg) {
    std::lock_guard<std::mutex> lk(g_io);
    std::cout << "[" << tag << "] " << msg << std::endl;
}

void warn(const std::string& tag, const std::string& msg) {
    std::lock_guard<std::mutex> lk(g_io);
    std::cerr << "[" << tag << "] [warn] " << msg << std::endl;
}

void error(const std::string& tag, const std::string& msg) {
    std::lock_guard<std::mutex> lk(g_io);
    std::cerr << "[" << tag << "] [error] " << msg << std::endl;
}

void debug(const std::string& tag, const std::string& msg) {
    if (!verbose_enabled()) return;
    std::lock_guard<std::mutex> lk(g_io);
    std::cout << "[" << tag << "] [debug] " << msg << std::endl;
}

} // namespace log
} // namespace taskgate
