#include "commitlint/logging.hpp"

#include <atomic>
#include <exception>
#include <iostream>
#include <mutex>

namespace commitlint {

static std::atomic<int> g_level{static_cast<int>(LogLevel::Warn)};
static std::mutex g_log_mu;

const char* level_tag(LogLevel lvl) noexcept {
    switch (lvl) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        default:              return "INFO";
    }
}

void set_log_level(LogLevel lvl) noexcept {
    g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel get_log_level() noexcept {
    return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

void log(LogLevel lvl, const std::string& msg) noexcept {
    try {
        if (static_cast<int>(lvl) < g_level.load(std::memory_order_relaxed)) return;

        std::lock_guard<std::mutex> lk(g_log_mu);
        std::cerr << "[commitlint][" << level_tag(lvl) << "] " << msg << "\n";
        std::cerr.flush();
    } catch (const std::exception&) {
        // A failed diagnostic write must not change the exit status.
    }
}

} // namespace commitlint
