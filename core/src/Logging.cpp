#include "wattline/Logging.h"

#include <atomic>
#include <chrono>
#include <ctime>
#include <exception>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace wattline {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::INFO)};
std::mutex g_log_mu;

const char* level_tag(LogLevel lvl) noexcept {
    switch (lvl) {
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARN:
            return "WARN";
        case LogLevel::ERROR:
            return "ERROR";
    }
    return "INFO";
}

std::string utc_timestamp() {
    using clock = std::chrono::system_clock;
    const std::time_t tt = clock::to_time_t(clock::now());
    std::tm tm{};
    gmtime_r(&tt, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

}  // namespace

void set_log_level(LogLevel lvl) noexcept {
    g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel get_log_level() noexcept {
    return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

/**
 * Writes one "[timestamp][LEVEL] message" line.
 *
 * DEBUG and INFO go to stdout, WARN and ERROR to stderr. Lines below the
 * current level are dropped before the lock is taken. A failed write is
 * ignored so that an analysis never fails because of its log.
 */
void log(LogLevel lvl, const std::string& msg) noexcept {
    if (static_cast<int>(lvl) < g_level.load(std::memory_order_relaxed)) return;
    try {
        std::lock_guard<std::mutex> lk(g_log_mu);
        std::ostream& out = (lvl >= LogLevel::WARN) ? std::cerr : std::cout;
        out << "[" << utc_timestamp() << "][" << level_tag(lvl) << "] " << msg << "\n";
        out.flush();
    } catch (const std::exception&) {
        return;
    }
}

}  // namespace wattline
