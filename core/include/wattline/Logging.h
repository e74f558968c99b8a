#pragma once

#include <string>

namespace wattline {

/**
 * Minimal engine logging.
 *
 * - Never throws (noexcept API).
 * - Output is serialized by a mutex so concurrent analyses stay readable.
 * - DEBUG/INFO go to stdout, WARN/ERROR to stderr.
 */
enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Set global logging verbosity (default INFO).
void set_log_level(LogLevel lvl) noexcept;

LogLevel get_log_level() noexcept;

void log(LogLevel lvl, const std::string& msg) noexcept;

}  // namespace wattline
