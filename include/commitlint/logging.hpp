#pragma once

#include <string>

namespace commitlint {

enum class LogLevel : int { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Process-wide verbosity (default Warn).
void set_log_level(LogLevel lvl) noexcept;
LogLevel get_log_level() noexcept;

// Writes "[commitlint][LEVEL] msg" to stderr. Never throws.
void log(LogLevel lvl, const std::string& msg) noexcept;

const char* level_tag(LogLevel lvl) noexcept;

} // namespace commitlint
