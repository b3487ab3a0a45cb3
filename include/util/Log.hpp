// Leveled stderr logging: every line is "sysvet: <message>"
#pragma once

namespace sysvet::util {

enum class LogLevel { Quiet = 0, Warn = 1, Info = 2, Debug = 3 };

// Level comes from SYSVET_LOG_LEVEL (0..3), default Warn. Read once.
[[nodiscard]] LogLevel log_level();
void set_log_level(LogLevel lvl);
[[nodiscard]] bool log_enabled(LogLevel lvl);

void logf(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

} // namespace sysvet::util
