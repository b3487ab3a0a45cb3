#include "util/Log.hpp"
#include "app/Config.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace sysvet::util {

static std::atomic<int> g_level{-1};
static std::mutex g_write_mu;

LogLevel log_level() {
  int v = g_level.load(std::memory_order_relaxed);
  if (v < 0) {
    v = sysvet::app::getenv_int("SYSVET_LOG_LEVEL", static_cast<int>(LogLevel::Warn));
    if (v < 0) v = 0;
    if (v > 3) v = 3;
    g_level.store(v, std::memory_order_relaxed);
  }
  return static_cast<LogLevel>(v);
}

void set_log_level(LogLevel lvl) { g_level.store(static_cast<int>(lvl), std::memory_order_relaxed); }

bool log_enabled(LogLevel lvl) {
  return lvl != LogLevel::Quiet && static_cast<int>(lvl) <= static_cast<int>(log_level());
}

void logf(LogLevel lvl, const char* fmt, ...) {
  if (!log_enabled(lvl)) return;
  char buf[1024];
  va_list ap;
  va_start(ap, fmt);
  std::vsnprintf(buf, sizeof(buf), fmt, ap);
  va_end(ap);
  // Collectors log from their own threads; keep lines whole
  std::lock_guard<std::mutex> lk(g_write_mu);
  std::fprintf(stderr, "sysvet: %s\n", buf);
}

} // namespace sysvet::util
