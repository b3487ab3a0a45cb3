#include "util/Format.hpp"

#include <cstdio>

namespace sysvet::util {

std::string human_bytes(uint64_t bytes) {
  static const char* units[] = {"B", "KB", "MB", "GB", "TB", "PB"};
  double v = static_cast<double>(bytes);
  int u = 0;
  while (v >= 1024.0 && u < 5) { v /= 1024.0; ++u; }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f %s", v, units[u]);
  return buf;
}

std::string format_pct(double pct) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f%%", pct);
  return buf;
}

std::string format_interval(uint64_t seconds) {
  if (seconds < 60) return std::to_string(seconds) + "s";
  if (seconds < 3600) return std::to_string(seconds / 60) + " min";
  if (seconds < 86400) return std::to_string(seconds / 3600) + " h";
  return std::to_string(seconds / 86400) + " d";
}

std::string rpad_trunc(const std::string& s, size_t w) {
  if (s.size() > w) {
    if (w <= 3) return s.substr(0, w);
    return s.substr(0, w - 3) + "...";
  }
  return s + std::string(w - s.size(), ' ');
}

} // namespace sysvet::util
