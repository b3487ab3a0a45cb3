#pragma once
#include <cstdint>
#include <string>

namespace sysvet::util {

// 1024-based, one decimal: "512.0 MB"
std::string human_bytes(uint64_t bytes);
// One decimal: "42.5%"
std::string format_pct(double pct);
// "45s", "5 min", "2 h", "3 d"
std::string format_interval(uint64_t seconds);
// Pad or truncate to a fixed display width (ASCII)
std::string rpad_trunc(const std::string& s, size_t w);

} // namespace sysvet::util
