#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sysvet::model {

struct ProcSample {
  int32_t pid{};
  std::string name;          // comm
  std::string exe_path;
  uint64_t total_time{};     // utime+stime, jiffies
  double   cpu_pct{};        // share of one core over the window, may exceed 100
  // nullopt when the counter could not be read (other user's process, exited)
  std::optional<uint64_t> rss_bytes;
  std::optional<uint64_t> read_bytes;
  std::optional<uint64_t> write_bytes;
};

struct ProcessSnapshot {
  std::vector<ProcSample> processes;  // unsorted, every process seen in both samples
  size_t total_processes{};
  double   cpu_total_pct{};           // whole machine, 0..100
  uint64_t mem_total_bytes{};
  uint64_t mem_available_bytes{};
  std::vector<std::string> notes;  // locations that exist but could not be read
  std::string error;               // set when the whole domain could not be read
};

} // namespace sysvet::model
