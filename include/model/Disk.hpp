#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sysvet::model {

struct Volume {
  std::string device;       // e.g. /dev/nvme0n1p2
  std::string mountpoint;   // e.g. /
  std::string fstype;       // e.g. ext4
  std::string disk;         // backing whole disk, e.g. nvme0n1
  uint64_t total_bytes{};
  uint64_t avail_bytes{};
  uint64_t temp_bytes{};
  uint64_t temp_files{};
  // nullopt when the health status could not be queried
  std::optional<bool> failure_predicted;
};

struct DiskSnapshot {
  std::vector<Volume> volumes;
  std::vector<std::string> notes;  // locations that exist but could not be read
  std::string error;               // set when the whole domain could not be read
};

} // namespace sysvet::model
