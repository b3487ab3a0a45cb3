#pragma once
#include "app/Config.hpp"
#include "model/Disk.hpp"
#include "model/ScanResult.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace sysvet::collectors {

class DiskSource {
public:
  virtual ~DiskSource() = default;
  [[nodiscard]] virtual bool read(const app::ScanConfig& cfg, model::DiskSnapshot& out, std::stop_token st) = 0;
  [[nodiscard]] virtual const char* name() const = 0;
};

// Mounted block-device filesystems from /proc/self/mounts, sized with statvfs,
// health from smartctl -H on the backing disk, temp locations sized recursively.
class MountDiskSource : public DiskSource {
public:
  bool read(const app::ScanConfig& cfg, model::DiskSnapshot& out, std::stop_token st) override;
  const char* name() const override { return "mount table + smartctl"; }

  struct MountEntry {
    std::string device;
    std::string mountpoint;
    std::string fstype;
  };
  // All well-formed lines, octal escapes (\040) in the mountpoint decoded.
  static std::vector<MountEntry> parse_mounts(const std::string& content);
  static bool is_pseudo_fs(const std::string& fstype);
  // true = failure predicted, false = passed, nullopt = no verdict in the output
  static std::optional<bool> parse_smart_health(const std::string& output);
  // Whole disk behind a partition name (nvme0n1p2 -> nvme0n1, sda3 -> sda) via /sys/class/block.
  static std::string backing_disk(const std::string& devname);
};

class DiskCollector {
public:
  static constexpr model::Category kCategory = model::Category::Disk;
  explicit DiskCollector(std::unique_ptr<DiskSource> source = std::make_unique<MountDiskSource>());
  [[nodiscard]] model::CollectorResult collect(const app::ScanConfig& cfg, std::stop_token st);

  // One finding per volume, in mount order.
  [[nodiscard]] static std::vector<model::Finding> to_findings(const model::DiskSnapshot& snap);
private:
  std::unique_ptr<DiskSource> source_;
};

} // namespace sysvet::collectors
