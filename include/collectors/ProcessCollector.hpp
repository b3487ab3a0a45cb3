#pragma once
#include "app/Config.hpp"
#include "model/Process.hpp"
#include "model/ScanResult.hpp"
#include <memory>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

namespace sysvet::collectors {

class ProcessSource {
public:
  virtual ~ProcessSource() = default;
  [[nodiscard]] virtual bool read(const app::ScanConfig& cfg, model::ProcessSnapshot& out, std::stop_token st) = 0;
  [[nodiscard]] virtual const char* name() const = 0;
};

// Two /proc samples taken cfg.sample_window apart. The wait between them is
// the one deliberate suspension point of a scan; a stop request ends it early
// and the read reports failure.
class ProcfsProcessSource : public ProcessSource {
public:
  bool read(const app::ScanConfig& cfg, model::ProcessSnapshot& out, std::stop_token st) override;
  const char* name() const override { return "/proc scanner"; }

  struct StatFields {
    std::string comm;
    uint64_t utime{};
    uint64_t stime{};
    int64_t rss_pages{};
  };
  static bool parse_stat_line(const std::string& content, StatFields& out);
  // read_bytes/write_bytes from a /proc/[pid]/io body
  static bool parse_io(const std::string& content, uint64_t& read_bytes, uint64_t& write_bytes);

private:
  struct CpuTimes { uint64_t total{}; uint64_t idle{}; };
  static CpuTimes read_cpu_times();
  static unsigned read_cpu_count();
  // pid -> utime+stime; false when /proc cannot be listed
  static bool snapshot_times(std::unordered_map<int32_t, uint64_t>& out, size_t& total);
};

class ProcessCollector {
public:
  static constexpr model::Category kCategory = model::Category::Process;
  explicit ProcessCollector(std::unique_ptr<ProcessSource> source = std::make_unique<ProcfsProcessSource>());
  [[nodiscard]] model::CollectorResult collect(const app::ScanConfig& cfg, std::stop_token st);

  // Rank by cpu_percent + memory_mb / 100, keep top_n, classify.
  [[nodiscard]] static std::vector<model::Finding> to_findings(const model::ProcessSnapshot& snap, size_t top_n);
private:
  std::unique_ptr<ProcessSource> source_;
};

} // namespace sysvet::collectors
