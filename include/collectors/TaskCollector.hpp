#pragma once
#include "app/Config.hpp"
#include "model/ScanResult.hpp"
#include "model/Task.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace sysvet::collectors {

class TaskSource {
public:
  virtual ~TaskSource() = default;
  [[nodiscard]] virtual bool read(const app::ScanConfig& cfg, model::TaskSnapshot& out, std::stop_token st) = 0;
  [[nodiscard]] virtual const char* name() const = 0;
};

// cron tables (system and per-user) and systemd timer units.
class CronTimerSource : public TaskSource {
public:
  bool read(const app::ScanConfig& cfg, model::TaskSnapshot& out, std::stop_token st) override;
  const char* name() const override { return "cron + systemd timers"; }

  // One crontab line. System tables (/etc/crontab, /etc/cron.d) carry a user
  // column; per-user tables do not and pass their owner in. Returns nullopt
  // for blanks, comments and VAR=value lines.
  static std::optional<model::TaskRecord> parse_cron_line(const std::string& line, bool system_table,
                                                         const std::string& owner);
  // Shortest gap between runs of a five-field schedule, seconds.
  static std::optional<uint64_t> cron_interval(const std::string& minute, const std::string& hour,
                                               const std::string& dom, const std::string& month,
                                               const std::string& dow);
  // systemd time span ("90", "15min", "1h 30min", "2d") in seconds.
  static std::optional<uint64_t> parse_timespan(const std::string& s);
  // OnCalendar= expression to a repeat interval, when it has a fixed one.
  static std::optional<uint64_t> calendar_interval(const std::string& expr);
  // [Timer] section of a .timer unit: fills boot_trigger, interval_seconds and command (activated unit).
  static void parse_timer(const std::string& body, const std::string& timer_name, model::TaskRecord& out);
};

class TaskCollector {
public:
  static constexpr model::Category kCategory = model::Category::ScheduledTask;
  static constexpr size_t kMaxTasks = 100;
  explicit TaskCollector(std::unique_ptr<TaskSource> source = std::make_unique<CronTimerSource>());
  [[nodiscard]] model::CollectorResult collect(const app::ScanConfig& cfg, std::stop_token st);

  // Third-party and boot-triggered tasks only; third-party first, capped at kMaxTasks.
  [[nodiscard]] static std::vector<model::Finding> to_findings(const model::TaskSnapshot& snap);
private:
  std::unique_ptr<TaskSource> source_;
};

} // namespace sysvet::collectors
