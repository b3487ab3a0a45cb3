#pragma once

#include "model/Finding.hpp"
#include <string>
#include <string_view>

namespace sysvet::app {

// Metric names shared by collectors, the classifier and the report.
namespace metric {
inline constexpr const char* kName = "name";
inline constexpr const char* kCommand = "command";
inline constexpr const char* kSource = "source";
inline constexpr const char* kState = "state";
inline constexpr const char* kThirdParty = "third_party";
inline constexpr const char* kUnitPath = "unit_path";
inline constexpr const char* kExecPath = "exec_path";
inline constexpr const char* kPid = "pid";
inline constexpr const char* kCpuPercent = "cpu_percent";
inline constexpr const char* kMemoryBytes = "memory_bytes";
inline constexpr const char* kReadBytes = "read_bytes";
inline constexpr const char* kWriteBytes = "write_bytes";
inline constexpr const char* kMountpoint = "mountpoint";
inline constexpr const char* kFstype = "fstype";
inline constexpr const char* kTotalBytes = "total_bytes";
inline constexpr const char* kFreeBytes = "free_bytes";
inline constexpr const char* kFreePercent = "free_percent";
inline constexpr const char* kFailurePredicted = "failure_predicted";
inline constexpr const char* kTempBytes = "temp_bytes";
inline constexpr const char* kErrorCode = "error_code";
inline constexpr const char* kSigned = "signed";
inline constexpr const char* kBus = "bus";
inline constexpr const char* kDriver = "driver";
inline constexpr const char* kOutOfTree = "out_of_tree";
inline constexpr const char* kBootTrigger = "boot_trigger";
inline constexpr const char* kIntervalSeconds = "interval_seconds";
inline constexpr const char* kEnabled = "enabled";
inline constexpr const char* kOwner = "owner";
} // namespace metric

// Thresholds. All comparisons are strict.
namespace threshold {
inline constexpr double kProcCpuCritical = 50.0;
inline constexpr double kProcCpuWarning = 20.0;
inline constexpr double kProcMemCritical = 2e9;
inline constexpr double kProcMemWarning = 1e9;
inline constexpr double kDiskFreeCritical = 5.0;
inline constexpr double kDiskFreeWarning = 10.0;
inline constexpr double kDiskTempWarning = 500e6;
inline constexpr double kTaskFrequentSeconds = 3600.0;
} // namespace threshold

struct Classification {
  model::Severity severity{model::Severity::OK};
  model::Impact impact{model::Impact::None};
  std::string description;
  bool indeterminate{false};
};

// Pure: the same (category, metrics) always yields the same Classification.
[[nodiscard]] Classification classify(model::Category category, const model::Metrics& metrics);

// Build a complete Finding; third_party is read from the third_party metric.
[[nodiscard]] model::Finding make_finding(model::Category category, std::string identifier,
                                          model::Metrics metrics);

// Startup impact from the known-application tables.
[[nodiscard]] model::Impact startup_impact(std::string_view name, std::string_view command);

// Device problem code description; nullptr for unmapped codes.
[[nodiscard]] const char* device_problem_description(int code);

// True for paths inside the distribution-managed tree (/usr/bin, /usr/lib, /sbin, ...).
[[nodiscard]] bool is_os_path(std::string_view path);

} // namespace sysvet::app
