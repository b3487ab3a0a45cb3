#pragma once
#include "model/Finding.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sysvet::model {

enum class FailureKind { DomainUnavailable, Timeout, Cancelled };

struct CollectorFailure {
  FailureKind kind{FailureKind::DomainUnavailable};
  std::string message;
  bool operator==(const CollectorFailure&) const = default;
};

// Machine-wide load measured over the process sampling window
struct SystemTotals {
  double cpu_percent{};
  uint64_t mem_total_bytes{};
  uint64_t mem_used_bytes{};
  double mem_used_percent{};
  bool operator==(const SystemTotals&) const = default;
};

struct CollectorResult {
  Category category{Category::Startup};
  std::vector<Finding> findings;          // empty when failure is set
  std::optional<CollectorFailure> failure;
  std::vector<std::string> notes;         // partial-read problems that did not abort the domain
  std::optional<SystemTotals> totals;     // Process only

  [[nodiscard]] bool evaluated() const { return !failure.has_value(); }
  bool operator==(const CollectorResult&) const = default;
};

struct Recommendation {
  Severity severity{Severity::Warning};
  Category category{Category::Startup};
  std::string identifier;
  std::string action;
  bool operator==(const Recommendation&) const = default;
};

struct CategoryCounts {
  size_t ok{};
  size_t warning{};
  size_t critical{};
  size_t indeterminate{};
  bool evaluated{false};
  bool operator==(const CategoryCounts&) const = default;
};

struct Summary {
  std::map<Severity, size_t> counts_by_severity;   // always holds all three tiers
  std::map<Category, CategoryCounts> counts_by_category;
  std::vector<Category> not_evaluated;             // in category declaration order
  size_t indeterminate{};
  std::vector<Recommendation> recommendations;     // severity desc, then category priority
  bool operator==(const Summary&) const = default;
};

enum class ScanMode { Quick, Full };
enum class ScanState { Idle, Running, Completed, Failed };

struct ScanResult {
  ScanMode mode{ScanMode::Full};
  ScanState state{ScanState::Idle};
  std::chrono::system_clock::time_point timestamp{};
  bool elevated{false};
  std::map<Category, CollectorResult> per_category;
  Summary summary;
  std::optional<SystemTotals> totals;
  std::string error;  // set when state == Failed
};

[[nodiscard]] const char* to_string(FailureKind k);
[[nodiscard]] const char* to_string(ScanMode m);
[[nodiscard]] const char* to_string(ScanState s);

} // namespace sysvet::model
