#include "model/Finding.hpp"
#include "model/ScanResult.hpp"

#include <cctype>

namespace sysvet::model {

const char* to_string(Category c) {
  switch (c) {
    case Category::Startup: return "Startup";
    case Category::Service: return "Services";
    case Category::Process: return "Processes";
    case Category::Disk: return "Disk";
    case Category::Driver: return "Drivers";
    case Category::ScheduledTask: return "Scheduled Tasks";
  }
  return "?";
}

const char* to_string(Severity s) {
  switch (s) {
    case Severity::OK: return "OK";
    case Severity::Warning: return "Warning";
    case Severity::Critical: return "Critical";
  }
  return "?";
}

const char* to_string(Impact i) {
  switch (i) {
    case Impact::None: return "-";
    case Impact::Low: return "Low";
    case Impact::Medium: return "Medium";
    case Impact::High: return "High";
  }
  return "?";
}

const char* to_string(FailureKind k) {
  switch (k) {
    case FailureKind::DomainUnavailable: return "unavailable";
    case FailureKind::Timeout: return "timed out";
    case FailureKind::Cancelled: return "cancelled";
  }
  return "?";
}

const char* to_string(ScanMode m) { return m == ScanMode::Quick ? "Quick" : "Full"; }

const char* to_string(ScanState s) {
  switch (s) {
    case ScanState::Idle: return "Idle";
    case ScanState::Running: return "Running";
    case ScanState::Completed: return "Completed";
    case ScanState::Failed: return "Failed";
  }
  return "?";
}

std::optional<Category> parse_category(std::string_view name) {
  std::string s;
  for (char c : name) {
    if (c == ' ' || c == '_' || c == '-') continue;
    s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (s == "startup") return Category::Startup;
  if (s == "service" || s == "services") return Category::Service;
  if (s == "process" || s == "processes") return Category::Process;
  if (s == "disk" || s == "disks") return Category::Disk;
  if (s == "driver" || s == "drivers") return Category::Driver;
  if (s == "task" || s == "tasks" || s == "scheduled" || s == "scheduledtask" || s == "scheduledtasks")
    return Category::ScheduledTask;
  return std::nullopt;
}

bool has_metric(const Metrics& m, std::string_view key) { return m.find(key) != m.end(); }

bool is_unknown(const Metrics& m, std::string_view key) {
  auto it = m.find(key);
  return it != m.end() && std::holds_alternative<Unknown>(it->second);
}

std::optional<double> number(const Metrics& m, std::string_view key) {
  auto it = m.find(key);
  if (it == m.end()) return std::nullopt;
  if (const auto* d = std::get_if<double>(&it->second)) return *d;
  return std::nullopt;
}

std::optional<std::string> text(const Metrics& m, std::string_view key) {
  auto it = m.find(key);
  if (it == m.end()) return std::nullopt;
  if (const auto* s = std::get_if<std::string>(&it->second)) return *s;
  return std::nullopt;
}

} // namespace sysvet::model
