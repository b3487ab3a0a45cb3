#include "app/Report.hpp"
#include "app/Aggregator.hpp"
#include "util/Format.hpp"

#include <algorithm>
#include <ctime>
#include <sstream>
#include <vector>

namespace sysvet::app {

using namespace sysvet::model;

static constexpr size_t kIdWidth = 32;

static const char* tag(const Finding& f) {
  if (f.indeterminate && f.severity == Severity::OK) return "??  ";
  switch (f.severity) {
    case Severity::OK: return "OK  ";
    case Severity::Warning: return "WARN";
    case Severity::Critical: return "CRIT";
  }
  return "    ";
}

static const char* tag(Severity s) {
  return s == Severity::Critical ? "CRIT" : (s == Severity::Warning ? "WARN" : "OK  ");
}

static std::string local_time(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tmv{};
  localtime_r(&t, &tmv);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tmv);
  return buf;
}

static std::string counts_line(const CategoryCounts& c) {
  std::ostringstream os;
  os << c.critical << " critical, " << c.warning << " warning, " << c.ok << " ok";
  if (c.indeterminate) os << ", " << c.indeterminate << " indeterminate";
  return os.str();
}

std::string render_text_report(const ScanResult& r) {
  std::ostringstream os;
  os << "sysvet " << (r.mode == ScanMode::Quick ? "quick" : "full") << " scan, " << local_time(r.timestamp);
  if (!r.elevated) os << " (not elevated: some metrics may be unknown)";
  os << "\n";
  if (r.state == ScanState::Failed) {
    os << "Scan failed: " << r.error << "\n";
    return os.str();
  }
  if (r.totals) {
    os << "System: CPU " << util::format_pct(r.totals->cpu_percent) << ", memory "
       << util::human_bytes(r.totals->mem_used_bytes) << " of " << util::human_bytes(r.totals->mem_total_bytes)
       << " (" << util::format_pct(r.totals->mem_used_percent) << ")\n";
  }

  const auto& s = r.summary;
  auto count = [&s](Severity sev) { auto it = s.counts_by_severity.find(sev); return it == s.counts_by_severity.end() ? size_t{0} : it->second; };
  os << "Summary: " << count(Severity::Critical) << " critical, " << count(Severity::Warning) << " warning, "
     << count(Severity::OK) << " ok";
  if (s.indeterminate) os << ", " << s.indeterminate << " indeterminate";
  os << "\n";

  // Most urgent category first
  std::vector<Category> order;
  for (const auto& [cat, res] : r.per_category) order.push_back(cat);
  std::sort(order.begin(), order.end(), [](Category a, Category b){ return category_priority(a) < category_priority(b); });

  for (Category cat : order) {
    const auto& res = r.per_category.at(cat);
    if (!res.evaluated()) continue;
    os << "\n== " << to_string(cat) << " ==";
    if (auto it = s.counts_by_category.find(cat); it != s.counts_by_category.end())
      os << "  " << counts_line(it->second);
    os << "\n";
    if (res.findings.empty()) os << "  (nothing to report)\n";
    for (const auto& f : res.findings) {
      os << "  [" << tag(f) << "] " << util::rpad_trunc(f.identifier, kIdWidth) << " " << f.description;
      if (f.third_party && cat != Category::Service && cat != Category::ScheduledTask) os << " [third-party]";
      os << "\n";
    }
    for (const auto& n : res.notes) os << "  note: " << n << "\n";
  }

  if (!s.not_evaluated.empty()) {
    os << "\nNot evaluated:\n";
    for (Category cat : s.not_evaluated) {
      const auto& res = r.per_category.at(cat);
      os << "  " << to_string(cat);
      if (res.failure) os << ": " << to_string(res.failure->kind) << " (" << res.failure->message << ")";
      os << "\n";
    }
  }

  os << "\nRecommendations:\n";
  if (s.recommendations.empty()) {
    os << "  No significant issues found.\n";
  } else {
    size_t i = 1;
    for (const auto& rec : s.recommendations)
      os << "  " << i++ << ". [" << tag(rec.severity) << "] " << to_string(rec.category) << ": " << rec.action << "\n";
  }
  return os.str();
}

} // namespace sysvet::app
