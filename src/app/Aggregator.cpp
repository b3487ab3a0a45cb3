#include "app/Aggregator.hpp"
#include "util/Log.hpp"

#include <algorithm>

namespace sysvet::app {

using namespace sysvet::model;

int category_priority(Category c) {
  switch (c) {
    case Category::Disk: return 0;
    case Category::Driver: return 1;
    case Category::Process: return 2;
    case Category::Service: return 3;
    case Category::ScheduledTask: return 4;
    case Category::Startup: return 5;
  }
  return 6;
}

struct ActionTemplate {
  Category category;
  const char* warning;
  const char* critical;
};

// "%s" is replaced by the finding identifier
static constexpr ActionTemplate kActions[] = {
  {Category::Startup,
   "Disable %s at login if it is not needed right after sign-in",
   "Remove %s from startup"},
  {Category::Service,
   "Review third-party service %s and disable it if it is not needed",
   "Investigate service %s and stop it if it misbehaves"},
  {Category::Process,
   "Keep an eye on %s; close it if the usage is unexpected",
   "Close or restart %s to free CPU and memory"},
  {Category::Disk,
   "Free up space on %s or clear temporary files",
   "Back up data on %s now, then free space or replace the drive"},
  {Category::Driver,
   "Replace the unsigned driver %s with a signed vendor build",
   "Update or reinstall the driver for %s"},
  {Category::ScheduledTask,
   "Review scheduled task %s; it runs at boot or more than hourly",
   "Investigate scheduled task %s"},
};

std::string action_for(Category c, Severity s, const std::string& identifier) {
  if (s == Severity::OK) return {};
  for (const auto& t : kActions) {
    if (t.category != c) continue;
    std::string text = (s == Severity::Critical) ? t.critical : t.warning;
    if (auto pos = text.find("%s"); pos != std::string::npos) text.replace(pos, 2, identifier);
    return text;
  }
  return {};
}

bool Aggregator::add(CollectorResult result) {
  const Category c = result.category;
  if (results_.count(c)) {
    util::logf(util::LogLevel::Warn, "aggregator: duplicate result for %s ignored", to_string(c));
    return false;
  }
  results_.emplace(c, std::move(result));
  return true;
}

Summary Aggregator::summarize() const { return app::summarize(results_); }

Summary summarize(const std::map<Category, CollectorResult>& per_category) {
  Summary s;
  for (Severity sev : {Severity::OK, Severity::Warning, Severity::Critical}) s.counts_by_severity[sev] = 0;

  // Categories in priority order; with the stable sort below this fixes tie order
  std::vector<Category> order;
  for (const auto& [cat, res] : per_category) order.push_back(cat);
  std::sort(order.begin(), order.end(), [](Category a, Category b){ return category_priority(a) < category_priority(b); });

  for (Category cat : order) {
    const auto& res = per_category.at(cat);
    if (!res.evaluated()) {
      s.not_evaluated.push_back(cat);
      continue;
    }
    CategoryCounts cc;
    cc.evaluated = true;
    for (const auto& f : res.findings) {
      if (f.indeterminate && f.severity == Severity::OK) {
        ++cc.indeterminate;
        ++s.indeterminate;
        continue;
      }
      switch (f.severity) {
        case Severity::OK: ++cc.ok; break;
        case Severity::Warning: ++cc.warning; break;
        case Severity::Critical: ++cc.critical; break;
      }
      ++s.counts_by_severity[f.severity];
      if (f.severity != Severity::OK)
        s.recommendations.push_back(Recommendation{f.severity, f.category, f.identifier,
                                                   action_for(f.category, f.severity, f.identifier)});
    }
    s.counts_by_category[cat] = cc;
  }

  std::stable_sort(s.recommendations.begin(), s.recommendations.end(),
                   [](const Recommendation& a, const Recommendation& b){
    if (a.severity != b.severity) return static_cast<int>(a.severity) > static_cast<int>(b.severity);
    return category_priority(a.category) < category_priority(b.category);
  });
  std::sort(s.not_evaluated.begin(), s.not_evaluated.end());
  return s;
}

} // namespace sysvet::app
