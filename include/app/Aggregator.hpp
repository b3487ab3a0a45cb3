#pragma once
#include "model/ScanResult.hpp"
#include <map>
#include <string>

namespace sysvet::app {

// Lower is more urgent: Disk, Driver, Process, Service, ScheduledTask, Startup.
[[nodiscard]] int category_priority(model::Category c);

// Action text for a Warning or Critical finding; empty for OK.
[[nodiscard]] std::string action_for(model::Category c, model::Severity s, const std::string& identifier);

// Folds CollectorResults into a Summary. At most one result per category; the
// Summary depends only on the set of results, not the order they were added.
class Aggregator {
public:
  // Returns false (and keeps the first) when the category was already added.
  bool add(model::CollectorResult result);
  [[nodiscard]] model::Summary summarize() const;
  [[nodiscard]] const std::map<model::Category, model::CollectorResult>& results() const { return results_; }

private:
  std::map<model::Category, model::CollectorResult> results_;
};

[[nodiscard]] model::Summary summarize(const std::map<model::Category, model::CollectorResult>& per_category);

} // namespace sysvet::app
