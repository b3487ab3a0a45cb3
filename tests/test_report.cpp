#include "minitest.hpp"
#include "app/Aggregator.hpp"
#include "app/Classifier.hpp"
#include "app/Report.hpp"

using namespace sysvet;
using namespace sysvet::model;
namespace metric = sysvet::app::metric;

static bool contains(const std::string& hay, const std::string& needle) {
  return hay.find(needle) != std::string::npos;
}

static ScanResult sample_scan() {
  ScanResult r;
  r.mode = ScanMode::Full;
  r.state = ScanState::Completed;
  r.timestamp = std::chrono::system_clock::now();
  r.elevated = false;

  CollectorResult disk;
  disk.category = Category::Disk;
  Metrics dm;
  dm[metric::kMountpoint] = std::string("/home");
  dm[metric::kFreePercent] = 3.0;
  dm[metric::kFailurePredicted] = 0.0;
  dm[metric::kTempBytes] = 0.0;
  disk.findings.push_back(app::make_finding(Category::Disk, "/home", dm));
  disk.notes.push_back("SMART status needs root, disk health unknown");
  r.per_category[Category::Disk] = disk;

  CollectorResult startup;
  startup.category = Category::Startup;
  Metrics sm;
  sm[metric::kName] = std::string("Steam");
  sm[metric::kCommand] = std::string("/usr/bin/steam -silent");
  sm[metric::kThirdParty] = 1.0;
  startup.findings.push_back(app::make_finding(Category::Startup, "Steam", sm));
  r.per_category[Category::Startup] = startup;

  CollectorResult drivers;
  drivers.category = Category::Driver;
  drivers.failure = CollectorFailure{FailureKind::Timeout, "exceeded 60000 ms"};
  r.per_category[Category::Driver] = drivers;

  r.summary = app::summarize(r.per_category);
  r.totals = SystemTotals{12.5, 8ull << 30, 2ull << 30, 25.0};
  return r;
}

TEST(report_lists_sections_and_recommendations) {
  auto text = app::render_text_report(sample_scan());
  ASSERT_TRUE(contains(text, "sysvet full scan"));
  ASSERT_TRUE(contains(text, "not elevated"));
  ASSERT_TRUE(contains(text, "System: CPU 12.5%"));
  ASSERT_TRUE(contains(text, "Summary: 1 critical, 1 warning, 0 ok"));
  ASSERT_TRUE(contains(text, "== Disk =="));
  ASSERT_TRUE(contains(text, "[CRIT] /home"));
  ASSERT_TRUE(contains(text, "note: SMART status needs root"));
  ASSERT_TRUE(contains(text, "[WARN] Steam"));
  ASSERT_TRUE(contains(text, "[third-party]"));
  ASSERT_TRUE(contains(text, "Not evaluated:\n  Drivers: timed out (exceeded 60000 ms)"));
  // Disk comes before Startup both in sections and in recommendations
  ASSERT_TRUE(text.find("== Disk ==") < text.find("== Startup =="));
  ASSERT_TRUE(contains(text, "1. [CRIT] Disk:"));
  ASSERT_TRUE(contains(text, "2. [WARN] Startup:"));
  ASSERT_FALSE(contains(text, "== Drivers =="));
}

TEST(report_without_issues) {
  ScanResult r;
  r.mode = ScanMode::Quick;
  r.state = ScanState::Completed;
  r.elevated = true;
  CollectorResult startup;
  startup.category = Category::Startup;
  r.per_category[Category::Startup] = startup;
  r.summary = app::summarize(r.per_category);
  auto text = app::render_text_report(r);
  ASSERT_TRUE(contains(text, "sysvet quick scan"));
  ASSERT_FALSE(contains(text, "not elevated"));
  ASSERT_TRUE(contains(text, "(nothing to report)"));
  ASSERT_TRUE(contains(text, "No significant issues found."));
  ASSERT_FALSE(contains(text, "Not evaluated"));
}

TEST(report_for_failed_scan) {
  ScanResult r;
  r.state = ScanState::Failed;
  r.error = "cannot start collector thread";
  auto text = app::render_text_report(r);
  ASSERT_TRUE(contains(text, "Scan failed: cannot start collector thread"));
  ASSERT_FALSE(contains(text, "Recommendations"));
}
