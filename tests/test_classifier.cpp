#include "minitest.hpp"
#include "app/Classifier.hpp"

using namespace sysvet;
using namespace sysvet::model;
namespace metric = sysvet::app::metric;

static Metrics proc(double cpu, double mem) {
  Metrics m;
  m[metric::kName] = std::string("worker");
  m[metric::kCpuPercent] = cpu;
  m[metric::kMemoryBytes] = mem;
  return m;
}

static Metrics disk(double free_pct, MetricValue failure, double temp) {
  Metrics m;
  m[metric::kMountpoint] = std::string("/");
  m[metric::kFreePercent] = free_pct;
  m[metric::kFailurePredicted] = std::move(failure);
  m[metric::kTempBytes] = temp;
  return m;
}

TEST(process_cpu_alone_reaches_critical) {
  ASSERT_EQ(app::classify(Category::Process, proc(51, 1e9)).severity, Severity::Critical);
}

TEST(process_cpu_49_is_warning_not_ok) {
  ASSERT_EQ(app::classify(Category::Process, proc(49, 1e9)).severity, Severity::Warning);
}

TEST(process_thresholds_are_strict) {
  ASSERT_EQ(app::classify(Category::Process, proc(50, 0)).severity, Severity::Warning);
  ASSERT_EQ(app::classify(Category::Process, proc(20, 0)).severity, Severity::OK);
  ASSERT_EQ(app::classify(Category::Process, proc(1, 1e9)).severity, Severity::OK);
  ASSERT_EQ(app::classify(Category::Process, proc(1, 2e9)).severity, Severity::Warning);
}

TEST(process_memory_alone_reaches_each_tier) {
  ASSERT_EQ(app::classify(Category::Process, proc(0, 1.1e9)).severity, Severity::Warning);
  ASSERT_EQ(app::classify(Category::Process, proc(0, 2.5e9)).severity, Severity::Critical);
}

TEST(process_unknown_memory_is_indeterminate_when_otherwise_ok) {
  Metrics m = proc(5, 0);
  m[metric::kMemoryBytes] = Unknown{};
  auto c = app::classify(Category::Process, m);
  ASSERT_EQ(c.severity, Severity::OK);
  ASSERT_TRUE(c.indeterminate);
  // a known metric over threshold still decides
  m[metric::kCpuPercent] = 75.0;
  c = app::classify(Category::Process, m);
  ASSERT_EQ(c.severity, Severity::Critical);
  ASSERT_FALSE(c.indeterminate);
}

TEST(disk_free_space_tiers) {
  ASSERT_EQ(app::classify(Category::Disk, disk(4, 0.0, 0)).severity, Severity::Critical);
  ASSERT_EQ(app::classify(Category::Disk, disk(9, 0.0, 0)).severity, Severity::Warning);
  ASSERT_EQ(app::classify(Category::Disk, disk(50, 0.0, 0)).severity, Severity::OK);
  ASSERT_EQ(app::classify(Category::Disk, disk(5, 0.0, 0)).severity, Severity::Warning);
  ASSERT_EQ(app::classify(Category::Disk, disk(10, 0.0, 0)).severity, Severity::OK);
}

TEST(disk_predicted_failure_is_critical) {
  auto c = app::classify(Category::Disk, disk(80, 1.0, 0));
  ASSERT_EQ(c.severity, Severity::Critical);
  ASSERT_TRUE(c.description.find("failure predicted") != std::string::npos);
}

TEST(disk_temp_footprint_warns) {
  ASSERT_EQ(app::classify(Category::Disk, disk(50, 0.0, 600e6)).severity, Severity::Warning);
  ASSERT_EQ(app::classify(Category::Disk, disk(50, 0.0, 500e6)).severity, Severity::OK);
}

TEST(disk_unknown_health_is_not_silently_ok) {
  auto c = app::classify(Category::Disk, disk(50, Unknown{}, 0));
  ASSERT_EQ(c.severity, Severity::OK);
  ASSERT_TRUE(c.indeterminate);
  ASSERT_TRUE(c.description.find("health unknown") != std::string::npos);
  auto known = app::classify(Category::Disk, disk(50, 0.0, 0));
  ASSERT_FALSE(known.indeterminate);
}

TEST(driver_known_codes_are_critical_with_table_text) {
  for (int code : {1, 10, 12, 22, 28, 31, 43, 52}) {
    Metrics m;
    m[metric::kErrorCode] = static_cast<double>(code);
    m[metric::kSigned] = 1.0;
    auto c = app::classify(Category::Driver, m);
    ASSERT_EQ(c.severity, Severity::Critical);
    const char* text = app::device_problem_description(code);
    ASSERT_TRUE(text != nullptr);
    ASSERT_EQ(c.description, std::string(text));
  }
  ASSERT_EQ(std::string(app::device_problem_description(28)), std::string("Drivers not installed"));
  ASSERT_EQ(std::string(app::device_problem_description(10)), std::string("Device cannot start"));
}

TEST(driver_unmapped_code_is_still_critical) {
  Metrics m;
  m[metric::kErrorCode] = 999.0;
  auto c = app::classify(Category::Driver, m);
  ASSERT_EQ(c.severity, Severity::Critical);
  ASSERT_TRUE(c.description.find("device error") != std::string::npos);
  ASSERT_TRUE(c.description.find("999") != std::string::npos);
}

TEST(driver_signature_rules) {
  Metrics m;
  m[metric::kErrorCode] = 0.0;
  m[metric::kSigned] = 0.0;
  ASSERT_EQ(app::classify(Category::Driver, m).severity, Severity::Warning);
  m[metric::kSigned] = 1.0;
  auto ok = app::classify(Category::Driver, m);
  ASSERT_EQ(ok.severity, Severity::OK);
  ASSERT_FALSE(ok.indeterminate);
  m[metric::kSigned] = Unknown{};
  auto unk = app::classify(Category::Driver, m);
  ASSERT_EQ(unk.severity, Severity::OK);
  ASSERT_TRUE(unk.indeterminate);
}

TEST(startup_high_impact_warns_and_never_critical) {
  Metrics m;
  m[metric::kName] = std::string("Discord");
  m[metric::kCommand] = std::string("/usr/bin/discord --start-minimized");
  auto c = app::classify(Category::Startup, m);
  ASSERT_EQ(c.impact, Impact::High);
  ASSERT_EQ(c.severity, Severity::Warning);

  m[metric::kName] = std::string("Update Notifier");
  m[metric::kCommand] = std::string("update-notifier");
  c = app::classify(Category::Startup, m);
  ASSERT_EQ(c.impact, Impact::Medium);
  ASSERT_EQ(c.severity, Severity::OK);

  m[metric::kName] = std::string("xbindkeys");
  m[metric::kCommand] = std::string("xbindkeys");
  c = app::classify(Category::Startup, m);
  ASSERT_EQ(c.impact, Impact::Low);
  ASSERT_EQ(c.severity, Severity::OK);
}

TEST(service_third_party_running_warns) {
  Metrics m;
  m[metric::kThirdParty] = 1.0;
  m[metric::kState] = std::string("running");
  ASSERT_EQ(app::classify(Category::Service, m).severity, Severity::Warning);
  m[metric::kThirdParty] = 0.0;
  ASSERT_EQ(app::classify(Category::Service, m).severity, Severity::OK);
  m[metric::kThirdParty] = 1.0;
  m[metric::kState] = Unknown{};
  auto c = app::classify(Category::Service, m);
  ASSERT_EQ(c.severity, Severity::Warning);
  ASSERT_TRUE(c.indeterminate);
}

TEST(task_rules) {
  Metrics m;
  m[metric::kThirdParty] = 1.0;
  m[metric::kBootTrigger] = 1.0;
  m[metric::kEnabled] = 1.0;
  ASSERT_EQ(app::classify(Category::ScheduledTask, m).severity, Severity::Warning);
  m[metric::kBootTrigger] = 0.0;
  m[metric::kIntervalSeconds] = 300.0;
  ASSERT_EQ(app::classify(Category::ScheduledTask, m).severity, Severity::Warning);
  m[metric::kIntervalSeconds] = 3600.0;
  ASSERT_EQ(app::classify(Category::ScheduledTask, m).severity, Severity::OK);
  m[metric::kBootTrigger] = 1.0;
  m[metric::kThirdParty] = 0.0;
  ASSERT_EQ(app::classify(Category::ScheduledTask, m).severity, Severity::OK);
  m[metric::kThirdParty] = 1.0;
  m[metric::kEnabled] = 0.0;
  ASSERT_EQ(app::classify(Category::ScheduledTask, m).severity, Severity::OK);
}

TEST(classification_is_idempotent) {
  Metrics m = proc(33.3, 1.5e9);
  auto a = app::make_finding(Category::Process, "worker (pid 7)", m);
  auto b = app::make_finding(Category::Process, "worker (pid 7)", m);
  ASSERT_TRUE(a == b);
  ASSERT_EQ(a.severity, Severity::Warning);
}

TEST(os_path_detection) {
  ASSERT_TRUE(app::is_os_path("/usr/bin/cron"));
  ASSERT_TRUE(app::is_os_path("/lib/systemd/systemd-udevd"));
  ASSERT_FALSE(app::is_os_path("/opt/vendor/agent"));
  ASSERT_FALSE(app::is_os_path("/usr/local/bin/tool"));
  ASSERT_FALSE(app::is_os_path("/home/u/bin/x"));
}
