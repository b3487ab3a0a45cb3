#include "minitest.hpp"
#include "app/Scanner.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace sysvet;
using namespace sysvet::model;
using namespace sysvet::collectors;

namespace {

template <class Base, class Snap>
struct FixedSource : Base {
  Snap snap;
  explicit FixedSource(Snap s = {}) : snap(std::move(s)) {}
  bool read(const app::ScanConfig&, Snap& out, std::stop_token) override { out = snap; return true; }
  const char* name() const override { return "fixed"; }
};

// Never finishes on its own; returns once stop is requested
template <class Base, class Snap>
struct BlockingSource : Base {
  bool read(const app::ScanConfig&, Snap&, std::stop_token st) override {
    std::mutex mu;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lk(mu);
    (void)cv.wait(lk, st, []{ return false; });
    return false;
  }
  const char* name() const override { return "blocking"; }
};

// Sits in a call that ignores the stop token, like a read on a hung disk
template <class Base, class Snap>
struct StuckSource : Base {
  bool read(const app::ScanConfig&, Snap&, std::stop_token) override {
    std::this_thread::sleep_for(std::chrono::milliseconds(1500));
    return true;
  }
  const char* name() const override { return "stuck"; }
};

template <class Base, class Snap>
struct ThrowingSource : Base {
  bool read(const app::ScanConfig&, Snap&, std::stop_token) override { throw std::runtime_error("boom"); }
  const char* name() const override { return "throwing"; }
};

StartupSnapshot one_heavy_startup_item() {
  StartupSnapshot s;
  StartupEntry e;
  e.name = "Discord";
  e.command = "discord --start-minimized";
  e.exe_path = "/usr/bin/discord";
  e.source = "user autostart";
  e.scope = StartupScope::User;
  s.entries.push_back(e);
  return s;
}

ProcessSnapshot one_busy_process() {
  ProcessSnapshot s;
  ProcSample p;
  p.pid = 4242;
  p.name = "encoder";
  p.cpu_pct = 60.0;
  p.rss_bytes = 100ull << 20;
  p.read_bytes = 0;
  p.write_bytes = 0;
  s.processes.push_back(p);
  s.total_processes = 1;
  s.cpu_total_pct = 30.0;
  s.mem_total_bytes = 8ull << 30;
  s.mem_available_bytes = 6ull << 30;
  return s;
}

DiskSnapshot one_healthy_volume() {
  DiskSnapshot s;
  Volume v;
  v.device = "/dev/sda1";
  v.mountpoint = "/";
  v.fstype = "ext4";
  v.total_bytes = 100ull << 30;
  v.avail_bytes = 50ull << 30;
  v.failure_predicted = false;
  s.volumes.push_back(v);
  return s;
}

enum class DriverMode { Fixed, Blocking };

Collector fake_collector(Category c, DriverMode driver = DriverMode::Fixed) {
  switch (c) {
    case Category::Startup:
      return StartupCollector(std::make_unique<FixedSource<StartupSource, StartupSnapshot>>(one_heavy_startup_item()));
    case Category::Service:
      return ServiceCollector(std::make_unique<FixedSource<ServiceSource, ServiceSnapshot>>());
    case Category::Process:
      return ProcessCollector(std::make_unique<FixedSource<ProcessSource, ProcessSnapshot>>(one_busy_process()));
    case Category::Disk:
      return DiskCollector(std::make_unique<FixedSource<DiskSource, DiskSnapshot>>(one_healthy_volume()));
    case Category::Driver:
      if (driver == DriverMode::Blocking)
        return DriverCollector(std::make_unique<BlockingSource<DriverSource, DriverSnapshot>>());
      return DriverCollector(std::make_unique<FixedSource<DriverSource, DriverSnapshot>>());
    case Category::ScheduledTask:
      return TaskCollector(std::make_unique<FixedSource<TaskSource, TaskSnapshot>>());
  }
  throw std::logic_error("unknown category");
}

app::ScanConfig test_config(ScanMode mode) {
  app::ScanConfig cfg;
  cfg.mode = mode;
  return cfg;
}

} // namespace

TEST(quick_scan_end_to_end) {
  app::Scanner scanner(test_config(ScanMode::Quick), [](Category c){ return fake_collector(c); });
  ASSERT_EQ(scanner.state(), ScanState::Idle);
  auto r = scanner.run();
  ASSERT_EQ(scanner.state(), ScanState::Completed);
  ASSERT_EQ(r.state, ScanState::Completed);
  ASSERT_EQ(r.mode, ScanMode::Quick);
  ASSERT_EQ(r.per_category.size(), size_t{2});
  ASSERT_EQ(r.summary.counts_by_severity.at(Severity::Warning), size_t{1});
  ASSERT_EQ(r.summary.counts_by_severity.at(Severity::Critical), size_t{1});
  ASSERT_EQ(r.summary.counts_by_severity.at(Severity::OK), size_t{0});
  ASSERT_EQ(r.summary.recommendations.size(), size_t{2});
  ASSERT_EQ(r.summary.recommendations[0].severity, Severity::Critical);
  ASSERT_EQ(r.summary.recommendations[0].category, Category::Process);
  ASSERT_EQ(r.summary.recommendations[1].category, Category::Startup);
  ASSERT_TRUE(r.totals.has_value());
  ASSERT_NEAR(r.totals->cpu_percent, 30.0, 1e-9);
  ASSERT_NEAR(r.totals->mem_used_percent, 25.0, 1e-9);
}

TEST(full_scan_driver_timeout_leaves_others_intact) {
  auto cfg = test_config(ScanMode::Full);
  cfg.timeouts[Category::Driver] = std::chrono::milliseconds(100);
  app::Scanner scanner(cfg, [](Category c){ return fake_collector(c, DriverMode::Blocking); });
  auto r = scanner.run();
  ASSERT_EQ(r.state, ScanState::Completed);
  ASSERT_EQ(r.per_category.size(), size_t{6});
  const auto& drv = r.per_category.at(Category::Driver);
  ASSERT_TRUE(drv.failure.has_value());
  ASSERT_EQ(drv.failure->kind, FailureKind::Timeout);
  ASSERT_TRUE(drv.findings.empty());
  ASSERT_EQ(r.summary.not_evaluated.size(), size_t{1});
  ASSERT_EQ(r.summary.not_evaluated[0], Category::Driver);
  ASSERT_EQ(r.summary.counts_by_category.count(Category::Driver), size_t{0});
  for (auto c : {Category::Startup, Category::Service, Category::Process, Category::Disk, Category::ScheduledTask}) {
    ASSERT_TRUE(r.per_category.at(c).evaluated());
    ASSERT_TRUE(r.summary.counts_by_category.at(c).evaluated);
  }
  // Startup warning, process critical, healthy disk OK
  ASSERT_EQ(r.summary.counts_by_severity.at(Severity::Critical), size_t{1});
  ASSERT_EQ(r.summary.counts_by_severity.at(Severity::Warning), size_t{1});
  ASSERT_EQ(r.summary.counts_by_severity.at(Severity::OK), size_t{1});
}

TEST(cancel_turns_unfinished_collectors_into_cancelled) {
  auto cfg = test_config(ScanMode::Quick);
  app::Scanner scanner(cfg, [](Category c) -> Collector {
    if (c == Category::Process)
      return ProcessCollector(std::make_unique<BlockingSource<ProcessSource, ProcessSnapshot>>());
    return fake_collector(c);
  });
  std::jthread canceller([&scanner]{
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    scanner.cancel();
  });
  auto r = scanner.run();
  ASSERT_EQ(r.state, ScanState::Completed);
  const auto& p = r.per_category.at(Category::Process);
  ASSERT_TRUE(p.failure.has_value());
  ASSERT_EQ(p.failure->kind, FailureKind::Cancelled);
  ASSERT_TRUE(r.per_category.at(Category::Startup).evaluated());
  ASSERT_EQ(r.summary.not_evaluated.size(), size_t{1});
}

TEST(throwing_collector_becomes_domain_unavailable) {
  app::Scanner scanner(test_config(ScanMode::Quick), [](Category c) -> Collector {
    if (c == Category::Startup)
      return StartupCollector(std::make_unique<ThrowingSource<StartupSource, StartupSnapshot>>());
    return fake_collector(c);
  });
  auto r = scanner.run();
  ASSERT_EQ(r.state, ScanState::Completed);
  const auto& s = r.per_category.at(Category::Startup);
  ASSERT_TRUE(s.failure.has_value());
  ASSERT_EQ(s.failure->kind, FailureKind::DomainUnavailable);
  ASSERT_EQ(s.failure->message, std::string("boom"));
  ASSERT_TRUE(r.per_category.at(Category::Process).evaluated());
}

TEST(stuck_collector_does_not_hold_up_the_scan) {
  auto cfg = test_config(ScanMode::Full);
  cfg.timeouts[Category::Driver] = std::chrono::milliseconds(100);
  app::Scanner scanner(cfg, [](Category c) -> Collector {
    if (c == Category::Driver)
      return DriverCollector(std::make_unique<StuckSource<DriverSource, DriverSnapshot>>());
    return fake_collector(c);
  });
  auto start = std::chrono::steady_clock::now();
  auto r = scanner.run();
  auto took = std::chrono::steady_clock::now() - start;
  ASSERT_TRUE(took < std::chrono::milliseconds(1000));
  ASSERT_EQ(r.state, ScanState::Completed);
  const auto& drv = r.per_category.at(Category::Driver);
  ASSERT_TRUE(drv.failure.has_value());
  ASSERT_EQ(drv.failure->kind, FailureKind::Timeout);
  ASSERT_TRUE(r.per_category.at(Category::Disk).evaluated());
}

TEST(non_standard_exception_becomes_domain_unavailable) {
  struct ThrowsInt : ServiceSource {
    bool read(const app::ScanConfig&, ServiceSnapshot&, std::stop_token) override { throw 42; }
    const char* name() const override { return "throws-int"; }
  };
  auto cfg = test_config(ScanMode::Quick);
  cfg.quick_categories = {Category::Service, Category::Startup};
  app::Scanner scanner(cfg, [](Category c) -> Collector {
    if (c == Category::Service) return ServiceCollector(std::make_unique<ThrowsInt>());
    return fake_collector(c);
  });
  auto r = scanner.run();
  ASSERT_EQ(r.state, ScanState::Completed);
  const auto& s = r.per_category.at(Category::Service);
  ASSERT_TRUE(s.failure.has_value());
  ASSERT_EQ(s.failure->kind, FailureKind::DomainUnavailable);
  ASSERT_TRUE(r.per_category.at(Category::Startup).evaluated());
}

TEST(factory_returning_wrong_collector_fails_the_scan) {
  ASSERT_EQ(category_of(fake_collector(Category::Disk)), Category::Disk);
  app::Scanner scanner(test_config(ScanMode::Quick), [](Category) { return fake_collector(Category::Startup); });
  auto r = scanner.run();
  ASSERT_EQ(r.state, ScanState::Failed);
  ASSERT_EQ(r.error, std::string("collector for Processes reports Startup"));
}

TEST(quick_mode_honours_configured_categories) {
  auto cfg = test_config(ScanMode::Quick);
  cfg.quick_categories = {Category::Disk, Category::Startup, Category::Disk};
  auto cats = cfg.categories();
  ASSERT_EQ(cats.size(), size_t{2});
  ASSERT_EQ(cats[0], Category::Startup);
  ASSERT_EQ(cats[1], Category::Disk);
  app::Scanner scanner(cfg, [](Category c){ return fake_collector(c); });
  auto r = scanner.run();
  ASSERT_EQ(r.per_category.size(), size_t{2});
  ASSERT_EQ(r.per_category.count(Category::Process), size_t{0});
}

TEST(factory_failure_fails_the_scan) {
  app::Scanner scanner(test_config(ScanMode::Full), [](Category c) -> Collector {
    if (c == Category::Disk) throw std::runtime_error("no disk backend");
    return fake_collector(c);
  });
  auto r = scanner.run();
  ASSERT_EQ(r.state, ScanState::Failed);
  ASSERT_EQ(scanner.state(), ScanState::Failed);
  ASSERT_EQ(r.error, std::string("no disk backend"));
}

TEST(scanner_is_single_use) {
  app::Scanner scanner(test_config(ScanMode::Quick), [](Category c){ return fake_collector(c); });
  auto first = scanner.run();
  ASSERT_EQ(first.state, ScanState::Completed);
  auto second = scanner.run();
  ASSERT_EQ(second.state, ScanState::Failed);
}

TEST(unavailable_source_reports_failure_not_findings) {
  struct Unreadable : DiskSource {
    bool read(const app::ScanConfig&, DiskSnapshot& out, std::stop_token) override {
      out.error = "cannot read /proc/self/mounts";
      return false;
    }
    const char* name() const override { return "unreadable"; }
  };
  DiskCollector c(std::make_unique<Unreadable>());
  auto r = c.collect(app::ScanConfig{}, {});
  ASSERT_TRUE(r.failure.has_value());
  ASSERT_EQ(r.failure->kind, FailureKind::DomainUnavailable);
  ASSERT_EQ(r.failure->message, std::string("cannot read /proc/self/mounts"));
  ASSERT_TRUE(r.findings.empty());
}
