#include "app/Config.hpp"
#include "app/Report.hpp"
#include "app/Scanner.hpp"
#include "util/Log.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <string>
#include <thread>
#include <unistd.h>

using namespace std::chrono_literals;

static std::atomic<bool> g_stop{false};
static void on_sigint(int) { g_stop.store(true); }

static void usage(std::ostream& os) {
  os << "Usage: sysvet [--quick|--full] [--config PATH] [--strict]\n";
  os << "  --quick        scan only the quick categories (default: startup, processes)\n";
  os << "  --full         scan all six categories (default)\n";
  os << "  --config PATH  read settings from PATH instead of ~/.config/sysvet/config.toml\n";
  os << "  --strict       exit with status 3 when any critical finding is reported\n";
  os << "Notes: Ctrl+C cancels a running scan; categories not finished are reported as cancelled.\n";
}

int main(int argc, char** argv) {
  std::signal(SIGINT, on_sigint);
  bool quick = false, strict = false;
  std::string config_path;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--quick") quick = true;
    else if (a == "--full") quick = false;
    else if (a == "--strict") strict = true;
    else if (a == "--config" && i + 1 < argc) config_path = argv[++i];
    else if (a == "-h" || a == "--help") { usage(std::cout); return 0; }
    else {
      std::fprintf(stderr, "sysvet: unknown argument '%s'\n", a.c_str());
      usage(std::cerr);
      return 2;
    }
  }

  auto cfg = sysvet::app::load_config(config_path);
  cfg.mode = quick ? sysvet::model::ScanMode::Quick : sysvet::model::ScanMode::Full;
  cfg.elevated = (::geteuid() == 0);

  sysvet::app::Scanner scanner(cfg);
  // Signal handlers only set a flag; this watcher turns it into a cancel
  std::jthread watcher([&scanner](std::stop_token st) {
    while (!st.stop_requested()) {
      if (g_stop.load()) { scanner.cancel(); return; }
      std::this_thread::sleep_for(50ms);
    }
  });

  auto result = scanner.run();
  watcher.request_stop();

  std::cout << sysvet::app::render_text_report(result);
  std::cout.flush();

  if (result.state == sysvet::model::ScanState::Failed) return 1;
  if (strict) {
    auto it = result.summary.counts_by_severity.find(sysvet::model::Severity::Critical);
    if (it != result.summary.counts_by_severity.end() && it->second > 0) return 3;
  }
  return 0;
}
