#pragma once

#include "model/Finding.hpp"
#include "model/ScanResult.hpp"
#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace sysvet::app {

// Read-only inputs for one scan. Built once in main and threaded through the
// orchestrator and every collector; nothing here changes classification rules.
struct ScanConfig {
  model::ScanMode mode{model::ScanMode::Full};
  bool elevated{false};
  std::vector<model::Category> quick_categories{model::Category::Startup, model::Category::Process};
  std::map<model::Category, std::chrono::milliseconds> timeouts{
    {model::Category::Startup,       std::chrono::milliseconds(10000)},
    {model::Category::Service,       std::chrono::milliseconds(10000)},
    {model::Category::Process,       std::chrono::milliseconds(15000)},
    {model::Category::Disk,          std::chrono::milliseconds(10000)},
    {model::Category::Driver,        std::chrono::milliseconds(60000)},
    {model::Category::ScheduledTask, std::chrono::milliseconds(60000)},
  };
  size_t process_top_n{20};
  std::chrono::milliseconds sample_window{2000};
  std::vector<std::string> temp_paths{"/tmp", "/var/tmp"};
  std::string smartctl{"smartctl"};
  std::string home;  // user home for per-user locations; empty skips them

  [[nodiscard]] std::vector<model::Category> categories() const;
  [[nodiscard]] std::chrono::milliseconds timeout_for(model::Category c) const;
};

// Environment variable helpers. SYSVET_X and sysvet_X are both accepted.
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);

// $XDG_CONFIG_HOME/sysvet/config.toml or ~/.config/sysvet/config.toml
std::string config_file_path();

// Defaults <- TOML file (if readable) <- environment. An empty path uses
// config_file_path(). A missing file is not an error.
ScanConfig load_config(const std::string& path = {});

} // namespace sysvet::app
