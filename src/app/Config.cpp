#include "app/Config.hpp"
#include "util/Log.hpp"
#include "util/TomlReader.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>

namespace sysvet::app {

using model::Category;

std::vector<Category> ScanConfig::categories() const {
  if (mode == model::ScanMode::Full)
    return std::vector<Category>(model::kAllCategories.begin(), model::kAllCategories.end());
  // Keep declaration order and drop duplicates regardless of how the list was configured
  std::vector<Category> out;
  for (auto c : model::kAllCategories)
    if (std::find(quick_categories.begin(), quick_categories.end(), c) != quick_categories.end())
      out.push_back(c);
  return out;
}

std::chrono::milliseconds ScanConfig::timeout_for(Category c) const {
  auto it = timeouts.find(c);
  if (it != timeouts.end()) return it->second;
  return std::chrono::milliseconds(10000);
}

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("SYSVET_", 0) == 0) {
    alt = std::string("sysvet_") + n.substr(7);
  } else if (n.rfind("sysvet_", 0) == 0) {
    alt = std::string("SYSVET_") + n.substr(7);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try { return std::stoi(v); } catch (const std::exception&) { return defv; }
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/sysvet/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/sysvet/config.toml";
  return {};
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  int v = def;
  if (have_toml && toml.has(section, key)) v = toml.get_int(section, key, def);
  if (env_name) v = getenv_int(env_name, v);
  return v;
}

struct TimeoutKey { Category category; const char* toml_key; const char* env_name; };

static constexpr TimeoutKey kTimeoutKeys[] = {
  {Category::Startup,       "startup",   "SYSVET_TIMEOUT_STARTUP_MS"},
  {Category::Service,       "services",  "SYSVET_TIMEOUT_SERVICES_MS"},
  {Category::Process,       "processes", "SYSVET_TIMEOUT_PROCESSES_MS"},
  {Category::Disk,          "disk",      "SYSVET_TIMEOUT_DISK_MS"},
  {Category::Driver,        "drivers",   "SYSVET_TIMEOUT_DRIVERS_MS"},
  {Category::ScheduledTask, "tasks",     "SYSVET_TIMEOUT_TASKS_MS"},
};

ScanConfig load_config(const std::string& path) {
  ScanConfig cfg;
  if (const char* home = std::getenv("HOME"); home && *home) cfg.home = home;

  util::TomlReader toml;
  std::string file = path.empty() ? config_file_path() : path;
  bool have_toml = !file.empty() && toml.load(file);
  if (!have_toml && !path.empty())
    util::logf(util::LogLevel::Warn, "config: cannot read %s, using defaults", path.c_str());
  else if (have_toml)
    util::logf(util::LogLevel::Info, "config: loaded %s", file.c_str());

  if (have_toml && toml.has("scan", "quick_categories")) {
    std::vector<Category> quick;
    for (const auto& name : toml.get_list("scan", "quick_categories")) {
      if (auto c = model::parse_category(name)) quick.push_back(*c);
      else util::logf(util::LogLevel::Warn, "config: unknown category '%s' in quick_categories", name.c_str());
    }
    cfg.quick_categories = std::move(quick);
  }

  int top_n = resolve_int(toml, have_toml, "scan", "process_top_n", "SYSVET_TOP_N", static_cast<int>(cfg.process_top_n));
  cfg.process_top_n = static_cast<size_t>(std::clamp(top_n, 1, 1000));
  int window = resolve_int(toml, have_toml, "scan", "sample_window_ms", "SYSVET_SAMPLE_MS",
                           static_cast<int>(cfg.sample_window.count()));
  cfg.sample_window = std::chrono::milliseconds(std::clamp(window, 100, 10000));

  for (const auto& k : kTimeoutKeys) {
    int def = static_cast<int>(cfg.timeout_for(k.category).count());
    int ms = resolve_int(toml, have_toml, "timeouts", k.toml_key, k.env_name, def);
    if (ms < 100) ms = 100;
    cfg.timeouts[k.category] = std::chrono::milliseconds(ms);
  }

  if (have_toml && toml.has("disk", "temp_paths")) cfg.temp_paths = toml.get_list("disk", "temp_paths");
  if (const char* tmpdir = std::getenv("TMPDIR"); tmpdir && *tmpdir) {
    std::string t(tmpdir);
    while (t.size() > 1 && t.back() == '/') t.pop_back();
    if (std::find(cfg.temp_paths.begin(), cfg.temp_paths.end(), t) == cfg.temp_paths.end()) cfg.temp_paths.push_back(t);
  }
  if (have_toml && toml.has("disk", "smartctl")) cfg.smartctl = toml.get_string("disk", "smartctl");
  if (const char* v = getenv_compat("SYSVET_SMARTCTL")) cfg.smartctl = v;
  return cfg;
}

} // namespace sysvet::app
