#include "collectors/StartupCollector.hpp"
#include "collectors/SourceRunner.hpp"
#include "app/Classifier.hpp"
#include "util/Procfs.hpp"
#include "util/Subprocess.hpp"

#include <algorithm>
#include <filesystem>
#include <sstream>
#include <unordered_set>

namespace sysvet::collectors {

using namespace sysvet::model;
namespace metric = sysvet::app::metric;

static std::string trim(std::string s) {
  while (!s.empty() && (s.back() == '\r' || s.back() == ' ' || s.back() == '\t')) s.pop_back();
  size_t i = 0; while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) ++i;
  return s.substr(i);
}

static bool ends_with(const std::string& s, const char* suffix) {
  std::string_view suf(suffix);
  return s.size() >= suf.size() && s.compare(s.size() - suf.size(), suf.size(), suf) == 0;
}

bool XdgStartupSource::parse_desktop_entry(const std::string& body, std::string& name, std::string& exec) {
  std::istringstream ss(body);
  std::string line;
  bool in_entry = false;
  bool hidden = false;
  name.clear(); exec.clear();
  while (std::getline(ss, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (line.front() == '[') { in_entry = (line == "[Desktop Entry]"); continue; }
    if (!in_entry) continue;
    auto eq = line.find('=');
    if (eq == std::string::npos) continue;
    std::string key = trim(line.substr(0, eq));
    std::string val = trim(line.substr(eq + 1));
    if (key == "Name" && name.empty()) name = val;
    else if (key == "Exec") exec = val;
    else if (key == "Hidden" && val == "true") hidden = true;
    else if (key == "X-GNOME-Autostart-enabled" && val == "false") hidden = true;
  }
  return !hidden && !exec.empty();
}

std::string XdgStartupSource::exec_program(const std::string& exec) {
  std::istringstream ss(exec);
  std::string tok;
  while (ss >> tok) {
    // systemd ExecStart= prefixes
    while (!tok.empty() && (tok[0] == '-' || tok[0] == '@' || tok[0] == ':' || tok[0] == '+' || tok[0] == '!')) tok.erase(0, 1);
    if (tok.size() >= 2 && (tok.front() == '"' || tok.front() == '\'')) tok = tok.substr(1, tok.size() - 2);
    if (tok.empty() || tok == "env" || tok == "/usr/bin/env") continue;
    if (tok.find('=') != std::string::npos && tok[0] != '/') continue; // VAR=value
    return tok;
  }
  return {};
}

// Launchers whose identity lives in the arguments, not the binary
static bool is_wrapper(const std::string& exe) {
  auto base = std::filesystem::path(exe).filename().string();
  static const std::unordered_set<std::string> wrappers = {
    "flatpak", "snap", "sh", "bash", "dash", "zsh", "python", "python3", "java", "wine", "gtk-launch",
  };
  return wrappers.count(base) != 0;
}

static std::string resolve_exe(const std::string& program) {
  if (program.empty()) return {};
  std::string path = program;
  if (program[0] != '/') {
    auto found = util::find_in_path(program);
    if (!found) return {};
    path = *found;
  }
  std::error_code ec;
  auto canon = std::filesystem::weakly_canonical(util::map_path(path), ec);
  if (ec) return path;
  return util::unmap_path(canon.string());
}

// Reads [Unit] Description= and [Service] ExecStart= from a unit file body
static void parse_unit(const std::string& body, std::string& description, std::string& exec_start) {
  std::istringstream ss(body);
  std::string line;
  while (std::getline(ss, line)) {
    line = trim(line);
    if (line.rfind("Description=", 0) == 0 && description.empty()) description = line.substr(12);
    else if (line.rfind("ExecStart=", 0) == 0 && exec_start.empty()) exec_start = line.substr(10);
  }
}

struct Location { std::string dir; const char* source; StartupScope scope; bool units; };

bool XdgStartupSource::read(const app::ScanConfig& cfg, StartupSnapshot& out, std::stop_token st) {
  std::vector<Location> locations;
  if (!cfg.home.empty()) {
    locations.push_back({cfg.home + "/.config/autostart", "user autostart", StartupScope::User, false});
    locations.push_back({cfg.home + "/.config/systemd/user/default.target.wants", "user systemd unit", StartupScope::User, true});
  }
  locations.push_back({"/etc/xdg/autostart", "machine autostart", StartupScope::Machine, false});
  locations.push_back({"/etc/systemd/user/default.target.wants", "machine systemd unit", StartupScope::Machine, true});

  size_t readable = 0;
  // A user autostart file shadows the machine file with the same name, even when it hides it
  std::unordered_set<std::string> shadowed;
  for (const auto& loc : locations) {
    if (st.stop_requested()) return false;
    auto names = util::list_dir(loc.dir);
    if (!names) {
      out.notes.push_back("cannot read " + loc.dir);
      continue;
    }
    ++readable;
    std::sort(names->begin(), names->end());
    for (const auto& fname : *names) {
      std::string path = loc.dir + "/" + fname;
      StartupEntry e;
      e.location = path;
      e.source = loc.source;
      e.scope = loc.scope;
      if (!loc.units) {
        if (!ends_with(fname, ".desktop")) continue;
        if (loc.scope == StartupScope::Machine && shadowed.count(fname)) continue;
        if (loc.scope == StartupScope::User) shadowed.insert(fname);
        auto body = util::read_file_string(path);
        if (!body) { out.notes.push_back("cannot read " + path); continue; }
        if (!parse_desktop_entry(*body, e.name, e.command)) continue;
        if (e.name.empty()) e.name = fname.substr(0, fname.size() - 8);
      } else {
        if (!ends_with(fname, ".service")) continue;
        // wants/ entries are symlinks to the real unit file
        std::string target = path;
        if (auto link = util::read_symlink(path)) {
          target = (!link->empty() && (*link)[0] == '/') ? *link : loc.dir + "/" + *link;
        }
        auto body = util::read_file_string(target);
        if (!body) { out.notes.push_back("cannot read " + target); continue; }
        std::string description;
        parse_unit(*body, description, e.command);
        if (e.command.empty()) continue;
        e.name = fname.substr(0, fname.size() - 8); // drop ".service"
        e.location = target;
      }
      e.exe_path = resolve_exe(exec_program(e.command));
      out.entries.push_back(std::move(e));
    }
  }
  if (readable == 0) {
    out.error = "no autostart location readable";
    return false;
  }
  return true;
}

StartupCollector::StartupCollector(std::unique_ptr<StartupSource> source) : source_(std::move(source)) {}

std::vector<Finding> StartupCollector::to_findings(const StartupSnapshot& snap) {
  std::vector<Finding> out;
  std::unordered_set<std::string> seen;
  for (const auto& e : snap.entries) {
    std::string key = e.exe_path.empty() ? e.command : e.exe_path;
    if (!e.exe_path.empty() && is_wrapper(e.exe_path)) key = e.command;
    if (!seen.insert(key).second) continue;
    Metrics m;
    m[metric::kName] = e.name;
    m[metric::kCommand] = e.command;
    m[metric::kSource] = e.source;
    m[metric::kExecPath] = e.exe_path.empty() ? MetricValue{Unknown{}} : MetricValue{e.exe_path};
    out.push_back(app::make_finding(Category::Startup, e.name, std::move(m)));
  }
  std::stable_sort(out.begin(), out.end(), [](const Finding& a, const Finding& b){
    return static_cast<int>(a.impact) > static_cast<int>(b.impact);
  });
  return out;
}

CollectorResult StartupCollector::collect(const app::ScanConfig& cfg, std::stop_token st) {
  return run_source<StartupSnapshot>(kCategory, *source_, cfg, st, [](const StartupSnapshot& snap, CollectorResult& res){
    res.findings = to_findings(snap);
  });
}

} // namespace sysvet::collectors
