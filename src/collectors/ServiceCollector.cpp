#include "collectors/ServiceCollector.hpp"
#include "collectors/SourceRunner.hpp"
#include "collectors/StartupCollector.hpp"
#include "app/Classifier.hpp"
#include "util/Procfs.hpp"

#include <algorithm>
#include <sstream>
#include <unordered_set>

namespace sysvet::collectors {

using namespace sysvet::model;
namespace metric = sysvet::app::metric;

static constexpr const char* kUnitDir = "/etc/systemd/system";

static bool ends_with(const std::string& s, std::string_view suf) {
  return s.size() >= suf.size() && s.compare(s.size() - suf.size(), suf.size(), suf) == 0;
}

static void parse_unit(const std::string& body, ServiceUnit& u) {
  std::istringstream ss(body);
  std::string line;
  while (std::getline(ss, line)) {
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) line.pop_back();
    if (line.rfind("Description=", 0) == 0 && u.description.empty()) u.description = line.substr(12);
    else if (line.rfind("ExecStart=", 0) == 0 && u.exec_path.empty())
      u.exec_path = XdgStartupSource::exec_program(line.substr(10));
  }
}

RunState SystemdServiceSource::run_state(const std::string& unit) {
  // Instances of templates live in a per-template slice: system-getty.slice/getty@tty1.service
  std::string rel = unit;
  if (auto at = unit.find('@'); at != std::string::npos) rel = "system-" + unit.substr(0, at) + ".slice/" + unit;
  for (const char* base : {"/sys/fs/cgroup/system.slice", "/sys/fs/cgroup/systemd/system.slice"}) {
    if (!util::is_directory(base)) continue;
    return util::is_directory(std::string(base) + "/" + rel) ? RunState::Running : RunState::Stopped;
  }
  return RunState::Unknown;
}

bool SystemdServiceSource::read(const app::ScanConfig&, ServiceSnapshot& out, std::stop_token st) {
  auto entries = util::list_dir(kUnitDir);
  if (!entries) { out.error = std::string("cannot read ") + kUnitDir; return false; }
  if (entries->empty() && !util::is_directory(kUnitDir)) { out.error = "systemd unit directory not present"; return false; }
  std::sort(entries->begin(), entries->end());

  std::unordered_set<std::string> seen;
  for (const auto& dir : *entries) {
    if (!ends_with(dir, ".target.wants")) continue;
    std::string wants = std::string(kUnitDir) + "/" + dir;
    auto links = util::list_dir(wants);
    if (!links) { out.notes.push_back("cannot read " + wants); continue; }
    std::sort(links->begin(), links->end());
    for (const auto& name : *links) {
      if (st.stop_requested()) return false;
      if (!ends_with(name, ".service") || !seen.insert(name).second) continue;
      ServiceUnit u;
      u.name = name;
      u.wanted_by = dir.substr(0, dir.size() - 6); // drop ".wants"
      std::string path = wants + "/" + name;
      if (auto link = util::read_symlink(path)) {
        path = (!link->empty() && (*link)[0] == '/') ? *link : wants + "/" + *link;
      }
      if (path == "/dev/null") continue; // masked
      u.unit_path = path;
      if (auto body = util::read_file_string(path)) parse_unit(*body, u);
      else out.notes.push_back("cannot read unit " + path);
      u.state = run_state(name);
      out.units.push_back(std::move(u));
    }
  }
  return true;
}

ServiceCollector::ServiceCollector(std::unique_ptr<ServiceSource> source) : source_(std::move(source)) {}

bool ServiceCollector::is_third_party(const ServiceUnit& u) {
  const bool vendor_unit = u.unit_path.rfind("/usr/lib/systemd/", 0) == 0 || u.unit_path.rfind("/lib/systemd/", 0) == 0;
  if (!vendor_unit) return true;
  if (!u.exec_path.empty() && u.exec_path[0] == '/' && !app::is_os_path(u.exec_path)) return true;
  return false;
}

std::vector<Finding> ServiceCollector::to_findings(const ServiceSnapshot& snap) {
  std::vector<Finding> out;
  for (const auto& u : snap.units) {
    Metrics m;
    m[metric::kName] = u.description.empty() ? u.name : u.description;
    m[metric::kUnitPath] = u.unit_path;
    if (!u.exec_path.empty()) m[metric::kExecPath] = u.exec_path;
    m[metric::kThirdParty] = is_third_party(u) ? 1.0 : 0.0;
    switch (u.state) {
      case RunState::Running: m[metric::kState] = std::string("running"); break;
      case RunState::Stopped: m[metric::kState] = std::string("stopped"); break;
      case RunState::Unknown: m[metric::kState] = Unknown{}; break;
    }
    out.push_back(app::make_finding(Category::Service, u.name, std::move(m)));
  }
  std::stable_sort(out.begin(), out.end(), [](const Finding& a, const Finding& b){
    if (a.third_party != b.third_party) return a.third_party;
    auto running = [](const Finding& f){ auto s = text(f.metrics, metric::kState); return s && *s == "running"; };
    return running(a) && !running(b);
  });
  return out;
}

CollectorResult ServiceCollector::collect(const app::ScanConfig& cfg, std::stop_token st) {
  return run_source<ServiceSnapshot>(kCategory, *source_, cfg, st, [](const ServiceSnapshot& snap, CollectorResult& res){
    res.findings = to_findings(snap);
  });
}

} // namespace sysvet::collectors
