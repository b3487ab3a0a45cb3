#include "collectors/TaskCollector.hpp"
#include "collectors/SourceRunner.hpp"
#include "collectors/StartupCollector.hpp"
#include "app/Classifier.hpp"
#include "util/Procfs.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <set>
#include <sstream>
#include <unordered_set>

namespace sysvet::collectors {

using namespace sysvet::model;
namespace metric = sysvet::app::metric;

static constexpr uint64_t kMinute = 60;
static constexpr uint64_t kHour = 3600;
static constexpr uint64_t kDay = 86400;
static constexpr uint64_t kWeek = 7 * kDay;

static std::string trim(const std::string& s) {
  size_t b = s.find_first_not_of(" \t\r");
  if (b == std::string::npos) return {};
  size_t e = s.find_last_not_of(" \t\r");
  return s.substr(b, e - b + 1);
}

static bool ends_with(const std::string& s, std::string_view suf) {
  return s.size() >= suf.size() && s.compare(s.size() - suf.size(), suf.size(), suf) == 0;
}

// Values of one cron field. nullopt for names (jan, mon) and malformed input.
static std::optional<std::set<int>> expand_field(const std::string& field, int lo, int hi) {
  std::set<int> out;
  std::istringstream ss(field);
  std::string part;
  while (std::getline(ss, part, ',')) {
    if (part.empty()) return std::nullopt;
    int step = 1;
    if (auto slash = part.find('/'); slash != std::string::npos) {
      step = std::atoi(part.c_str() + slash + 1);
      if (step <= 0) return std::nullopt;
      part = part.substr(0, slash);
      if (part != "*" && part.find('-') == std::string::npos) part += "-" + std::to_string(hi);
    }
    int a = lo, b = hi;
    if (part != "*") {
      if (part.empty() || !std::isdigit(static_cast<unsigned char>(part[0]))) return std::nullopt;
      auto dash = part.find('-');
      a = std::atoi(part.c_str());
      b = dash == std::string::npos ? a : std::atoi(part.c_str() + dash + 1);
    }
    if (a < lo || b > hi || a > b) return std::nullopt;
    for (int v = a; v <= b; v += step) out.insert(v);
  }
  if (out.empty()) return std::nullopt;
  return out;
}

static uint64_t min_gap(const std::set<int>& values, int period) {
  if (values.size() <= 1) return static_cast<uint64_t>(period);
  int best = period - *values.rbegin() + *values.begin();
  int prev = -1;
  for (int v : values) {
    if (prev >= 0) best = std::min(best, v - prev);
    prev = v;
  }
  return static_cast<uint64_t>(best);
}

std::optional<uint64_t> CronTimerSource::cron_interval(const std::string& minute, const std::string& hour,
                                                        const std::string& dom, const std::string& month,
                                                        const std::string& dow) {
  auto m = expand_field(minute, 0, 59);
  auto h = expand_field(hour, 0, 23);
  if (!m || !h) return std::nullopt;
  if (m->size() > 1) return min_gap(*m, 60) * kMinute;
  if (h->size() > 1) return min_gap(*h, 24) * kHour;
  if (dom != "*" || month != "*") return std::nullopt;
  if (dow == "*") return kDay;
  auto d = expand_field(dow, 0, 7);
  if (!d) return std::nullopt;
  if (d->erase(7)) d->insert(0); // 7 is Sunday too
  return d->size() > 1 ? min_gap(*d, 7) * kDay : kWeek;
}

// The program a shell command line runs, looking through "test -x X &&" guards.
static std::string command_program(const std::string& command) {
  std::istringstream ss(command);
  std::vector<std::string> toks;
  std::string t;
  while (ss >> t && toks.size() < 3) toks.push_back(t);
  if (toks.empty()) return {};
  if ((toks[0] == "test" || toks[0] == "[") && toks.size() == 3 && (toks[1] == "-x" || toks[1] == "-f")) return toks[2];
  return XdgStartupSource::exec_program(command);
}

std::optional<TaskRecord> CronTimerSource::parse_cron_line(const std::string& raw, bool system_table,
                                                           const std::string& owner) {
  std::string line = trim(raw);
  if (line.empty() || line[0] == '#') return std::nullopt;
  std::istringstream ss(line);
  std::string first;
  ss >> first;
  // VAR=value and VAR = value
  if (first[0] != '@' && !std::isdigit(static_cast<unsigned char>(first[0])) && first[0] != '*') return std::nullopt;

  TaskRecord t;
  t.owner = owner;
  if (first[0] == '@') {
    static const std::pair<const char*, uint64_t> kKeywords[] = {
      {"@hourly", kHour}, {"@daily", kDay}, {"@midnight", kDay}, {"@weekly", kWeek},
      {"@monthly", 30 * kDay}, {"@yearly", 365 * kDay}, {"@annually", 365 * kDay},
    };
    if (first == "@reboot") t.boot_trigger = true;
    else {
      auto it = std::find_if(std::begin(kKeywords), std::end(kKeywords), [&](const auto& k){ return first == k.first; });
      if (it == std::end(kKeywords)) return std::nullopt;
      t.interval_seconds = it->second;
    }
  } else {
    std::string f[4];
    if (!(ss >> f[0] >> f[1] >> f[2] >> f[3])) return std::nullopt;
    t.interval_seconds = cron_interval(first, f[0], f[1], f[2], f[3]);
  }
  if (system_table && !(ss >> t.owner)) return std::nullopt;
  std::string rest;
  std::getline(ss, rest);
  t.command = trim(rest);
  if (t.command.empty()) return std::nullopt;

  const std::string prog = command_program(t.command);
  const bool absolute = !prog.empty() && prog[0] == '/';
  t.third_party = absolute ? !app::is_os_path(prog) : !system_table;
  return t;
}

std::optional<uint64_t> CronTimerSource::parse_timespan(const std::string& s) {
  static const std::pair<const char*, double> kUnits[] = {
    {"usec", 1e-6}, {"us", 1e-6}, {"msec", 1e-3}, {"ms", 1e-3},
    {"seconds", 1}, {"second", 1}, {"sec", 1}, {"s", 1},
    {"minutes", 60}, {"minute", 60}, {"min", 60}, {"m", 60},
    {"hours", 3600}, {"hour", 3600}, {"hr", 3600}, {"h", 3600},
    {"days", 86400}, {"day", 86400}, {"d", 86400},
    {"weeks", 604800}, {"week", 604800}, {"w", 604800},
    {"months", 2629800}, {"month", 2629800}, {"M", 2629800},
    {"years", 31557600}, {"year", 31557600}, {"y", 31557600},
  };
  double total = 0;
  bool any = false;
  size_t i = 0;
  while (i < s.size()) {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    if (i >= s.size()) break;
    size_t start = i;
    while (i < s.size() && (std::isdigit(static_cast<unsigned char>(s[i])) || s[i] == '.')) ++i;
    if (i == start) return std::nullopt;
    double value = std::strtod(s.substr(start, i - start).c_str(), nullptr);
    while (i < s.size() && s[i] == ' ') ++i;
    size_t ustart = i;
    while (i < s.size() && std::isalpha(static_cast<unsigned char>(s[i]))) ++i;
    std::string unit = s.substr(ustart, i - ustart);
    double mult = 1;
    if (!unit.empty()) {
      auto it = std::find_if(std::begin(kUnits), std::end(kUnits), [&](const auto& u){ return unit == u.first; });
      if (it == std::end(kUnits)) return std::nullopt;
      mult = it->second;
    }
    total += value * mult;
    any = true;
  }
  if (!any) return std::nullopt;
  return static_cast<uint64_t>(total);
}

std::optional<uint64_t> CronTimerSource::calendar_interval(const std::string& expr) {
  static const std::pair<const char*, uint64_t> kShorthands[] = {
    {"minutely", kMinute}, {"hourly", kHour}, {"daily", kDay}, {"weekly", kWeek},
    {"monthly", 30 * kDay}, {"quarterly", 91 * kDay}, {"semiannually", 182 * kDay},
    {"yearly", 365 * kDay}, {"annually", 365 * kDay},
  };
  std::string e = trim(expr);
  for (const auto& [name, secs] : kShorthands)
    if (e == name) return secs;

  std::istringstream ss(e);
  std::string tok, weekday, date, time;
  while (ss >> tok) {
    if (tok.find(':') != std::string::npos) time = tok;
    else if (std::isalpha(static_cast<unsigned char>(tok[0]))) weekday = tok;
    else date = tok;
  }
  if (time.empty()) time = "00:00:00";
  auto c1 = time.find(':');
  std::string hour = time.substr(0, c1);
  std::string minute = time.substr(c1 + 1);
  minute = minute.substr(0, minute.find(':'));
  auto m = expand_field(minute, 0, 59);
  auto h = expand_field(hour, 0, 23);
  if (!m || !h) return std::nullopt;
  if (m->size() > 1) return min_gap(*m, 60) * kMinute;
  if (h->size() > 1) return min_gap(*h, 24) * kHour;
  if (!date.empty() && date != "*-*-*" && date != "*-*") return std::nullopt;
  if (weekday.empty()) return kDay;
  bool several = weekday.find(',') != std::string::npos || weekday.find("..") != std::string::npos;
  return several ? kDay : kWeek;
}

void CronTimerSource::parse_timer(const std::string& body, const std::string& timer_name, TaskRecord& out) {
  std::istringstream ss(body);
  std::string line;
  bool in_timer = false;
  std::string unit;
  auto keep_min = [&out](std::optional<uint64_t> v){
    if (v && (!out.interval_seconds || *v < *out.interval_seconds)) out.interval_seconds = v;
  };
  while (std::getline(ss, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#' || line[0] == ';') continue;
    if (line[0] == '[') { in_timer = (line == "[Timer]"); continue; }
    if (!in_timer) continue;
    auto eq = line.find('=');
    if (eq == std::string::npos) continue;
    std::string key = trim(line.substr(0, eq));
    std::string val = trim(line.substr(eq + 1));
    if (val.empty()) continue;
    if (key == "OnBootSec" || key == "OnStartupSec") out.boot_trigger = true;
    else if (key == "OnUnitActiveSec" || key == "OnUnitInactiveSec") keep_min(parse_timespan(val));
    else if (key == "OnCalendar") keep_min(calendar_interval(val));
    else if (key == "Unit") unit = val;
  }
  if (unit.empty() && ends_with(timer_name, ".timer"))
    unit = timer_name.substr(0, timer_name.size() - 6) + ".service";
  out.command = unit;
}

static std::string exec_start_of(const std::string& body) {
  std::istringstream ss(body);
  std::string line;
  while (std::getline(ss, line)) {
    line = trim(line);
    if (line.rfind("ExecStart=", 0) == 0) return line.substr(10);
  }
  return {};
}

static bool vendor_unit(const std::string& path) {
  return path.rfind("/usr/lib/systemd/", 0) == 0 || path.rfind("/lib/systemd/", 0) == 0;
}

static std::string resolve_link(const std::string& dir, const std::string& name) {
  std::string path = dir + "/" + name;
  if (auto link = util::read_symlink(path))
    path = (!link->empty() && (*link)[0] == '/') ? *link : dir + "/" + *link;
  return path;
}

// Cron ignores names with dots and editor/package leftovers in cron.d
static bool cron_file_ignored(const std::string& name) {
  return name.empty() || name[0] == '.' || name.back() == '~' || name.find(".dpkg-") != std::string::npos ||
         name.find(".rpm") != std::string::npos;
}

struct TimerDir { std::string dir; bool user; };

bool CronTimerSource::read(const app::ScanConfig& cfg, TaskSnapshot& out, std::stop_token st) {
  size_t readable = 0;

  auto read_table = [&](const std::string& path, bool system_table, const std::string& owner) {
    auto body = util::read_file_string(path);
    if (!body) { out.notes.push_back("cannot read " + path); return; }
    ++readable;
    std::istringstream ss(*body);
    std::string line;
    size_t lineno = 0;
    while (std::getline(ss, line)) {
      ++lineno;
      auto t = parse_cron_line(line, system_table, owner);
      if (!t) continue;
      t->name = std::filesystem::path(path).filename().string() + ":" + std::to_string(lineno);
      t->origin = path;
      out.tasks.push_back(std::move(*t));
    }
  };

  if (util::path_exists("/etc/crontab")) read_table("/etc/crontab", true, {});

  struct CronDir { const char* dir; bool system_table; };
  for (const CronDir& cd : {CronDir{"/etc/cron.d", true}, CronDir{"/var/spool/cron/crontabs", false},
                            CronDir{"/var/spool/cron", false}}) {
    if (st.stop_requested()) return false;
    auto names = util::list_dir(cd.dir);
    if (!names) { out.notes.push_back(std::string("cannot read ") + cd.dir + " (not elevated?)"); continue; }
    if (names->empty()) { if (util::is_directory(cd.dir)) ++readable; continue; }
    ++readable;
    std::sort(names->begin(), names->end());
    for (const auto& n : *names) {
      std::string path = std::string(cd.dir) + "/" + n;
      if (cron_file_ignored(n) || util::is_directory(path)) continue;
      read_table(path, cd.system_table, cd.system_table ? std::string() : n);
    }
  }

  std::vector<TimerDir> timer_dirs{{"/etc/systemd/system", false}, {"/usr/lib/systemd/system", false},
                                   {"/lib/systemd/system", false}};
  if (!cfg.home.empty()) timer_dirs.push_back({cfg.home + "/.config/systemd/user", true});
  const std::string user = cfg.home.empty() ? std::string() : std::filesystem::path(cfg.home).filename().string();

  auto enabled = [&](const std::string& name, bool user_unit) {
    const char* sys_wants[] = {"/etc/systemd/system/timers.target.wants", "/usr/lib/systemd/system/timers.target.wants",
                               "/lib/systemd/system/timers.target.wants"};
    if (user_unit) return util::path_exists(cfg.home + "/.config/systemd/user/timers.target.wants/" + name);
    return std::any_of(std::begin(sys_wants), std::end(sys_wants),
                       [&](const char* w){ return util::path_exists(std::string(w) + "/" + name); });
  };
  auto find_unit = [&](const std::string& name, bool user_unit) -> std::optional<std::string> {
    for (const auto& td : timer_dirs) {
      if (td.user != user_unit) continue;
      auto body = util::read_file_string(resolve_link(td.dir, name));
      if (body) return body;
    }
    return std::nullopt;
  };

  std::unordered_set<std::string> seen;
  for (const auto& td : timer_dirs) {
    if (st.stop_requested()) return false;
    auto names = util::list_dir(td.dir);
    if (!names) { out.notes.push_back("cannot read " + td.dir); continue; }
    if (names->empty()) { if (util::is_directory(td.dir)) ++readable; continue; }
    ++readable;
    std::sort(names->begin(), names->end());
    for (const auto& n : *names) {
      if (!ends_with(n, ".timer")) continue;
      if (!seen.insert((td.user ? "user:" : "system:") + n).second) continue; // /etc shadows /usr/lib
      std::string path = resolve_link(td.dir, n);
      if (path == "/dev/null") continue; // masked
      auto body = util::read_file_string(path);
      if (!body) { out.notes.push_back("cannot read " + path); continue; }
      TaskRecord t;
      t.name = n;
      t.origin = path;
      t.owner = td.user ? user : std::string();
      parse_timer(*body, n, t);
      t.enabled = enabled(n, td.user);
      t.third_party = !vendor_unit(path);
      if (auto svc = find_unit(t.command, td.user)) {
        std::string exec = exec_start_of(*svc);
        std::string prog = XdgStartupSource::exec_program(exec);
        if (!prog.empty() && prog[0] == '/' && !app::is_os_path(prog)) t.third_party = true;
        if (!exec.empty()) t.command = exec;
      }
      out.tasks.push_back(std::move(t));
    }
  }

  if (readable == 0) { out.error = "no cron table or timer directory readable"; return false; }
  return true;
}

TaskCollector::TaskCollector(std::unique_ptr<TaskSource> source) : source_(std::move(source)) {}

std::vector<Finding> TaskCollector::to_findings(const TaskSnapshot& snap) {
  std::vector<Finding> out;
  for (const auto& t : snap.tasks) {
    if (!t.third_party && !t.boot_trigger) continue;
    Metrics m;
    m[metric::kName] = t.name;
    m[metric::kCommand] = t.command;
    m[metric::kSource] = t.origin;
    if (!t.owner.empty()) m[metric::kOwner] = t.owner;
    m[metric::kBootTrigger] = t.boot_trigger ? 1.0 : 0.0;
    if (t.interval_seconds) m[metric::kIntervalSeconds] = static_cast<double>(*t.interval_seconds);
    m[metric::kEnabled] = t.enabled ? 1.0 : 0.0;
    m[metric::kThirdParty] = t.third_party ? 1.0 : 0.0;
    out.push_back(app::make_finding(Category::ScheduledTask, t.name, std::move(m)));
  }
  std::stable_sort(out.begin(), out.end(), [](const Finding& a, const Finding& b){
    if (a.third_party != b.third_party) return a.third_party;
    return static_cast<int>(a.severity) > static_cast<int>(b.severity);
  });
  if (out.size() > kMaxTasks) out.resize(kMaxTasks);
  return out;
}

CollectorResult TaskCollector::collect(const app::ScanConfig& cfg, std::stop_token st) {
  return run_source<TaskSnapshot>(kCategory, *source_, cfg, st, [](const TaskSnapshot& snap, CollectorResult& res){
    res.findings = to_findings(snap);
  });
}

} // namespace sysvet::collectors
