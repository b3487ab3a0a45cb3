#include "collectors/ProcessCollector.hpp"
#include "collectors/SourceRunner.hpp"
#include "app/Classifier.hpp"
#include "util/Procfs.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <condition_variable>
#include <mutex>
#include <sstream>

namespace sysvet::collectors {

using namespace sysvet::model;
namespace metric = sysvet::app::metric;

ProcfsProcessSource::CpuTimes ProcfsProcessSource::read_cpu_times() {
  CpuTimes t;
  auto txt = util::read_file_string("/proc/stat"); if (!txt) return t;
  std::istringstream ss(*txt); std::string line; if (!std::getline(ss, line)) return t;
  // parse after 'cpu '
  size_t pos = line.find(' '); if (pos == std::string::npos) return t;
  std::string_view rest(line.c_str() + pos + 1);
  uint64_t vals[8]{}; int i=0; size_t start=0;
  while (i<8 && start<rest.size()) {
    while (start<rest.size() && (rest[start]==' '||rest[start]=='\t')) ++start;
    size_t end=start; while (end<rest.size() && rest[end]>='0'&&rest[end]<='9') ++end;
    if (end>start) { std::from_chars(rest.data()+start, rest.data()+end, vals[i++]); }
    start=end+1;
  }
  for (int j=0;j<8;++j) t.total+=vals[j];
  t.idle = vals[3] + vals[4]; // idle + iowait
  return t;
}

unsigned ProcfsProcessSource::read_cpu_count() {
  auto txt = util::read_file_string("/proc/stat"); if (!txt) return 1;
  std::istringstream ss(*txt); std::string line; unsigned count = 0; bool first = true;
  while (std::getline(ss, line)) {
    if (line.rfind("cpu", 0) == 0) {
      if (first) { first = false; continue; } // skip aggregate 'cpu '
      if (line.size() >= 4 && std::isdigit(static_cast<unsigned char>(line[3]))) count++;
    } else if (!first) {
      break; // stop after cpu block
    }
  }
  if (count == 0) count = 1;
  return count;
}

bool ProcfsProcessSource::parse_stat_line(const std::string& content, StatFields& out) {
  // comm may contain spaces and parentheses; it ends at the last ')'
  auto lp = content.find('('); auto rp = content.rfind(')');
  if (lp==std::string::npos||rp==std::string::npos||rp<lp||rp+2>content.size()) return false;
  out.comm = content.substr(lp+1, rp-lp-1);
  std::istringstream ss(content.substr(rp+2));
  char state = 0; int32_t ppid = 0;
  if (!(ss >> state >> ppid)) return false;
  // skip fields up to utime (9 fields)
  for (int i=0;i<9;i++){ std::string tmp; ss >> tmp; }
  if (!(ss >> out.utime >> out.stime)) return false;
  // Skip: cutime, cstime, priority, nice, num_threads, itrealvalue, starttime (7 fields)
  for (int i=0;i<7;i++){ std::string tmp; ss >> tmp; }
  unsigned long long vsize_bytes = 0;
  if (!(ss >> vsize_bytes >> out.rss_pages)) return false;
  return true;
}

bool ProcfsProcessSource::parse_io(const std::string& content, uint64_t& read_bytes, uint64_t& write_bytes) {
  std::istringstream ss(content); std::string line; bool have_r = false, have_w = false;
  while (std::getline(ss, line)) {
    if (line.rfind("read_bytes:", 0) == 0) { std::istringstream ls(line.substr(11)); have_r = static_cast<bool>(ls >> read_bytes); }
    else if (line.rfind("write_bytes:", 0) == 0) { std::istringstream ls(line.substr(12)); have_w = static_cast<bool>(ls >> write_bytes); }
  }
  return have_r && have_w;
}

bool ProcfsProcessSource::snapshot_times(std::unordered_map<int32_t, uint64_t>& out, size_t& total) {
  auto names = util::list_dir("/proc");
  if (!names || names->empty()) return false;
  total = 0;
  for (const auto& name : *names) {
    if (name.empty() || name[0]<'0' || name[0]>'9') continue; // numeric
    ++total;
    int32_t pid = static_cast<int32_t>(std::strtol(name.c_str(), nullptr, 10));
    auto content = util::read_file_string("/proc/" + name + "/stat");
    if (!content) continue; // exited between listing and reading
    StatFields f;
    if (!parse_stat_line(*content, f)) continue;
    out[pid] = f.utime + f.stime;
  }
  return true;
}

static void read_meminfo(ProcessSnapshot& out) {
  auto txt = util::read_file_string("/proc/meminfo"); if (!txt) return;
  std::istringstream ss(*txt); std::string key; uint64_t kb = 0;
  std::string line;
  while (std::getline(ss, line)) {
    std::istringstream ls(line);
    if (!(ls >> key >> kb)) continue;
    if (key == "MemTotal:") out.mem_total_bytes = kb * 1024;
    else if (key == "MemAvailable:") out.mem_available_bytes = kb * 1024;
  }
}

bool ProcfsProcessSource::read(const app::ScanConfig& cfg, ProcessSnapshot& out, std::stop_token st) {
  const unsigned ncpu = read_cpu_count();
  std::unordered_map<int32_t, uint64_t> first;
  size_t total = 0;
  CpuTimes cpu0 = read_cpu_times();
  if (!snapshot_times(first, total)) { out.error = "cannot list /proc"; return false; }

  {
    // Two-point measurement: wait out the window unless the scan is cancelled
    std::mutex mu;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lk(mu);
    (void)cv.wait_for(lk, st, cfg.sample_window, []{ return false; });
  }
  if (st.stop_requested()) return false;

  CpuTimes cpu1 = read_cpu_times();
  const uint64_t dt = (cpu1.total > cpu0.total) ? (cpu1.total - cpu0.total) : 0;
  const uint64_t didle = (cpu1.idle > cpu0.idle) ? (cpu1.idle - cpu0.idle) : 0;
  if (dt > 0) out.cpu_total_pct = 100.0 * static_cast<double>(dt - std::min(dt, didle)) / static_cast<double>(dt);
  read_meminfo(out);

  auto names = util::list_dir("/proc");
  if (!names) { out.error = "cannot list /proc"; return false; }
  const uint64_t page = static_cast<uint64_t>(::sysconf(_SC_PAGESIZE));
  size_t io_denied = 0;
  for (const auto& name : *names) {
    if (st.stop_requested()) return false;
    if (name.empty() || name[0]<'0' || name[0]>'9') continue;
    int32_t pid = static_cast<int32_t>(std::strtol(name.c_str(), nullptr, 10));
    auto it = first.find(pid);
    if (it == first.end()) continue; // started inside the window
    auto content = util::read_file_string("/proc/" + name + "/stat");
    if (!content) continue;
    StatFields f;
    if (!parse_stat_line(*content, f)) continue;

    ProcSample ps;
    ps.pid = pid;
    ps.name = f.comm;
    ps.total_time = f.utime + f.stime;
    uint64_t dp = (ps.total_time > it->second) ? (ps.total_time - it->second) : 0;
    if (dt > 0) ps.cpu_pct = (100.0 * static_cast<double>(dp) / static_cast<double>(dt)) * static_cast<double>(ncpu);
    if (f.rss_pages >= 0) ps.rss_bytes = static_cast<uint64_t>(f.rss_pages) * page;
    if (auto link = util::read_symlink("/proc/" + name + "/exe")) ps.exe_path = *link;
    if (auto io = util::read_file_string("/proc/" + name + "/io")) {
      uint64_t r = 0, w = 0;
      if (parse_io(*io, r, w)) { ps.read_bytes = r; ps.write_bytes = w; }
    } else {
      ++io_denied;
    }
    out.processes.push_back(std::move(ps));
  }
  out.total_processes = total;
  if (io_denied > 0 && !cfg.elevated)
    out.notes.push_back("I/O counters unreadable for " + std::to_string(io_denied) + " processes (not elevated)");
  return true;
}

ProcessCollector::ProcessCollector(std::unique_ptr<ProcessSource> source) : source_(std::move(source)) {}

static double rank_weight(const ProcSample& p) {
  double mem_mb = p.rss_bytes ? static_cast<double>(*p.rss_bytes) / (1024.0 * 1024.0) : 0.0;
  return p.cpu_pct + mem_mb / 100.0;
}

static MetricValue opt_metric(const std::optional<uint64_t>& v) {
  if (!v) return Unknown{};
  return static_cast<double>(*v);
}

std::vector<Finding> ProcessCollector::to_findings(const ProcessSnapshot& snap, size_t top_n) {
  std::vector<const ProcSample*> ranked;
  ranked.reserve(snap.processes.size());
  for (const auto& p : snap.processes) ranked.push_back(&p);
  // pid breaks ties so the ranking does not depend on /proc listing order
  std::sort(ranked.begin(), ranked.end(), [](const ProcSample* a, const ProcSample* b){
    double wa = rank_weight(*a), wb = rank_weight(*b);
    if (wa != wb) return wa > wb;
    return a->pid < b->pid;
  });
  if (ranked.size() > top_n) ranked.resize(top_n);

  std::vector<Finding> out;
  out.reserve(ranked.size());
  for (const auto* p : ranked) {
    Metrics m;
    m[metric::kName] = p->name;
    m[metric::kPid] = static_cast<double>(p->pid);
    m[metric::kCpuPercent] = p->cpu_pct;
    m[metric::kMemoryBytes] = opt_metric(p->rss_bytes);
    m[metric::kReadBytes] = opt_metric(p->read_bytes);
    m[metric::kWriteBytes] = opt_metric(p->write_bytes);
    if (!p->exe_path.empty()) m[metric::kExecPath] = p->exe_path;
    out.push_back(app::make_finding(Category::Process, p->name + " (pid " + std::to_string(p->pid) + ")", std::move(m)));
  }
  return out;
}

CollectorResult ProcessCollector::collect(const app::ScanConfig& cfg, std::stop_token st) {
  return run_source<ProcessSnapshot>(kCategory, *source_, cfg, st, [&cfg](const ProcessSnapshot& snap, CollectorResult& res){
    res.findings = to_findings(snap, cfg.process_top_n);
    SystemTotals t;
    t.cpu_percent = snap.cpu_total_pct;
    t.mem_total_bytes = snap.mem_total_bytes;
    t.mem_used_bytes = snap.mem_total_bytes > snap.mem_available_bytes ? snap.mem_total_bytes - snap.mem_available_bytes : 0;
    t.mem_used_percent = snap.mem_total_bytes > 0
        ? 100.0 * static_cast<double>(t.mem_used_bytes) / static_cast<double>(snap.mem_total_bytes) : 0.0;
    res.totals = t;
  });
}

} // namespace sysvet::collectors
