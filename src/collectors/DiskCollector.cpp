#include "collectors/DiskCollector.hpp"
#include "collectors/SourceRunner.hpp"
#include "app/Classifier.hpp"
#include "util/Procfs.hpp"
#include "util/Subprocess.hpp"

#include <sys/statvfs.h>

#include <algorithm>
#include <filesystem>
#include <map>
#include <sstream>
#include <unordered_set>

namespace sysvet::collectors {

using namespace sysvet::model;
namespace metric = sysvet::app::metric;
namespace fs = std::filesystem;

static constexpr std::chrono::milliseconds kSmartTimeout{5000};

bool MountDiskSource::is_pseudo_fs(const std::string& fstype) {
  static const std::unordered_set<std::string> bad = {
    "proc","sysfs","devtmpfs","devpts","tmpfs","cgroup","cgroup2","pstore","securityfs",
    "bpf","autofs","mqueue","hugetlbfs","configfs","debugfs","tracefs","nsfs","ramfs",
    "fusectl","fuse.portal","overlay","squashfs","efivarfs","binfmt_misc","rpc_pipefs"
  };
  return bad.count(fstype) != 0;
}

static bool is_memory_fs(const std::string& fstype) { return fstype == "tmpfs" || fstype == "ramfs"; }

// /proc/mounts escapes space, tab, newline and backslash as \ooo
static std::string unescape_mount(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '\\' && i + 3 < s.size() &&
        s[i+1] >= '0' && s[i+1] <= '7' && s[i+2] >= '0' && s[i+2] <= '7' && s[i+3] >= '0' && s[i+3] <= '7') {
      out.push_back(static_cast<char>((s[i+1]-'0')*64 + (s[i+2]-'0')*8 + (s[i+3]-'0')));
      i += 3;
    } else {
      out.push_back(s[i]);
    }
  }
  return out;
}

std::vector<MountDiskSource::MountEntry> MountDiskSource::parse_mounts(const std::string& content) {
  std::vector<MountEntry> out;
  std::istringstream ss(content);
  std::string line;
  while (std::getline(ss, line)) {
    if (line.empty()) continue;
    std::istringstream ls(line);
    MountEntry m;
    if (!(ls >> m.device >> m.mountpoint >> m.fstype)) continue;
    m.mountpoint = unescape_mount(m.mountpoint);
    out.push_back(std::move(m));
  }
  return out;
}

std::optional<bool> MountDiskSource::parse_smart_health(const std::string& output) {
  std::istringstream ss(output);
  std::string line;
  while (std::getline(ss, line)) {
    auto pos = line.find("self-assessment test result:");
    size_t skip = 28;
    if (pos == std::string::npos) { pos = line.find("SMART Health Status:"); skip = 20; }
    if (pos == std::string::npos) continue;
    std::string verdict = line.substr(pos + skip);
    verdict.erase(0, verdict.find_first_not_of(" \t"));
    if (verdict.rfind("PASSED", 0) == 0 || verdict.rfind("OK", 0) == 0) return false;
    if (verdict.find("FAIL") != std::string::npos) return true;
  }
  return std::nullopt;
}

std::string MountDiskSource::backing_disk(const std::string& devname) {
  const std::string node = "/sys/class/block/" + devname;
  if (!util::path_exists(node + "/partition")) return devname;
  // class/block/<part> links to .../block/<disk>/<part>
  auto link = util::read_symlink(node);
  if (!link) return devname;
  fs::path p(*link);
  auto parent = p.parent_path().filename().string();
  return parent.empty() ? devname : parent;
}

// Kernel device name for a /dev path, following /dev/mapper and by-uuid links.
static std::string device_name(const std::string& device) {
  std::error_code ec;
  auto canon = fs::canonical(util::map_path(device), ec);
  if (ec) return fs::path(device).filename().string();
  return canon.filename().string();
}

static bool smart_capable(const std::string& disk) {
  static const char* virt[] = {"dm-", "loop", "md", "zram", "nbd", "ram"};
  for (const char* p : virt)
    if (disk.rfind(p, 0) == 0) return false;
  return !disk.empty();
}

// Sum regular file sizes under root without following symlinks. False when stopped.
static bool dir_size(const std::string& root, uint64_t& bytes, uint64_t& files, size_t& denied, std::stop_token st) {
  std::error_code ec;
  fs::recursive_directory_iterator it(util::map_path(root), fs::directory_options::skip_permission_denied, ec);
  if (ec) { ++denied; return true; }
  size_t visited = 0;
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) { ++denied; ec.clear(); continue; }
    if ((++visited & 0xff) == 0 && st.stop_requested()) return false;
    auto status = it->symlink_status(ec);
    if (ec) { ec.clear(); continue; }
    if (!fs::is_regular_file(status)) continue;
    auto sz = it->file_size(ec);
    if (ec) { ec.clear(); continue; }
    bytes += sz;
    ++files;
  }
  return true;
}

static bool under(const std::string& path, const std::string& mountpoint) {
  if (mountpoint == "/") return !path.empty() && path[0] == '/';
  return path == mountpoint || (path.rfind(mountpoint, 0) == 0 && path.size() > mountpoint.size() && path[mountpoint.size()] == '/');
}

static bool fill_usage(Volume& v) {
  struct statvfs vfs{};
  if (::statvfs(util::map_path(v.mountpoint).c_str(), &vfs) != 0) return false;
  v.total_bytes = static_cast<uint64_t>(vfs.f_blocks) * vfs.f_frsize;
  v.avail_bytes = static_cast<uint64_t>(vfs.f_bavail) * vfs.f_frsize;
  return true;
}

bool MountDiskSource::read(const app::ScanConfig& cfg, DiskSnapshot& out, std::stop_token st) {
  auto content = util::read_file_string("/proc/self/mounts");
  if (!content) { out.error = "cannot read /proc/self/mounts"; return false; }
  const auto mounts = parse_mounts(*content);

  std::unordered_set<std::string> devices;
  for (const auto& m : mounts) {
    if (m.device.rfind("/dev/", 0) != 0 || is_pseudo_fs(m.fstype)) continue;
    if (!devices.insert(m.device).second) continue; // bind mounts, subvolumes
    Volume v;
    v.device = m.device;
    v.mountpoint = m.mountpoint;
    v.fstype = m.fstype;
    if (!fill_usage(v)) { out.notes.push_back("cannot stat " + m.mountpoint); continue; }
    v.disk = backing_disk(device_name(m.device));
    out.volumes.push_back(std::move(v));
  }

  // Health, once per physical disk
  std::map<std::string, std::optional<bool>> health;
  bool smartctl_missing = false, smart_silent = false;
  for (auto& v : out.volumes) {
    if (st.stop_requested()) return false;
    if (!smart_capable(v.disk)) continue;
    auto it = health.find(v.disk);
    if (it == health.end()) {
      std::optional<bool> verdict;
      if (!smartctl_missing) {
        auto res = util::run_command({cfg.smartctl, "-H", "/dev/" + v.disk}, kSmartTimeout, st);
        if (!res) smartctl_missing = true;
        else if (res->timed_out) out.notes.push_back("smartctl timed out on /dev/" + v.disk);
        else {
          verdict = parse_smart_health(res->out);
          if (!verdict) smart_silent = true;
        }
      }
      it = health.emplace(v.disk, verdict).first;
    }
    v.failure_predicted = it->second;
  }
  if (smartctl_missing) out.notes.push_back(cfg.smartctl + " not available, disk health unknown");
  if (smart_silent && !cfg.elevated) out.notes.push_back("SMART status needs root, disk health unknown");

  // Temp locations count against the volume holding them. The longest matching
  // mountpoint decides; a memory-backed /tmp becomes its own volume.
  std::vector<std::string> temps;
  for (const auto& t : cfg.temp_paths) {
    if (t.empty() || t[0] != '/') continue;
    std::string p = t;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    if (std::find(temps.begin(), temps.end(), p) == temps.end()) temps.push_back(p);
  }
  for (const auto& t : temps) {
    if (st.stop_requested()) return false;
    if (!util::is_directory(t)) continue;
    // nested in another temp location: already counted
    bool nested = std::any_of(temps.begin(), temps.end(), [&t](const std::string& o){ return o != t && under(t, o); });
    if (nested) continue;

    const MountEntry* best = nullptr;
    for (const auto& m : mounts)
      if (under(t, m.mountpoint) && (!best || m.mountpoint.size() >= best->mountpoint.size())) best = &m;
    Volume* target = nullptr;
    if (best) {
      for (auto& v : out.volumes)
        if (v.mountpoint == best->mountpoint) { target = &v; break; }
      // second mount of a device already listed (btrfs subvolume, bind mount)
      if (!target && best->device.rfind("/dev/", 0) == 0) {
        for (auto& v : out.volumes)
          if (v.device == best->device) { target = &v; break; }
      }
      if (!target && is_memory_fs(best->fstype)) {
        Volume v;
        v.device = best->device;
        v.mountpoint = best->mountpoint;
        v.fstype = best->fstype;
        v.failure_predicted = false; // no physical medium
        if (fill_usage(v)) { out.volumes.push_back(std::move(v)); target = &out.volumes.back(); }
      }
    }
    if (!target) { out.notes.push_back("no volume found for " + t); continue; }
    size_t denied = 0;
    if (!dir_size(t, target->temp_bytes, target->temp_files, denied, st)) return false;
    if (denied > 0) out.notes.push_back("some entries under " + t + " could not be read");
  }

  if (out.volumes.empty()) { out.error = "no block-device volumes mounted"; return false; }
  return true;
}

DiskCollector::DiskCollector(std::unique_ptr<DiskSource> source) : source_(std::move(source)) {}

std::vector<Finding> DiskCollector::to_findings(const DiskSnapshot& snap) {
  std::vector<Finding> out;
  out.reserve(snap.volumes.size());
  for (const auto& v : snap.volumes) {
    Metrics m;
    m[metric::kMountpoint] = v.mountpoint;
    m[metric::kFstype] = v.fstype;
    m[metric::kTotalBytes] = static_cast<double>(v.total_bytes);
    m[metric::kFreeBytes] = static_cast<double>(v.avail_bytes);
    if (v.total_bytes > 0)
      m[metric::kFreePercent] = 100.0 * static_cast<double>(v.avail_bytes) / static_cast<double>(v.total_bytes);
    else
      m[metric::kFreePercent] = Unknown{};
    if (v.failure_predicted) m[metric::kFailurePredicted] = *v.failure_predicted ? 1.0 : 0.0;
    else m[metric::kFailurePredicted] = Unknown{};
    m[metric::kTempBytes] = static_cast<double>(v.temp_bytes);
    out.push_back(app::make_finding(Category::Disk, v.mountpoint, std::move(m)));
  }
  return out;
}

CollectorResult DiskCollector::collect(const app::ScanConfig& cfg, std::stop_token st) {
  return run_source<DiskSnapshot>(kCategory, *source_, cfg, st, [](const DiskSnapshot& snap, CollectorResult& res){
    res.findings = to_findings(snap);
  });
}

} // namespace sysvet::collectors
