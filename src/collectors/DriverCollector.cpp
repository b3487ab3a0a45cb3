#include "collectors/DriverCollector.hpp"
#include "collectors/SourceRunner.hpp"
#include "app/Classifier.hpp"
#include "util/Procfs.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sstream>

namespace sysvet::collectors {

using namespace sysvet::model;
namespace metric = sysvet::app::metric;

static constexpr int kCodeNotInstalled = 28;
static constexpr int kCodeDisabled = 22;
static constexpr int kCodeReportedProblems = 43;
static constexpr int kCodeCannotStart = 10;
static constexpr size_t kKmsgMaxBytes = 8u << 20;

static std::string basename_of(const std::string& p) {
  return std::filesystem::path(p).filename().string();
}

static unsigned parse_hex(const std::string& s) {
  return static_cast<unsigned>(std::strtoul(s.c_str(), nullptr, 16));
}

bool SysfsDriverSource::pci_class_needs_driver(unsigned class_code) {
  const unsigned base = (class_code >> 16) & 0xff;
  const unsigned sub = (class_code >> 8) & 0xff;
  switch (base) {
    case 0x01: // storage
    case 0x02: // network
    case 0x03: // display
    case 0x04: // multimedia
    case 0x0d: // wireless
      return true;
    case 0x0c: // serial bus: USB controllers only
      return sub == 0x03;
    default:
      return false;
  }
}

static const char* pci_class_name(unsigned class_code) {
  switch ((class_code >> 16) & 0xff) {
    case 0x01: return "storage controller";
    case 0x02: return "network controller";
    case 0x03: return "display controller";
    case 0x04: return "multimedia controller";
    case 0x0c: return "USB controller";
    case 0x0d: return "wireless controller";
    default: return "device";
  }
}

std::optional<SysfsDriverSource::ProbeFailure> SysfsDriverSource::parse_probe_failure(const std::string& record) {
  std::string text = record;
  if (auto semi = text.find(';'); semi != std::string::npos && text.find(',') < semi) text = text.substr(semi + 1);
  auto p = text.find("probe of ");
  if (p == std::string::npos) return std::nullopt;
  auto f = text.find(" failed with error ", p);
  if (f == std::string::npos) return std::nullopt;
  ProbeFailure pf;
  pf.device = text.substr(p + 9, f - (p + 9));
  if (pf.device.empty()) return std::nullopt;
  pf.error = static_cast<int>(std::strtol(text.c_str() + f + 19, nullptr, 10));
  auto sp = text.find(' ');
  if (sp != std::string::npos && sp < p) pf.driver = text.substr(0, sp);
  return pf;
}

bool SysfsDriverSource::read_pci(DriverSnapshot& out, std::stop_token st) {
  const std::string base = "/sys/bus/pci/devices";
  auto names = util::list_dir(base);
  if (!names) { out.notes.push_back("cannot read " + base); return false; }
  if (names->empty()) return util::is_directory(base);
  std::sort(names->begin(), names->end());
  for (const auto& n : *names) {
    if (st.stop_requested()) return true;
    const std::string dir = base + "/" + n;
    if (util::path_exists(dir + "/driver")) continue;
    auto cls = util::read_first_line(dir + "/class");
    if (!cls) continue;
    const unsigned code = parse_hex(*cls);
    if (!pci_class_needs_driver(code)) continue;
    DeviceRecord d;
    d.id = n;
    d.bus = "pci";
    std::string vendor = util::read_first_line(dir + "/vendor").value_or("0x0000");
    std::string device = util::read_first_line(dir + "/device").value_or("0x0000");
    d.name = std::string("PCI ") + pci_class_name(code) + " " +
             (vendor.size() > 2 ? vendor.substr(2) : vendor) + ":" + (device.size() > 2 ? device.substr(2) : device);
    d.error_code = kCodeNotInstalled;
    out.devices.push_back(std::move(d));
  }
  return true;
}

bool SysfsDriverSource::read_usb(DriverSnapshot& out, std::stop_token st) {
  const std::string base = "/sys/bus/usb/devices";
  auto names = util::list_dir(base);
  if (!names) { out.notes.push_back("cannot read " + base); return false; }
  if (names->empty()) return util::is_directory(base);
  std::sort(names->begin(), names->end());
  for (const auto& n : *names) {
    if (st.stop_requested()) return true;
    if (n.find(':') != std::string::npos) continue; // interface, not device
    const std::string dir = base + "/" + n;
    auto vendor = util::read_first_line(dir + "/idVendor");
    if (!vendor) continue;
    int code = 0;
    if (util::read_first_line(dir + "/authorized").value_or("1") == "0") code = kCodeDisabled;
    else if (util::read_first_line(dir + "/power/runtime_status").value_or("") == "error") code = kCodeReportedProblems;
    if (code == 0) continue;
    DeviceRecord d;
    d.id = n;
    d.bus = "usb";
    d.error_code = code;
    if (auto product = util::read_first_line(dir + "/product"); product && !product->empty()) d.name = *product;
    else d.name = "USB device " + *vendor + ":" + util::read_first_line(dir + "/idProduct").value_or("0000");
    if (auto link = util::read_symlink(dir + "/driver")) d.driver = basename_of(*link);
    out.devices.push_back(std::move(d));
  }
  return true;
}

bool SysfsDriverSource::read_modules(DriverSnapshot& out, std::stop_token st) {
  const std::string base = "/sys/module";
  auto names = util::list_dir(base);
  if (!names) { out.notes.push_back("cannot read " + base); return false; }
  if (names->empty()) return util::is_directory(base);
  std::sort(names->begin(), names->end());
  // Without signing support in the kernel a missing 'E' says nothing
  const bool sig_support = util::path_exists(base + "/module/parameters/sig_enforce");
  for (const auto& n : *names) {
    if (st.stop_requested()) return true;
    auto taint = util::read_first_line(base + "/" + n + "/taint");
    if (!taint || taint->empty()) continue; // built-in or clean
    DeviceRecord d;
    d.kind = DeviceKind::Module;
    d.id = n;
    d.name = n;
    d.bus = "module";
    d.driver = n;
    d.out_of_tree = taint->find('O') != std::string::npos;
    if (taint->find('E') != std::string::npos) d.is_signed = false;
    else if (sig_support) d.is_signed = true;
    out.devices.push_back(std::move(d));
  }
  return true;
}

// Bus a device name lives on, and whether a driver is bound to it now.
static std::optional<std::pair<std::string, bool>> locate_device(const std::string& dev) {
  auto buses = util::list_dir("/sys/bus");
  if (!buses) return std::nullopt;
  for (const auto& bus : *buses) {
    std::string dir = "/sys/bus/" + bus + "/devices/" + dev;
    if (util::path_exists(dir)) return std::make_pair(bus, util::path_exists(dir + "/driver"));
  }
  return std::nullopt;
}

void SysfsDriverSource::read_kmsg(DriverSnapshot& out, std::stop_token st) {
  int fd = ::open(util::map_path("/dev/kmsg").c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
  if (fd < 0) {
    out.notes.push_back(std::string("kernel log unreadable, probe failures not checked (") + std::strerror(errno) + ")");
    return;
  }
  std::string data;
  char buf[8192];
  while (data.size() < kKmsgMaxBytes && !st.stop_requested()) {
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) { data.append(buf, static_cast<size_t>(n)); continue; }
    if (n == 0) break;
    if (errno == EINTR || errno == EPIPE) continue; // EPIPE: records overwritten while reading
    break; // EAGAIN: end of buffer
  }
  ::close(fd);

  std::istringstream ss(data);
  std::string line;
  while (std::getline(ss, line)) {
    if (line.empty() || line[0] == ' ') continue; // key=value continuation
    auto pf = parse_probe_failure(line);
    if (!pf) continue;
    auto it = std::find_if(out.devices.begin(), out.devices.end(),
                           [&](const DeviceRecord& d){ return d.kind == DeviceKind::Device && d.id == pf->device; });
    if (it != out.devices.end()) {
      it->error_code = kCodeCannotStart;
      if (!pf->driver.empty()) it->driver = pf->driver;
      continue;
    }
    auto where = locate_device(pf->device);
    if (!where) continue;         // device is gone (unplugged)
    if (where->second) continue;  // a later probe succeeded
    DeviceRecord d;
    d.id = pf->device;
    d.name = pf->device;
    d.bus = where->first;
    d.driver = pf->driver;
    d.error_code = kCodeCannotStart;
    out.devices.push_back(std::move(d));
  }
}

bool SysfsDriverSource::read(const app::ScanConfig&, DriverSnapshot& out, std::stop_token st) {
  const bool pci = read_pci(out, st);
  const bool usb = read_usb(out, st);
  const bool mods = read_modules(out, st);
  if (st.stop_requested()) return false;
  if (!pci && !usb && !mods) { out.error = "no device tree readable under /sys"; return false; }
  read_kmsg(out, st);
  return !st.stop_requested();
}

DriverCollector::DriverCollector(std::unique_ptr<DriverSource> source) : source_(std::move(source)) {}

std::vector<Finding> DriverCollector::to_findings(const DriverSnapshot& snap) {
  std::vector<Finding> out;
  out.reserve(snap.devices.size());
  for (const auto& d : snap.devices) {
    Metrics m;
    m[metric::kName] = d.name;
    m[metric::kBus] = d.bus;
    if (!d.driver.empty()) m[metric::kDriver] = d.driver;
    m[metric::kErrorCode] = static_cast<double>(d.error_code);
    if (d.is_signed) m[metric::kSigned] = *d.is_signed ? 1.0 : 0.0;
    else m[metric::kSigned] = Unknown{};
    m[metric::kOutOfTree] = d.out_of_tree ? 1.0 : 0.0;
    m[metric::kThirdParty] = d.out_of_tree ? 1.0 : 0.0;
    out.push_back(app::make_finding(Category::Driver, d.id, std::move(m)));
  }
  std::stable_sort(out.begin(), out.end(), [](const Finding& a, const Finding& b){
    if (a.severity != b.severity) return static_cast<int>(a.severity) > static_cast<int>(b.severity);
    return a.identifier < b.identifier;
  });
  return out;
}

CollectorResult DriverCollector::collect(const app::ScanConfig& cfg, std::stop_token st) {
  return run_source<DriverSnapshot>(kCategory, *source_, cfg, st, [](const DriverSnapshot& snap, CollectorResult& res){
    res.findings = to_findings(snap);
  });
}

} // namespace sysvet::collectors
