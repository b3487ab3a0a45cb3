#include "app/Classifier.hpp"
#include "util/Format.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>

namespace sysvet::app {

using model::Category;
using model::Impact;
using model::Metrics;
using model::Severity;

static std::string to_lower_copy(std::string_view s, size_t max_len = 512) {
  std::string out(s.substr(0, std::min(s.size(), max_len)));
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return out;
}

// Resource-heavy applications: sync clients, chat/voice, media and game
// launchers, RGB/peripheral utilities, antivirus, virtualization, GPU tools
static constexpr std::string_view kHighImpact[] = {
  "steam", "discord", "spotify", "teams", "slack", "skype", "zoom",
  "onedrive", "dropbox", "googledrive", "insync", "nextcloud", "megasync", "icloud",
  "adobe", "creative cloud", "vmware", "virtualbox", "docker",
  "mcafee", "norton", "avast", "avg", "kaspersky", "bitdefender", "clamtk",
  "itunes", "epicgames", "heroic", "lutris", "origin", "battlenet", "gog galaxy",
  "corsair", "razer", "logitech", "steelseries", "nzxt", "openrgb", "ckb-next", "polychromatic",
  "nvidia", "amd", "geforce", "radeon",
};

// Update helpers, tray agents, sync daemons
static constexpr std::string_view kMediumImpact[] = {
  "java", "update", "helper", "sync", "tray", "agent", "monitor", "service",
  "daemon", "launcher", "updater", "assistant", "companion", "manager",
};

Impact startup_impact(std::string_view name, std::string_view command) {
  const std::string n = to_lower_copy(name);
  const std::string c = to_lower_copy(command);
  auto hit = [&](std::string_view key){
    return n.find(key) != std::string::npos || c.find(key) != std::string::npos;
  };
  for (auto key : kHighImpact) if (hit(key)) return Impact::High;
  for (auto key : kMediumImpact) if (hit(key)) return Impact::Medium;
  return Impact::Low;
}

struct ProblemCode { int code; const char* text; };

static constexpr ProblemCode kProblemCodes[] = {
  {1, "Device not configured"},
  {3, "Driver corrupted"},
  {10, "Device cannot start"},
  {12, "Resource conflict"},
  {14, "Device needs restart"},
  {16, "Cannot identify resources"},
  {18, "Needs reinstall"},
  {19, "Registry corrupted"},
  {21, "System removing device"},
  {22, "Device disabled"},
  {24, "Device not present"},
  {28, "Drivers not installed"},
  {29, "Device disabled by firmware"},
  {31, "Device not working"},
  {32, "Driver disabled"},
  {33, "Cannot determine resources"},
  {34, "Cannot determine IRQ"},
  {35, "Cannot determine IRQ table"},
  {36, "Cannot determine IRQ translation"},
  {37, "Cannot determine DMA"},
  {38, "Cannot determine DMA type"},
  {39, "Driver registry entry corrupted"},
  {40, "Driver missing/corrupted"},
  {41, "Device failed to load"},
  {42, "Device cannot start"},
  {43, "Device reported problems"},
  {44, "Device stopped"},
  {45, "Device not connected"},
  {46, "Device not available"},
  {47, "Cannot use device"},
  {48, "Device software blocked"},
  {49, "Registry too large"},
  {52, "Driver not digitally signed"},
};

const char* device_problem_description(int code) {
  for (const auto& p : kProblemCodes)
    if (p.code == code) return p.text;
  return nullptr;
}

static constexpr std::string_view kOsPrefixes[] = {
  "/usr/bin/", "/usr/sbin/", "/usr/lib/", "/usr/lib64/", "/usr/libexec/", "/usr/share/",
  "/bin/", "/sbin/", "/lib/", "/lib64/",
};

bool is_os_path(std::string_view path) {
  for (auto pref : kOsPrefixes)
    if (path.substr(0, pref.size()) == pref) return true;
  return false;
}

static bool flag(const Metrics& m, const char* key) {
  auto v = model::number(m, key);
  return v && *v != 0.0;
}

static std::string text_or(const Metrics& m, const char* key, const char* def) {
  auto v = model::text(m, key);
  return v ? *v : std::string(def);
}

static Classification classify_startup(const Metrics& m) {
  Classification c;
  c.impact = startup_impact(text_or(m, metric::kName, ""), text_or(m, metric::kCommand, ""));
  c.severity = (c.impact == Impact::High) ? Severity::Warning : Severity::OK;
  c.description = std::string(model::to_string(c.impact)) + " impact startup item";
  if (auto src = model::text(m, metric::kSource)) c.description += " (" + *src + ")";
  return c;
}

static Classification classify_service(const Metrics& m) {
  Classification c;
  const bool third = flag(m, metric::kThirdParty);
  const bool unknown_state = model::is_unknown(m, metric::kState) || !model::has_metric(m, metric::kState);
  const std::string state = text_or(m, metric::kState, "unknown");
  const std::string owner = third ? "Third-party" : "OS";
  if (unknown_state) {
    c.severity = third ? Severity::Warning : Severity::OK;
    c.indeterminate = true;
    c.description = owner + " service enabled at boot, run state unknown";
    return c;
  }
  c.severity = (third && state != "stopped") ? Severity::Warning : Severity::OK;
  c.description = owner + " service enabled at boot, currently " + state;
  return c;
}

static Classification classify_process(const Metrics& m) {
  Classification c;
  auto cpu = model::number(m, metric::kCpuPercent);
  auto mem = model::number(m, metric::kMemoryBytes);
  const bool crit = (cpu && *cpu > threshold::kProcCpuCritical) || (mem && *mem > threshold::kProcMemCritical);
  const bool warn = (cpu && *cpu > threshold::kProcCpuWarning) || (mem && *mem > threshold::kProcMemWarning);
  c.severity = crit ? Severity::Critical : (warn ? Severity::Warning : Severity::OK);
  c.indeterminate = (c.severity == Severity::OK) && (!cpu || !mem);
  c.description = "CPU " + (cpu ? util::format_pct(*cpu) : std::string("unknown"));
  c.description += ", memory " + (mem ? util::human_bytes(static_cast<uint64_t>(std::max(0.0, *mem))) : std::string("unknown"));
  if (crit) c.description += ", heavy resource use";
  else if (warn) c.description += ", elevated resource use";
  return c;
}

static Classification classify_disk(const Metrics& m) {
  Classification c;
  auto free_pct = model::number(m, metric::kFreePercent);
  auto failure = model::number(m, metric::kFailurePredicted);
  auto temp = model::number(m, metric::kTempBytes);
  const bool predicted = failure && *failure != 0.0;
  const bool crit = (free_pct && *free_pct < threshold::kDiskFreeCritical) || predicted;
  const bool warn = (free_pct && *free_pct < threshold::kDiskFreeWarning) ||
                    (temp && *temp > threshold::kDiskTempWarning);
  c.severity = crit ? Severity::Critical : (warn ? Severity::Warning : Severity::OK);
  c.indeterminate = (c.severity == Severity::OK) && (!free_pct || !failure);

  c.description = free_pct ? util::format_pct(*free_pct) + " free" : std::string("free space unknown");
  if (predicted) c.description += ", failure predicted";
  else if (failure) c.description += ", health OK";
  else c.description += ", health unknown";
  if (temp && *temp > 0.0) c.description += ", temp files " + util::human_bytes(static_cast<uint64_t>(*temp));
  return c;
}

static Classification classify_driver(const Metrics& m) {
  Classification c;
  auto code = model::number(m, metric::kErrorCode);
  auto is_signed = model::number(m, metric::kSigned);
  int ec = code ? static_cast<int>(std::lround(*code)) : 0;
  if (ec != 0) {
    c.severity = Severity::Critical;
    if (const char* d = device_problem_description(ec)) c.description = d;
    else c.description = "Unknown device error (code " + std::to_string(ec) + ")";
    return c;
  }
  if (is_signed && *is_signed == 0.0) {
    c.severity = Severity::Warning;
    c.description = "Unsigned driver";
    return c;
  }
  c.severity = Severity::OK;
  c.indeterminate = !is_signed;
  if (flag(m, metric::kOutOfTree)) c.description = "Out-of-tree driver";
  else c.description = "Driver working";
  if (!is_signed) c.description += ", signature unknown";
  else c.description += ", signed";
  return c;
}

static Classification classify_task(const Metrics& m) {
  Classification c;
  const bool third = flag(m, metric::kThirdParty);
  const std::string owner = third ? "Third-party" : "OS";
  if (model::has_metric(m, metric::kEnabled) && !flag(m, metric::kEnabled)) {
    c.description = owner + " task, disabled";
    return c;
  }
  const bool boot = flag(m, metric::kBootTrigger);
  auto interval = model::number(m, metric::kIntervalSeconds);
  const bool frequent = interval && *interval < threshold::kTaskFrequentSeconds;
  c.severity = (third && (boot || frequent)) ? Severity::Warning : Severity::OK;
  c.description = owner + " task";
  if (boot) c.description += ", runs at boot/logon";
  if (interval) c.description += ", every " + util::format_interval(static_cast<uint64_t>(std::max(0.0, *interval)));
  return c;
}

Classification classify(Category category, const Metrics& metrics) {
  switch (category) {
    case Category::Startup: return classify_startup(metrics);
    case Category::Service: return classify_service(metrics);
    case Category::Process: return classify_process(metrics);
    case Category::Disk: return classify_disk(metrics);
    case Category::Driver: return classify_driver(metrics);
    case Category::ScheduledTask: return classify_task(metrics);
  }
  return {};
}

model::Finding make_finding(Category category, std::string identifier, Metrics metrics) {
  model::Finding f;
  auto c = classify(category, metrics);
  f.category = category;
  f.identifier = std::move(identifier);
  f.severity = c.severity;
  f.impact = c.impact;
  f.description = std::move(c.description);
  f.indeterminate = c.indeterminate;
  f.third_party = flag(metrics, metric::kThirdParty);
  f.metrics = std::move(metrics);
  return f;
}

} // namespace sysvet::app
