#pragma once
#include "app/Config.hpp"
#include "model/ScanResult.hpp"
#include "model/Startup.hpp"
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace sysvet::collectors {

// Raw access to auto-start locations so tests and other platforms can swap it.
class StartupSource {
public:
  virtual ~StartupSource() = default;
  // Return false when no location could be read at all.
  [[nodiscard]] virtual bool read(const app::ScanConfig& cfg, model::StartupSnapshot& out, std::stop_token st) = 0;
  [[nodiscard]] virtual const char* name() const = 0;
};

// XDG autostart desktop entries and systemd user units wanted by default.target,
// per-user (~/.config) and machine-wide (/etc).
class XdgStartupSource : public StartupSource {
public:
  bool read(const app::ScanConfig& cfg, model::StartupSnapshot& out, std::stop_token st) override;
  const char* name() const override { return "XDG autostart + systemd user units"; }

  // Parse one .desktop file body. Returns false for hidden/disabled entries or
  // entries without Exec=.
  static bool parse_desktop_entry(const std::string& body, std::string& name, std::string& exec);
  // First program token of an Exec=/ExecStart= line, with systemd prefixes (-@:+!) and env assignments removed.
  static std::string exec_program(const std::string& exec);
};

class StartupCollector {
public:
  static constexpr model::Category kCategory = model::Category::Startup;
  explicit StartupCollector(std::unique_ptr<StartupSource> source = std::make_unique<XdgStartupSource>());
  [[nodiscard]] model::CollectorResult collect(const app::ScanConfig& cfg, std::stop_token st);

  // Deduplicate by resolved executable and classify; High impact first (stable).
  [[nodiscard]] static std::vector<model::Finding> to_findings(const model::StartupSnapshot& snap);
private:
  std::unique_ptr<StartupSource> source_;
};

} // namespace sysvet::collectors
