#pragma once
#include "app/Config.hpp"
#include "model/Driver.hpp"
#include "model/ScanResult.hpp"
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace sysvet::collectors {

class DriverSource {
public:
  virtual ~DriverSource() = default;
  [[nodiscard]] virtual bool read(const app::ScanConfig& cfg, model::DriverSnapshot& out, std::stop_token st) = 0;
  [[nodiscard]] virtual const char* name() const = 0;
};

// Device problems from sysfs and the kernel log:
//   PCI function with no bound driver            -> 28
//   USB device deauthorized                      -> 22
//   USB device runtime power status "error"      -> 43
//   "probe of X failed with error N" in /dev/kmsg -> 10
// plus loaded modules whose taint flags are non-empty.
class SysfsDriverSource : public DriverSource {
public:
  bool read(const app::ScanConfig& cfg, model::DriverSnapshot& out, std::stop_token st) override;
  const char* name() const override { return "sysfs + kernel log"; }

  struct ProbeFailure {
    std::string driver;
    std::string device;
    int error{};
  };
  // One kernel log record ("prio,seq,ts,flags;text" or plain text).
  static std::optional<ProbeFailure> parse_probe_failure(const std::string& record);
  // True for PCI class codes (0xCCSSPP) whose functions are expected to have a driver.
  static bool pci_class_needs_driver(unsigned class_code);

private:
  static bool read_pci(model::DriverSnapshot& out, std::stop_token st);
  static bool read_usb(model::DriverSnapshot& out, std::stop_token st);
  static bool read_modules(model::DriverSnapshot& out, std::stop_token st);
  static void read_kmsg(model::DriverSnapshot& out, std::stop_token st);
};

class DriverCollector {
public:
  static constexpr model::Category kCategory = model::Category::Driver;
  explicit DriverCollector(std::unique_ptr<DriverSource> source = std::make_unique<SysfsDriverSource>());
  [[nodiscard]] model::CollectorResult collect(const app::ScanConfig& cfg, std::stop_token st);

  // Critical devices first, then by id.
  [[nodiscard]] static std::vector<model::Finding> to_findings(const model::DriverSnapshot& snap);
private:
  std::unique_ptr<DriverSource> source_;
};

} // namespace sysvet::collectors
