#pragma once
#include "app/Config.hpp"
#include "model/ScanResult.hpp"
#include "model/Service.hpp"
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace sysvet::collectors {

class ServiceSource {
public:
  virtual ~ServiceSource() = default;
  [[nodiscard]] virtual bool read(const app::ScanConfig& cfg, model::ServiceSnapshot& out, std::stop_token st) = 0;
  [[nodiscard]] virtual const char* name() const = 0;
};

// systemd system units enabled through /etc/systemd/system/*.target.wants,
// with run state taken from the unit's cgroup.
class SystemdServiceSource : public ServiceSource {
public:
  bool read(const app::ScanConfig& cfg, model::ServiceSnapshot& out, std::stop_token st) override;
  const char* name() const override { return "systemd unit files"; }

  [[nodiscard]] static model::RunState run_state(const std::string& unit);
};

class ServiceCollector {
public:
  static constexpr model::Category kCategory = model::Category::Service;
  explicit ServiceCollector(std::unique_ptr<ServiceSource> source = std::make_unique<SystemdServiceSource>());
  [[nodiscard]] model::CollectorResult collect(const app::ScanConfig& cfg, std::stop_token st);

  // Unit file outside the vendor unit dirs, or ExecStart outside the OS tree
  [[nodiscard]] static bool is_third_party(const model::ServiceUnit& u);
  // Third-party first, then running first (stable)
  [[nodiscard]] static std::vector<model::Finding> to_findings(const model::ServiceSnapshot& snap);
private:
  std::unique_ptr<ServiceSource> source_;
};

} // namespace sysvet::collectors
