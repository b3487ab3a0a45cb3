#include "collectors/Collector.hpp"

namespace sysvet::collectors {

Collector make_collector(model::Category category) {
  using model::Category;
  switch (category) {
    case Category::Startup: return StartupCollector{};
    case Category::Service: return ServiceCollector{};
    case Category::Process: return ProcessCollector{};
    case Category::Disk: return DiskCollector{};
    case Category::Driver: return DriverCollector{};
    case Category::ScheduledTask: return TaskCollector{};
  }
  return StartupCollector{};
}

} // namespace sysvet::collectors
