#pragma once
#include "collectors/DiskCollector.hpp"
#include "collectors/DriverCollector.hpp"
#include "collectors/ProcessCollector.hpp"
#include "collectors/ServiceCollector.hpp"
#include "collectors/StartupCollector.hpp"
#include "collectors/TaskCollector.hpp"
#include <stop_token>
#include <type_traits>
#include <variant>

namespace sysvet::collectors {

// The closed set of domain collectors. Each alternative owns its source.
using Collector = std::variant<StartupCollector, ServiceCollector, ProcessCollector,
                               DiskCollector, DriverCollector, TaskCollector>;

// Collector for a category backed by the live Linux source.
[[nodiscard]] Collector make_collector(model::Category category);

[[nodiscard]] inline model::Category category_of(const Collector& c) {
  return std::visit([](const auto& col) { return std::decay_t<decltype(col)>::kCategory; }, c);
}

[[nodiscard]] inline model::CollectorResult collect(Collector& c, const app::ScanConfig& cfg, std::stop_token st) {
  return std::visit([&](auto& col) { return col.collect(cfg, st); }, c);
}

} // namespace sysvet::collectors
