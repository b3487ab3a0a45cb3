#pragma once
#include "app/Config.hpp"
#include "model/ScanResult.hpp"
#include "util/Log.hpp"
#include <stop_token>
#include <utility>

namespace sysvet::collectors {

// Shared collect() body: read raw facts from a source, then turn them into
// findings. A source that returns false yields a DomainUnavailable failure and
// no findings; notes from a partial read are carried through.
template <class Snapshot, class Source, class Convert>
model::CollectorResult run_source(model::Category category, Source& source,
                                  const app::ScanConfig& cfg, std::stop_token st,
                                  Convert&& convert) {
  model::CollectorResult res;
  res.category = category;
  Snapshot snap{};
  if (!source.read(cfg, snap, st)) {
    if (st.stop_requested()) {
      res.failure = model::CollectorFailure{model::FailureKind::Cancelled, "scan cancelled"};
    } else {
      res.failure = model::CollectorFailure{model::FailureKind::DomainUnavailable,
                                            snap.error.empty() ? std::string("no data source readable") : snap.error};
      util::logf(util::LogLevel::Warn, "%s: %s unavailable: %s", model::to_string(category),
                 source.name(), res.failure->message.c_str());
    }
    return res;
  }
  for (const auto& n : snap.notes)
    util::logf(util::LogLevel::Info, "%s: %s", model::to_string(category), n.c_str());
  res.notes = snap.notes;
  std::forward<Convert>(convert)(snap, res);
  return res;
}

} // namespace sysvet::collectors
