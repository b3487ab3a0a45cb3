#pragma once
#include "model/ScanResult.hpp"
#include <string>

namespace sysvet::app {

// Plain-text report: header with privilege note, system totals, one table per
// evaluated category, the not-evaluated list and the ranked recommendations.
[[nodiscard]] std::string render_text_report(const model::ScanResult& result);

} // namespace sysvet::app
