#pragma once
#include "app/Config.hpp"
#include "collectors/Collector.hpp"
#include "model/ScanResult.hpp"
#include <atomic>
#include <functional>
#include <memory>

namespace sysvet::app {

// Runs one scan: every selected collector on its own thread, each bounded by
// its category timeout. A collector that times out or is cancelled is asked
// to stop and released; run() does not wait for it and its late result is
// dropped. A Scanner is single-use; run() on a used Scanner returns a Failed
// result.
class Scanner {
public:
  using Factory = std::function<collectors::Collector(model::Category)>;

  explicit Scanner(ScanConfig cfg, Factory factory = collectors::make_collector);

  // Blocks until every selected collector finished, timed out or was cancelled.
  [[nodiscard]] model::ScanResult run();
  // Safe from any thread (not from a signal handler).
  void cancel();
  [[nodiscard]] model::ScanState state() const { return state_.load(); }

private:
  ScanConfig cfg_;
  Factory factory_;
  std::atomic<model::ScanState> state_{model::ScanState::Idle};
  // Shared with the collector threads, which may outlive the Scanner
  struct Board;
  std::shared_ptr<Board> board_;
};

} // namespace sysvet::app
