#include "app/Scanner.hpp"
#include "app/Aggregator.hpp"
#include "util/Log.hpp"

#include <condition_variable>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono;

namespace sysvet::app {

using namespace sysvet::model;

namespace {

CollectorResult failed(Category c, FailureKind kind, std::string message) {
  CollectorResult r;
  r.category = c;
  r.failure = CollectorFailure{kind, std::move(message)};
  return r;
}

} // namespace

struct Scanner::Board {
  struct Slot {
    Category category{Category::Startup};
    std::optional<CollectorResult> result;
    bool finished = false; // collector thread returned
    steady_clock::time_point started{};
    steady_clock::time_point deadline{};
  };

  std::mutex mu;
  std::condition_variable cv;
  std::stop_source cancel;
  std::vector<Slot> slots;
};

Scanner::Scanner(ScanConfig cfg, Factory factory)
    : cfg_(std::move(cfg)), factory_(std::move(factory)), board_(std::make_shared<Board>()) {}

void Scanner::cancel() {
  {
    std::lock_guard<std::mutex> lk(board_->mu);
    board_->cancel.request_stop();
  }
  board_->cv.notify_all();
}

ScanResult Scanner::run() {
  ScanResult out;
  out.mode = cfg_.mode;
  out.elevated = cfg_.elevated;
  out.timestamp = system_clock::now();

  auto expected = ScanState::Idle;
  if (!state_.compare_exchange_strong(expected, ScanState::Running)) {
    out.state = ScanState::Failed;
    out.error = "scanner already used";
    return out;
  }

  const auto cats = cfg_.categories();
  auto board = board_;
  auto cfg = std::make_shared<const ScanConfig>(cfg_);
  {
    std::lock_guard<std::mutex> lk(board->mu);
    board->slots.resize(cats.size());
  }
  std::vector<std::jthread> threads;
  threads.reserve(cats.size());
  try {
    for (size_t i = 0; i < cats.size(); ++i) {
      auto col = factory_(cats[i]);
      if (collectors::category_of(col) != cats[i])
        throw std::logic_error(std::string("collector for ") + to_string(cats[i]) + " reports " +
                               to_string(collectors::category_of(col)));
      {
        std::lock_guard<std::mutex> lk(board->mu);
        auto& slot = board->slots[i];
        slot.category = cats[i];
        slot.started = steady_clock::now();
        slot.deadline = slot.started + cfg->timeout_for(cats[i]);
      }
      // The thread holds its own references; it never touches the Scanner
      threads.emplace_back([board, cfg, i, category = cats[i], col = std::move(col)](std::stop_token st) mutable {
        CollectorResult res;
        try {
          res = collectors::collect(col, *cfg, st);
        } catch (const std::exception& e) {
          res = failed(category, FailureKind::DomainUnavailable, e.what());
          util::logf(util::LogLevel::Warn, "%s: collector failed: %s", to_string(category), e.what());
        } catch (...) {
          res = failed(category, FailureKind::DomainUnavailable, "unknown exception");
          util::logf(util::LogLevel::Warn, "%s: collector failed with a non-standard exception", to_string(category));
        }
        res.category = category;
        std::lock_guard<std::mutex> lk(board->mu);
        auto& slot = board->slots[i];
        slot.finished = true;
        if (util::log_enabled(util::LogLevel::Debug)) {
          auto ms = duration_cast<milliseconds>(steady_clock::now() - slot.started).count();
          util::logf(util::LogLevel::Debug, "%s: finished in %lld ms", to_string(category), static_cast<long long>(ms));
        }
        if (!slot.result) slot.result = std::move(res); // a timed-out slot keeps its Timeout
        board->cv.notify_all();
      });
    }
  } catch (const std::exception& e) {
    // Could not start a collector (factory or thread creation); nothing partial is returned
    for (auto& t : threads) {
      t.request_stop();
      t.detach();
    }
    util::logf(util::LogLevel::Warn, "scan failed to start: %s", e.what());
    state_ = ScanState::Failed;
    out.state = ScanState::Failed;
    out.error = e.what();
    return out;
  }

  std::vector<CollectorResult> results;
  std::vector<bool> released(cats.size(), false);
  {
    std::unique_lock<std::mutex> lk(board->mu);
    for (;;) {
      const auto now = steady_clock::now();
      const bool cancelled = board->cancel.stop_requested();
      bool pending = false;
      auto next = steady_clock::time_point::max();
      for (size_t i = 0; i < board->slots.size(); ++i) {
        auto& s = board->slots[i];
        if (s.result) continue;
        if (cancelled) {
          s.result = failed(s.category, FailureKind::Cancelled, "scan cancelled");
          threads[i].request_stop();
        } else if (now >= s.deadline) {
          auto limit = duration_cast<milliseconds>(s.deadline - s.started).count();
          s.result = failed(s.category, FailureKind::Timeout, "no result within " + std::to_string(limit) + " ms");
          threads[i].request_stop();
          util::logf(util::LogLevel::Warn, "%s: timed out after %lld ms", to_string(s.category), static_cast<long long>(limit));
        } else {
          pending = true;
          if (s.deadline < next) next = s.deadline;
        }
      }
      if (!pending) break;
      board->cv.wait_until(lk, next);
    }
    results.reserve(board->slots.size());
    for (size_t i = 0; i < board->slots.size(); ++i) {
      auto& s = board->slots[i];
      released[i] = !s.finished;
      results.push_back(std::move(*s.result));
    }
  }
  // Finished threads are only returning; stuck ones are left to run out on their own
  for (size_t i = 0; i < threads.size(); ++i) {
    if (released[i]) threads[i].detach();
  }
  threads.clear();

  for (auto& r : results) {
    if (r.totals) out.totals = r.totals;
    auto c = r.category;
    out.per_category[c] = std::move(r);
  }
  out.summary = summarize(out.per_category);
  out.state = ScanState::Completed;
  state_ = ScanState::Completed;
  return out;
}

} // namespace sysvet::app
