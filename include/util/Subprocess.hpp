#pragma once
#include <chrono>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace sysvet::util {

struct CommandOutput {
  int exit_code{-1};   // -1 when killed or not exited normally
  std::string out;     // stdout only; stderr goes to /dev/null
  bool timed_out{false};
};

// Run argv[0] (PATH lookup) with a deadline. The child is killed when the
// deadline passes or stop is requested. Returns std::nullopt when the
// process could not be started (fork/exec failure, missing binary).
[[nodiscard]] auto run_command(const std::vector<std::string>& argv,
                               std::chrono::milliseconds timeout,
                               std::stop_token st = {}) -> std::optional<CommandOutput>;

// Search PATH for an executable name. A name containing '/' is checked directly.
// Returns std::nullopt unless the result is executable.
[[nodiscard]] auto find_in_path(const std::string& name) -> std::optional<std::string>;

} // namespace sysvet::util
