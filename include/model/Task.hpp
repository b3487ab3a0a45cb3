#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sysvet::model {

struct TaskRecord {
  std::string name;           // timer unit name or "<file>:<line>"
  std::string origin;         // file the task was read from
  std::string command;        // cron command or the unit the timer activates
  std::string owner;          // cron user, empty for timers
  bool boot_trigger{false};   // @reboot, OnBootSec=, OnStartupSec=
  // Shortest repeat interval in seconds; nullopt when not periodic or not derivable
  std::optional<uint64_t> interval_seconds;
  bool enabled{true};
  bool third_party{false};
};

struct TaskSnapshot {
  std::vector<TaskRecord> tasks;
  std::vector<std::string> notes;  // locations that exist but could not be read
  std::string error;               // set when the whole domain could not be read
};

} // namespace sysvet::model
