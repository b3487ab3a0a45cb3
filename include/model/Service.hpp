#pragma once
#include <string>
#include <vector>

namespace sysvet::model {

enum class RunState { Unknown, Running, Stopped };

struct ServiceUnit {
  std::string name;         // e.g. "sshd.service"
  std::string description;  // Description=
  std::string unit_path;    // resolved unit file
  std::string exec_path;    // first ExecStart= token
  std::string wanted_by;    // target whose .wants holds the link
  RunState state{RunState::Unknown};
};

struct ServiceSnapshot {
  std::vector<ServiceUnit> units;
  std::vector<std::string> notes;  // locations that exist but could not be read
  std::string error;               // set when the whole domain could not be read
};

} // namespace sysvet::model
