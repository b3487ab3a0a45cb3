#pragma once
#include <string>
#include <vector>

namespace sysvet::model {

enum class StartupScope { User, Machine };

struct StartupEntry {
  std::string name;        // desktop Name= or unit name
  std::string command;     // Exec= / ExecStart= line as written
  std::string exe_path;    // resolved executable, empty when unresolvable
  std::string location;    // file the entry was read from
  std::string source;      // e.g. "user autostart", "machine user-unit"
  StartupScope scope{StartupScope::User};
};

struct StartupSnapshot {
  std::vector<StartupEntry> entries;
  std::vector<std::string> notes;  // locations that exist but could not be read
  std::string error;               // set when the whole domain could not be read
};

} // namespace sysvet::model
