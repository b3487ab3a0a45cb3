#pragma once
#include <optional>
#include <string>
#include <vector>

namespace sysvet::model {

enum class DeviceKind { Device, Module };

struct DeviceRecord {
  DeviceKind kind{DeviceKind::Device};
  std::string id;           // sysfs device name or module name
  std::string name;         // human label (vendor:device, module name)
  std::string bus;          // pci, usb, module
  std::string driver;       // bound driver, empty if none
  int error_code{0};        // problem code, 0 = none
  std::optional<bool> is_signed;
  bool out_of_tree{false};
};

struct DriverSnapshot {
  std::vector<DeviceRecord> devices;
  std::vector<std::string> notes;  // locations that exist but could not be read
  std::string error;               // set when the whole domain could not be read
};

} // namespace sysvet::model
