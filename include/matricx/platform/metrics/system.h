#pragma once

#include <optional>
#include <string>

namespace matricx::platform {

struct OsRelease {
  std::string distro;   // NAME from /etc/os-release
  std::string release;  // VERSION_ID (falls back to VERSION)
  std::string kernel;   // uname -r
};

struct LoadAvg {
  double one = 0.0;
  double five = 0.0;
  double fifteen = 0.0;
};

OsRelease readOsRelease();
std::optional<double> readUptimeSeconds();
std::optional<LoadAvg> readLoadAvg();

// Charge of the first battery under /sys/class/power_supply, nullopt when none.
std::optional<double> readBatteryPercent();

}  // namespace matricx::platform
