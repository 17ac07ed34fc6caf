#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace matricx::platform {

struct InterfaceCounters {
  std::string name;
  std::uint64_t rxBytes = 0;
  std::uint64_t txBytes = 0;
};

// Per-interface cumulative counters in /proc/net/dev order. Loopback is skipped.
std::optional<std::vector<InterfaceCounters>> readInterfaceCounters();

}  // namespace matricx::platform
